#include "coursedl/transfer_executor.hpp"
#include "coursedl/engine_context.hpp"
#include "coursedl/http_client.hpp"
#include "coursedl/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <unistd.h>

namespace coursedl {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

std::optional<std::uint64_t> existingSize(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

TransferOutcome failed(TransferOutcome::Kind kind, ErrorKind error, std::string message, long status = 0) {
    TransferOutcome outcome;
    outcome.kind = kind;
    outcome.error = TransferError{error, status, std::move(message)};
    return outcome;
}

TransferOutcome localIo(const std::string& what, const std::filesystem::path& path) {
    return failed(TransferOutcome::Kind::Retryable, ErrorKind::LocalIo,
                  fmt::format("{} {}: {}", what, path.string(), std::strerror(errno)));
}

// Streams one response body into the destination file, chunk by chunk.
class BodyWriter : public ResponseHandler {
public:
    BodyWriter(EngineContext& context, const DownloadTask& task, FILE* file, std::uint64_t offset,
               const ByteProgress& progress)
        : context_(context), task_(task), file_(file), offset_(offset), bytes_(offset), progress_(progress) {}

    bool onResponse(const HttpResponseHead& head) override {
        status_ = head.status;

        if (offset_ > 0) {
            if (head.status == 206) {
                if (!head.content_range || head.content_range->start != offset_) {
                    range_rejected_ = true;
                    return false;
                }
                total_ = head.content_range->total;
                if (!total_ && head.content_length) {
                    total_ = offset_ + *head.content_length;
                }
                return true;
            }
            if (head.status == 200) {
                log::get()->info("task {}: server ignored range request at byte {}, restarting from 0",
                                 task_.id, offset_);
                if (!rewind()) {
                    return false;
                }
                total_ = head.content_length;
                return true;
            }
            if (head.status == 416) {
                range_rejected_ = true;
                return false;
            }
        }

        if (auto error = classifyHttpStatus(head.status)) {
            http_error_ = std::move(error);
            return false;
        }
        total_ = head.content_range ? head.content_range->total : head.content_length;
        return true;
    }

    bool onBody(const char* data, std::size_t size) override {
        const std::size_t chunk = context_.config().chunk_size;
        std::size_t done = 0;
        while (done < size) {
            if (context_.cancellation().stopRequested()) {
                cancelled_ = true;
                return false;
            }
            const std::size_t n = std::min(chunk, size - done);
            context_.rateLimiter().acquire(n);
            if (std::fwrite(data + done, 1, n, file_) != n) {
                io_error_ = TransferError{ErrorKind::LocalIo, 0,
                                          fmt::format("write to {} failed: {}", task_.destination.string(),
                                                      std::strerror(errno))};
                return false;
            }
            done += n;
            bytes_ += n;
            if (progress_) {
                progress_(bytes_, total_);
            }
        }
        return true;
    }

    bool keepWaiting() override {
        if (context_.cancellation().stopRequested()) {
            cancelled_ = true;
            return false;
        }
        return true;
    }

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }
    [[nodiscard]] const std::optional<std::uint64_t>& total() const noexcept { return total_; }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }
    [[nodiscard]] bool rangeRejected() const noexcept { return range_rejected_; }
    [[nodiscard]] const std::optional<TransferError>& httpError() const noexcept { return http_error_; }
    [[nodiscard]] const std::optional<TransferError>& ioError() const noexcept { return io_error_; }

private:
    bool rewind() {
        if (std::fflush(file_) != 0 || ::ftruncate(::fileno(file_), 0) != 0 || fseeko(file_, 0, SEEK_SET) != 0) {
            io_error_ = TransferError{ErrorKind::LocalIo, 0,
                                      fmt::format("cannot truncate {}: {}", task_.destination.string(),
                                                  std::strerror(errno))};
            return false;
        }
        bytes_ = 0;
        return true;
    }

    EngineContext& context_;
    const DownloadTask& task_;
    FILE* file_;
    std::uint64_t offset_;
    std::uint64_t bytes_;
    const ByteProgress& progress_;

    long status_{0};
    std::optional<std::uint64_t> total_;
    bool cancelled_{false};
    bool range_rejected_{false};
    std::optional<TransferError> http_error_;
    std::optional<TransferError> io_error_;
};

} // namespace

const char* outcomeLabel(TransferOutcome::Kind kind) noexcept {
    switch (kind) {
        case TransferOutcome::Kind::Success: return "success";
        case TransferOutcome::Kind::Skip: return "skip";
        case TransferOutcome::Kind::Retryable: return "retryable";
        case TransferOutcome::Kind::Fatal: return "fatal";
        case TransferOutcome::Kind::Cancelled: return "cancelled";
    }
    return "unknown";
}

TransferExecutor::TransferExecutor(EngineContext& context) : context_(context) {}

TransferOutcome TransferExecutor::execute(const DownloadTask& task,
                                          const ResumeRecord& record,
                                          const AttemptOptions& options,
                                          const ByteProgress& progress) {
    const EngineConfig& config = context_.config();
    const std::filesystem::path& destination = task.destination;

    if (context_.cancellation().stopRequested()) {
        TransferOutcome outcome;
        outcome.kind = TransferOutcome::Kind::Cancelled;
        outcome.bytes_on_disk = existingSize(destination).value_or(0);
        return outcome;
    }

    ResolvedSource source;
    try {
        source = context_.resolvers().resolve(task);
    } catch (const ResolveError& ex) {
        return ex.retryable()
                   ? failed(TransferOutcome::Kind::Retryable, ErrorKind::TransientNetwork, ex.what())
                   : failed(TransferOutcome::Kind::Fatal, ErrorKind::Client, ex.what());
    } catch (const std::exception& ex) {
        return failed(TransferOutcome::Kind::Fatal, ErrorKind::Client,
                      fmt::format("resolver for category '{}' failed: {}", task.category, ex.what()));
    }

    std::error_code ec;
    const auto parent = destination.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return failed(TransferOutcome::Kind::Retryable, ErrorKind::LocalIo,
                          fmt::format("cannot create {}: {}", parent.string(), ec.message()));
        }
    }

    const auto expected = task.expected_size ? task.expected_size : record.total_bytes;
    std::uint64_t offset = 0;
    const auto existing = existingSize(destination);
    if (config.resume_on_restart && !options.force_restart && existing && *existing > 0) {
        if (expected && *existing == *expected) {
            ResumeRecord baseline = record;
            baseline.total_bytes = expected;
            const VerifyResult check = context_.validator().verify(task, baseline);
            if (check.ok()) {
                TransferOutcome outcome;
                outcome.kind = TransferOutcome::Kind::Skip;
                outcome.skip_reason = "already complete";
                outcome.bytes_on_disk = check.actual_size;
                outcome.total_bytes = expected;
                outcome.checksum = check.checksum;
                return outcome;
            }
            log::get()->info("task {}: existing file fails validation ({}), restarting", task.id,
                             mismatchLabel(check.mismatch));
        } else if (!expected || *existing < *expected) {
            offset = *existing;
        }
    }

    std::optional<std::uint64_t> total;
    std::uint64_t written = 0;
    for (;;) {
        FilePtr file{std::fopen(destination.c_str(), offset > 0 ? "r+b" : "wb")};
        if (!file) {
            return localIo("cannot open", destination);
        }
        if (offset > 0 && fseeko(file.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
            return localIo("cannot seek in", destination);
        }

        HttpRequest request;
        request.url = source.url;
        request.headers = source.headers;
        if (offset > 0) {
            request.range_start = offset;
            log::get()->debug("task {}: resuming at byte {}", task.id, offset);
        }
        request.connect_timeout = config.connect_timeout;
        request.read_timeout = config.read_timeout;

        BodyWriter writer(context_, task, file.get(), offset, progress);
        const HttpResult result = context_.http().get(request, writer);
        const bool closed = std::fclose(file.release()) == 0;

        if (writer.cancelled()) {
            TransferOutcome outcome;
            outcome.kind = TransferOutcome::Kind::Cancelled;
            outcome.bytes_on_disk = writer.bytes();
            outcome.total_bytes = writer.total();
            return outcome;
        }
        if (writer.ioError()) {
            TransferOutcome outcome;
            outcome.kind = TransferOutcome::Kind::Retryable;
            outcome.error = writer.ioError();
            outcome.bytes_on_disk = writer.bytes();
            return outcome;
        }
        if (writer.rangeRejected()) {
            if (offset > 0) {
                log::get()->warn("task {}: server rejected resume at byte {} (HTTP {}), restarting from 0",
                                 task.id, offset, writer.status());
                offset = 0;
                continue;
            }
            return failed(TransferOutcome::Kind::Retryable, ErrorKind::RangeUnsupported,
                          "server rejected the byte range", writer.status());
        }
        if (const auto& http_error = writer.httpError()) {
            TransferOutcome outcome;
            outcome.kind = RetryPolicy::isRetryable(*http_error) ? TransferOutcome::Kind::Retryable
                                                                 : TransferOutcome::Kind::Fatal;
            outcome.error = http_error;
            outcome.bytes_on_disk = writer.bytes();
            return outcome;
        }
        if (!result.ok()) {
            const bool fatal = result.error == TransportError::BadUrl;
            TransferOutcome outcome = failed(fatal ? TransferOutcome::Kind::Fatal : TransferOutcome::Kind::Retryable,
                                             fatal ? ErrorKind::Client : ErrorKind::TransientNetwork,
                                             fmt::format("{}: {}", transportErrorLabel(result.error), result.message),
                                             result.status);
            outcome.bytes_on_disk = writer.bytes();
            outcome.total_bytes = writer.total();
            return outcome;
        }
        if (!closed) {
            return localIo("cannot close", destination);
        }

        written = writer.bytes();
        total = writer.total();
        if (total && written < *total) {
            TransferOutcome outcome = failed(TransferOutcome::Kind::Retryable, ErrorKind::TransientNetwork,
                                             fmt::format("body ended at {} of {} bytes", written, *total),
                                             result.status);
            outcome.bytes_on_disk = written;
            outcome.total_bytes = total;
            return outcome;
        }
        break;
    }

    ResumeRecord baseline = record;
    if (total) {
        baseline.total_bytes = total;
    }
    const VerifyResult check = context_.validator().verify(task, baseline);
    if (!check.ok()) {
        TransferOutcome outcome = failed(TransferOutcome::Kind::Retryable, ErrorKind::IntegrityMismatch,
                                         fmt::format("{} ({} bytes on disk)", mismatchLabel(check.mismatch),
                                                     check.actual_size));
        outcome.bytes_on_disk = check.actual_size;
        outcome.total_bytes = total;
        outcome.restart_from_zero = true;
        return outcome;
    }

    TransferOutcome outcome;
    outcome.kind = TransferOutcome::Kind::Success;
    outcome.bytes_on_disk = check.actual_size;
    outcome.total_bytes = task.expected_size.value_or(total.value_or(check.actual_size));
    outcome.checksum = check.checksum;
    return outcome;
}

} // namespace coursedl
