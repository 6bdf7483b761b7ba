#include "coursedl/validator.hpp"
#include "coursedl/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace coursedl {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::optional<std::uint64_t> regularFileSize(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace

const char* mismatchLabel(Mismatch mismatch) noexcept {
    switch (mismatch) {
        case Mismatch::None: return "none";
        case Mismatch::Missing: return "file missing";
        case Mismatch::TooSmall: return "file smaller than expected";
        case Mismatch::TooLarge: return "file larger than expected";
        case Mismatch::ChecksumMismatch: return "checksum mismatch";
    }
    return "unknown";
}

std::optional<ChecksumSpec> parseChecksum(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    ChecksumSpec spec;
    const auto colon = text.find(':');
    if (colon != std::string::npos) {
        spec.algorithm = toLower(text.substr(0, colon));
        spec.hex = toLower(text.substr(colon + 1));
    } else {
        spec.hex = toLower(text);
        switch (spec.hex.size()) {
            case 32: spec.algorithm = "md5"; break;
            case 40: spec.algorithm = "sha1"; break;
            case 64: spec.algorithm = "sha256"; break;
            default: return std::nullopt;
        }
    }

    const bool hex_only = std::all_of(spec.hex.begin(), spec.hex.end(),
                                      [](unsigned char ch) { return std::isxdigit(ch) != 0; });
    if (spec.algorithm.empty() || spec.hex.empty() || !hex_only) {
        return std::nullopt;
    }
    return spec;
}

Validator::Validator(bool enabled, std::string default_algorithm)
    : enabled_(enabled), default_algorithm_(toLower(std::move(default_algorithm))) {}

VerifyResult Validator::verify(const DownloadTask& task, const ResumeRecord& record) const {
    VerifyResult result;
    const auto size = regularFileSize(task.destination);
    if (!size) {
        result.mismatch = Mismatch::Missing;
        return result;
    }
    result.actual_size = *size;

    if (!enabled_) {
        return result;
    }

    const auto expected_size = task.expected_size ? task.expected_size : record.total_bytes;
    if (expected_size && *size < *expected_size) {
        result.mismatch = Mismatch::TooSmall;
        return result;
    }
    if (expected_size && *size > *expected_size) {
        result.mismatch = Mismatch::TooLarge;
        return result;
    }

    std::optional<ChecksumSpec> expected_sum;
    if (task.expected_checksum) {
        expected_sum = parseChecksum(*task.expected_checksum);
        if (!expected_sum) {
            log::get()->warn("task {}: ignoring unparsable checksum '{}'", task.id, *task.expected_checksum);
        }
    }
    if (!expected_sum && record.checksum) {
        expected_sum = parseChecksum(*record.checksum);
    }

    const std::string algorithm = expected_sum ? expected_sum->algorithm : default_algorithm_;
    result.checksum = computeChecksum(task.destination, algorithm);
    if (!result.checksum) {
        // An unreadable file cannot be trusted as complete.
        result.mismatch = Mismatch::Missing;
        return result;
    }

    if (expected_sum) {
        const auto actual = parseChecksum(*result.checksum);
        if (!actual || actual->hex != expected_sum->hex) {
            result.mismatch = Mismatch::ChecksumMismatch;
        }
    }
    return result;
}

bool Validator::canSkip(const DownloadTask& task, const ResumeRecord& record) const {
    if (record.status != TransferStatus::Completed) {
        return false;
    }
    if (!record.destination.empty() && record.destination != task.destination.string()) {
        return false;
    }

    const auto size = regularFileSize(task.destination);
    if (!size) {
        return false;
    }

    // Size is re-checked even with integrity validation off; it catches deleted or truncated files.
    const std::uint64_t expected_size =
        task.expected_size.value_or(record.total_bytes.value_or(record.bytes_downloaded));
    if (*size != expected_size) {
        return false;
    }
    if (!enabled_) {
        return true;
    }

    ResumeRecord baseline = record;
    baseline.total_bytes = expected_size;
    return verify(task, baseline).ok();
}

std::optional<std::string> Validator::computeChecksum(const std::filesystem::path& path,
                                                      const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        log::get()->warn("unknown digest algorithm '{}'", algorithm);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
    DigestContext ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            return std::nullopt;
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return toLower(algorithm) + ":" + hex;
}

} // namespace coursedl
