#include "coursedl/status_store.hpp"
#include "coursedl/errors.hpp"
#include "coursedl/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <json/json.h>

namespace coursedl {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

std::optional<std::string> readWholeFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

void writeAndSync(const fs::path& path, const std::string& text) {
    std::unique_ptr<FILE, FileDeleter> file{std::fopen(path.c_str(), "wb")};
    if (!file) {
        throw StatusStoreError(fmt::format("cannot open {}: {}", path.string(), std::strerror(errno)));
    }
    if (!text.empty() && std::fwrite(text.data(), 1, text.size(), file.get()) != text.size()) {
        throw StatusStoreError(fmt::format("short write to {}", path.string()));
    }
    if (std::fflush(file.get()) != 0 || ::fsync(::fileno(file.get())) != 0) {
        throw StatusStoreError(fmt::format("cannot sync {}: {}", path.string(), std::strerror(errno)));
    }
    if (std::fclose(file.release()) != 0) {
        throw StatusStoreError(fmt::format("cannot close {}: {}", path.string(), std::strerror(errno)));
    }
}

// Makes the rename itself durable. Failure here is not fatal for correctness.
void syncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}

std::optional<ResumeRecord> recordFromJson(const std::string& id, const Json::Value& entry) {
    if (!entry.isObject() || !entry["status"].isString()) {
        return std::nullopt;
    }
    const auto status = parseStatus(entry["status"].asString());
    if (!status) {
        return std::nullopt;
    }

    ResumeRecord record;
    record.task_id = id;
    record.status = *status;

    const Json::Value& bytes = entry["bytes_downloaded"];
    if (!bytes.isNull()) {
        if (!bytes.isUInt64()) return std::nullopt;
        record.bytes_downloaded = bytes.asUInt64();
    }
    const Json::Value& total = entry["total_bytes"];
    if (!total.isNull()) {
        if (!total.isUInt64()) return std::nullopt;
        record.total_bytes = total.asUInt64();
    }
    const Json::Value& attempts = entry["attempt_count"];
    if (!attempts.isNull()) {
        if (!attempts.isUInt()) return std::nullopt;
        record.attempt_count = attempts.asUInt();
    }
    const Json::Value& updated = entry["updated_at"];
    if (updated.isInt64()) {
        record.updated_at = updated.asInt64();
    }
    if (entry["checksum"].isString()) {
        record.checksum = entry["checksum"].asString();
    }
    if (entry["last_error"].isString()) {
        record.last_error = entry["last_error"].asString();
    }
    if (entry["destination"].isString()) {
        record.destination = entry["destination"].asString();
    }
    return record;
}

} // namespace

const char* loadSourceLabel(LoadSource source) noexcept {
    switch (source) {
        case LoadSource::Primary: return "primary";
        case LoadSource::Backup: return "backup";
        case LoadSource::Empty: return "empty";
    }
    return "unknown";
}

class StatusStore::Impl {
public:
    explicit Impl(fs::path path) : path_(std::move(path)) {}

    LoadSource load() {
        std::lock_guard<std::mutex> flush_lock(flush_mutex_);

        if (path_.empty()) {
            replaceRecords({}, false);
            return LoadSource::Empty;
        }

        if (auto records = readDocument(path_)) {
            replaceRecords(std::move(*records), true);
            return LoadSource::Primary;
        }

        const fs::path backup = backupPath();
        if (auto records = readDocument(backup)) {
            log::get()->warn("status document {} unusable, recovered from backup {}", path_.string(),
                             backup.string());
            replaceRecords(std::move(*records), false);
            return LoadSource::Backup;
        }

        std::error_code ec;
        if (fs::exists(path_, ec) || fs::exists(backup, ec)) {
            log::get()->warn("status documents {} and {} unusable, starting with an empty store; "
                             "previous resume progress is lost",
                             path_.string(), backup.string());
        } else {
            log::get()->info("no status document at {}, starting with an empty store", path_.string());
        }
        replaceRecords({}, false);
        return LoadSource::Empty;
    }

    void flush() {
        std::lock_guard<std::mutex> flush_lock(flush_mutex_);

        std::string text;
        std::uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            text = serialize(records_);
            generation = generation_;
        }

        if (path_.empty()) {
            markFlushed(generation);
            return;
        }

        std::error_code ec;
        const fs::path parent = path_.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw StatusStoreError(fmt::format("cannot create {}: {}", parent.string(), ec.message()));
            }
        }

        // A primary we could not parse must not overwrite the backup we recovered from.
        if (primary_valid_ && fs::exists(path_, ec)) {
            fs::copy_file(path_, backupPath(), fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw StatusStoreError(fmt::format("cannot back up {}: {}", path_.string(), ec.message()));
            }
        }

        const fs::path temp = tempPath();
        writeAndSync(temp, text);
        fs::rename(temp, path_, ec);
        if (ec) {
            throw StatusStoreError(fmt::format("cannot replace {}: {}", path_.string(), ec.message()));
        }
        syncDirectory(parent);

        primary_valid_ = true;
        markFlushed(generation);
    }

    std::optional<ResumeRecord> get(const std::string& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(task_id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void put(ResumeRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string id = record.task_id;
        records_[id] = std::move(record);
        ++generation_;
    }

    bool erase(const std::string& task_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (records_.erase(task_id) == 0) {
            return false;
        }
        ++generation_;
        return true;
    }

    std::size_t purge(const std::set<std::string>& keep) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (keep.count(it->first) == 0) {
                it = records_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            ++generation_;
        }
        return removed;
    }

    std::vector<ResumeRecord> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ResumeRecord> out;
        out.reserve(records_.size());
        for (const auto& entry : records_) {
            out.push_back(entry.second);
        }
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    bool dirty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_ != flushed_generation_;
    }

    const fs::path& path() const noexcept { return path_; }

    fs::path backupPath() const {
        fs::path backup = path_;
        backup += ".bak";
        return backup;
    }

    fs::path tempPath() const {
        fs::path temp = path_;
        temp += ".tmp";
        return temp;
    }

private:
    std::optional<std::map<std::string, ResumeRecord>> readDocument(const fs::path& path) const {
        const auto text = readWholeFile(path);
        if (!text) {
            return std::nullopt;
        }
        auto records = StatusStore::parse(*text);
        if (!records) {
            log::get()->warn("status document {} is not parseable", path.string());
        }
        return records;
    }

    void replaceRecords(std::map<std::string, ResumeRecord> records, bool primary_valid) {
        for (auto& entry : records) {
            // A transfer that was running when the process died is resumable, not running.
            if (entry.second.status == TransferStatus::InProgress) {
                entry.second.status = TransferStatus::Paused;
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        records_ = std::move(records);
        ++generation_;
        flushed_generation_ = generation_;
        primary_valid_ = primary_valid;
    }

    void markFlushed(std::uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        flushed_generation_ = generation;
    }

    fs::path path_;
    std::map<std::string, ResumeRecord> records_;
    std::uint64_t generation_{0};
    std::uint64_t flushed_generation_{0};
    bool primary_valid_{false};
    mutable std::mutex mutex_;
    std::mutex flush_mutex_;
};

StatusStore::StatusStore(fs::path path)
    : impl_(std::make_unique<Impl>(std::move(path))) {}

StatusStore::~StatusStore() = default;

LoadSource StatusStore::load() { return impl_->load(); }

void StatusStore::flush() { impl_->flush(); }

std::optional<ResumeRecord> StatusStore::get(const std::string& task_id) const { return impl_->get(task_id); }

void StatusStore::put(ResumeRecord record) { impl_->put(std::move(record)); }

bool StatusStore::erase(const std::string& task_id) { return impl_->erase(task_id); }

std::size_t StatusStore::purge(const std::set<std::string>& keep) { return impl_->purge(keep); }

std::vector<ResumeRecord> StatusStore::snapshot() const { return impl_->snapshot(); }

std::size_t StatusStore::size() const { return impl_->size(); }

bool StatusStore::dirty() const { return impl_->dirty(); }

const fs::path& StatusStore::path() const noexcept { return impl_->path(); }

fs::path StatusStore::backupPath() const { return impl_->backupPath(); }

fs::path StatusStore::tempPath() const { return impl_->tempPath(); }

std::string StatusStore::serialize(const std::map<std::string, ResumeRecord>& records) {
    Json::Value root(Json::objectValue);
    for (const auto& [id, record] : records) {
        Json::Value entry(Json::objectValue);
        entry["status"] = statusLabel(record.status);
        entry["bytes_downloaded"] = Json::UInt64(record.bytes_downloaded);
        entry["total_bytes"] = record.total_bytes ? Json::Value(Json::UInt64(*record.total_bytes))
                                                  : Json::Value(Json::nullValue);
        if (record.checksum) {
            entry["checksum"] = *record.checksum;
        }
        entry["attempt_count"] = Json::UInt(record.attempt_count);
        entry["updated_at"] = Json::Int64(record.updated_at);
        if (record.last_error) {
            entry["last_error"] = *record.last_error;
        }
        if (!record.destination.empty()) {
            entry["destination"] = record.destination;
        }
        root[id] = std::move(entry);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

std::optional<std::map<std::string, ResumeRecord>> StatusStore::parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors) || !root.isObject()) {
        return std::nullopt;
    }

    std::map<std::string, ResumeRecord> records;
    for (const auto& id : root.getMemberNames()) {
        auto record = recordFromJson(id, root[id]);
        if (!record) {
            log::get()->warn("dropping malformed status entry for task {}", id);
            continue;
        }
        records.emplace(id, std::move(*record));
    }
    return records;
}

} // namespace coursedl
