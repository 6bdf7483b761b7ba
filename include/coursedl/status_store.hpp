#pragma once

#include "transfer_status.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace coursedl {

enum class LoadSource {
    Primary,
    Backup,
    Empty
};

[[nodiscard]] const char* loadSourceLabel(LoadSource source) noexcept;

// Crash-safe map of task id -> ResumeRecord. The primary document is only
// ever replaced by rename, and the previous generation is kept as "<file>.bak".
class StatusStore {
public:
    // An empty path keeps the store in memory; flush() then does nothing.
    explicit StatusStore(std::filesystem::path path);
    ~StatusStore();

    StatusStore(const StatusStore&) = delete;
    StatusStore& operator=(const StatusStore&) = delete;

    // Replaces the in-memory map with the primary document, falling back to the
    // backup and then to an empty map. Never throws for unreadable documents.
    LoadSource load();

    // Throws StatusStoreError when the new generation cannot be written.
    void flush();

    [[nodiscard]] std::optional<ResumeRecord> get(const std::string& task_id) const;
    void put(ResumeRecord record);
    bool erase(const std::string& task_id);

    // Drops every record whose id is not in `keep`. Returns the number removed.
    std::size_t purge(const std::set<std::string>& keep);

    [[nodiscard]] std::vector<ResumeRecord> snapshot() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool dirty() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept;
    [[nodiscard]] std::filesystem::path backupPath() const;
    [[nodiscard]] std::filesystem::path tempPath() const;

    // Document encoding, exposed for tests and tooling.
    [[nodiscard]] static std::string serialize(const std::map<std::string, ResumeRecord>& records);
    [[nodiscard]] static std::optional<std::map<std::string, ResumeRecord>> parse(const std::string& text);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace coursedl
