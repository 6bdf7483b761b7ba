#pragma once

#include "download_task.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace coursedl {

class ManifestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads a task list: either a JSON array of task objects or an object with a
// "tasks" array. Relative destinations are resolved against `base_dir`.
//
//   {"id": "...", "url": "...", "destination": "...", "expected_size": 123,
//    "checksum": "md5:...", "category": "video", "priority": 1,
//    "headers": {"Cookie": "..."}}
//
// Throws ManifestError naming the offending entry.
std::vector<DownloadTask> parseManifest(const std::string& text, const std::filesystem::path& base_dir);
std::vector<DownloadTask> loadManifest(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace coursedl
