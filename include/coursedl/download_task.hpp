#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coursedl {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// One file to fetch. Built by the task enumeration layer and never mutated by the engine.
struct DownloadTask {
    std::string id;
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> expected_size;
    // "<algorithm>:<hex>" or bare hex (length picks md5/sha1/sha256).
    std::optional<std::string> expected_checksum;
    std::string category{"other"};
    int priority{0};
    HeaderList headers;
};

} // namespace coursedl
