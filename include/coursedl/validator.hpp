#pragma once

#include "download_task.hpp"
#include "transfer_status.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace coursedl {

enum class Mismatch {
    None,
    Missing,
    TooSmall,
    TooLarge,
    ChecksumMismatch
};

[[nodiscard]] const char* mismatchLabel(Mismatch mismatch) noexcept;

struct VerifyResult {
    Mismatch mismatch{Mismatch::None};
    std::uint64_t actual_size{0};
    // "<algorithm>:<hex>" of the file when a digest was computed.
    std::optional<std::string> checksum;

    [[nodiscard]] bool ok() const noexcept { return mismatch == Mismatch::None; }
};

// Splits "<algorithm>:<hex>"; bare hex is mapped by length (32 md5, 40 sha1, 64 sha256).
struct ChecksumSpec {
    std::string algorithm;
    std::string hex;
};

[[nodiscard]] std::optional<ChecksumSpec> parseChecksum(const std::string& text);

class Validator {
public:
    Validator(bool enabled, std::string default_algorithm);

    // Compares the destination file of `task` with the expected size and
    // checksum (task values first, then what `record` remembers).
    [[nodiscard]] VerifyResult verify(const DownloadTask& task, const ResumeRecord& record) const;

    // True only for a completed record whose artifact still matches on disk.
    [[nodiscard]] bool canSkip(const DownloadTask& task, const ResumeRecord& record) const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

    // Streams the file through an OpenSSL digest. Returns "<algorithm>:<hex>".
    [[nodiscard]] static std::optional<std::string> computeChecksum(const std::filesystem::path& path,
                                                                    const std::string& algorithm);

private:
    bool enabled_;
    std::string default_algorithm_;
};

} // namespace coursedl
