#include <catch2/catch.hpp>

#include "coursedl/validator.hpp"
#include "test_support.hpp"

using namespace coursedl;
using coursedl::test::TempDir;
using coursedl::test::writeFile;

namespace {

constexpr const char* kHelloMd5 = "md5:5eb63bbbe01eeed093cb22bb8f5acdc3";
constexpr const char* kHelloSha256 = "sha256:b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

DownloadTask taskFor(const std::filesystem::path& destination) {
    DownloadTask task;
    task.id = "t";
    task.url = "https://cdn.example.com/t";
    task.destination = destination;
    return task;
}

ResumeRecord completedRecord(const DownloadTask& task, std::uint64_t size) {
    ResumeRecord record;
    record.task_id = task.id;
    record.status = TransferStatus::Completed;
    record.bytes_downloaded = size;
    record.total_bytes = size;
    record.destination = task.destination.string();
    return record;
}

} // namespace

TEST_CASE("parseChecksum accepts prefixed and bare digests", "[validator]") {
    const auto prefixed = parseChecksum("SHA256:ABCDEF0123456789abcdef0123456789ABCDEF0123456789abcdef0123456789");
    REQUIRE(prefixed.has_value());
    CHECK(prefixed->algorithm == "sha256");
    CHECK(prefixed->hex == "abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123456789");

    const auto bare = parseChecksum("5eb63bbbe01eeed093cb22bb8f5acdc3");
    REQUIRE(bare.has_value());
    CHECK(bare->algorithm == "md5");

    CHECK(parseChecksum("2aae6c35c94fcfb415dbe95f408b9ce91ee846ed")->algorithm == "sha1");
    CHECK_FALSE(parseChecksum("").has_value());
    CHECK_FALSE(parseChecksum("abc").has_value());
    CHECK_FALSE(parseChecksum("md5:not-hex!").has_value());
}

TEST_CASE("computeChecksum streams the file through the requested digest", "[validator]") {
    TempDir dir;
    const auto file = dir / "hello.txt";
    writeFile(file, "hello world");

    CHECK(Validator::computeChecksum(file, "md5") == std::optional<std::string>(kHelloMd5));
    CHECK(Validator::computeChecksum(file, "sha256") == std::optional<std::string>(kHelloSha256));
    CHECK_FALSE(Validator::computeChecksum(dir / "absent", "md5").has_value());
    CHECK_FALSE(Validator::computeChecksum(file, "no-such-digest").has_value());
}

TEST_CASE("Validator verify reports the kind of mismatch", "[validator]") {
    TempDir dir;
    const auto file = dir / "hello.txt";
    auto task = taskFor(file);
    Validator validator(true, "md5");
    ResumeRecord record;

    SECTION("missing file") {
        CHECK(validator.verify(task, record).mismatch == Mismatch::Missing);
    }

    writeFile(file, "hello world");

    SECTION("no expectations yields a baseline") {
        const auto result = validator.verify(task, record);
        CHECK(result.ok());
        CHECK(result.actual_size == 11);
        CHECK(result.checksum == std::optional<std::string>(kHelloMd5));
    }

    SECTION("size checks") {
        task.expected_size = 12;
        CHECK(validator.verify(task, record).mismatch == Mismatch::TooSmall);
        task.expected_size = 10;
        CHECK(validator.verify(task, record).mismatch == Mismatch::TooLarge);
        task.expected_size = 11;
        CHECK(validator.verify(task, record).ok());
    }

    SECTION("record total is used when the task has no size") {
        record.total_bytes = 20;
        CHECK(validator.verify(task, record).mismatch == Mismatch::TooSmall);
    }

    SECTION("checksum checks") {
        task.expected_checksum = kHelloSha256;
        CHECK(validator.verify(task, record).ok());
        task.expected_checksum = "sha256:0000000000000000000000000000000000000000000000000000000000000000";
        CHECK(validator.verify(task, record).mismatch == Mismatch::ChecksumMismatch);
    }

    SECTION("disabled validation only checks existence") {
        Validator lenient(false, "md5");
        task.expected_size = 1000;
        task.expected_checksum = "md5:00000000000000000000000000000000";
        CHECK(lenient.verify(task, record).ok());
    }
}

TEST_CASE("Validator canSkip only trusts completed records that still match", "[validator]") {
    TempDir dir;
    const auto file = dir / "hello.txt";
    auto task = taskFor(file);
    writeFile(file, "hello world");
    Validator validator(true, "md5");

    auto record = completedRecord(task, 11);
    record.checksum = kHelloMd5;
    CHECK(validator.canSkip(task, record));

    SECTION("not completed") {
        record.status = TransferStatus::Paused;
        CHECK_FALSE(validator.canSkip(task, record));
    }
    SECTION("file deleted") {
        std::filesystem::remove(file);
        CHECK_FALSE(validator.canSkip(task, record));
    }
    SECTION("file truncated") {
        writeFile(file, "hello");
        CHECK_FALSE(validator.canSkip(task, record));
    }
    SECTION("content changed with the same size") {
        writeFile(file, "HELLO WORLD");
        CHECK_FALSE(validator.canSkip(task, record));
        CHECK(Validator(false, "md5").canSkip(task, record));
    }
    SECTION("record points at another destination") {
        record.destination = (dir / "other.txt").string();
        CHECK_FALSE(validator.canSkip(task, record));
    }
}
