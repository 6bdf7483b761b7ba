#include <catch2/catch.hpp>

#include "coursedl/manifest.hpp"
#include "coursedl/progress_panel.hpp"

#include <sstream>

using namespace coursedl;

TEST_CASE("parseManifest reads task objects", "[manifest]") {
    const auto tasks = parseManifest(R"({"tasks": [
        {"id": "intro", "url": "https://cdn.example.com/intro.mp4", "destination": "01 Intro/intro.mp4",
         "expected_size": 1048576, "checksum": "md5:5eb63bbbe01eeed093cb22bb8f5acdc3",
         "category": "video", "priority": 3, "headers": {"Referer": "https://school.example.com"}},
        {"url": "https://cdn.example.com/notes.pdf", "destination": "/abs/notes.pdf"}
    ]})",
                                     "/downloads");

    REQUIRE(tasks.size() == 2);
    CHECK(tasks[0].id == "intro");
    CHECK(tasks[0].destination == std::filesystem::path("/downloads/01 Intro/intro.mp4"));
    CHECK(tasks[0].expected_size == std::optional<std::uint64_t>(1048576));
    CHECK(tasks[0].category == "video");
    CHECK(tasks[0].priority == 3);
    REQUIRE(tasks[0].headers.size() == 1);
    CHECK(tasks[0].headers[0].second == "https://school.example.com");

    CHECK(tasks[1].id == "/abs/notes.pdf");
    CHECK(tasks[1].category == "other");
    CHECK_FALSE(tasks[1].expected_size.has_value());
}

TEST_CASE("parseManifest accepts a bare array", "[manifest]") {
    const auto tasks = parseManifest(R"([{"id": "a", "url": "https://x/a", "destination": "a"}])", "base");
    REQUIRE(tasks.size() == 1);
    CHECK(tasks[0].destination == std::filesystem::path("base/a"));
}

TEST_CASE("parseManifest rejects malformed entries", "[manifest]") {
    CHECK_THROWS_AS(parseManifest("{", "."), ManifestError);
    CHECK_THROWS_AS(parseManifest(R"({"items": []})", "."), ManifestError);
    CHECK_THROWS_AS(parseManifest(R"([{"destination": "a"}])", "."), ManifestError);
    CHECK_THROWS_AS(parseManifest(R"([{"url": "https://x/a"}])", "."), ManifestError);
    CHECK_THROWS_AS(parseManifest(R"([{"url": "https://x/a", "destination": "a", "expected_size": -1}])", "."),
                    ManifestError);
    CHECK_THROWS_AS(parseManifest(R"([{"url": "https://x/a", "destination": "a", "headers": ["x"]}])", "."),
                    ManifestError);
    CHECK_THROWS_AS(loadManifest("/nonexistent/manifest.json", "."), ManifestError);
}

TEST_CASE("ProgressPanel formats sizes and rows", "[panel]") {
    CHECK(ProgressPanel::formatSize(512) == "512 B");
    CHECK(ProgressPanel::formatSize(1536) == "1.5 KB");
    CHECK(ProgressPanel::formatSize(5ULL * 1024 * 1024) == "5.0 MB");
    CHECK(ProgressPanel::formatSize(3ULL * 1024 * 1024 * 1024) == "3.0 GB");
    CHECK(ProgressPanel::formatSize(2ULL * 1024 * 1024 * 1024 * 1024) == "2.0 TB");

    ProgressPanel::Row row;
    row.task_id = "intro";
    row.label = "intro.mp4";
    row.status = TransferStatus::InProgress;
    row.bytes = 512;
    row.total = 1024;
    const auto line = ProgressPanel::formatRow(row);
    CHECK(line.find("intro.mp4") == 0);
    CHECK(line.find(" 50%") != std::string::npos);

    row.status = TransferStatus::Queued;
    CHECK(ProgressPanel::formatRow(row).find("[Queued]") != std::string::npos);
}

TEST_CASE("ProgressPanel tracks events per task", "[panel]") {
    std::ostringstream out;
    ProgressPanel panel(out);
    panel.setLabel("a", "a.pdf");
    panel.onEvent(ProgressEvent{"a", TransferStatus::Completed, 100, 100, 0});
    panel.onEvent(ProgressEvent{"b", TransferStatus::Failed, 0, std::nullopt, 0});

    const auto text = panel.buildPanel();
    CHECK(text.find("(2 tasks)") != std::string::npos);
    CHECK(text.find("a.pdf") != std::string::npos);
    CHECK(text.find("[Failed]") != std::string::npos);
    CHECK(text.find("2/2 tasks done") != std::string::npos);

    panel.redraw();
    panel.redraw();
    CHECK(out.str().find("\033[") != std::string::npos);
}
