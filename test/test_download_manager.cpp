#include <catch2/catch.hpp>

#include "coursedl/download_manager.hpp"
#include "coursedl/engine_context.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace coursedl;
using coursedl::test::FakeHttpClient;
using coursedl::test::FakeResource;
using coursedl::test::TempDir;

namespace {

std::string urlFor(int i) {
    return "https://cdn.example.com/lesson-" + std::to_string(i);
}

std::vector<DownloadTask> makeTasks(const TempDir& dir, FakeHttpClient& http, int count) {
    std::vector<DownloadTask> tasks;
    for (int i = 0; i < count; ++i) {
        const std::string body = coursedl::test::makeBody(5000 + i * 1000, static_cast<unsigned>(i));
        http.serve(urlFor(i), FakeResource{body});

        DownloadTask task;
        task.id = "lesson-" + std::to_string(i);
        task.url = urlFor(i);
        task.destination = dir / ("downloads/lesson-" + std::to_string(i) + ".bin");
        task.expected_size = body.size();
        tasks.push_back(task);
    }
    return tasks;
}

class EventLog {
public:
    void operator()(const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<TransferStatus> statusesFor(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TransferStatus> out;
        for (const auto& event : events_) {
            if (event.task_id == id && (out.empty() || out.back() != event.status)) {
                out.push_back(event.status);
            }
        }
        return out;
    }

private:
    std::vector<ProgressEvent> events_;
    mutable std::mutex mutex_;
};

} // namespace

TEST_CASE("DownloadManager isolates a failing task from the rest", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 5);
    FakeResource broken;
    broken.status = 500;
    http->serve(urlFor(2), broken);

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    DownloadManager manager(context);
    REQUIRE(manager.submit(tasks) == 5);

    const auto summary = manager.run(2);
    CHECK(summary.completed == 4);
    CHECK(summary.failed == 1);
    CHECK(summary.skipped == 0);
    REQUIRE(summary.failures.size() == 1);
    CHECK(summary.failures.front().task_id == "lesson-2");
    CHECK(summary.failures.front().error.http_status == 500);
    CHECK_FALSE(summary.persistence_degraded);

    // The failing task used exactly its retry budget.
    CHECK(http->requestCount(urlFor(2)) == 3);

    const auto failed = context.store().get("lesson-2");
    REQUIRE(failed.has_value());
    CHECK(failed->status == TransferStatus::Failed);
    CHECK(failed->attempt_count == 3);
    CHECK(failed->last_error.has_value());

    for (int i : {0, 1, 3, 4}) {
        const auto record = context.store().get("lesson-" + std::to_string(i));
        REQUIRE(record.has_value());
        CHECK(record->status == TransferStatus::Completed);
        CHECK(record->checksum.has_value());
        CHECK(record->bytes_downloaded == *tasks[static_cast<std::size_t>(i)].expected_size);
    }
}

TEST_CASE("DownloadManager re-run over completed tasks makes no requests", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    const auto tasks = makeTasks(dir, *http, 3);
    const auto config = coursedl::test::testConfig(dir.path());

    {
        EngineContext context(config, http);
        DownloadManager manager(context);
        manager.submit(tasks);
        const auto summary = manager.run(3);
        REQUIRE(summary.completed == 3);
    }
    const auto requests_after_first_run = http->requestCount();
    REQUIRE(requests_after_first_run == 3);

    EngineContext context(config, http);
    REQUIRE(context.loadSource() == LoadSource::Primary);
    EventLog events;
    context.setProgressSink(std::ref(events));
    DownloadManager manager(context);
    CHECK(manager.submit(tasks) == 0);

    const auto summary = manager.run(2);
    CHECK(summary.skipped == 3);
    CHECK(summary.completed == 0);
    CHECK(http->requestCount() == requests_after_first_run);
    CHECK(events.statusesFor("lesson-1") == std::vector<TransferStatus>{TransferStatus::Skipped});

    // Skipping leaves the durable state completed.
    CHECK(context.store().get("lesson-1")->status == TransferStatus::Completed);
}

TEST_CASE("DownloadManager downloads again when a completed file was deleted", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    const auto tasks = makeTasks(dir, *http, 2);
    const auto config = coursedl::test::testConfig(dir.path());

    {
        EngineContext context(config, http);
        DownloadManager manager(context);
        manager.submit(tasks);
        REQUIRE(manager.run(1).completed == 2);
    }
    std::filesystem::remove(tasks[0].destination);

    EngineContext context(config, http);
    DownloadManager manager(context);
    CHECK(manager.submit(tasks) == 1);
    const auto summary = manager.run(1);
    CHECK(summary.completed == 1);
    CHECK(summary.skipped == 1);
    CHECK(std::filesystem::exists(tasks[0].destination));
}

TEST_CASE("DownloadManager resumes a transfer interrupted by a crash", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 1);
    const auto& task = tasks.front();
    const std::string body = coursedl::test::makeBody(static_cast<std::size_t>(*task.expected_size), 0);
    const auto config = coursedl::test::testConfig(dir.path());

    // State a killed process leaves behind: partial file, record still in_progress.
    coursedl::test::writeFile(task.destination, body.substr(0, 2048));
    coursedl::test::writeFile(config.status_file,
                              "{\"lesson-0\": {\"status\": \"in_progress\", \"bytes_downloaded\": 2048, "
                              "\"total_bytes\": null, \"attempt_count\": 1, \"updated_at\": 0, "
                              "\"destination\": \"" + task.destination.string() + "\"}}");

    EngineContext context(config, http);
    REQUIRE(context.store().get("lesson-0")->status == TransferStatus::Paused);

    DownloadManager manager(context);
    REQUIRE(manager.submit(tasks) == 1);
    CHECK(context.store().get("lesson-0")->attempt_count == 1);

    const auto summary = manager.run(1);
    CHECK(summary.completed == 1);

    const auto requests = http->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests.front().range_start == std::optional<std::uint64_t>(2048));
    CHECK(coursedl::test::readFile(task.destination) == body);
}

TEST_CASE("DownloadManager keeps counting attempts across a restart", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 1);
    FakeResource broken;
    broken.status = 500;
    http->serve(urlFor(0), broken);
    const auto config = coursedl::test::testConfig(dir.path());
    REQUIRE(config.retry_attempts == 3);

    // Two attempts were already spent before the process stopped.
    coursedl::test::writeFile(config.status_file,
                              "{\"lesson-0\": {\"status\": \"paused\", \"bytes_downloaded\": 0, "
                              "\"total_bytes\": null, \"attempt_count\": 2, \"updated_at\": 0, "
                              "\"destination\": \"" + tasks[0].destination.string() + "\"}}");

    EngineContext context(config, http);
    DownloadManager manager(context);
    REQUIRE(manager.submit(tasks) == 1);

    const auto summary = manager.run(1);
    CHECK(summary.failed == 1);
    CHECK(summary.completed == 0);
    CHECK(http->requestCount() == 1);

    const auto record = context.store().get("lesson-0");
    REQUIRE(record.has_value());
    CHECK(record->status == TransferStatus::Failed);
    CHECK(record->attempt_count == 3);
}

TEST_CASE("DownloadManager retries transient failures and resumes the partial file", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 1);
    const std::string body = coursedl::test::makeBody(static_cast<std::size_t>(*tasks[0].expected_size), 0);

    // Every response is cut after 3000 bytes; the resumed one only needs 2000.
    FakeResource flaky{body};
    flaky.fail_after = 3000;
    http->serve(urlFor(0), flaky);

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    DownloadManager manager(context);
    manager.submit(tasks);
    const auto summary = manager.run(1);

    CHECK(summary.completed == 1);
    const auto requests = http->requests();
    REQUIRE(requests.size() == 2);
    CHECK_FALSE(requests[0].range_start.has_value());
    CHECK(requests[1].range_start == std::optional<std::uint64_t>(3000));
    CHECK(context.store().get("lesson-0")->attempt_count == 1);
    CHECK(coursedl::test::readFile(tasks[0].destination) == body);
}

TEST_CASE("DownloadManager retries a connection that fails before any byte", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 1);
    const std::string body = coursedl::test::makeBody(static_cast<std::size_t>(*tasks[0].expected_size), 0);

    FakeResource flaky{body};
    flaky.transient_failures = 2;
    http->serve(urlFor(0), flaky);

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    DownloadManager manager(context);
    manager.submit(tasks);

    CHECK(manager.run(1).completed == 1);
    CHECK(http->requestCount() == 3);
    CHECK(context.store().get("lesson-0")->attempt_count == 2);
}

TEST_CASE("DownloadManager runs tasks by priority", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 4);
    tasks[3].priority = 10;
    tasks[1].priority = 5;

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    DownloadManager manager(context);
    manager.submit(tasks);
    REQUIRE(manager.run(1).completed == 4);

    std::vector<std::string> order;
    for (const auto& request : http->requests()) {
        order.push_back(request.url);
    }
    CHECK(order == std::vector<std::string>{urlFor(3), urlFor(1), urlFor(0), urlFor(2)});
}

TEST_CASE("DownloadManager reports lifecycle events", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 2);

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    EventLog events;
    context.setProgressSink(std::ref(events));
    DownloadManager manager(context);
    manager.submit(tasks);
    manager.run(2);

    const auto statuses = events.statusesFor("lesson-0");
    REQUIRE(statuses.size() == 3);
    CHECK(statuses[0] == TransferStatus::Queued);
    CHECK(statuses[1] == TransferStatus::InProgress);
    CHECK(statuses[2] == TransferStatus::Completed);
}

TEST_CASE("DownloadManager cancel leaves unstarted tasks queued", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 3);

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    DownloadManager manager(context);
    manager.submit(tasks);
    manager.cancel();

    const auto summary = manager.run(2);
    CHECK(summary.not_started == 3);
    CHECK(summary.completed == 0);
    CHECK(http->requestCount() == 0);
    CHECK(context.store().get("lesson-0")->status == TransferStatus::Queued);

    // The next run starts fresh and picks up the queued tasks.
    const auto resumed = manager.run(2);
    CHECK(resumed.completed == 3);
    CHECK(resumed.not_started == 0);
    CHECK(http->requestCount() == 3);
    CHECK(context.store().get("lesson-0")->status == TransferStatus::Completed);
}

TEST_CASE("DownloadManager cancel pauses a running transfer", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 1);

    auto config = coursedl::test::testConfig(dir.path());
    config.rate_limit_bytes_per_sec = 4096;
    EngineContext context(config, http);
    DownloadManager manager(context);
    context.setProgressSink([&manager](const ProgressEvent& event) {
        if (event.status == TransferStatus::InProgress && event.bytes_downloaded > 0) {
            manager.cancel();
        }
    });
    manager.submit(tasks);

    const auto summary = manager.run(1);
    CHECK(summary.paused == 1);

    const auto record = context.store().get("lesson-0");
    REQUIRE(record.has_value());
    CHECK(record->status == TransferStatus::Paused);
    CHECK(record->bytes_downloaded == std::filesystem::file_size(tasks[0].destination));
    CHECK(record->bytes_downloaded < *tasks[0].expected_size);
}

TEST_CASE("DownloadManager rejects duplicate ids and bad concurrency", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 2);
    tasks.push_back(tasks.front());

    EngineContext context(coursedl::test::testConfig(dir.path()), http);
    DownloadManager manager(context);
    CHECK(manager.submit(tasks) == 2);

    CHECK_THROWS_AS(manager.run(0), std::invalid_argument);
    CHECK_THROWS_AS(manager.run(11), std::invalid_argument);
    CHECK(manager.run(10).completed == 2);
}

TEST_CASE("DownloadManager purges records of tasks no longer submitted", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 3);
    const auto config = coursedl::test::testConfig(dir.path());

    {
        EngineContext context(config, http);
        DownloadManager manager(context);
        manager.submit(tasks);
        manager.run(2);
    }

    tasks.pop_back();
    EngineContext context(config, http);
    DownloadManager manager(context);
    manager.submit(tasks);
    CHECK(manager.purgeUnreferenced() == 1);
    CHECK(manager.snapshot().size() == 2);

    StatusStore reread(config.status_file);
    reread.load();
    CHECK_FALSE(reread.get("lesson-2").has_value());
}

TEST_CASE("DownloadManager discards a record that points at another destination", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 1);
    const auto config = coursedl::test::testConfig(dir.path());

    {
        EngineContext context(config, http);
        DownloadManager manager(context);
        manager.submit(tasks);
        REQUIRE(manager.run(1).completed == 1);
    }

    tasks[0].destination = dir / "moved" / "lesson-0.bin";
    EngineContext context(config, http);
    DownloadManager manager(context);
    CHECK(manager.submit(tasks) == 1);
    CHECK(manager.run(1).completed == 1);
    CHECK(context.store().get("lesson-0")->destination == tasks[0].destination.string());
    CHECK(http->requestCount() == 2);
}

TEST_CASE("DownloadManager keeps running when the status document cannot be written", "[manager]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto tasks = makeTasks(dir, *http, 2);

    coursedl::test::writeFile(dir / "blocker", "x");
    auto config = coursedl::test::testConfig(dir.path());
    config.status_file = dir / "blocker" / "status.json";

    EngineContext context(config, http);
    DownloadManager manager(context);
    manager.submit(tasks);
    const auto summary = manager.run(2);

    CHECK(summary.completed == 2);
    CHECK(summary.persistence_degraded);
    CHECK(context.store().get("lesson-1")->status == TransferStatus::Completed);
}
