#include <catch2/catch.hpp>

#include "datanode/chunk_service/chunk_service.hpp"
#include "testing/test_support.hpp"

#include <mutex>
#include <stdexcept>

using errors::ErrorCode;

namespace
{
    struct Report
    {
        std::string operation;
        std::uint64_t bytes;
    };

    class RecordingReporter : public master_link::MetricReporter
    {
    public:
        void report(const std::string &operation, std::uint64_t bytes, double) override
        {
            std::lock_guard<std::mutex> lock(mutex);
            reports.push_back({operation, bytes});
        }

        std::mutex mutex;
        std::vector<Report> reports;
    };

    class BrokenReporter : public master_link::MetricReporter
    {
    public:
        void report(const std::string &, std::uint64_t, double) override
        {
            throw std::runtime_error("master unreachable");
        }
    };
}

TEST_CASE("Store acknowledges with id, size and node")
{
    test_support::TempDir dir;
    chunk_store::ChunkStore store(dir.path());
    node_metrics::MetricsBuffer metrics(10);
    RecordingReporter reporter;
    chunk_service::ChunkService service("3", store, metrics, reporter);

    auto ack = service.storeChunk("9_0", std::string(4096, 'z'));
    REQUIRE(ack.success);
    REQUIRE(ack.value.status == "stored");
    REQUIRE(ack.value.chunk_id == "9_0");
    REQUIRE(ack.value.size == 4096);
    REQUIRE(ack.value.node_id == "3");

    REQUIRE(metrics.writes().size() == 1);
    REQUIRE(metrics.writes()[0].size == 4096);
    REQUIRE(reporter.reports.size() == 1);
    REQUIRE(reporter.reports[0].operation == "write");
    REQUIRE(reporter.reports[0].bytes == 4096);
}

TEST_CASE("Retrieve returns the stored bytes and records a read")
{
    test_support::TempDir dir;
    chunk_store::ChunkStore store(dir.path());
    node_metrics::MetricsBuffer metrics(10);
    RecordingReporter reporter;
    test_support::ManualClock clock;
    chunk_service::ChunkService service("1", store, metrics, reporter, clock);

    const std::string bytes = test_support::random_bytes(1000);
    REQUIRE(service.storeChunk("c", bytes).success);
    auto back = service.retrieveChunk("c");
    REQUIRE(back.success);
    REQUIRE(back.value == bytes);

    REQUIRE(metrics.reads().size() == 1);
    REQUIRE(metrics.reads()[0].timestamp == Approx(1000.0));
    REQUIRE(reporter.reports.back().operation == "read");
}

TEST_CASE("Missing chunks fail without recording metrics")
{
    test_support::TempDir dir;
    chunk_store::ChunkStore store(dir.path());
    node_metrics::MetricsBuffer metrics(10);
    RecordingReporter reporter;
    chunk_service::ChunkService service("1", store, metrics, reporter);

    auto missing = service.retrieveChunk("absent");
    REQUIRE(missing.code == ErrorCode::NotFound);
    REQUIRE(metrics.reads().empty());
    REQUIRE(reporter.reports.empty());
}

TEST_CASE("A failing reporter does not fail the operation")
{
    test_support::TempDir dir;
    chunk_store::ChunkStore store(dir.path());
    node_metrics::MetricsBuffer metrics(10);
    BrokenReporter reporter;
    chunk_service::ChunkService service("1", store, metrics, reporter);

    REQUIRE(service.storeChunk("c", "payload").success);
    REQUIRE(service.retrieveChunk("c").value == "payload");
    REQUIRE(metrics.writes().size() == 1);
    REQUIRE(metrics.reads().size() == 1);
}

TEST_CASE("Metrics list is capped per operation")
{
    test_support::TempDir dir;
    chunk_store::ChunkStore store(dir.path());
    node_metrics::MetricsBuffer metrics(5);
    RecordingReporter reporter;
    chunk_service::ChunkService service("1", store, metrics, reporter);

    for (int i = 0; i < 12; ++i)
        REQUIRE(service.storeChunk("c" + std::to_string(i), "x").success);

    auto j = service.metrics();
    REQUIRE(j["writes"].size() == 5);
    REQUIRE(j["writes"][0]["chunk_id"].get<std::string>() == "c7");
}
