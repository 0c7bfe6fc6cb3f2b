#include <catch2/catch.hpp>

#include "client/transfer/transfer_engine.hpp"
#include "master/coordinator/coordinator.hpp"
#include "testing/test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;
using errors::ErrorCode;

namespace
{
    // Plans straight from an in-process coordinator.
    class CoordinatorPlans : public transfer::PlanSource
    {
    public:
        explicit CoordinatorPlans(coordinator::Coordinator &coord) : coord_(coord) {}

        errors::Result<schema::FileRecord> createFile(const std::string &filename, std::uint64_t filesize) override
        {
            return coord_.createFile({filename, filesize});
        }

        errors::Result<schema::FileRecord> getFile(const std::string &filename) override
        {
            return coord_.getFile(filename);
        }

    private:
        coordinator::Coordinator &coord_;
    };

    // In-memory chunk storage. Later chunks answer sooner so completions
    // arrive out of plan order.
    class MemoryTransport : public transfer::ChunkTransport
    {
    public:
        errors::Status storeChunk(const schema::ChunkInfo &chunk, const std::string &bytes) override
        {
            enter(chunk);
            errors::Status status = errors::Status::ok();
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++store_calls;
                if (consumeFailure(chunk.chunk_id))
                    status = errors::Status::fail(ErrorCode::Transport, "injected store failure");
                else
                    chunks[chunk.chunk_id] = bytes;
            }
            leave();
            return status;
        }

        errors::Result<std::string> retrieveChunk(const schema::ChunkInfo &chunk) override
        {
            enter(chunk);
            errors::Result<std::string> out;
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++retrieve_calls;
                auto it = chunks.find(chunk.chunk_id);
                if (consumeFailure(chunk.chunk_id))
                    out = errors::Result<std::string>::fail(ErrorCode::Transport, "injected retrieve failure");
                else if (it == chunks.end())
                    out = errors::Result<std::string>::fail(ErrorCode::NotFound, "Chunk not found");
                else
                    out = errors::Result<std::string>::ok(it->second);
            }
            leave();
            return out;
        }

        // Fails the next `times` calls for chunk_id; negative means always.
        void failChunk(const std::string &chunk_id, int times)
        {
            std::lock_guard<std::mutex> lock(mutex);
            failures[chunk_id] = times;
        }

        std::mutex mutex;
        std::map<std::string, std::string> chunks;
        std::map<std::string, int> failures;
        int store_calls = 0;
        int retrieve_calls = 0;
        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};

    private:
        bool consumeFailure(const std::string &chunk_id)
        {
            auto it = failures.find(chunk_id);
            if (it == failures.end() || it->second == 0)
                return false;
            if (it->second > 0)
                --it->second;
            return true;
        }

        void enter(const schema::ChunkInfo &chunk)
        {
            int now = ++in_flight;
            int seen = max_in_flight.load();
            while (now > seen && !max_in_flight.compare_exchange_weak(seen, now))
            {
            }
            auto index = std::stoull(chunk.chunk_id.substr(chunk.chunk_id.rfind('_') + 1));
            std::this_thread::sleep_for(std::chrono::milliseconds(index < 8 ? 2 * (8 - index) : 0));
        }

        void leave() { --in_flight; }
    };

    struct Harness
    {
        test_support::TempDir dir;
        test_support::ManualClock clock; // frozen, so file ids are consecutive
        checkpoint::CheckpointStore store;
        coordinator::Coordinator coord;
        CoordinatorPlans plans;
        MemoryTransport transport;

        explicit Harness(std::uint64_t chunk_size, int nodes = 2)
            : store(dir / "master" / "metadata.json", chunk_size),
              coord(store, coordinator::CoordinatorOptions{}, clock),
              plans(coord)
        {
            for (int i = 1; i <= nodes; ++i)
            {
                const std::string id = std::to_string(i);
                auto registered = coord.registerNode({id, "http://datanode" + id + ":800" + id});
                if (!registered.success)
                    throw std::runtime_error(registered.err);
            }
        }

        transfer::TransferEngine engine(std::size_t workers = 5, int attempts = 2)
        {
            transfer::TransferOptions options;
            options.workers = workers;
            options.max_attempts = attempts;
            return transfer::TransferEngine(plans, transport, options);
        }

        fs::path local(const std::string &name, const std::string &bytes)
        {
            auto p = dir / name;
            test_support::write_file(p, bytes);
            return p;
        }
    };
}

TEST_CASE("Upload then download reproduces the file")
{
    Harness h(4096);
    const std::string bytes = test_support::random_bytes(10000);
    auto source = h.local("input.bin", bytes);
    auto engine = h.engine();

    auto up = engine.upload(source.string(), "data.bin");
    REQUIRE(up.success);
    REQUIRE(up.bytes == 10000);
    REQUIRE(up.chunks.size() == 3);
    REQUIRE(up.failedChunks() == 0);
    REQUIRE(h.transport.chunks.at(up.file_id + "_2").size() == 1808);
    REQUIRE(h.transport.chunks.at(up.file_id + "_1") == bytes.substr(4096, 4096));

    auto out = h.dir / "out" / "data.bin";
    auto down = engine.download("data.bin", out.string());
    REQUIRE(down.success);
    REQUIRE(test_support::read_file(out) == bytes);
    REQUIRE_FALSE(fs::exists(out.string() + ".part"));
}

TEST_CASE("Many small chunks reassemble in offset order")
{
    Harness h(100, 3);
    const std::string bytes = test_support::random_bytes(1234, 7);
    auto source = h.local("many.bin", bytes);
    auto engine = h.engine(4);

    REQUIRE(engine.upload(source.string(), "many.bin").success);
    auto down = engine.download("many.bin", (h.dir / "many.out").string());
    REQUIRE(down.success);
    REQUIRE(down.chunks.size() == 13);
    REQUIRE(test_support::read_file(h.dir / "many.out") == bytes);
}

TEST_CASE("Worker pool bounds concurrent transfers")
{
    Harness h(10, 2);
    auto source = h.local("wide.bin", test_support::random_bytes(300));
    auto engine = h.engine(3);

    REQUIRE(engine.upload(source.string(), "wide.bin").success);
    REQUIRE(h.transport.max_in_flight.load() <= 3);
    REQUIRE(h.transport.max_in_flight.load() >= 1);
}

TEST_CASE("Zero-size files transfer without touching datanodes")
{
    Harness h(4096);
    auto source = h.local("empty.txt", "");
    auto engine = h.engine();

    auto up = engine.upload(source.string(), "empty.txt");
    REQUIRE(up.success);
    REQUIRE(up.chunks.empty());

    auto out = h.dir / "empty.out";
    auto down = engine.download("empty.txt", out.string());
    REQUIRE(down.success);
    REQUIRE(fs::exists(out));
    REQUIRE(fs::file_size(out) == 0);
    REQUIRE(h.transport.store_calls == 0);
    REQUIRE(h.transport.retrieve_calls == 0);
}

TEST_CASE("A transient store failure is retried")
{
    Harness h(4096);
    auto source = h.local("retry.bin", test_support::random_bytes(9000));
    auto engine = h.engine(5, 2);

    auto created = h.coord.createFile({"first", 1});
    REQUIRE(created.success);
    // The next file id is one past the first file's.
    const std::string next_id = std::to_string(std::stoull(created.value.file_id) + 1);
    h.transport.failChunk(next_id + "_1", 1);

    auto up = engine.upload(source.string(), "retry.bin");
    REQUIRE(up.file_id == next_id);
    REQUIRE(up.success);
    REQUIRE(up.chunks[1].attempts == 2);
    REQUIRE(up.chunks[0].attempts == 1);
}

TEST_CASE("A persistent store failure reports the file as incomplete")
{
    Harness h(4096);
    auto source = h.local("partial.bin", test_support::random_bytes(9000));
    auto engine = h.engine(5, 2);

    auto created = h.coord.createFile({"first", 1});
    const std::string next_id = std::to_string(std::stoull(created.value.file_id) + 1);
    h.transport.failChunk(next_id + "_0", -1);

    auto up = engine.upload(source.string(), "partial.bin");
    REQUIRE_FALSE(up.success);
    REQUIRE(up.failedChunks() == 1);
    REQUIRE_FALSE(up.chunks[0].success);
    REQUIRE(up.chunks[0].attempts == 2);
    REQUIRE(up.chunks[0].code == ErrorCode::Transport);

    // Chunks that made it stay stored.
    REQUIRE(h.transport.chunks.count(next_id + "_1") == 1);
    REQUIRE(h.transport.chunks.count(next_id + "_2") == 1);
    REQUIRE(h.coord.getFile("partial.bin").success);
}

TEST_CASE("A failed download writes nothing")
{
    Harness h(1000);
    const std::string bytes = test_support::random_bytes(5500);
    auto source = h.local("lossy.bin", bytes);
    auto engine = h.engine(2, 1);

    auto up = engine.upload(source.string(), "lossy.bin");
    REQUIRE(up.success);
    h.transport.chunks.erase(up.file_id + "_3");

    auto out = h.dir / "lossy.out";
    auto down = engine.download("lossy.bin", out.string());
    REQUIRE_FALSE(down.success);
    REQUIRE(down.code == ErrorCode::NotFound);
    REQUIRE(down.failedChunks() >= 1);
    REQUIRE_FALSE(fs::exists(out));
    REQUIRE_FALSE(fs::exists(out.string() + ".part"));
}

TEST_CASE("A download does not replace an existing file on failure")
{
    Harness h(1000);
    auto source = h.local("keep.bin", test_support::random_bytes(2500));
    auto engine = h.engine(2, 1);
    auto up = engine.upload(source.string(), "keep.bin");
    REQUIRE(up.success);
    h.transport.failChunk(up.file_id + "_0", -1);

    auto out = h.dir / "keep.out";
    test_support::write_file(out, "previous contents");
    REQUIRE_FALSE(engine.download("keep.bin", out.string()).success);
    REQUIRE(test_support::read_file(out) == "previous contents");
}

TEST_CASE("A chunk of the wrong size fails the download")
{
    Harness h(1000);
    auto source = h.local("short.bin", test_support::random_bytes(2000));
    auto engine = h.engine(2, 1);
    auto up = engine.upload(source.string(), "short.bin");
    REQUIRE(up.success);
    h.transport.chunks[up.file_id + "_1"] = "truncated";

    auto down = engine.download("short.bin", (h.dir / "short.out").string());
    REQUIRE_FALSE(down.success);
    REQUIRE_FALSE(fs::exists(h.dir / "short.out"));
}

TEST_CASE("Downloading an unknown file reports NotFound")
{
    Harness h(4096);
    auto engine = h.engine();
    auto down = engine.download("missing.bin", (h.dir / "x").string());
    REQUIRE_FALSE(down.success);
    REQUIRE(down.code == ErrorCode::NotFound);
    REQUIRE(h.transport.retrieve_calls == 0);
}

TEST_CASE("Upload without datanodes fails before any transfer")
{
    Harness h(4096, 0);
    auto source = h.local("lonely.bin", "abc");
    auto engine = h.engine();

    auto up = engine.upload(source.string(), "lonely.bin");
    REQUIRE_FALSE(up.success);
    REQUIRE(up.code == ErrorCode::NoNodesAvailable);
    REQUIRE(h.transport.store_calls == 0);
    REQUIRE(h.coord.listFiles().empty());
}

TEST_CASE("Upload of a missing local file is rejected")
{
    Harness h(4096);
    auto engine = h.engine();
    auto up = engine.upload((h.dir / "nope.bin").string(), "nope.bin");
    REQUIRE_FALSE(up.success);
    REQUIRE(up.code == ErrorCode::InvalidArgument);
    REQUIRE(h.coord.listFiles().empty());
}

TEST_CASE("Reassembly orders by offset and rejects gaps or overlaps")
{
    std::vector<transfer::RetrievedChunk> chunks{{6, "ghi"}, {0, "abc"}, {3, "def"}};
    REQUIRE(transfer::orderForReassembly(chunks, 9).success);
    REQUIRE(chunks[0].data == "abc");
    REQUIRE(chunks[2].data == "ghi");

    std::vector<transfer::RetrievedChunk> gap{{0, "abc"}, {4, "efg"}};
    REQUIRE_FALSE(transfer::orderForReassembly(gap, 7).success);

    std::vector<transfer::RetrievedChunk> overlap{{0, "abcd"}, {3, "def"}};
    REQUIRE_FALSE(transfer::orderForReassembly(overlap, 7).success);

    std::vector<transfer::RetrievedChunk> short_total{{0, "abc"}};
    REQUIRE_FALSE(transfer::orderForReassembly(short_total, 4).success);

    std::vector<transfer::RetrievedChunk> none;
    REQUIRE(transfer::orderForReassembly(none, 0).success);
}

TEST_CASE("Plans must tile the file")
{
    std::vector<schema::ChunkInfo> plan{{"f_1", "B", "u", 5, 5}, {"f_0", "A", "u", 0, 5}};
    REQUIRE(transfer::validatePlan(plan, 10).success);
    REQUIRE_FALSE(transfer::validatePlan(plan, 11).success);

    plan.push_back({"f_2", "A", "u", 8, 2});
    REQUIRE_FALSE(transfer::validatePlan(plan, 10).success);
}
