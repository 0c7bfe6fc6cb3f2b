#include "coordinator.hpp"
#include "../../common/logger/Mylogger.h"

#include <iomanip>
#include <sstream>

namespace coordinator
{
    using errors::ErrorCode;

    Coordinator::Coordinator(checkpoint::CheckpointStore &store,
                             CoordinatorOptions options,
                             dfs_clock::Clock clock)
        : store_(store),
          options_(options),
          registry_(clock),
          metadata_(1, clock, options.max_chunks_per_file)
    {
        checkpoint::Snapshot snapshot = store_.load();
        registry_.restore(snapshot.datanodes);
        metadata_.restore(snapshot.chunk_size, std::move(snapshot.files));
        MyLogger::info("Coordinator ready: chunk_size=" + std::to_string(metadata_.chunkSize()) +
                       " nodes=" + std::to_string(registry_.size()));
    }

    errors::Result<schema::RegisterResponse> Coordinator::registerNode(const schema::RegisterRequest &req)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto inserted = registry_.registerNode(req.node_id, req.node_url);
        if (!inserted.success)
            return errors::Result<schema::RegisterResponse>::fail(inserted.code, inserted.err);

        schema::RegisterResponse resp;
        resp.status = inserted.value ? "registered" : "already_registered";
        resp.chunk_size = metadata_.chunkSize();

        auto saved = checkpointLocked();
        if (!saved.success)
            return errors::Result<schema::RegisterResponse>::fail(saved);

        if (inserted.value)
            MyLogger::info("Datanode " + req.node_id + " registered at " + req.node_url);
        else
            MyLogger::info("Datanode " + req.node_id + " re-registered; keeping original registration");
        return errors::Result<schema::RegisterResponse>::ok(resp);
    }

    errors::Status Coordinator::heartbeat(const schema::HeartbeatRequest &req)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto status = registry_.heartbeat(req.node_id);
        if (!status.success)
            return status;
        MyLogger::debug("Heartbeat from " + req.node_id);
        return checkpointLocked();
    }

    errors::Result<schema::FileRecord> Coordinator::createFile(const schema::CreateFileRequest &req)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto created = metadata_.createFile(req.filename, req.filesize, registry_);
        if (!created.success)
            return created;

        auto saved = checkpointLocked();
        if (!saved.success)
            return errors::Result<schema::FileRecord>::fail(saved);

        MyLogger::info("Created file metadata for " + req.filename + ", " +
                       std::to_string(created.value.chunks.size()) + " chunks");
        return created;
    }

    errors::Result<schema::FileRecord> Coordinator::getFile(const std::string &filename) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return metadata_.getFile(filename);
    }

    std::vector<schema::FileSummary> Coordinator::listFiles() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return metadata_.listFiles();
    }

    std::vector<schema::NodeStatus> Coordinator::listNodes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return registry_.liveness(options_.heartbeat_timeout_seconds);
    }

    errors::Result<double> Coordinator::recordStats(const schema::StatsRequest &req) const
    {
        double throughput = 0.0;
        if (req.duration_ms > 0.0)
            throughput = (req.bytes / 1024.0 / 1024.0) / (req.duration_ms / 1000.0);

        std::ostringstream line;
        line << "Node " << req.node_id << " - " << req.operation << ": "
             << std::fixed << std::setprecision(2) << throughput << " MB/s ("
             << static_cast<std::uint64_t>(req.bytes) << " bytes in " << req.duration_ms << " ms)";
        MyLogger::info(line.str());
        return errors::Result<double>::ok(throughput);
    }

    std::uint64_t Coordinator::chunkSize() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return metadata_.chunkSize();
    }

    checkpoint::Snapshot Coordinator::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshotLocked();
    }

    checkpoint::Snapshot Coordinator::snapshotLocked() const
    {
        checkpoint::Snapshot snapshot;
        snapshot.files = metadata_.files();
        snapshot.datanodes = registry_.nodes();
        snapshot.chunk_size = metadata_.chunkSize();
        return snapshot;
    }

    errors::Status Coordinator::checkpointLocked()
    {
        auto status = store_.save(snapshotLocked());
        if (!status.success)
            MyLogger::error("Checkpoint failed: " + status.err);
        return status;
    }

} // namespace coordinator
