#pragma once

#include "../../common/clock/clock.hpp"
#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"
#include "../checkpoint/checkpoint_store.hpp"
#include "../metadata_manager/metadata_manager.hpp"
#include "../node_registry/node_registry.hpp"

#include <mutex>
#include <vector>

namespace coordinator
{
    struct CoordinatorOptions
    {
        double heartbeat_timeout_seconds = 30.0;
        std::uint64_t max_chunks_per_file = metadata::MetadataManager::kDefaultMaxChunks;
    };

    // The coordination service state: node registry, file metadata and the
    // checkpoint that persists both. A single mutex covers every read of the
    // registry, plan computation, commit and the following checkpoint write.
    class Coordinator
    {
    public:
        // Loads the checkpoint; throws std::runtime_error if it is unreadable.
        Coordinator(checkpoint::CheckpointStore &store,
                    CoordinatorOptions options = {},
                    dfs_clock::Clock clock = dfs_clock::wall_seconds);

        errors::Result<schema::RegisterResponse> registerNode(const schema::RegisterRequest &req);
        errors::Status heartbeat(const schema::HeartbeatRequest &req);
        errors::Result<schema::FileRecord> createFile(const schema::CreateFileRequest &req);
        errors::Result<schema::FileRecord> getFile(const std::string &filename) const;
        std::vector<schema::FileSummary> listFiles() const;
        std::vector<schema::NodeStatus> listNodes() const;

        // Logs throughput for a node-side read or write; keeps no state.
        // Returns the throughput in MB/s.
        errors::Result<double> recordStats(const schema::StatsRequest &req) const;

        std::uint64_t chunkSize() const;
        checkpoint::Snapshot snapshot() const;

    private:
        checkpoint::Snapshot snapshotLocked() const;
        errors::Status checkpointLocked();

        checkpoint::CheckpointStore &store_;
        CoordinatorOptions options_;
        registry::NodeRegistry registry_;
        metadata::MetadataManager metadata_;
        mutable std::mutex mutex_;
    };

} // namespace coordinator
