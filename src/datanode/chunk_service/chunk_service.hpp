#pragma once

#include "../../common/clock/clock.hpp"
#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"
#include "../chunk_store/chunk_store.hpp"
#include "../master_link/master_link.hpp"
#include "../metrics/metrics_buffer.hpp"

#include <string>

namespace chunk_service
{
    // Node-side store/retrieve contract. Times each operation, records a
    // metric sample locally and hands the figures to the reporter. Reporting
    // never affects the outcome of the operation.
    class ChunkService
    {
    public:
        ChunkService(std::string node_id,
                     chunk_store::ChunkStore &store,
                     node_metrics::MetricsBuffer &metrics,
                     master_link::MetricReporter &reporter,
                     dfs_clock::Clock wall_clock = dfs_clock::wall_seconds);

        errors::Result<schema::StoreChunkResponse> storeChunk(const std::string &chunk_id, const std::string &bytes);
        errors::Result<std::string> retrieveChunk(const std::string &chunk_id);
        schema::json metrics() const;

        const std::string &nodeId() const { return node_id_; }

    private:
        void observe(node_metrics::Operation op, const std::string &chunk_id, std::uint64_t size, double duration_ms);

        std::string node_id_;
        chunk_store::ChunkStore &store_;
        node_metrics::MetricsBuffer &metrics_;
        master_link::MetricReporter &reporter_;
        dfs_clock::Clock wall_clock_;
    };

} // namespace chunk_service
