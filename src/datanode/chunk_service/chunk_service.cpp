#include "chunk_service.hpp"
#include "../../common/logger/Mylogger.h"

#include <iomanip>
#include <sstream>

namespace chunk_service
{
    ChunkService::ChunkService(std::string node_id,
                               chunk_store::ChunkStore &store,
                               node_metrics::MetricsBuffer &metrics,
                               master_link::MetricReporter &reporter,
                               dfs_clock::Clock wall_clock)
        : node_id_(std::move(node_id)),
          store_(store),
          metrics_(metrics),
          reporter_(reporter),
          wall_clock_(std::move(wall_clock))
    {
    }

    errors::Result<schema::StoreChunkResponse> ChunkService::storeChunk(const std::string &chunk_id,
                                                                        const std::string &bytes)
    {
        double started = dfs_clock::steady_millis();
        auto status = store_.put(chunk_id, bytes);
        if (!status.success)
        {
            MyLogger::error("Failed to store chunk " + chunk_id + ": " + status.err);
            return errors::Result<schema::StoreChunkResponse>::fail(status);
        }
        double duration_ms = dfs_clock::steady_millis() - started;

        observe(node_metrics::Operation::Write, chunk_id, bytes.size(), duration_ms);

        schema::StoreChunkResponse resp;
        resp.status = "stored";
        resp.chunk_id = chunk_id;
        resp.size = bytes.size();
        resp.node_id = node_id_;
        return errors::Result<schema::StoreChunkResponse>::ok(resp);
    }

    errors::Result<std::string> ChunkService::retrieveChunk(const std::string &chunk_id)
    {
        double started = dfs_clock::steady_millis();
        auto data = store_.get(chunk_id);
        if (!data.success)
        {
            if (data.code == errors::ErrorCode::NotFound)
                MyLogger::warning("Chunk not found: " + chunk_id);
            else
                MyLogger::error("Failed to retrieve chunk " + chunk_id + ": " + data.err);
            return data;
        }
        double duration_ms = dfs_clock::steady_millis() - started;

        observe(node_metrics::Operation::Read, chunk_id, data.value.size(), duration_ms);
        return data;
    }

    schema::json ChunkService::metrics() const
    {
        return metrics_.toJson();
    }

    void ChunkService::observe(node_metrics::Operation op, const std::string &chunk_id, std::uint64_t size, double duration_ms)
    {
        schema::MetricSample sample;
        sample.chunk_id = chunk_id;
        sample.size = size;
        sample.duration_ms = duration_ms;
        sample.throughput = node_metrics::throughput_mbps(static_cast<double>(size), duration_ms);
        sample.timestamp = wall_clock_();
        metrics_.record(op, sample);

        const bool write = op == node_metrics::Operation::Write;
        std::ostringstream line;
        line << (write ? "Stored chunk " : "Retrieved chunk ") << chunk_id << " (" << size << " bytes) at "
             << std::fixed << std::setprecision(2) << sample.throughput << " MB/s";
        MyLogger::info(line.str());

        try
        {
            reporter_.report(write ? "write" : "read", size, duration_ms);
        }
        catch (const std::exception &e)
        {
            MyLogger::error(std::string("Error reporting metrics: ") + e.what());
        }
    }

} // namespace chunk_service
