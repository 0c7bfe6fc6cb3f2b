#pragma once

#include "../../common/schema/schema.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace node_metrics
{
    enum class Operation
    {
        Read,
        Write
    };

    // Recent chunk read/write samples. Each operation kind keeps at most
    // `capacity` entries; the oldest sample is dropped first.
    class MetricsBuffer
    {
    public:
        explicit MetricsBuffer(std::size_t capacity = 1000);

        void record(Operation op, const schema::MetricSample &sample);

        std::vector<schema::MetricSample> reads() const;
        std::vector<schema::MetricSample> writes() const;

        // {"reads": [...], "writes": [...]}
        schema::json toJson() const;

        std::size_t capacity() const { return capacity_; }

    private:
        std::size_t capacity_;
        mutable std::mutex mutex_;
        std::deque<schema::MetricSample> reads_;
        std::deque<schema::MetricSample> writes_;
    };

    // MB/s for `bytes` moved in `duration_ms`; 0 when the duration is 0.
    double throughput_mbps(double bytes, double duration_ms);

} // namespace node_metrics
