#include "metrics_buffer.hpp"

namespace node_metrics
{
    MetricsBuffer::MetricsBuffer(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    void MetricsBuffer::record(Operation op, const schema::MetricSample &sample)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &samples = op == Operation::Read ? reads_ : writes_;
        samples.push_back(sample);
        while (samples.size() > capacity_)
            samples.pop_front();
    }

    std::vector<schema::MetricSample> MetricsBuffer::reads() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return {reads_.begin(), reads_.end()};
    }

    std::vector<schema::MetricSample> MetricsBuffer::writes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return {writes_.begin(), writes_.end()};
    }

    schema::json MetricsBuffer::toJson() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        schema::json reads = schema::json::array();
        for (const auto &s : reads_)
            reads.push_back(schema::json(s));
        schema::json writes = schema::json::array();
        for (const auto &s : writes_)
            writes.push_back(schema::json(s));
        return schema::json{{"reads", reads}, {"writes", writes}};
    }

    double throughput_mbps(double bytes, double duration_ms)
    {
        if (duration_ms <= 0.0)
            return 0.0;
        return (bytes / 1024.0 / 1024.0) / (duration_ms / 1000.0);
    }

} // namespace node_metrics
