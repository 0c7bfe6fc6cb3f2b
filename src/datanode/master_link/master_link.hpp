#pragma once

#include "../../common/errors/errors.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace master_link
{
    // Sink for per-chunk transfer metrics. Implementations must not block the
    // caller on network I/O and must never throw.
    class MetricReporter
    {
    public:
        virtual ~MetricReporter() = default;
        virtual void report(const std::string &operation, std::uint64_t bytes, double duration_ms) = 0;
    };

    struct MasterLinkOptions
    {
        std::string master_url;
        std::string node_id;
        std::string node_url;
        std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(10)};
        long request_timeout_ms = 5000;
        std::size_t max_pending_reports = 1024;
    };

    // Everything a storage node says to the coordination service:
    // registration, the background heartbeat loop and best-effort /stats
    // reports.
    class MasterLink : public MetricReporter
    {
    public:
        explicit MasterLink(MasterLinkOptions options);
        ~MasterLink() override;

        MasterLink(const MasterLink &) = delete;
        MasterLink &operator=(const MasterLink &) = delete;

        // Returns the chunk size announced by the master.
        errors::Result<std::uint64_t> registerWithMaster();
        errors::Result<std::uint64_t> registerWithRetry(int attempts, std::chrono::milliseconds delay);

        bool masterAlive();
        bool sendHeartbeat();

        // Starts the heartbeat thread; failures are logged and the loop keeps
        // going until stopHeartbeat() or destruction.
        void startHeartbeat();
        void stopHeartbeat();

        // Queues a POST /stats on the reporter thread and returns at once.
        // Reports still queued at destruction are discarded.
        void report(const std::string &operation, std::uint64_t bytes, double duration_ms) override;

    private:
        void heartbeatLoop();
        void sendReport(const std::string &operation, std::uint64_t bytes, double duration_ms);

        MasterLinkOptions options_;
        std::string base_url_;

        std::thread heartbeat_thread_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stop_ = false;

        std::atomic<std::size_t> pending_reports_{0};
        boost::asio::thread_pool reporter_pool_{1};
    };

} // namespace master_link
