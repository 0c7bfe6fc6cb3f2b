#include "master_link.hpp"
#include "../../common/http_util/http_util.hpp"
#include "../../common/logger/Mylogger.h"
#include "../../common/schema/schema.hpp"

#include <boost/asio/post.hpp>

namespace master_link
{
    using errors::ErrorCode;

    MasterLink::MasterLink(MasterLinkOptions options)
        : options_(std::move(options)),
          base_url_(http_util::trim_base(options_.master_url))
    {
    }

    MasterLink::~MasterLink()
    {
        stopHeartbeat();
        // Queued reports are dropped; only one already in flight is waited for.
        reporter_pool_.stop();
        reporter_pool_.join();
    }

    errors::Result<std::uint64_t> MasterLink::registerWithMaster()
    {
        schema::RegisterRequest req{options_.node_id, options_.node_url};
        auto resp = http_util::postJson(base_url_ + "/register", schema::toJson(req).dump(), options_.request_timeout_ms);
        if (!resp.success)
        {
            MyLogger::error("Error registering with master: " + resp.err);
            return errors::Result<std::uint64_t>::fail(ErrorCode::Transport, resp.err);
        }
        if (resp.status != 200)
        {
            std::string message = schema::errorMessage(resp.body);
            MyLogger::error("Failed to register with master: " + message);
            return errors::Result<std::uint64_t>::fail(ErrorCode::Internal, message);
        }

        auto parsed = schema::parseRegisterResponse(resp.body);
        if (!parsed.success)
        {
            MyLogger::error("Unexpected registration response: " + parsed.err);
            return errors::Result<std::uint64_t>::fail(parsed.code, parsed.err);
        }
        MyLogger::info("Registered with master (" + parsed.value.status +
                       "). Chunk size: " + std::to_string(parsed.value.chunk_size) + " bytes");
        return errors::Result<std::uint64_t>::ok(parsed.value.chunk_size);
    }

    errors::Result<std::uint64_t> MasterLink::registerWithRetry(int attempts, std::chrono::milliseconds delay)
    {
        errors::Result<std::uint64_t> last = errors::Result<std::uint64_t>::fail(ErrorCode::Transport, "No attempts made");
        for (int attempt = 1; attempt <= attempts; ++attempt)
        {
            last = registerWithMaster();
            if (last.success)
                return last;
            MyLogger::warning("Registration attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                              " failed: " + last.err);
            if (attempt < attempts)
                std::this_thread::sleep_for(delay);
        }
        return last;
    }

    bool MasterLink::masterAlive()
    {
        auto resp = http_util::head(base_url_ + "/", options_.request_timeout_ms);
        return resp.success && resp.status == 200;
    }

    bool MasterLink::sendHeartbeat()
    {
        if (!masterAlive())
            MyLogger::debug("Master is dead");

        schema::HeartbeatRequest req{options_.node_id};
        auto resp = http_util::postJson(base_url_ + "/heartbeat", schema::toJson(req).dump(), options_.request_timeout_ms);
        if (!resp.success)
        {
            MyLogger::error("Error sending heartbeat: " + resp.err);
            return false;
        }
        if (resp.status != 200)
        {
            MyLogger::warning("Failed to send heartbeat: " + schema::errorMessage(resp.body));
            return false;
        }
        MyLogger::debug("Heartbeat sent to master");
        return true;
    }

    void MasterLink::startHeartbeat()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (heartbeat_thread_.joinable())
            return;
        stop_ = false;
        heartbeat_thread_ = std::thread(&MasterLink::heartbeatLoop, this);
        MyLogger::info("Heartbeat thread started");
    }

    void MasterLink::stopHeartbeat()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (heartbeat_thread_.joinable())
        {
            heartbeat_thread_.join();
            MyLogger::info("Heartbeat thread stopped");
        }
    }

    void MasterLink::heartbeatLoop()
    {
        while (true)
        {
            sendHeartbeat();

            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, options_.heartbeat_interval, [this]
                             { return stop_; }))
                break;
        }
    }

    void MasterLink::report(const std::string &operation, std::uint64_t bytes, double duration_ms)
    {
        if (pending_reports_.load() >= options_.max_pending_reports)
        {
            MyLogger::warning("Dropping " + operation + " metric report: reporter queue full");
            return;
        }
        ++pending_reports_;
        boost::asio::post(reporter_pool_, [this, operation, bytes, duration_ms]()
                          {
            sendReport(operation, bytes, duration_ms);
            --pending_reports_; });
    }

    void MasterLink::sendReport(const std::string &operation, std::uint64_t bytes, double duration_ms)
    {
        schema::StatsRequest req;
        req.node_id = options_.node_id;
        req.operation = operation;
        req.bytes = static_cast<double>(bytes);
        req.duration_ms = duration_ms;

        auto resp = http_util::postJson(base_url_ + "/stats", schema::toJson(req).dump(), options_.request_timeout_ms);
        if (!resp.success)
            MyLogger::error("Error reporting metrics: " + resp.err);
        else if (resp.status != 200)
            MyLogger::warning("Metric report rejected: " + schema::errorMessage(resp.body));
    }

} // namespace master_link
