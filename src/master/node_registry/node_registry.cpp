#include "node_registry.hpp"
#include "../../common/logger/Mylogger.h"

namespace registry
{
    using errors::ErrorCode;

    NodeRegistry::NodeRegistry(dfs_clock::Clock clock)
        : clock_(std::move(clock))
    {
    }

    errors::Result<bool> NodeRegistry::registerNode(const std::string &node_id, const std::string &url)
    {
        if (node_id.empty() || url.empty())
            return errors::Result<bool>::fail(ErrorCode::InvalidArgument, "Missing node_id or node_url");

        if (nodes_.count(node_id) != 0)
        {
            MyLogger::debug("Node " + node_id + " already registered");
            return errors::Result<bool>::ok(false);
        }

        double now = clock_();
        schema::NodeInfo node;
        node.node_id = node_id;
        node.url = url;
        node.registered_at = now;
        node.last_heartbeat = now;
        nodes_.emplace(node_id, node);
        order_.push_back(node_id);
        return errors::Result<bool>::ok(true);
    }

    errors::Status NodeRegistry::heartbeat(const std::string &node_id)
    {
        auto it = nodes_.find(node_id);
        if (it == nodes_.end())
            return errors::Status::fail(ErrorCode::UnknownNode, "Unknown node_id");
        it->second.last_heartbeat = clock_();
        return errors::Status::ok();
    }

    std::vector<std::string> NodeRegistry::listActive() const
    {
        return order_;
    }

    std::vector<schema::NodeInfo> NodeRegistry::nodes() const
    {
        std::vector<schema::NodeInfo> out;
        out.reserve(order_.size());
        for (const auto &id : order_)
            out.push_back(nodes_.at(id));
        return out;
    }

    std::optional<schema::NodeInfo> NodeRegistry::find(const std::string &node_id) const
    {
        auto it = nodes_.find(node_id);
        if (it == nodes_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<schema::NodeStatus> NodeRegistry::liveness(double timeout_seconds) const
    {
        double now = clock_();
        std::vector<schema::NodeStatus> out;
        out.reserve(order_.size());
        for (const auto &id : order_)
        {
            const auto &node = nodes_.at(id);
            out.push_back({node, now - node.last_heartbeat < timeout_seconds});
        }
        return out;
    }

    bool NodeRegistry::isAlive(const std::string &node_id, double timeout_seconds) const
    {
        auto it = nodes_.find(node_id);
        if (it == nodes_.end())
            return false;
        return clock_() - it->second.last_heartbeat < timeout_seconds;
    }

    void NodeRegistry::restore(const std::vector<schema::NodeInfo> &nodes)
    {
        order_.clear();
        nodes_.clear();
        for (const auto &node : nodes)
        {
            if (nodes_.emplace(node.node_id, node).second)
                order_.push_back(node.node_id);
        }
    }

} // namespace registry
