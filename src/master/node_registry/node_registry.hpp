#pragma once

#include "../../common/clock/clock.hpp"
#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace registry
{
    // Known storage nodes in registration order. Not synchronized: the
    // coordinator owns the only instance and guards it with its mutex.
    class NodeRegistry
    {
    public:
        explicit NodeRegistry(dfs_clock::Clock clock = dfs_clock::wall_seconds);

        // Inserts a node with registered_at = last_heartbeat = now. Returns
        // true when the node was new, false when it was already registered
        // (in which case nothing changes).
        errors::Result<bool> registerNode(const std::string &node_id, const std::string &url);

        errors::Status heartbeat(const std::string &node_id);

        // Every registered node id in insertion order. Liveness is not
        // applied here; placement uses all of them.
        std::vector<std::string> listActive() const;

        std::vector<schema::NodeInfo> nodes() const;
        std::optional<schema::NodeInfo> find(const std::string &node_id) const;
        std::vector<schema::NodeStatus> liveness(double timeout_seconds) const;
        bool isAlive(const std::string &node_id, double timeout_seconds) const;

        std::size_t size() const { return order_.size(); }
        bool empty() const { return order_.empty(); }

        // Replaces the registry contents with checkpointed nodes, keeping
        // their order.
        void restore(const std::vector<schema::NodeInfo> &nodes);

    private:
        dfs_clock::Clock clock_;
        std::vector<std::string> order_;
        std::unordered_map<std::string, schema::NodeInfo> nodes_;
    };

} // namespace registry
