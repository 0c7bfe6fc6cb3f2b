#pragma once

#include <cstddef>
#include <string>

namespace Initiation
{
    struct DatanodeConfig
    {
        std::string node_id = "1";
        std::string node_url; // derived from node_id and port when empty
        std::string server_ip = "0.0.0.0";
        int server_port = 0;  // 8000 + node_id when 0 and node_id is numeric
        std::string master_url = "http://master:5000";
        std::string data_dir = "/data";
        int heartbeat_interval_seconds = 10;
        long request_timeout_ms = 5000;
        std::size_t metrics_capacity = 1000;
        int register_attempts = 5;
        int register_retry_seconds = 2;
        std::string log_file;
        std::string log_level = "info";
    };

    // Reads the datanode configuration; NODE_ID and MASTER_URL from the
    // environment override the file. Throws std::runtime_error on failure.
    DatanodeConfig load_datanode_config(const std::string &config_path);

    // Fills server_port and node_url when the configuration leaves them unset.
    // The derived port is 8000 + node_id; throws std::runtime_error when
    // node_id is not all digits or the port would exceed 65535.
    void derive_defaults(DatanodeConfig &cfg);
}
