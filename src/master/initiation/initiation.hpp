#pragma once

#include <cstdint>
#include <string>

namespace Initiation
{
    struct MasterConfig
    {
        std::string server_ip = "0.0.0.0";
        int server_port = 5000;
        std::string data_dir = "/data";
        std::string checkpoint_file = "metadata.json";
        std::uint64_t chunk_size = 4 * 1024 * 1024;
        std::uint64_t max_chunks_per_file = 1ULL << 20;
        double heartbeat_timeout_seconds = 30.0;
        std::string log_file;
        std::string log_level = "info";

        std::string checkpointPath() const;
    };

    // Reads the master configuration file; throws std::runtime_error when the
    // file is missing, unparsable or holds an invalid value.
    MasterConfig load_master_config(const std::string &config_path);
}
