#pragma once

#include <cstddef>
#include <string>

namespace Initiation
{
    struct ClientConfig
    {
        std::string master_url = "http://master:5000";
        std::size_t workers = 5;
        int max_attempts = 2;
        long request_timeout_ms = 30000;
        std::string log_file;
        std::string log_level = "info";
    };

    // A missing config file is not an error; MASTER_URL overrides the file.
    ClientConfig load_client_config(const std::string &config_path);
}
