#include "initiation.hpp"
#include "../../common/load_config/load_config.hpp"
#include "../../common/logger/Mylogger.h"

#include <filesystem>
#include <stdexcept>

namespace Initiation
{
    ClientConfig load_client_config(const std::string &config_path)
    {
        json config = json::object();
        if (!config_path.empty() && std::filesystem::exists(config_path))
            config = ConfigReader::load(config_path);

        ClientConfig cfg;
        cfg.master_url = ConfigReader::get_config_string("master_url", config, cfg.master_url);
        cfg.workers = ConfigReader::get_config_u64("workers", config, cfg.workers);
        cfg.max_attempts = ConfigReader::get_config_value("max_attempts", config, cfg.max_attempts);
        cfg.request_timeout_ms = ConfigReader::get_config_value("request_timeout_ms", config, static_cast<int>(cfg.request_timeout_ms));
        cfg.log_file = ConfigReader::get_config_string("log_file", config, cfg.log_file);
        cfg.log_level = ConfigReader::get_config_string("log_level", config, cfg.log_level);

        cfg.master_url = ConfigReader::env_or("MASTER_URL", cfg.master_url);

        if (cfg.workers == 0)
            throw std::runtime_error("workers must be positive");
        if (cfg.max_attempts <= 0)
            throw std::runtime_error("max_attempts must be positive");
        return cfg;
    }
}
