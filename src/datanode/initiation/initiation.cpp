#include "initiation.hpp"
#include "../../common/load_config/load_config.hpp"
#include "../../common/logger/Mylogger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace Initiation
{
    DatanodeConfig load_datanode_config(const std::string &config_path)
    {
        json config = json::object();
        if (std::filesystem::exists(config_path))
            config = ConfigReader::load(config_path);
        else
            MyLogger::warning("Config file " + config_path + " not found, using defaults and environment");

        DatanodeConfig cfg;
        cfg.node_id = ConfigReader::get_config_string("node_id", config, cfg.node_id);
        cfg.node_url = ConfigReader::get_config_string("node_url", config, cfg.node_url);
        cfg.server_ip = ConfigReader::get_config_string("server_ip", config, cfg.server_ip);
        cfg.server_port = ConfigReader::get_config_short("server_port", config, 0);
        cfg.master_url = ConfigReader::get_config_string("master_url", config, cfg.master_url);
        cfg.data_dir = ConfigReader::get_config_string("data_dir", config, cfg.data_dir);
        cfg.heartbeat_interval_seconds =
            ConfigReader::get_config_value("heartbeat_interval_seconds", config, cfg.heartbeat_interval_seconds);
        cfg.request_timeout_ms = ConfigReader::get_config_value("request_timeout_ms", config, static_cast<int>(cfg.request_timeout_ms));
        cfg.metrics_capacity = ConfigReader::get_config_u64("metrics_capacity", config, cfg.metrics_capacity);
        cfg.register_attempts = ConfigReader::get_config_value("register_attempts", config, cfg.register_attempts);
        cfg.register_retry_seconds = ConfigReader::get_config_value("register_retry_seconds", config, cfg.register_retry_seconds);
        cfg.log_file = ConfigReader::get_config_string("log_file", config, cfg.log_file);
        cfg.log_level = ConfigReader::get_config_string("log_level", config, cfg.log_level);

        cfg.node_id = ConfigReader::env_or("NODE_ID", cfg.node_id);
        cfg.master_url = ConfigReader::env_or("MASTER_URL", cfg.master_url);

        if (cfg.node_id.empty())
            throw std::runtime_error("node_id must be set");
        if (cfg.heartbeat_interval_seconds <= 0)
            throw std::runtime_error("heartbeat_interval_seconds must be positive");
        if (cfg.register_attempts <= 0)
            cfg.register_attempts = 1;

        derive_defaults(cfg);
        MyLogger::info("Datanode " + cfg.node_id + " configured at " + cfg.node_url + ", master " + cfg.master_url);
        return cfg;
    }

    void derive_defaults(DatanodeConfig &cfg)
    {
        if (cfg.server_port == 0)
        {
            const std::string &id = cfg.node_id;
            bool numeric = !id.empty() && id.size() <= 5 &&
                           std::all_of(id.begin(), id.end(), [](unsigned char c)
                                       { return std::isdigit(c) != 0; });
            if (!numeric)
                throw std::runtime_error("server_port must be set when node_id is not a plain number: " + id);
            int port = 8000 + std::stoi(id);
            if (port > 65535)
                throw std::runtime_error("node_id " + id + " gives port " + std::to_string(port) +
                                         ", outside 1..65535; set server_port");
            cfg.server_port = port;
        }
        if (cfg.node_url.empty())
            cfg.node_url = "http://datanode" + cfg.node_id + ":" + std::to_string(cfg.server_port);
    }
}
