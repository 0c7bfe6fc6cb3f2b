#include "initiation.hpp"
#include "../../common/load_config/load_config.hpp"
#include "../../common/logger/Mylogger.h"

#include <filesystem>
#include <stdexcept>

namespace Initiation
{
    std::string MasterConfig::checkpointPath() const
    {
        return (std::filesystem::path(data_dir) / checkpoint_file).string();
    }

    MasterConfig load_master_config(const std::string &config_path)
    {
        json config = ConfigReader::load(config_path);

        MasterConfig cfg;
        cfg.server_ip = ConfigReader::get_config_string("server_ip", config, cfg.server_ip);
        cfg.server_port = ConfigReader::get_config_short("server_port", config, static_cast<unsigned short>(cfg.server_port));
        cfg.data_dir = ConfigReader::get_config_string("data_dir", config, cfg.data_dir);
        cfg.checkpoint_file = ConfigReader::get_config_string("checkpoint_file", config, cfg.checkpoint_file);
        cfg.chunk_size = ConfigReader::get_config_u64("chunk_size", config, cfg.chunk_size);
        cfg.max_chunks_per_file = ConfigReader::get_config_u64("max_chunks_per_file", config, cfg.max_chunks_per_file);
        cfg.heartbeat_timeout_seconds =
            ConfigReader::get_config_double("heartbeat_timeout_seconds", config, cfg.heartbeat_timeout_seconds);
        cfg.log_file = ConfigReader::get_config_string("log_file", config, cfg.log_file);
        cfg.log_level = ConfigReader::get_config_string("log_level", config, cfg.log_level);

        if (cfg.chunk_size == 0)
            throw std::runtime_error("chunk_size must be positive");
        if (cfg.max_chunks_per_file == 0)
            throw std::runtime_error("max_chunks_per_file must be positive");
        if (cfg.server_port == 0)
            throw std::runtime_error("server_port must be set");

        MyLogger::info("Master configured: " + cfg.server_ip + ":" + std::to_string(cfg.server_port) +
                       " checkpoint=" + cfg.checkpointPath());
        return cfg;
    }
}
