/*
    Coordination service: node registry, chunk placement and file metadata.

    usage: dfs_master [config/master_config.json]
*/

#include "./checkpoint/checkpoint_store.hpp"
#include "./coordinator/coordinator.hpp"
#include "./http_routes/http_routes.hpp"
#include "./initiation/initiation.hpp"
#include "../common/logger/Mylogger.h"

#include <httplib.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

std::atomic<bool> server_running(true);
httplib::Server *global_server = nullptr;

void shutdown_server(int)
{
    if (server_running.exchange(false) && global_server)
        global_server->stop();
}

int main(int argc, char *argv[])
{
    std::string config_path = argc > 1 ? argv[1] : "config/master_config.json";

    Initiation::MasterConfig cfg;
    try
    {
        cfg = Initiation::load_master_config(config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0] << " [master_config_path]" << std::endl;
        return 1;
    }
    MyLogger::init(cfg.log_file, cfg.log_level);

    checkpoint::CheckpointStore store(cfg.checkpointPath(), cfg.chunk_size);
    std::unique_ptr<coordinator::Coordinator> coord;
    try
    {
        coordinator::CoordinatorOptions options;
        options.heartbeat_timeout_seconds = cfg.heartbeat_timeout_seconds;
        options.max_chunks_per_file = cfg.max_chunks_per_file;
        coord = std::make_unique<coordinator::Coordinator>(store, options);
    }
    catch (const std::exception &e)
    {
        MyLogger::error(std::string("Failed to restore coordinator state: ") + e.what());
        return 1;
    }

    httplib::Server svr;
    global_server = &svr;
    signal(SIGINT, shutdown_server);
    signal(SIGTERM, shutdown_server);

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res)
                   { MyLogger::debug("Request: " + req.method + " " + req.path + " -> " + std::to_string(res.status)); });
    master_routes::register_routes(svr, *coord);

    MyLogger::info("Master started at IP: " + cfg.server_ip + " Port: " + std::to_string(cfg.server_port));
    if (!svr.listen(cfg.server_ip, cfg.server_port))
    {
        if (!server_running)
            return 0;
        MyLogger::error("Failed to start server. Check IP/port binding. Server IP: " + cfg.server_ip +
                        " | Server Port: " + std::to_string(cfg.server_port));
        return 1;
    }
    MyLogger::info("Master stopped");
    return 0;
}
