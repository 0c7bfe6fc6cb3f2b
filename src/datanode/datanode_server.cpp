/*
    Storage node: keeps chunk bytes on local disk, registers with the master
    and heartbeats in the background.

    usage: dfs_datanode [config/datanode_config.json]
*/

#include "./chunk_service/chunk_service.hpp"
#include "./chunk_store/chunk_store.hpp"
#include "./http_routes/http_routes.hpp"
#include "./initiation/initiation.hpp"
#include "./master_link/master_link.hpp"
#include "./metrics/metrics_buffer.hpp"
#include "../common/http_util/http_util.hpp"
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
    std::string config_path = argc > 1 ? argv[1] : "config/datanode_config.json";

    Initiation::DatanodeConfig cfg;
    try
    {
        cfg = Initiation::load_datanode_config(config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0] << " [datanode_config_path]" << std::endl;
        return 1;
    }
    MyLogger::init(cfg.log_file, cfg.log_level);
    try
    {
        http_util::global_init();
    }
    catch (const std::exception &e)
    {
        MyLogger::error(e.what());
        return 1;
    }

    std::unique_ptr<chunk_store::ChunkStore> store;
    try
    {
        store = std::make_unique<chunk_store::ChunkStore>(cfg.data_dir);
    }
    catch (const std::exception &e)
    {
        MyLogger::error(e.what());
        return 1;
    }

    master_link::MasterLinkOptions link_options;
    link_options.master_url = cfg.master_url;
    link_options.node_id = cfg.node_id;
    link_options.node_url = cfg.node_url;
    link_options.heartbeat_interval = std::chrono::seconds(cfg.heartbeat_interval_seconds);
    link_options.request_timeout_ms = cfg.request_timeout_ms;
    master_link::MasterLink link(link_options);

    auto registered = link.registerWithRetry(cfg.register_attempts, std::chrono::seconds(cfg.register_retry_seconds));
    if (!registered.success)
    {
        MyLogger::error("Failed to register with master. Exiting.");
        return 1;
    }

    node_metrics::MetricsBuffer metrics(cfg.metrics_capacity);
    chunk_service::ChunkService service(cfg.node_id, *store, metrics, link);

    httplib::Server svr;
    global_server = &svr;
    signal(SIGINT, shutdown_server);
    signal(SIGTERM, shutdown_server);

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res)
                   { MyLogger::debug("Request: " + req.method + " " + req.path + " -> " + std::to_string(res.status)); });
    datanode_routes::register_routes(svr, service);

    link.startHeartbeat();

    MyLogger::info("Datanode " + cfg.node_id + " serving at IP: " + cfg.server_ip +
                   " Port: " + std::to_string(cfg.server_port));
    bool listened = svr.listen(cfg.server_ip, cfg.server_port);
    link.stopHeartbeat();
    if (!listened && server_running)
    {
        MyLogger::error("Failed to start server. Check IP/port binding. Server IP: " + cfg.server_ip +
                        " | Server Port: " + std::to_string(cfg.server_port));
        return 1;
    }
    MyLogger::info("Datanode stopped");
    http_util::global_cleanup();
    return 0;
}
