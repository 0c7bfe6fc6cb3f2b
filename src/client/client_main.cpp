/*
    Command-line client: stores files across the datanodes and reads them back.

    usage: dfs_client [-c config.json] <command> [args]
*/

#include "chunk_transport/chunk_transport.hpp"
#include "initiation/initiation.hpp"
#include "master_api/master_api.hpp"
#include "transfer/transfer_engine.hpp"
#include "../common/http_util/http_util.hpp"
#include "../common/logger/Mylogger.h"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace
{
    std::string format_time(double epoch_seconds)
    {
        std::time_t t = static_cast<std::time_t>(epoch_seconds);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    double to_mb(std::uint64_t bytes)
    {
        return static_cast<double>(bytes) / (1024.0 * 1024.0);
    }

    void usage(const char *prog)
    {
        std::cerr << "Usage: " << prog << " [-c config.json] <command> [args]\n"
                  << "Commands:\n"
                  << "  upload <local_path> [--name remote_name]\n"
                  << "  download <remote_name> <output_path>\n"
                  << "  listfiles\n"
                  << "  info <remote_name>\n"
                  << "  nodes\n";
    }

    void print_report(const transfer::TransferReport &report)
    {
        std::cout << std::fixed << std::setprecision(2);
        if (report.success)
        {
            std::cout << report.filename << ": " << report.bytes << " bytes in " << report.seconds << " s ("
                      << report.throughput_mbps << " MB/s)\n";
            return;
        }
        std::cerr << report.filename << ": " << report.err << "\n";
        for (const auto &c : report.chunks)
        {
            if (!c.success && !c.err.empty())
                std::cerr << "  " << c.chunk_id << " on node " << c.node_id << ": " << c.err << "\n";
        }
    }

    int cmd_upload(transfer::TransferEngine &engine, const std::vector<std::string> &args)
    {
        if (args.empty())
            return 2;
        std::string local_path = args[0];
        std::string remote_name = std::filesystem::path(local_path).filename().string();
        for (std::size_t i = 1; i + 1 < args.size(); ++i)
        {
            if (args[i] == "--name")
                remote_name = args[i + 1];
        }
        auto report = engine.upload(local_path, remote_name);
        print_report(report);
        return report.success ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int cmd_download(transfer::TransferEngine &engine, const std::vector<std::string> &args)
    {
        if (args.size() < 2)
            return 2;
        auto report = engine.download(args[0], args[1]);
        print_report(report);
        return report.success ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int cmd_listfiles(master_api::MasterClient &master)
    {
        auto files = master.listFiles();
        if (!files.success)
        {
            std::cerr << "Error listing files: " << files.err << "\n";
            return EXIT_FAILURE;
        }
        if (files.value.empty())
        {
            std::cout << "No files stored\n";
            return EXIT_SUCCESS;
        }
        std::cout << std::fixed << std::setprecision(2);
        for (const auto &f : files.value)
            std::cout << std::left << std::setw(40) << f.filename << std::right << std::setw(10) << to_mb(f.size)
                      << " MB  " << format_time(f.created_at) << "\n";
        return EXIT_SUCCESS;
    }

    int cmd_info(master_api::MasterClient &master, const std::vector<std::string> &args)
    {
        if (args.empty())
            return 2;
        auto record = master.getFile(args[0]);
        if (!record.success)
        {
            std::cerr << "Error getting file info: " << record.err << "\n";
            return EXIT_FAILURE;
        }

        const auto &r = record.value;
        std::cout << "File: " << args[0] << "\n"
                  << "ID: " << r.file_id << "\n"
                  << "Size: " << std::fixed << std::setprecision(2) << to_mb(r.size) << " MB (" << r.size << " bytes)\n"
                  << "Created: " << format_time(r.created_at) << "\n"
                  << "Chunks: " << r.chunks.size() << "\n";

        std::map<std::string, std::size_t> per_node;
        for (const auto &c : r.chunks)
            ++per_node[c.node_id];
        std::cout << "Chunk distribution:\n";
        for (const auto &entry : per_node)
            std::cout << "  Node " << entry.first << ": " << entry.second << " chunks\n";
        return EXIT_SUCCESS;
    }

    int cmd_nodes(master_api::MasterClient &master)
    {
        auto nodes = master.listNodes();
        if (!nodes.success)
        {
            std::cerr << "Error listing nodes: " << nodes.err << "\n";
            return EXIT_FAILURE;
        }
        for (const auto &n : nodes.value)
            std::cout << "Node " << n.node.node_id << " " << n.node.url << (n.alive ? " alive" : " stale") << "\n";
        return EXIT_SUCCESS;
    }
}

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = "config/client_config.json";
    if (args.size() >= 2 && (args[0] == "-c" || args[0] == "--config"))
    {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty())
    {
        usage(argv[0]);
        return 2;
    }

    Initiation::ClientConfig cfg;
    try
    {
        cfg = Initiation::load_client_config(config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error loading config: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    MyLogger::init(cfg.log_file, cfg.log_level);

    const std::string command = args[0];
    args.erase(args.begin());

    try
    {
        http_util::global_init();
    }
    catch (const std::exception &e)
    {
        MyLogger::error(e.what());
        return EXIT_FAILURE;
    }
    master_api::MasterClient master(cfg.master_url, cfg.request_timeout_ms);
    chunk_transport::HttpChunkTransport transport(cfg.request_timeout_ms);
    transfer::TransferOptions options;
    options.workers = cfg.workers;
    options.max_attempts = cfg.max_attempts;
    transfer::TransferEngine engine(master, transport, options);

    int rc = 2;
    if (command == "upload")
        rc = cmd_upload(engine, args);
    else if (command == "download")
        rc = cmd_download(engine, args);
    else if (command == "listfiles")
        rc = cmd_listfiles(master);
    else if (command == "info")
        rc = cmd_info(master, args);
    else if (command == "nodes")
        rc = cmd_nodes(master);

    if (rc == 2)
        usage(argv[0]);
    http_util::global_cleanup();
    return rc;
}
