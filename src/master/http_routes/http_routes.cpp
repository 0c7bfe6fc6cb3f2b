#include "http_routes.hpp"
#include "../../common/logger/Mylogger.h"

namespace master_routes
{
    namespace
    {
        const char *kJson = "application/json";

        void reply_error(httplib::Response &res, errors::ErrorCode code, const std::string &message)
        {
            res.status = errors::http_status(code);
            res.set_content(schema::errorBody(message), kJson);
        }

        void reply_internal(httplib::Response &res, const char *where, const std::exception &e)
        {
            MyLogger::error(std::string("Exception in ") + where + ": " + e.what());
            res.status = 500;
            res.set_content(R"({"error": "Internal server error"})", kJson);
        }

        void register_node(coordinator::Coordinator &coord, const httplib::Request &req, httplib::Response &res)
        {
            MyLogger::info("Received datanode registration request");
            try
            {
                auto parsed = schema::parseRegisterRequest(req.body);
                if (!parsed.success)
                {
                    MyLogger::warning("Registration rejected: " + parsed.err);
                    reply_error(res, parsed.code, parsed.err);
                    return;
                }

                auto result = coord.registerNode(parsed.value);
                if (!result.success)
                {
                    reply_error(res, result.code, result.err);
                    return;
                }
                res.status = 200;
                res.set_content(schema::toJson(result.value).dump(), kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "register_node", e);
            }
        }

        void heartbeat(coordinator::Coordinator &coord, const httplib::Request &req, httplib::Response &res)
        {
            try
            {
                auto parsed = schema::parseHeartbeatRequest(req.body);
                if (!parsed.success)
                {
                    MyLogger::warning("Heartbeat rejected: " + parsed.err);
                    reply_error(res, parsed.code, parsed.err);
                    return;
                }

                auto status = coord.heartbeat(parsed.value);
                if (!status.success)
                {
                    if (status.code == errors::ErrorCode::UnknownNode)
                        MyLogger::warning("Heartbeat from unknown node: " + parsed.value.node_id);
                    reply_error(res, status.code, status.err);
                    return;
                }
                res.status = 200;
                res.set_content(R"({"status": "alive"})", kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "heartbeat", e);
            }
        }

        void create_file(coordinator::Coordinator &coord, const httplib::Request &req, httplib::Response &res)
        {
            MyLogger::info("Received file creation request");
            try
            {
                auto parsed = schema::parseCreateFileRequest(req.body);
                if (!parsed.success)
                {
                    MyLogger::warning("File creation rejected: " + parsed.err);
                    reply_error(res, parsed.code, parsed.err);
                    return;
                }

                auto created = coord.createFile(parsed.value);
                if (!created.success)
                {
                    MyLogger::warning("File creation failed for " + parsed.value.filename + ": " + created.err);
                    reply_error(res, created.code, created.err);
                    return;
                }
                res.status = 200;
                res.set_content(schema::createFileResponse(created.value, coord.chunkSize()).dump(), kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "create_file", e);
            }
        }

        void get_file(coordinator::Coordinator &coord, const httplib::Request &req, httplib::Response &res)
        {
            try
            {
                std::string filename = req.matches[1];
                MyLogger::debug("File info request for " + filename);
                auto record = coord.getFile(filename);
                if (!record.success)
                {
                    reply_error(res, record.code, record.err);
                    return;
                }
                res.status = 200;
                res.set_content(schema::fileRecordToJson(record.value).dump(), kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "get_file", e);
            }
        }

        void list_files(coordinator::Coordinator &coord, httplib::Response &res)
        {
            try
            {
                res.status = 200;
                res.set_content(schema::fileListingToJson(coord.listFiles()).dump(), kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "list_files", e);
            }
        }

        void list_nodes(coordinator::Coordinator &coord, httplib::Response &res)
        {
            try
            {
                res.status = 200;
                res.set_content(schema::nodeListingToJson(coord.listNodes()).dump(), kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "list_nodes", e);
            }
        }

        void record_stats(coordinator::Coordinator &coord, const httplib::Request &req, httplib::Response &res)
        {
            try
            {
                auto parsed = schema::parseStatsRequest(req.body);
                if (!parsed.success)
                {
                    MyLogger::warning("Stats rejected: " + parsed.err);
                    reply_error(res, parsed.code, parsed.err);
                    return;
                }
                auto recorded = coord.recordStats(parsed.value);
                if (!recorded.success)
                {
                    reply_error(res, recorded.code, recorded.err);
                    return;
                }
                res.status = 200;
                res.set_content(R"({"status": "recorded"})", kJson);
            }
            catch (const std::exception &e)
            {
                reply_internal(res, "record_stats", e);
            }
        }
    } // namespace

    void register_routes(httplib::Server &svr, coordinator::Coordinator &coord)
    {
        svr.Post("/register", [&coord](const httplib::Request &req, httplib::Response &res)
                 { register_node(coord, req, res); });
        svr.Post("/heartbeat", [&coord](const httplib::Request &req, httplib::Response &res)
                 { heartbeat(coord, req, res); });
        svr.Post("/file", [&coord](const httplib::Request &req, httplib::Response &res)
                 { create_file(coord, req, res); });
        svr.Get(R"(/file/(.+))", [&coord](const httplib::Request &req, httplib::Response &res)
                { get_file(coord, req, res); });
        svr.Get("/files", [&coord](const httplib::Request &, httplib::Response &res)
                { list_files(coord, res); });
        svr.Get("/nodes", [&coord](const httplib::Request &, httplib::Response &res)
                { list_nodes(coord, res); });
        svr.Post("/stats", [&coord](const httplib::Request &req, httplib::Response &res)
                 { record_stats(coord, req, res); });
        svr.Get("/", [](const httplib::Request &, httplib::Response &res)
                { res.set_content(R"({"status": "ok"})", kJson); });
    }

} // namespace master_routes
