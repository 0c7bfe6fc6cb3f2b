#include "http_routes.hpp"
#include "../../common/logger/Mylogger.h"

namespace datanode_routes
{
    namespace
    {
        const char *kJson = "application/json";

        void store_chunk(chunk_service::ChunkService &service, const httplib::Request &req, httplib::Response &res)
        {
            std::string chunk_id = req.matches[1];
            try
            {
                auto stored = service.storeChunk(chunk_id, req.body);
                if (!stored.success)
                {
                    res.status = errors::http_status(stored.code);
                    res.set_content(schema::errorBody(stored.err), kJson);
                    return;
                }
                res.status = 200;
                res.set_content(schema::toJson(stored.value).dump(), kJson);
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Exception in store_chunk for " + chunk_id + ": " + e.what());
                res.status = 500;
                res.set_content(R"({"error": "Internal server error"})", kJson);
            }
        }

        void retrieve_chunk(chunk_service::ChunkService &service, const httplib::Request &req, httplib::Response &res)
        {
            std::string chunk_id = req.matches[1];
            try
            {
                auto data = service.retrieveChunk(chunk_id);
                if (!data.success)
                {
                    res.status = errors::http_status(data.code);
                    res.set_content(schema::errorBody(data.err), kJson);
                    return;
                }
                res.status = 200;
                res.set_content(std::move(data.value), "application/octet-stream");
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Exception in retrieve_chunk for " + chunk_id + ": " + e.what());
                res.status = 500;
                res.set_content(R"({"error": "Internal server error"})", kJson);
            }
        }
    } // namespace

    void register_routes(httplib::Server &svr, chunk_service::ChunkService &service)
    {
        svr.Put(R"(/chunk/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res)
                { store_chunk(service, req, res); });
        svr.Get(R"(/chunk/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res)
                { retrieve_chunk(service, req, res); });
        svr.Get("/metrics", [&service](const httplib::Request &, httplib::Response &res)
                { res.set_content(service.metrics().dump(), kJson); });
    }

} // namespace datanode_routes
