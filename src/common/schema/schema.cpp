#include "schema.hpp"

namespace schema
{
    using errors::ErrorCode;

    namespace
    {
        // Parses a body that must be a JSON object. Sets err on failure.
        bool parse_object(const std::string &body, json &out, std::string &err)
        {
            out = json::parse(body, nullptr, false);
            if (out.is_discarded())
            {
                err = "Malformed JSON body";
                return false;
            }
            if (!out.is_object())
            {
                err = "Request body must be a JSON object";
                return false;
            }
            return true;
        }

        bool require_string(const json &j, const char *key, std::string &out, std::string &err)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                err = std::string("Missing ") + key;
                return false;
            }
            if (!it->is_string() || it->get<std::string>().empty())
            {
                err = std::string("Field '") + key + "' must be a non-empty string";
                return false;
            }
            out = it->get<std::string>();
            return true;
        }

        bool require_u64(const json &j, const char *key, std::uint64_t &out, std::string &err)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                err = std::string("Missing ") + key;
                return false;
            }
            if (!it->is_number_unsigned())
            {
                err = std::string("Field '") + key + "' must be a non-negative integer";
                return false;
            }
            out = it->get<std::uint64_t>();
            return true;
        }

        bool require_number(const json &j, const char *key, double &out, std::string &err)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                err = std::string("Missing ") + key;
                return false;
            }
            if (!it->is_number() || it->get<double>() < 0.0)
            {
                err = std::string("Field '") + key + "' must be a non-negative number";
                return false;
            }
            out = it->get<double>();
            return true;
        }
    } // namespace

    void to_json(json &j, const ChunkInfo &c)
    {
        j = json{{"chunk_id", c.chunk_id},
                 {"node_id", c.node_id},
                 {"node_url", c.node_url},
                 {"start", c.start},
                 {"size", c.size}};
    }

    void from_json(const json &j, ChunkInfo &c)
    {
        j.at("chunk_id").get_to(c.chunk_id);
        j.at("node_id").get_to(c.node_id);
        j.at("node_url").get_to(c.node_url);
        j.at("start").get_to(c.start);
        j.at("size").get_to(c.size);
    }

    void to_json(json &j, const NodeInfo &n)
    {
        j = json{{"url", n.url},
                 {"registered_at", n.registered_at},
                 {"last_heartbeat", n.last_heartbeat}};
    }

    void to_json(json &j, const MetricSample &m)
    {
        j = json{{"chunk_id", m.chunk_id},
                 {"size", m.size},
                 {"duration_ms", m.duration_ms},
                 {"throughput", m.throughput},
                 {"timestamp", m.timestamp}};
    }

    void from_json(const json &j, MetricSample &m)
    {
        j.at("chunk_id").get_to(m.chunk_id);
        j.at("size").get_to(m.size);
        j.at("duration_ms").get_to(m.duration_ms);
        j.at("throughput").get_to(m.throughput);
        j.at("timestamp").get_to(m.timestamp);
    }

    errors::Result<RegisterRequest> parseRegisterRequest(const std::string &body)
    {
        json j;
        std::string err;
        RegisterRequest req;
        if (!parse_object(body, j, err) ||
            !require_string(j, "node_id", req.node_id, err) ||
            !require_string(j, "node_url", req.node_url, err))
        {
            return errors::Result<RegisterRequest>::fail(ErrorCode::InvalidArgument, err);
        }
        return errors::Result<RegisterRequest>::ok(req);
    }

    errors::Result<HeartbeatRequest> parseHeartbeatRequest(const std::string &body)
    {
        json j;
        std::string err;
        HeartbeatRequest req;
        if (!parse_object(body, j, err) || !require_string(j, "node_id", req.node_id, err))
            return errors::Result<HeartbeatRequest>::fail(ErrorCode::InvalidArgument, err);
        return errors::Result<HeartbeatRequest>::ok(req);
    }

    errors::Result<CreateFileRequest> parseCreateFileRequest(const std::string &body)
    {
        json j;
        std::string err;
        CreateFileRequest req;
        if (!parse_object(body, j, err) ||
            !require_string(j, "filename", req.filename, err) ||
            !require_u64(j, "filesize", req.filesize, err))
        {
            return errors::Result<CreateFileRequest>::fail(ErrorCode::InvalidArgument, err);
        }
        return errors::Result<CreateFileRequest>::ok(req);
    }

    errors::Result<StatsRequest> parseStatsRequest(const std::string &body)
    {
        json j;
        std::string err;
        StatsRequest req;
        if (!parse_object(body, j, err) ||
            !require_string(j, "node_id", req.node_id, err) ||
            !require_string(j, "operation", req.operation, err) ||
            !require_number(j, "bytes", req.bytes, err) ||
            !require_number(j, "duration_ms", req.duration_ms, err))
        {
            return errors::Result<StatsRequest>::fail(ErrorCode::InvalidArgument, err);
        }
        return errors::Result<StatsRequest>::ok(req);
    }

    json toJson(const RegisterRequest &r)
    {
        return json{{"node_id", r.node_id}, {"node_url", r.node_url}};
    }

    json toJson(const HeartbeatRequest &r)
    {
        return json{{"node_id", r.node_id}};
    }

    json toJson(const CreateFileRequest &r)
    {
        return json{{"filename", r.filename}, {"filesize", r.filesize}};
    }

    json toJson(const StatsRequest &r)
    {
        return json{{"node_id", r.node_id},
                    {"operation", r.operation},
                    {"bytes", r.bytes},
                    {"duration_ms", r.duration_ms}};
    }

    json toJson(const RegisterResponse &r)
    {
        return json{{"status", r.status}, {"chunk_size", r.chunk_size}};
    }

    json toJson(const StoreChunkResponse &r)
    {
        return json{{"status", r.status},
                    {"chunk_id", r.chunk_id},
                    {"size", r.size},
                    {"node_id", r.node_id}};
    }

    json createFileResponse(const FileRecord &record, std::uint64_t chunk_size)
    {
        return json{{"file_id", record.file_id},
                    {"chunks", record.chunks},
                    {"chunk_size", chunk_size},
                    {"size", record.size},
                    {"created_at", record.created_at}};
    }

    json fileRecordToJson(const FileRecord &record)
    {
        return json{{"file_id", record.file_id},
                    {"size", record.size},
                    {"created_at", record.created_at},
                    {"chunks", record.chunks}};
    }

    json fileListingToJson(const std::vector<FileSummary> &files)
    {
        json out = json::object();
        for (const auto &f : files)
            out[f.filename] = json{{"size", f.size}, {"created_at", f.created_at}};
        return out;
    }

    json nodeListingToJson(const std::vector<NodeStatus> &nodes)
    {
        json out = json::object();
        for (const auto &n : nodes)
        {
            json entry = n.node;
            entry["alive"] = n.alive;
            out[n.node.node_id] = entry;
        }
        return out;
    }

    errors::Result<FileRecord> parseFileRecord(const std::string &filename, const std::string &body)
    {
        json j;
        std::string err;
        if (!parse_object(body, j, err))
            return errors::Result<FileRecord>::fail(ErrorCode::Internal, err);
        try
        {
            FileRecord record;
            record.filename = filename;
            j.at("file_id").get_to(record.file_id);
            j.at("chunks").get_to(record.chunks);
            if (j.contains("size"))
            {
                j.at("size").get_to(record.size);
            }
            else
            {
                for (const auto &c : record.chunks)
                    record.size += c.size;
            }
            if (j.contains("created_at"))
                j.at("created_at").get_to(record.created_at);
            return errors::Result<FileRecord>::ok(record);
        }
        catch (const json::exception &e)
        {
            return errors::Result<FileRecord>::fail(ErrorCode::Internal,
                                                    std::string("Malformed file record: ") + e.what());
        }
    }

    errors::Result<std::vector<FileSummary>> parseFileListing(const std::string &body)
    {
        json j;
        std::string err;
        if (!parse_object(body, j, err))
            return errors::Result<std::vector<FileSummary>>::fail(ErrorCode::Internal, err);
        try
        {
            std::vector<FileSummary> files;
            for (const auto &item : j.items())
            {
                FileSummary f;
                f.filename = item.key();
                item.value().at("size").get_to(f.size);
                item.value().at("created_at").get_to(f.created_at);
                files.push_back(f);
            }
            return errors::Result<std::vector<FileSummary>>::ok(files);
        }
        catch (const json::exception &e)
        {
            return errors::Result<std::vector<FileSummary>>::fail(ErrorCode::Internal,
                                                                  std::string("Malformed file listing: ") + e.what());
        }
    }

    errors::Result<std::vector<NodeStatus>> parseNodeListing(const std::string &body)
    {
        json j;
        std::string err;
        if (!parse_object(body, j, err))
            return errors::Result<std::vector<NodeStatus>>::fail(ErrorCode::Internal, err);
        try
        {
            std::vector<NodeStatus> nodes;
            for (const auto &item : j.items())
            {
                NodeStatus s;
                s.node.node_id = item.key();
                item.value().at("url").get_to(s.node.url);
                item.value().at("registered_at").get_to(s.node.registered_at);
                item.value().at("last_heartbeat").get_to(s.node.last_heartbeat);
                item.value().at("alive").get_to(s.alive);
                nodes.push_back(s);
            }
            return errors::Result<std::vector<NodeStatus>>::ok(nodes);
        }
        catch (const json::exception &e)
        {
            return errors::Result<std::vector<NodeStatus>>::fail(ErrorCode::Internal,
                                                                 std::string("Malformed node listing: ") + e.what());
        }
    }

    errors::Result<RegisterResponse> parseRegisterResponse(const std::string &body)
    {
        json j;
        std::string err;
        RegisterResponse r;
        if (!parse_object(body, j, err) ||
            !require_string(j, "status", r.status, err) ||
            !require_u64(j, "chunk_size", r.chunk_size, err))
        {
            return errors::Result<RegisterResponse>::fail(ErrorCode::Internal, err);
        }
        return errors::Result<RegisterResponse>::ok(r);
    }

    errors::Result<StoreChunkResponse> parseStoreChunkResponse(const std::string &body)
    {
        json j;
        std::string err;
        StoreChunkResponse r;
        if (!parse_object(body, j, err) ||
            !require_string(j, "status", r.status, err) ||
            !require_string(j, "chunk_id", r.chunk_id, err) ||
            !require_u64(j, "size", r.size, err) ||
            !require_string(j, "node_id", r.node_id, err))
        {
            return errors::Result<StoreChunkResponse>::fail(ErrorCode::Internal, err);
        }
        return errors::Result<StoreChunkResponse>::ok(r);
    }

    std::string errorBody(const std::string &message)
    {
        return json{{"error", message}}.dump();
    }

    std::string errorMessage(const std::string &body)
    {
        json j = json::parse(body, nullptr, false);
        if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_string())
            return j["error"].get<std::string>();
        return body;
    }

} // namespace schema
