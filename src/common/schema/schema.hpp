#pragma once

#include "../errors/errors.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Typed request/response bodies for every HTTP endpoint, plus the records
// persisted in the checkpoint. Object keys keep insertion order so node
// listings and snapshots preserve registry order.
namespace schema
{
    using json = nlohmann::ordered_json;

    struct ChunkInfo
    {
        std::string chunk_id;
        std::string node_id;
        std::string node_url;
        std::uint64_t start = 0;
        std::uint64_t size = 0;
    };

    struct FileRecord
    {
        std::string file_id;
        std::string filename;
        std::uint64_t size = 0;
        double created_at = 0.0;
        std::vector<ChunkInfo> chunks;
    };

    struct FileSummary
    {
        std::string filename;
        std::uint64_t size = 0;
        double created_at = 0.0;
    };

    struct NodeInfo
    {
        std::string node_id;
        std::string url;
        double registered_at = 0.0;
        double last_heartbeat = 0.0;
    };

    struct NodeStatus
    {
        NodeInfo node;
        bool alive = false;
    };

    struct RegisterRequest
    {
        std::string node_id;
        std::string node_url;
    };

    struct RegisterResponse
    {
        std::string status;
        std::uint64_t chunk_size = 0;
    };

    struct HeartbeatRequest
    {
        std::string node_id;
    };

    struct CreateFileRequest
    {
        std::string filename;
        std::uint64_t filesize = 0;
    };

    struct StatsRequest
    {
        std::string node_id;
        std::string operation;
        double bytes = 0.0;
        double duration_ms = 0.0;
    };

    struct StoreChunkResponse
    {
        std::string status;
        std::string chunk_id;
        std::uint64_t size = 0;
        std::string node_id;
    };

    struct MetricSample
    {
        std::string chunk_id;
        std::uint64_t size = 0;
        double duration_ms = 0.0;
        double throughput = 0.0;
        double timestamp = 0.0;
    };

    void to_json(json &j, const ChunkInfo &c);
    void from_json(const json &j, ChunkInfo &c);
    void to_json(json &j, const NodeInfo &n);
    void to_json(json &j, const MetricSample &m);
    void from_json(const json &j, MetricSample &m);

    // Request parsing. Malformed JSON, missing fields and wrong field types all
    // yield InvalidArgument with a message naming the offending field.
    errors::Result<RegisterRequest> parseRegisterRequest(const std::string &body);
    errors::Result<HeartbeatRequest> parseHeartbeatRequest(const std::string &body);
    errors::Result<CreateFileRequest> parseCreateFileRequest(const std::string &body);
    errors::Result<StatsRequest> parseStatsRequest(const std::string &body);

    json toJson(const RegisterRequest &r);
    json toJson(const HeartbeatRequest &r);
    json toJson(const CreateFileRequest &r);
    json toJson(const StatsRequest &r);
    json toJson(const RegisterResponse &r);
    json toJson(const StoreChunkResponse &r);

    // POST /file response: {file_id, chunks, chunk_size, size, created_at}
    json createFileResponse(const FileRecord &record, std::uint64_t chunk_size);
    // GET /file/{filename} response: {file_id, size, created_at, chunks}
    json fileRecordToJson(const FileRecord &record);
    // GET /files response: {filename: {size, created_at}, ...}
    json fileListingToJson(const std::vector<FileSummary> &files);
    // GET /nodes response: {node_id: {url, registered_at, last_heartbeat, alive}, ...}
    json nodeListingToJson(const std::vector<NodeStatus> &nodes);

    // Response parsing on the client side.
    errors::Result<FileRecord> parseFileRecord(const std::string &filename, const std::string &body);
    errors::Result<std::vector<FileSummary>> parseFileListing(const std::string &body);
    errors::Result<std::vector<NodeStatus>> parseNodeListing(const std::string &body);
    errors::Result<RegisterResponse> parseRegisterResponse(const std::string &body);
    errors::Result<StoreChunkResponse> parseStoreChunkResponse(const std::string &body);

    std::string errorBody(const std::string &message);
    // Extracts "error" from an error body, or returns the raw body.
    std::string errorMessage(const std::string &body);

} // namespace schema
