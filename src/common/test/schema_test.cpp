#include <catch2/catch.hpp>

#include "common/schema/schema.hpp"

using errors::ErrorCode;

TEST_CASE("Create-file requests are validated field by field")
{
    auto ok = schema::parseCreateFileRequest(R"({"filename": "a.bin", "filesize": 10000})");
    REQUIRE(ok.success);
    REQUIRE(ok.value.filename == "a.bin");
    REQUIRE(ok.value.filesize == 10000);

    auto zero = schema::parseCreateFileRequest(R"({"filename": "empty", "filesize": 0})");
    REQUIRE(zero.success);
    REQUIRE(zero.value.filesize == 0);

    auto missing = schema::parseCreateFileRequest(R"({"filesize": 1})");
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.code == ErrorCode::InvalidArgument);
    REQUIRE(missing.err == "Missing filename");

    auto negative = schema::parseCreateFileRequest(R"({"filename": "a", "filesize": -1})");
    REQUIRE_FALSE(negative.success);
    REQUIRE(negative.code == ErrorCode::InvalidArgument);

    auto text = schema::parseCreateFileRequest(R"({"filename": "a", "filesize": "12"})");
    REQUIRE_FALSE(text.success);

    auto garbage = schema::parseCreateFileRequest("not json");
    REQUIRE_FALSE(garbage.success);
    REQUIRE(garbage.err == "Malformed JSON body");

    auto array = schema::parseCreateFileRequest("[1, 2]");
    REQUIRE_FALSE(array.success);
}

TEST_CASE("Register and heartbeat requests need non-empty strings")
{
    REQUIRE(schema::parseRegisterRequest(R"({"node_id": "1", "node_url": "http://d1:8001"})").success);
    REQUIRE_FALSE(schema::parseRegisterRequest(R"({"node_id": "1"})").success);
    REQUIRE_FALSE(schema::parseRegisterRequest(R"({"node_id": "", "node_url": "u"})").success);
    REQUIRE_FALSE(schema::parseRegisterRequest(R"({"node_id": 1, "node_url": "u"})").success);

    REQUIRE(schema::parseHeartbeatRequest(R"({"node_id": "7"})").success);
    REQUIRE_FALSE(schema::parseHeartbeatRequest("{}").success);
}

TEST_CASE("Stats requests accept a zero duration")
{
    auto req = schema::parseStatsRequest(
        R"({"node_id": "1", "operation": "write", "bytes": 4096, "duration_ms": 0})");
    REQUIRE(req.success);
    REQUIRE(req.value.bytes == Approx(4096.0));
    REQUIRE(req.value.duration_ms == Approx(0.0));

    REQUIRE_FALSE(schema::parseStatsRequest(
                      R"({"node_id": "1", "operation": "write", "bytes": -5, "duration_ms": 1})")
                      .success);
}

TEST_CASE("Node listings keep registration order")
{
    std::vector<schema::NodeStatus> nodes;
    nodes.push_back({{"B", "http://b:8002", 1.0, 2.0}, true});
    nodes.push_back({{"A", "http://a:8001", 3.0, 4.0}, false});

    auto j = schema::nodeListingToJson(nodes);
    REQUIRE(j.begin().key() == "B");
    REQUIRE(j["A"]["alive"].get<bool>() == false);
    REQUIRE(j["B"]["url"].get<std::string>() == "http://b:8002");

    auto parsed = schema::parseNodeListing(j.dump());
    REQUIRE(parsed.success);
    REQUIRE(parsed.value.size() == 2);
    REQUIRE(parsed.value[0].node.node_id == "B");
    REQUIRE(parsed.value[1].alive == false);
}

TEST_CASE("File records without a size field sum their chunks")
{
    auto record = schema::parseFileRecord("f", R"({"file_id": "17", "chunks": [
        {"chunk_id": "17_0", "node_id": "A", "node_url": "u", "start": 0, "size": 10},
        {"chunk_id": "17_1", "node_id": "B", "node_url": "v", "start": 10, "size": 5}]})");
    REQUIRE(record.success);
    REQUIRE(record.value.filename == "f");
    REQUIRE(record.value.size == 15);
    REQUIRE(record.value.chunks[1].node_id == "B");

    auto broken = schema::parseFileRecord("f", R"({"file_id": "17"})");
    REQUIRE_FALSE(broken.success);
    REQUIRE(broken.code == ErrorCode::Internal);
}

TEST_CASE("Create-file responses carry the plan and chunk size")
{
    schema::FileRecord record;
    record.file_id = "100";
    record.filename = "x";
    record.size = 3;
    record.chunks.push_back({"100_0", "A", "http://a", 0, 3});

    auto j = schema::createFileResponse(record, 4096);
    REQUIRE(j["file_id"].get<std::string>() == "100");
    REQUIRE(j["chunk_size"].get<std::uint64_t>() == 4096);
    REQUIRE(j["chunks"].size() == 1);
    REQUIRE(j["chunks"][0]["node_url"].get<std::string>() == "http://a");
}

TEST_CASE("Error bodies round through errorMessage")
{
    REQUIRE(schema::errorMessage(schema::errorBody("File not found")) == "File not found");
    REQUIRE(schema::errorMessage("plain text") == "plain text");
}
