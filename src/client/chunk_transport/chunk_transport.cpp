#include "chunk_transport.hpp"
#include "../../common/http_util/http_util.hpp"

namespace chunk_transport
{
    using errors::ErrorCode;

    namespace
    {
        std::string chunk_url(const schema::ChunkInfo &chunk)
        {
            return http_util::trim_base(chunk.node_url) + "/chunk/" + http_util::escape(chunk.chunk_id);
        }

        std::string describe(const schema::ChunkInfo &chunk)
        {
            return "node " + chunk.node_id + " (" + chunk.node_url + ")";
        }
    } // namespace

    HttpChunkTransport::HttpChunkTransport(long timeout_ms) : timeout_ms_(timeout_ms) {}

    errors::Status HttpChunkTransport::storeChunk(const schema::ChunkInfo &chunk, const std::string &bytes)
    {
        auto resp = http_util::putBytes(chunk_url(chunk), bytes, timeout_ms_);
        if (!resp.success)
            return errors::Status::fail(ErrorCode::Transport, describe(chunk) + " unreachable: " + resp.err);
        if (resp.status != 200)
            return errors::Status::fail(errors::from_http_status(resp.status),
                                        describe(chunk) + " refused chunk: " + schema::errorMessage(resp.body));

        auto ack = schema::parseStoreChunkResponse(resp.body);
        if (!ack.success)
            return ack.status();
        if (ack.value.chunk_id != chunk.chunk_id || ack.value.size != bytes.size())
            return errors::Status::fail(ErrorCode::Internal,
                                        describe(chunk) + " acknowledged " + ack.value.chunk_id + " with " +
                                            std::to_string(ack.value.size) + " bytes");
        return errors::Status::ok();
    }

    errors::Result<std::string> HttpChunkTransport::retrieveChunk(const schema::ChunkInfo &chunk)
    {
        auto resp = http_util::get(chunk_url(chunk), timeout_ms_);
        if (!resp.success)
            return errors::Result<std::string>::fail(ErrorCode::Transport, describe(chunk) + " unreachable: " + resp.err);
        if (resp.status != 200)
            return errors::Result<std::string>::fail(errors::from_http_status(resp.status),
                                                     "Chunk " + chunk.chunk_id + " on " + describe(chunk) + ": " +
                                                         schema::errorMessage(resp.body));
        return errors::Result<std::string>::ok(std::move(resp.body));
    }
}
