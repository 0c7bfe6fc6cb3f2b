#pragma once

#include "../transfer/transfer_engine.hpp"

namespace chunk_transport
{
    // Moves chunk bytes with PUT/GET {node_url}/chunk/{chunk_id}.
    class HttpChunkTransport : public transfer::ChunkTransport
    {
    public:
        explicit HttpChunkTransport(long timeout_ms);

        errors::Status storeChunk(const schema::ChunkInfo &chunk, const std::string &bytes) override;
        errors::Result<std::string> retrieveChunk(const schema::ChunkInfo &chunk) override;

    private:
        long timeout_ms_;
    };
}
