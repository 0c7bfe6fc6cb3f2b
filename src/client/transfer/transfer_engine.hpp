#pragma once

#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transfer
{
    // Where chunk plans come from (the coordination service in production).
    class PlanSource
    {
    public:
        virtual ~PlanSource() = default;
        virtual errors::Result<schema::FileRecord> createFile(const std::string &filename, std::uint64_t filesize) = 0;
        virtual errors::Result<schema::FileRecord> getFile(const std::string &filename) = 0;
    };

    // Moves one chunk's bytes to or from the node named in its plan entry.
    // Implementations are called concurrently from pool workers.
    class ChunkTransport
    {
    public:
        virtual ~ChunkTransport() = default;
        virtual errors::Status storeChunk(const schema::ChunkInfo &chunk, const std::string &bytes) = 0;
        virtual errors::Result<std::string> retrieveChunk(const schema::ChunkInfo &chunk) = 0;
    };

    struct TransferOptions
    {
        std::size_t workers = 5;
        int max_attempts = 2;
    };

    struct ChunkOutcome
    {
        std::string chunk_id;
        std::string node_id;
        std::uint64_t start = 0;
        std::uint64_t size = 0;
        bool success = false;
        int attempts = 0;
        errors::ErrorCode code = errors::ErrorCode::None;
        std::string err;
    };

    struct TransferReport
    {
        bool success = false;
        std::string filename;
        std::string file_id;
        std::uint64_t bytes = 0;
        double seconds = 0.0;
        double throughput_mbps = 0.0;
        errors::ErrorCode code = errors::ErrorCode::None;
        std::string err;
        std::vector<ChunkOutcome> chunks; // plan order

        std::size_t failedChunks() const;
    };

    // Client-side split/join engine. Uploads read each plan entry's byte
    // range from the local file and push it to its node; downloads pull every
    // chunk and reassemble them by offset. All disk and network I/O runs on a
    // bounded Boost.Asio pool; the calling thread only waits.
    //
    // Downloads are all-or-nothing: once a chunk fails for good, the queued
    // retrievals are cancelled and the output path is left untouched.
    class TransferEngine
    {
    public:
        TransferEngine(PlanSource &plans, ChunkTransport &transport, TransferOptions options = {});

        TransferReport upload(const std::string &local_path, const std::string &remote_name);
        TransferReport download(const std::string &remote_name, const std::string &output_path);

    private:
        PlanSource &plans_;
        ChunkTransport &transport_;
        TransferOptions options_;
    };

    // A retrieved chunk tagged with the offset it belongs at.
    struct RetrievedChunk
    {
        std::uint64_t start = 0;
        std::string data;
    };

    // Checks that a plan's chunks are contiguous from offset 0 and add up to
    // the file size.
    errors::Status validatePlan(const std::vector<schema::ChunkInfo> &chunks, std::uint64_t total_size);

    // Orders chunks by start offset and checks that they tile [0, total_size)
    // exactly. Fails with Internal on a gap, overlap or size mismatch.
    errors::Status orderForReassembly(std::vector<RetrievedChunk> &chunks, std::uint64_t total_size);

} // namespace transfer
