#include "chunk_store.hpp"
#include "../../common/logger/Mylogger.h"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

namespace chunk_store
{
    using errors::ErrorCode;

    ChunkStore::ChunkStore(fs::path data_dir)
        : data_dir_(std::move(data_dir))
    {
        std::error_code ec;
        fs::create_directories(data_dir_, ec);
        if (ec)
        {
            MyLogger::error("Error creating data directory '" + data_dir_.string() + "': " + ec.message());
            throw std::runtime_error("Cannot create data directory " + data_dir_.string());
        }
    }

    bool ChunkStore::validChunkId(const std::string &chunk_id)
    {
        // Leading dots are reserved for staging files.
        if (chunk_id.empty() || chunk_id.front() == '.')
            return false;
        if (chunk_id.find('/') != std::string::npos || chunk_id.find('\\') != std::string::npos)
            return false;
        if (chunk_id.find("..") != std::string::npos)
            return false;
        return chunk_id.find('\0') == std::string::npos;
    }

    errors::Status ChunkStore::put(const std::string &chunk_id, const std::string &bytes)
    {
        if (!validChunkId(chunk_id))
            return errors::Status::fail(ErrorCode::InvalidArgument, "Invalid chunk_id");

        fs::path target = data_dir_ / chunk_id;
        fs::path staging = data_dir_ / ("." + chunk_id + ".tmp" + std::to_string(staging_seq_.fetch_add(1)));
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
                return errors::Status::fail(ErrorCode::Internal, "Cannot open " + staging.string());
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!out)
            {
                std::error_code ec;
                fs::remove(staging, ec);
                return errors::Status::fail(ErrorCode::Internal, "Failed writing " + staging.string());
            }
        }

        std::error_code ec;
        fs::rename(staging, target, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(staging, ignored);
            return errors::Status::fail(ErrorCode::Internal, "Failed to commit chunk " + chunk_id + ": " + ec.message());
        }
        return errors::Status::ok();
    }

    errors::Result<std::string> ChunkStore::get(const std::string &chunk_id) const
    {
        if (!validChunkId(chunk_id))
            return errors::Result<std::string>::fail(ErrorCode::InvalidArgument, "Invalid chunk_id");

        fs::path target = data_dir_ / chunk_id;
        std::ifstream in(target, std::ios::binary);
        if (!in.is_open())
            return errors::Result<std::string>::fail(ErrorCode::NotFound, "Chunk not found");

        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            return errors::Result<std::string>::fail(ErrorCode::Internal, "Failed reading chunk " + chunk_id);
        return errors::Result<std::string>::ok(std::move(content));
    }

    bool ChunkStore::contains(const std::string &chunk_id) const
    {
        std::error_code ec;
        return validChunkId(chunk_id) && fs::is_regular_file(data_dir_ / chunk_id, ec);
    }

} // namespace chunk_store
