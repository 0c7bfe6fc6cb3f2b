#include "metadata_manager.hpp"
#include "../../common/logger/Mylogger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace metadata
{
    using errors::ErrorCode;

    std::uint64_t chunkCount(std::uint64_t filesize, std::uint64_t chunk_size)
    {
        return filesize / chunk_size + (filesize % chunk_size != 0 ? 1 : 0);
    }

    std::vector<schema::ChunkInfo> planChunks(const std::string &file_id,
                                              std::uint64_t filesize,
                                              std::uint64_t chunk_size,
                                              const std::vector<schema::NodeInfo> &nodes)
    {
        std::vector<schema::ChunkInfo> chunks;
        if (filesize == 0 || nodes.empty())
            return chunks;

        std::uint64_t num_chunks = chunkCount(filesize, chunk_size);
        chunks.reserve(num_chunks);
        for (std::uint64_t i = 0; i < num_chunks; ++i)
        {
            const auto &node = nodes[i % nodes.size()];
            schema::ChunkInfo chunk;
            chunk.chunk_id = file_id + "_" + std::to_string(i);
            chunk.node_id = node.node_id;
            chunk.node_url = node.url;
            chunk.start = i * chunk_size;
            chunk.size = std::min(chunk_size, filesize - chunk.start);
            chunks.push_back(chunk);
        }
        return chunks;
    }

    MetadataManager::MetadataManager(std::uint64_t chunk_size, dfs_clock::Clock clock, std::uint64_t max_chunks)
        : chunk_size_(chunk_size), max_chunks_(max_chunks), clock_(std::move(clock))
    {
        if (chunk_size_ == 0)
            throw std::invalid_argument("chunk_size must be positive");
        if (max_chunks_ == 0)
            throw std::invalid_argument("max_chunks must be positive");
    }

    errors::Result<schema::FileRecord> MetadataManager::createFile(const std::string &filename,
                                                                   std::uint64_t filesize,
                                                                   const registry::NodeRegistry &nodes)
    {
        if (filename.empty())
            return errors::Result<schema::FileRecord>::fail(ErrorCode::InvalidArgument, "Missing filename");
        if (nodes.empty())
            return errors::Result<schema::FileRecord>::fail(ErrorCode::NoNodesAvailable,
                                                            "No active datanodes available");
        if (chunkCount(filesize, chunk_size_) > max_chunks_)
            return errors::Result<schema::FileRecord>::fail(
                ErrorCode::InvalidArgument, "filesize " + std::to_string(filesize) + " needs more than " +
                                                std::to_string(max_chunks_) + " chunks");

        schema::FileRecord record;
        record.file_id = mintFileId();
        record.filename = filename;
        record.size = filesize;
        record.created_at = clock_();
        record.chunks = planChunks(record.file_id, filesize, chunk_size_, nodes.nodes());

        if (files_.count(filename) != 0)
            MyLogger::info("Replacing existing metadata for " + filename);
        files_[filename] = record;
        return errors::Result<schema::FileRecord>::ok(record);
    }

    errors::Result<schema::FileRecord> MetadataManager::getFile(const std::string &filename) const
    {
        auto it = files_.find(filename);
        if (it == files_.end())
            return errors::Result<schema::FileRecord>::fail(ErrorCode::NotFound, "File not found");
        return errors::Result<schema::FileRecord>::ok(it->second);
    }

    std::vector<schema::FileSummary> MetadataManager::listFiles() const
    {
        std::vector<schema::FileSummary> out;
        out.reserve(files_.size());
        for (const auto &[filename, record] : files_)
            out.push_back({filename, record.size, record.created_at});
        return out;
    }

    void MetadataManager::restore(std::uint64_t chunk_size, std::map<std::string, schema::FileRecord> files)
    {
        if (chunk_size == 0)
            throw std::invalid_argument("chunk_size must be positive");
        chunk_size_ = chunk_size;
        files_ = std::move(files);
        last_file_id_ = 0;
        for (auto &[filename, record] : files_)
        {
            record.filename = filename;
            try
            {
                last_file_id_ = std::max<std::uint64_t>(last_file_id_, std::stoull(record.file_id));
            }
            catch (const std::exception &)
            {
                MyLogger::warning("Non-numeric file_id in checkpoint for " + filename + ": " + record.file_id);
            }
        }
    }

    std::string MetadataManager::mintFileId()
    {
        auto millis = static_cast<std::uint64_t>(std::floor(clock_() * 1000.0));
        last_file_id_ = std::max(millis, last_file_id_ + 1);
        return std::to_string(last_file_id_);
    }

} // namespace metadata
