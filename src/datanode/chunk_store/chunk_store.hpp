#pragma once

#include "../../common/errors/errors.hpp"

#include <atomic>
#include <filesystem>
#include <string>

namespace chunk_store
{
    // Chunk bytes on local disk, one file per chunk id under the data
    // directory. Writes go through a unique staging file and are renamed into
    // place, so a reader sees either the previous or the new bytes.
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path data_dir);

        errors::Status put(const std::string &chunk_id, const std::string &bytes);
        errors::Result<std::string> get(const std::string &chunk_id) const;
        bool contains(const std::string &chunk_id) const;

        // Chunk ids name files directly, so separators and dot segments are
        // refused.
        static bool validChunkId(const std::string &chunk_id);

        const std::filesystem::path &dataDir() const { return data_dir_; }

    private:
        std::filesystem::path data_dir_;
        std::atomic<unsigned long> staging_seq_{0};
    };

} // namespace chunk_store
