#pragma once

#include "../../common/clock/clock.hpp"
#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"
#include "../node_registry/node_registry.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace metadata
{
    // ceil(filesize / chunk_size) without overflow; chunk_size must be non-zero.
    std::uint64_t chunkCount(std::uint64_t filesize, std::uint64_t chunk_size);

    // Round-robin chunk plan for a file of `filesize` bytes. Chunk i covers
    // [i * chunk_size, min((i + 1) * chunk_size, filesize)) and lands on
    // nodes[i % nodes.size()]. `nodes` must be non-empty unless filesize is 0.
    std::vector<schema::ChunkInfo> planChunks(const std::string &file_id,
                                              std::uint64_t filesize,
                                              std::uint64_t chunk_size,
                                              const std::vector<schema::NodeInfo> &nodes);

    // Owns filename -> file record mapping and the chunk-size policy.
    // Not synchronized; see Coordinator.
    class MetadataManager
    {
    public:
        static constexpr std::uint64_t kDefaultMaxChunks = 1ULL << 20;

        MetadataManager(std::uint64_t chunk_size,
                        dfs_clock::Clock clock = dfs_clock::wall_seconds,
                        std::uint64_t max_chunks = kDefaultMaxChunks);

        // Plans and commits a file record, replacing any previous record for
        // the same filename. Fails with NoNodesAvailable when the registry is
        // empty and with InvalidArgument when the file would need more than
        // max_chunks chunks; neither failure commits anything.
        errors::Result<schema::FileRecord> createFile(const std::string &filename,
                                                      std::uint64_t filesize,
                                                      const registry::NodeRegistry &nodes);

        errors::Result<schema::FileRecord> getFile(const std::string &filename) const;
        std::vector<schema::FileSummary> listFiles() const;

        std::uint64_t chunkSize() const { return chunk_size_; }
        const std::map<std::string, schema::FileRecord> &files() const { return files_; }

        void restore(std::uint64_t chunk_size, std::map<std::string, schema::FileRecord> files);

    private:
        std::string mintFileId();

        std::uint64_t chunk_size_;
        std::uint64_t max_chunks_;
        dfs_clock::Clock clock_;
        std::map<std::string, schema::FileRecord> files_;
        std::uint64_t last_file_id_ = 0;
    };

} // namespace metadata
