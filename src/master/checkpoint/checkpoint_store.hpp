#pragma once

#include "../../common/errors/errors.hpp"
#include "../../common/schema/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace checkpoint
{
    struct Snapshot
    {
        std::map<std::string, schema::FileRecord> files;
        std::vector<schema::NodeInfo> datanodes; // registry insertion order
        std::uint64_t chunk_size = 0;
    };

    schema::json snapshotToJson(const Snapshot &snapshot);
    // Throws nlohmann::json::exception on a structurally invalid document.
    Snapshot snapshotFromJson(const schema::json &j);

    // Whole-state checkpoint in a single JSON file. Every save writes a
    // staging file next to the canonical one, syncs it and renames it over
    // the canonical path, so readers see either the old or the new snapshot.
    class CheckpointStore
    {
    public:
        CheckpointStore(std::filesystem::path path, std::uint64_t default_chunk_size);

        // Returns the empty default snapshot when no checkpoint exists yet.
        // Throws std::runtime_error when the canonical file is unreadable.
        Snapshot load() const;

        errors::Status save(const Snapshot &snapshot);

        const std::filesystem::path &path() const { return path_; }
        std::filesystem::path stagingPath() const;

    private:
        std::filesystem::path path_;
        std::uint64_t default_chunk_size_;
    };

} // namespace checkpoint
