#include "checkpoint_store.hpp"
#include "../../common/logger/Mylogger.h"

#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace checkpoint
{
    using errors::ErrorCode;

    namespace
    {
        bool sync_path(const fs::path &p, int flags)
        {
            int fd = ::open(p.c_str(), flags);
            if (fd < 0)
                return false;
            bool synced = ::fsync(fd) == 0;
            ::close(fd);
            return synced;
        }
    }

    schema::json snapshotToJson(const Snapshot &snapshot)
    {
        schema::json files = schema::json::object();
        for (const auto &[filename, record] : snapshot.files)
            files[filename] = schema::fileRecordToJson(record);

        schema::json datanodes = schema::json::object();
        for (const auto &node : snapshot.datanodes)
            datanodes[node.node_id] = node;

        return schema::json{{"files", files},
                            {"datanodes", datanodes},
                            {"chunk_size", snapshot.chunk_size}};
    }

    Snapshot snapshotFromJson(const schema::json &j)
    {
        Snapshot snapshot;
        j.at("chunk_size").get_to(snapshot.chunk_size);

        for (const auto &item : j.at("files").items())
        {
            const auto &value = item.value();
            schema::FileRecord record;
            record.filename = item.key();
            value.at("file_id").get_to(record.file_id);
            value.at("size").get_to(record.size);
            value.at("created_at").get_to(record.created_at);
            value.at("chunks").get_to(record.chunks);
            snapshot.files.emplace(item.key(), std::move(record));
        }

        for (const auto &item : j.at("datanodes").items())
        {
            const auto &value = item.value();
            schema::NodeInfo node;
            node.node_id = item.key();
            value.at("url").get_to(node.url);
            value.at("registered_at").get_to(node.registered_at);
            value.at("last_heartbeat").get_to(node.last_heartbeat);
            snapshot.datanodes.push_back(std::move(node));
        }
        return snapshot;
    }

    CheckpointStore::CheckpointStore(fs::path path, std::uint64_t default_chunk_size)
        : path_(std::move(path)), default_chunk_size_(default_chunk_size)
    {
    }

    fs::path CheckpointStore::stagingPath() const
    {
        fs::path staging = path_;
        staging += ".tmp";
        return staging;
    }

    Snapshot CheckpointStore::load() const
    {
        std::error_code ec;
        if (fs::exists(stagingPath(), ec))
        {
            MyLogger::warning("Discarding leftover staging checkpoint: " + stagingPath().string());
            fs::remove(stagingPath(), ec);
        }

        if (!fs::exists(path_, ec))
        {
            MyLogger::info("No checkpoint at " + path_.string() + ", starting empty");
            Snapshot empty;
            empty.chunk_size = default_chunk_size_;
            return empty;
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in.is_open())
        {
            MyLogger::error("Failed to open checkpoint: " + path_.string());
            throw std::runtime_error("Failed to open checkpoint: " + path_.string());
        }

        try
        {
            schema::json j = schema::json::parse(in);
            Snapshot snapshot = snapshotFromJson(j);
            MyLogger::info("Loaded checkpoint with " + std::to_string(snapshot.files.size()) + " files and " +
                           std::to_string(snapshot.datanodes.size()) + " datanodes");
            return snapshot;
        }
        catch (const schema::json::exception &e)
        {
            MyLogger::error("Corrupt checkpoint " + path_.string() + ": " + e.what());
            throw std::runtime_error("Corrupt checkpoint: " + path_.string());
        }
    }

    errors::Status CheckpointStore::save(const Snapshot &snapshot)
    {
        std::error_code ec;
        if (path_.has_parent_path())
        {
            fs::create_directories(path_.parent_path(), ec);
            if (ec)
                return errors::Status::fail(ErrorCode::Internal, "Cannot create checkpoint directory: " + ec.message());
        }

        const std::string payload = snapshotToJson(snapshot).dump();
        const fs::path staging = stagingPath();
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
                return errors::Status::fail(ErrorCode::Internal, "Cannot open staging checkpoint " + staging.string());
            out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            out.flush();
            if (!out)
                return errors::Status::fail(ErrorCode::Internal, "Failed writing staging checkpoint " + staging.string());
        }
        if (!sync_path(staging, O_RDONLY))
            return errors::Status::fail(ErrorCode::Internal, "Failed to sync staging checkpoint " + staging.string());

        fs::rename(staging, path_, ec);
        if (ec)
            return errors::Status::fail(ErrorCode::Internal, "Failed to replace checkpoint: " + ec.message());

        // The rename is done; a failed directory sync only weakens durability.
        if (path_.has_parent_path() && !sync_path(path_.parent_path(), O_RDONLY | O_DIRECTORY))
            MyLogger::warning("Failed to sync checkpoint directory " + path_.parent_path().string());
        MyLogger::debug("Checkpoint written to " + path_.string());
        return errors::Status::ok();
    }

} // namespace checkpoint
