#include "transfer_engine.hpp"
#include "../../common/clock/clock.hpp"
#include "../../common/logger/Mylogger.h"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <memory>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace transfer
{
    using errors::ErrorCode;

    namespace
    {
        // Runs fn on the pool and hands back its result through a future.
        template <typename Fn>
        auto submit(boost::asio::thread_pool &pool, Fn fn) -> std::future<decltype(fn())>
        {
            using R = decltype(fn());
            auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
            auto future = task->get_future();
            boost::asio::post(pool, [task]()
                              { (*task)(); });
            return future;
        }

        ChunkOutcome outcome_for(const schema::ChunkInfo &chunk)
        {
            ChunkOutcome out;
            out.chunk_id = chunk.chunk_id;
            out.node_id = chunk.node_id;
            out.start = chunk.start;
            out.size = chunk.size;
            return out;
        }

        void fail_outcome(ChunkOutcome &out, ErrorCode code, std::string err)
        {
            out.success = false;
            out.code = code;
            out.err = std::move(err);
        }

        double mbps(std::uint64_t bytes, double seconds)
        {
            if (seconds <= 0.0)
                return 0.0;
            return (static_cast<double>(bytes) / 1024.0 / 1024.0) / seconds;
        }

        std::string format_mbps(double value)
        {
            std::ostringstream out;
            out << std::fixed << std::setprecision(2) << value;
            return out.str();
        }

        errors::Result<std::uint64_t> local_file_size(const std::string &path)
        {
            std::error_code ec;
            if (!fs::is_regular_file(path, ec))
                return errors::Result<std::uint64_t>::fail(ErrorCode::InvalidArgument, "Not a regular file: " + path);
            auto size = fs::file_size(path, ec);
            if (ec)
                return errors::Result<std::uint64_t>::fail(ErrorCode::InvalidArgument,
                                                           "Cannot stat " + path + ": " + ec.message());
            return errors::Result<std::uint64_t>::ok(size);
        }

        errors::Result<std::string> read_range(const std::string &path, std::uint64_t start, std::uint64_t size)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
                return errors::Result<std::string>::fail(ErrorCode::Internal, "Failed to open file: " + path);
            in.seekg(static_cast<std::streamoff>(start), std::ios::beg);
            std::string bytes(size, '\0');
            in.read(bytes.data(), static_cast<std::streamsize>(size));
            if (static_cast<std::uint64_t>(in.gcount()) != size)
                return errors::Result<std::string>::fail(ErrorCode::Internal,
                                                         "Short read at offset " + std::to_string(start) + " of " + path);
            return errors::Result<std::string>::ok(std::move(bytes));
        }

        errors::Status write_reassembled(const std::vector<RetrievedChunk> &chunks, const std::string &output_path)
        {
            fs::path target(output_path);
            std::error_code ec;
            if (target.has_parent_path())
            {
                fs::create_directories(target.parent_path(), ec);
                if (ec)
                    return errors::Status::fail(ErrorCode::Internal, "Cannot create " + target.parent_path().string() +
                                                                         ": " + ec.message());
            }

            fs::path staging = target;
            staging += ".part";
            {
                std::ofstream out(staging, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                    return errors::Status::fail(ErrorCode::Internal, "Failed to create output file: " + staging.string());
                for (const auto &chunk : chunks)
                    out.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
                out.flush();
                if (!out)
                {
                    out.close();
                    fs::remove(staging, ec);
                    return errors::Status::fail(ErrorCode::Internal, "Failed writing " + staging.string());
                }
            }

            fs::rename(staging, target, ec);
            if (ec)
            {
                std::error_code ignored;
                fs::remove(staging, ignored);
                return errors::Status::fail(ErrorCode::Internal, "Failed to move output into place: " + ec.message());
            }
            return errors::Status::ok();
        }
    } // namespace

    std::size_t TransferReport::failedChunks() const
    {
        return static_cast<std::size_t>(std::count_if(chunks.begin(), chunks.end(),
                                                      [](const ChunkOutcome &c)
                                                      { return !c.success; }));
    }

    errors::Status validatePlan(const std::vector<schema::ChunkInfo> &chunks, std::uint64_t total_size)
    {
        std::vector<const schema::ChunkInfo *> ordered;
        ordered.reserve(chunks.size());
        for (const auto &c : chunks)
            ordered.push_back(&c);
        std::sort(ordered.begin(), ordered.end(), [](const schema::ChunkInfo *a, const schema::ChunkInfo *b)
                  { return a->start < b->start; });

        std::uint64_t expected = 0;
        for (const auto *c : ordered)
        {
            if (c->start != expected || c->size == 0)
                return errors::Status::fail(ErrorCode::Internal, "Chunk plan is not contiguous at offset " +
                                                                     std::to_string(expected));
            expected += c->size;
        }
        if (expected != total_size)
            return errors::Status::fail(ErrorCode::Internal, "Chunk plan covers " + std::to_string(expected) +
                                                                 " bytes, file has " + std::to_string(total_size));
        return errors::Status::ok();
    }

    errors::Status orderForReassembly(std::vector<RetrievedChunk> &chunks, std::uint64_t total_size)
    {
        std::sort(chunks.begin(), chunks.end(), [](const RetrievedChunk &a, const RetrievedChunk &b)
                  { return a.start < b.start; });

        std::uint64_t expected = 0;
        for (const auto &c : chunks)
        {
            if (c.start != expected)
                return errors::Status::fail(ErrorCode::Internal, "Missing or overlapping data at offset " +
                                                                     std::to_string(expected));
            expected += c.data.size();
        }
        if (expected != total_size)
            return errors::Status::fail(ErrorCode::Internal, "Reassembled " + std::to_string(expected) +
                                                                 " bytes, expected " + std::to_string(total_size));
        return errors::Status::ok();
    }

    TransferEngine::TransferEngine(PlanSource &plans, ChunkTransport &transport, TransferOptions options)
        : plans_(plans), transport_(transport), options_(options)
    {
        if (options_.workers == 0)
            options_.workers = 1;
        if (options_.max_attempts < 1)
            options_.max_attempts = 1;
    }

    TransferReport TransferEngine::upload(const std::string &local_path, const std::string &remote_name)
    {
        TransferReport report;
        report.filename = remote_name;
        boost::asio::thread_pool pool(options_.workers);

        // Stat and plan registration are blocking calls too; keep them off
        // the calling thread.
        auto planned = submit(pool, [this, &local_path, &remote_name]()
                              {
            auto size = local_file_size(local_path);
            if (!size.success)
                return errors::Result<schema::FileRecord>::fail(size.code, size.err);
            return plans_.createFile(remote_name, size.value); }).get();

        if (!planned.success)
        {
            MyLogger::error("Error registering file with master: " + planned.err);
            report.code = planned.code;
            report.err = planned.err;
            return report;
        }

        const schema::FileRecord &record = planned.value;
        report.file_id = record.file_id;
        report.bytes = record.size;

        auto plan_ok = validatePlan(record.chunks, record.size);
        if (!plan_ok.success)
        {
            MyLogger::error("Rejecting chunk plan for " + remote_name + ": " + plan_ok.err);
            report.code = plan_ok.code;
            report.err = plan_ok.err;
            return report;
        }

        MyLogger::info("Uploading " + remote_name + " (" + std::to_string(record.size) + " bytes) in " +
                       std::to_string(record.chunks.size()) + " chunks");

        double started = dfs_clock::steady_millis();
        std::vector<std::future<ChunkOutcome>> pending;
        pending.reserve(record.chunks.size());
        for (const auto &chunk : record.chunks)
        {
            pending.push_back(submit(pool, [this, &local_path, chunk]()
                                     {
                ChunkOutcome out = outcome_for(chunk);
                try
                {
                    auto bytes = read_range(local_path, chunk.start, chunk.size);
                    if (!bytes.success)
                    {
                        fail_outcome(out, bytes.code, bytes.err);
                        MyLogger::error("Error reading chunk " + chunk.chunk_id + ": " + bytes.err);
                        return out;
                    }
                    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt)
                    {
                        out.attempts = attempt;
                        auto stored = transport_.storeChunk(chunk, bytes.value);
                        if (stored.success)
                        {
                            out.success = true;
                            out.code = ErrorCode::None;
                            out.err.clear();
                            MyLogger::info("Uploaded chunk " + chunk.chunk_id + " to " + chunk.node_url);
                            return out;
                        }
                        fail_outcome(out, stored.code, stored.err);
                        MyLogger::warning("Attempt " + std::to_string(attempt) + " to upload chunk " +
                                          chunk.chunk_id + " failed: " + stored.err);
                    }
                    MyLogger::error("Failed to upload chunk " + chunk.chunk_id + ": " + out.err);
                }
                catch (const std::exception &e)
                {
                    fail_outcome(out, ErrorCode::Internal, e.what());
                    MyLogger::error("Error uploading chunk " + chunk.chunk_id + ": " + e.what());
                }
                return out; }));
        }

        for (auto &f : pending)
            report.chunks.push_back(f.get());
        pool.join();

        report.seconds = (dfs_clock::steady_millis() - started) / 1000.0;
        report.throughput_mbps = mbps(report.bytes, report.seconds);

        std::size_t failed = report.failedChunks();
        report.success = failed == 0;
        if (report.success)
        {
            MyLogger::info("Successfully uploaded " + remote_name + " at " + format_mbps(report.throughput_mbps) + " MB/s");
        }
        else
        {
            report.code = ErrorCode::Transport;
            report.err = std::to_string(failed) + " of " + std::to_string(report.chunks.size()) +
                         " chunks failed to upload. File may be incomplete.";
            MyLogger::warning(report.err);
        }
        return report;
    }

    TransferReport TransferEngine::download(const std::string &remote_name, const std::string &output_path)
    {
        TransferReport report;
        report.filename = remote_name;
        boost::asio::thread_pool pool(options_.workers);

        auto fetched = submit(pool, [this, &remote_name]()
                              { return plans_.getFile(remote_name); })
                           .get();
        if (!fetched.success)
        {
            MyLogger::error("Error getting file info for " + remote_name + ": " + fetched.err);
            report.code = fetched.code;
            report.err = fetched.err;
            return report;
        }

        const schema::FileRecord &record = fetched.value;
        report.file_id = record.file_id;
        report.bytes = record.size;

        auto plan_ok = validatePlan(record.chunks, record.size);
        if (!plan_ok.success)
        {
            MyLogger::error("Rejecting chunk plan for " + remote_name + ": " + plan_ok.err);
            report.code = plan_ok.code;
            report.err = plan_ok.err;
            return report;
        }

        MyLogger::info("Downloading " + remote_name + " (" + std::to_string(record.size) + " bytes) in " +
                       std::to_string(record.chunks.size()) + " chunks");

        double started = dfs_clock::steady_millis();
        auto cancelled = std::make_shared<std::atomic<bool>>(false);
        std::vector<std::future<std::pair<ChunkOutcome, RetrievedChunk>>> pending;
        pending.reserve(record.chunks.size());
        for (const auto &chunk : record.chunks)
        {
            pending.push_back(submit(pool, [this, chunk, cancelled]()
                                     {
                std::pair<ChunkOutcome, RetrievedChunk> result;
                ChunkOutcome &out = result.first;
                out = outcome_for(chunk);
                result.second.start = chunk.start;
                try
                {
                    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt)
                    {
                        if (cancelled->load())
                        {
                            if (out.attempts == 0)
                                fail_outcome(out, ErrorCode::Transport, "Cancelled after another chunk failed");
                            return result;
                        }
                        out.attempts = attempt;
                        auto data = transport_.retrieveChunk(chunk);
                        if (data.success && data.value.size() == chunk.size)
                        {
                            out.success = true;
                            out.code = ErrorCode::None;
                            out.err.clear();
                            result.second.data = std::move(data.value);
                            MyLogger::info("Downloaded chunk " + chunk.chunk_id + " from " + chunk.node_url);
                            return result;
                        }
                        if (data.success)
                            fail_outcome(out, ErrorCode::Internal, "Chunk " + chunk.chunk_id + " has " +
                                                                       std::to_string(data.value.size()) + " bytes, expected " +
                                                                       std::to_string(chunk.size));
                        else
                            fail_outcome(out, data.code, data.err);
                        MyLogger::warning("Attempt " + std::to_string(attempt) + " to download chunk " +
                                          chunk.chunk_id + " failed: " + out.err);
                    }
                    MyLogger::error("Failed to download chunk " + chunk.chunk_id + ": " + out.err);
                }
                catch (const std::exception &e)
                {
                    fail_outcome(out, ErrorCode::Internal, e.what());
                    MyLogger::error("Error downloading chunk " + chunk.chunk_id + ": " + e.what());
                }
                cancelled->store(true);
                return result; }));
        }

        std::vector<RetrievedChunk> retrieved;
        retrieved.reserve(pending.size());
        for (auto &f : pending)
        {
            auto result = f.get();
            report.chunks.push_back(result.first);
            if (result.first.success)
                retrieved.push_back(std::move(result.second));
        }

        std::size_t failed = report.failedChunks();
        if (failed != 0)
        {
            pool.join();
            // Report the first chunk that actually failed, not one cancelled
            // because of it.
            auto first = std::find_if(report.chunks.begin(), report.chunks.end(), [](const ChunkOutcome &c)
                                      { return !c.success && c.attempts > 0; });
            if (first == report.chunks.end())
                first = std::find_if(report.chunks.begin(), report.chunks.end(), [](const ChunkOutcome &c)
                                     { return !c.success; });
            report.code = first->code;
            report.err = std::to_string(failed) + " of " + std::to_string(report.chunks.size()) +
                         " chunks failed to download; " + output_path + " was not written";
            MyLogger::error(report.err);
            return report;
        }

        // Chunks complete in any order; the merge sorts by offset before
        // writing.
        auto written = submit(pool, [&retrieved, &record, &output_path]()
                              {
            auto ordered = orderForReassembly(retrieved, record.size);
            if (!ordered.success)
                return ordered;
            return write_reassembled(retrieved, output_path); })
                           .get();
        pool.join();

        report.seconds = (dfs_clock::steady_millis() - started) / 1000.0;
        report.throughput_mbps = mbps(report.bytes, report.seconds);
        if (!written.success)
        {
            report.code = written.code;
            report.err = written.err;
            MyLogger::error("Error writing " + output_path + ": " + written.err);
            return report;
        }

        report.success = true;
        MyLogger::info("Successfully downloaded " + remote_name + " to " + output_path + " at " +
                       format_mbps(report.throughput_mbps) + " MB/s");
        return report;
    }

} // namespace transfer
