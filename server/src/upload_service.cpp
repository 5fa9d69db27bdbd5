#include "chunkdrive/server/upload_service.hpp"

#include <algorithm>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <string>

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/errors.hpp"
#include "chunkdrive/server/event_log.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr int kMaxChunkAttempts = 3;

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    struct UploadService::IngestJob
    {
        std::filesystem::path source;
        std::string session_id;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::atomic<std::uint64_t> remaining{0};
        std::atomic<bool> failed{false};
    };

    UploadService::UploadService(ServiceConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          signals_(io_context_),
          dispatcher_(config_.event_queue_capacity),
          store_(config_.engine.staging_dir, config_.engine.upload_dir),
          tracker_(dispatcher_, config_.speed_window),
          engine_(config_.engine, store_, registry_, tracker_),
          sweeper_(io_context_, engine_, tracker_, config_.sweep_interval, config_.progress_retention)
    {
        dispatcher_.subscribe(make_logging_listener());

        spdlog::info("Staging uploads in {}, publishing to {}", store_.staging_dir().string(),
                     store_.upload_dir().string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    bool UploadService::run()
    {
        engine_.restore_sessions();
        sweeper_.start();

        if (!config_.ingest_files.empty())
        {
            active_jobs_ = config_.ingest_files.size();
            asio::post(io_context_, [this]
                       { start_ingest(); });
        }

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Upload service running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();

        dispatcher_.flush();
        dispatcher_.stop();
        spdlog::info("Upload service stopped ({} events delivered, {} dropped)", dispatcher_.delivered_count(),
                     dispatcher_.dropped_count());
        return !ingest_failed_;
    }

    void UploadService::stop()
    {
        sweeper_.stop();
        std::error_code ec;
        signals_.cancel(ec);
        io_context_.stop();
    }

    void UploadService::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        stop();
    }

    void UploadService::start_ingest()
    {
        for (const auto &path : config_.ingest_files)
        {
            try
            {
                ingest_file(path);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Failed to start ingest of {}: {}", path.string(), ex.what());
                ingest_failed_ = true;
                job_done();
            }
        }
    }

    void UploadService::ingest_file(const std::filesystem::path &path)
    {
        const auto total_size = std::filesystem::file_size(path);
        const auto checksum = crypto::hash_file(path);
        const auto session_id = engine_.create_session(checksum.substr(0, 12), path.filename().string(), total_size,
                                                       config_.ingest_chunk_size, checksum);

        auto job = std::make_shared<IngestJob>();
        job->source = path;
        job->session_id = session_id;
        job->total_size = total_size;
        job->chunk_size = config_.ingest_chunk_size;

        const auto missing = engine_.resume_upload(session_id);
        job->remaining = missing.size();
        if (missing.empty())
        {
            asio::post(io_context_, [this, job]
                       { finish_ingest(job); });
            return;
        }
        // Highest index first; the engine accepts chunks in any order.
        for (auto it = missing.rbegin(); it != missing.rend(); ++it)
        {
            asio::post(io_context_, [this, job, chunk_id = *it]
                       { upload_ingest_chunk(job, chunk_id); });
        }
    }

    void UploadService::upload_ingest_chunk(const std::shared_ptr<IngestJob> &job, std::uint64_t chunk_id)
    {
        if (!job->failed)
        {
            try
            {
                const auto offset = chunk_id * job->chunk_size;
                const auto size = std::min(job->chunk_size, job->total_size - offset);
                std::vector<std::byte> buffer(static_cast<std::size_t>(size));
                std::ifstream in(job->source, std::ios::binary);
                in.seekg(static_cast<std::streamoff>(offset));
                in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (static_cast<std::uint64_t>(in.gcount()) != size)
                {
                    throw std::runtime_error("Short read from " + job->source.string());
                }

                for (int attempt = 1;; ++attempt)
                {
                    try
                    {
                        engine_.upload_chunk(job->session_id, chunk_id, buffer);
                        break;
                    }
                    catch (const ChunkIoError &ex)
                    {
                        if (attempt >= kMaxChunkAttempts)
                        {
                            throw;
                        }
                        spdlog::warn("Retrying chunk {} of {} (attempt {}): {}", chunk_id, job->source.string(),
                                     attempt + 1, ex.what());
                    }
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Ingest of {} failed at chunk {}: {}", job->source.string(), chunk_id, ex.what());
                job->failed = true;
            }
        }

        if (job->remaining.fetch_sub(1) == 1)
        {
            finish_ingest(job);
        }
    }

    void UploadService::finish_ingest(const std::shared_ptr<IngestJob> &job)
    {
        if (job->failed)
        {
            engine_.cancel_upload(job->session_id);
            ingest_failed_ = true;
        }
        else
        {
            try
            {
                const auto result = engine_.complete_upload(job->session_id);
                spdlog::info("Ingested {} -> {} ({})", job->source.string(), result.final_path.string(),
                             result.checksum);
            }
            catch (const TransferError &ex)
            {
                spdlog::error("Failed to complete ingest of {}: [{}] {}", job->source.string(),
                              chunkdrive::to_string(ex.code()), ex.what());
                ingest_failed_ = true;
            }
        }
        job_done();
    }

    void UploadService::job_done()
    {
        if (active_jobs_.fetch_sub(1) == 1)
        {
            spdlog::info("All ingest jobs finished");
            stop();
        }
    }

} // namespace chunkdrive::server
