#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/event_dispatcher.hpp"
#include "chunkdrive/server/progress_tracker.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/session_sweeper.hpp"
#include "chunkdrive/server/upload_engine.hpp"

namespace chunkdrive::server
{

    // Hosts the upload engine on an asio worker pool. Without ingest files it
    // runs until SIGINT/SIGTERM; with ingest files it feeds each file through
    // the engine chunk by chunk and returns once all of them are done.
    class UploadService
    {
    public:
        explicit UploadService(ServiceConfig config);

        // Returns false if any ingest failed.
        bool run();

        void stop();

        ChunkedUploadEngine &engine() noexcept { return engine_; }

    private:
        struct IngestJob;

        void handle_signal();
        void start_ingest();
        void ingest_file(const std::filesystem::path &path);
        void upload_ingest_chunk(const std::shared_ptr<IngestJob> &job, std::uint64_t chunk_id);
        void finish_ingest(const std::shared_ptr<IngestJob> &job);
        void job_done();

        ServiceConfig config_;
        asio::io_context io_context_;
        asio::signal_set signals_;

        EventDispatcher dispatcher_;
        ChunkStore store_;
        SessionRegistry registry_;
        ProgressTracker tracker_;
        ChunkedUploadEngine engine_;
        SessionSweeper sweeper_;

        std::atomic<std::size_t> active_jobs_{0};
        std::atomic<bool> ingest_failed_{false};
        std::vector<std::thread> workers_;
    };

} // namespace chunkdrive::server
