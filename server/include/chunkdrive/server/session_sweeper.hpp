#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "chunkdrive/server/progress_tracker.hpp"
#include "chunkdrive/server/upload_engine.hpp"

namespace chunkdrive::server
{

    // Periodically expires idle sessions and evicts finished progress snapshots.
    class SessionSweeper
    {
    public:
        SessionSweeper(asio::io_context &io_context, ChunkedUploadEngine &engine, ProgressTracker &tracker,
                       std::chrono::seconds interval, std::chrono::seconds retention);

        void start();
        void stop();

        // Returns the number of sessions expired.
        std::size_t sweep_once();

    private:
        void schedule();

        asio::steady_timer timer_;
        ChunkedUploadEngine &engine_;
        ProgressTracker &tracker_;
        std::chrono::seconds interval_;
        std::chrono::seconds retention_;
        std::atomic<bool> running_{false};
    };

} // namespace chunkdrive::server
