#include "chunkdrive/server/session_sweeper.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    SessionSweeper::SessionSweeper(asio::io_context &io_context, ChunkedUploadEngine &engine,
                                   ProgressTracker &tracker, std::chrono::seconds interval,
                                   std::chrono::seconds retention)
        : timer_(io_context),
          engine_(engine),
          tracker_(tracker),
          interval_(std::max(interval, std::chrono::seconds{1})),
          retention_(retention)
    {
    }

    void SessionSweeper::start()
    {
        running_ = true;
        schedule();
    }

    void SessionSweeper::stop()
    {
        running_ = false;
        timer_.cancel();
    }

    std::size_t SessionSweeper::sweep_once()
    {
        const auto expired = engine_.expire_idle_sessions();
        const auto pruned = tracker_.prune_finished(retention_);
        if (!expired.empty() || pruned > 0)
        {
            spdlog::debug("Sweep expired {} session(s), evicted {} finished snapshot(s)", expired.size(), pruned);
        }
        return expired.size();
    }

    void SessionSweeper::schedule()
    {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          {
        if (ec || !running_) {
            return;
        }
        try {
            sweep_once();
        } catch (const std::exception &ex) {
            spdlog::error("Session sweep failed: {}", ex.what());
        }
        schedule(); });
    }

} // namespace chunkdrive::server
