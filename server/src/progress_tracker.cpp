#include "chunkdrive/server/progress_tracker.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    namespace
    {

        double percent_of(std::uint64_t transferred, std::uint64_t total)
        {
            if (total == 0)
            {
                return 0.0;
            }
            return std::min(100.0, static_cast<double>(transferred) / static_cast<double>(total) * 100.0);
        }

    } // namespace

    ProgressTracker::ProgressTracker(EventDispatcher &dispatcher, std::size_t speed_window)
        : dispatcher_(dispatcher), speed_window_(speed_window)
    {
    }

    bool ProgressTracker::track(const std::string &transfer_id, const std::string &filename, std::uint64_t total_size)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(transfer_id);
        if (it != entries_.end() && !is_terminal(it->second.snapshot.status))
        {
            return false;
        }
        Entry entry{.snapshot = {}, .speed = SpeedCalculator(speed_window_)};
        entry.snapshot.transfer_id = transfer_id;
        entry.snapshot.filename = filename;
        entry.snapshot.total_size = total_size;
        entry.snapshot.status = TransferStatus::Pending;
        entry.snapshot.started_at = std::chrono::system_clock::now();
        entry.snapshot.updated_at = entry.snapshot.started_at;
        entries_.insert_or_assign(transfer_id, std::move(entry));
        return true;
    }

    bool ProgressTracker::start_transfer(const std::string &transfer_id)
    {
        return transition(transfer_id, TransferStatus::Starting, EventType::TransferStarted);
    }

    bool ProgressTracker::update_progress(const std::string &transfer_id, std::uint64_t bytes_transferred,
                                          Clock::time_point now)
    {
        ProgressSnapshot copy;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it == entries_.end())
            {
                return false;
            }
            auto &entry = it->second;
            auto &snapshot = entry.snapshot;
            switch (snapshot.status)
            {
            case TransferStatus::Starting:
                snapshot.status = TransferStatus::InProgress;
                break;
            case TransferStatus::InProgress:
            case TransferStatus::Paused:
                break;
            case TransferStatus::Pending:
            case TransferStatus::Completed:
            case TransferStatus::Failed:
            case TransferStatus::Cancelled:
                return false;
            }

            // Concurrent writers may report cumulative totals out of order.
            snapshot.transferred_size = std::min(std::max(snapshot.transferred_size, bytes_transferred),
                                                 snapshot.total_size);
            snapshot.progress_percent = percent_of(snapshot.transferred_size, snapshot.total_size);
            entry.speed.add_sample(snapshot.transferred_size, now);
            snapshot.transfer_speed = entry.speed.calculate_speed();
            snapshot.eta_seconds = entry.speed.calculate_eta(snapshot.total_size - snapshot.transferred_size);
            snapshot.updated_at = std::chrono::system_clock::now();
            copy = snapshot;
        }
        publish(EventType::ProgressUpdated, std::move(copy));
        return true;
    }

    bool ProgressTracker::pause_transfer(const std::string &transfer_id)
    {
        return transition(transfer_id, TransferStatus::Paused, EventType::TransferPaused);
    }

    bool ProgressTracker::resume_transfer(const std::string &transfer_id)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it == entries_.end() || it->second.snapshot.status != TransferStatus::Paused)
            {
                return false;
            }
            // Throughput measured before the pause would skew the estimate.
            it->second.speed.reset();
        }
        return transition(transfer_id, TransferStatus::InProgress, EventType::TransferResumed);
    }

    bool ProgressTracker::complete_transfer(const std::string &transfer_id)
    {
        return transition(transfer_id, TransferStatus::Completed, EventType::TransferCompleted);
    }

    bool ProgressTracker::fail_transfer(const std::string &transfer_id, const std::string &reason)
    {
        return transition(transfer_id, TransferStatus::Failed, EventType::TransferFailed, reason);
    }

    bool ProgressTracker::cancel_transfer(const std::string &transfer_id)
    {
        return transition(transfer_id, TransferStatus::Cancelled, EventType::TransferCancelled);
    }

    bool ProgressTracker::record_error(const std::string &transfer_id, const std::string &message)
    {
        ProgressSnapshot copy;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it == entries_.end() || is_terminal(it->second.snapshot.status))
            {
                return false;
            }
            auto &snapshot = it->second.snapshot;
            ++snapshot.error_count;
            snapshot.last_error = message;
            snapshot.updated_at = std::chrono::system_clock::now();
            copy = snapshot;
        }
        publish(EventType::TransferError, std::move(copy), message);
        return true;
    }

    bool ProgressTracker::record_retry(const std::string &transfer_id)
    {
        ProgressSnapshot copy;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it == entries_.end() || is_terminal(it->second.snapshot.status))
            {
                return false;
            }
            auto &snapshot = it->second.snapshot;
            ++snapshot.retry_count;
            snapshot.updated_at = std::chrono::system_clock::now();
            copy = snapshot;
        }
        publish(EventType::TransferRetry, std::move(copy));
        return true;
    }

    std::optional<ProgressSnapshot> ProgressTracker::snapshot(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(transfer_id);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second.snapshot;
    }

    std::vector<ProgressSnapshot> ProgressTracker::snapshots() const
    {
        std::lock_guard lock(mutex_);
        std::vector<ProgressSnapshot> result;
        result.reserve(entries_.size());
        for (const auto &[id, entry] : entries_)
        {
            result.push_back(entry.snapshot);
        }
        return result;
    }

    bool ProgressTracker::evict(const std::string &transfer_id)
    {
        std::lock_guard lock(mutex_);
        return entries_.erase(transfer_id) > 0;
    }

    std::size_t ProgressTracker::prune_finished(std::chrono::seconds max_age)
    {
        std::lock_guard lock(mutex_);
        const auto now = Clock::now();
        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();)
        {
            if (is_terminal(it->second.snapshot.status) && now - it->second.finished_at >= max_age)
            {
                it = entries_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t ProgressTracker::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    bool ProgressTracker::transition(const std::string &transfer_id, TransferStatus target, EventType event,
                                     std::optional<std::string> message)
    {
        ProgressSnapshot copy;
        {
            std::lock_guard lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it == entries_.end())
            {
                return false;
            }
            auto &entry = it->second;
            auto &snapshot = entry.snapshot;
            if (!can_transition(snapshot.status, target))
            {
                spdlog::debug("Ignoring {} -> {} for transfer {}", to_string(snapshot.status), to_string(target),
                              transfer_id);
                return false;
            }
            snapshot.status = target;
            snapshot.updated_at = std::chrono::system_clock::now();
            switch (target)
            {
            case TransferStatus::Completed:
                snapshot.transferred_size = snapshot.total_size;
                snapshot.progress_percent = 100.0;
                snapshot.eta_seconds = 0.0;
                entry.finished_at = Clock::now();
                break;
            case TransferStatus::Failed:
                snapshot.last_error = message;
                snapshot.eta_seconds.reset();
                entry.finished_at = Clock::now();
                break;
            case TransferStatus::Cancelled:
                snapshot.transfer_speed = 0.0;
                snapshot.eta_seconds.reset();
                entry.finished_at = Clock::now();
                break;
            case TransferStatus::Paused:
                snapshot.transfer_speed = 0.0;
                snapshot.eta_seconds.reset();
                break;
            case TransferStatus::Pending:
            case TransferStatus::Starting:
            case TransferStatus::InProgress:
                break;
            }
            copy = snapshot;
        }
        publish(event, std::move(copy), std::move(message));
        return true;
    }

    void ProgressTracker::publish(EventType type, ProgressSnapshot snapshot, std::optional<std::string> message)
    {
        TransferEvent event{
            .type = type,
            .snapshot = std::move(snapshot),
            .timestamp = std::chrono::system_clock::now(),
            .message = std::move(message),
        };
        dispatcher_.publish(std::move(event));
    }

} // namespace chunkdrive::server
