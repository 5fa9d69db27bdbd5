#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkdrive/server/event_dispatcher.hpp"
#include "chunkdrive/server/speed_calculator.hpp"
#include "chunkdrive/transfer_types.hpp"

namespace chunkdrive::server
{

    // Per-transfer progress state machine:
    //   PENDING -> STARTING -> IN_PROGRESS <-> PAUSED -> COMPLETED | FAILED | CANCELLED
    // Every mutation publishes an event carrying a copy of the snapshot.
    // Operations on unknown transfers or disallowed transitions return false.
    class ProgressTracker
    {
    public:
        using Clock = SpeedCalculator::Clock;

        explicit ProgressTracker(EventDispatcher &dispatcher,
                                 std::size_t speed_window = SpeedCalculator::kDefaultWindow);

        bool track(const std::string &transfer_id, const std::string &filename, std::uint64_t total_size);

        bool start_transfer(const std::string &transfer_id);

        bool update_progress(const std::string &transfer_id, std::uint64_t bytes_transferred,
                             Clock::time_point now = Clock::now());

        bool pause_transfer(const std::string &transfer_id);
        bool resume_transfer(const std::string &transfer_id);

        bool complete_transfer(const std::string &transfer_id);
        bool fail_transfer(const std::string &transfer_id, const std::string &reason);
        bool cancel_transfer(const std::string &transfer_id);

        bool record_error(const std::string &transfer_id, const std::string &message);
        bool record_retry(const std::string &transfer_id);

        std::optional<ProgressSnapshot> snapshot(const std::string &transfer_id) const;
        std::vector<ProgressSnapshot> snapshots() const;

        bool evict(const std::string &transfer_id);

        // Drops terminal snapshots that finished more than max_age ago.
        std::size_t prune_finished(std::chrono::seconds max_age);

        std::size_t size() const;

    private:
        struct Entry
        {
            ProgressSnapshot snapshot;
            SpeedCalculator speed;
            Clock::time_point finished_at{};
        };

        bool transition(const std::string &transfer_id, TransferStatus target, EventType event,
                        std::optional<std::string> message = std::nullopt);
        void publish(EventType type, ProgressSnapshot snapshot, std::optional<std::string> message = std::nullopt);

        EventDispatcher &dispatcher_;
        std::size_t speed_window_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace chunkdrive::server
