/**
 * ChunkDrive - Transfer status enums, progress snapshots and event records with
 * their JSON serialization.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chunkdrive
{

    enum class ChunkStatus : std::uint8_t
    {
        Pending,
        Uploading,
        Completed,
        Failed
    };

    std::string_view to_string(ChunkStatus status) noexcept;
    std::optional<ChunkStatus> chunk_status_from_string(std::string_view value) noexcept;

    enum class TransferStatus : std::uint8_t
    {
        Pending,
        Starting,
        InProgress,
        Paused,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(TransferStatus status) noexcept;
    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept;

    bool is_terminal(TransferStatus status) noexcept;

    // Whether the progress state machine permits moving from `from` to `to`.
    bool can_transition(TransferStatus from, TransferStatus to) noexcept;

    enum class EventType : std::uint8_t
    {
        TransferStarted,
        ProgressUpdated,
        TransferPaused,
        TransferResumed,
        TransferCompleted,
        TransferFailed,
        TransferCancelled,
        TransferError,
        TransferRetry
    };

    std::string_view to_string(EventType type) noexcept;
    std::optional<EventType> event_type_from_string(std::string_view value) noexcept;

    struct ProgressSnapshot
    {
        std::string transfer_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t transferred_size{};
        double progress_percent{};
        double transfer_speed{};
        std::optional<double> eta_seconds{};
        TransferStatus status{TransferStatus::Pending};
        std::uint32_t error_count{};
        std::uint32_t retry_count{};
        std::optional<std::string> last_error{};
        std::chrono::system_clock::time_point started_at{};
        std::chrono::system_clock::time_point updated_at{};
    };

    void to_json(nlohmann::json &json, const ProgressSnapshot &snapshot);
    void from_json(const nlohmann::json &json, ProgressSnapshot &snapshot);

    struct TransferEvent
    {
        EventType type{EventType::ProgressUpdated};
        ProgressSnapshot snapshot{};
        std::chrono::system_clock::time_point timestamp{};
        std::optional<std::string> message{};
    };

    void to_json(nlohmann::json &json, const TransferEvent &event);
    void from_json(const nlohmann::json &json, TransferEvent &event);

    std::int64_t to_unix_millis(std::chrono::system_clock::time_point time);
    std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);

} // namespace chunkdrive
