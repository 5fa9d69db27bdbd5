#include "chunkdrive/transfer_types.hpp"

#include <array>
#include <stdexcept>

namespace chunkdrive
{

    namespace
    {

        struct ChunkStatusMapping
        {
            ChunkStatus status;
            std::string_view label;
        };

        constexpr std::array<ChunkStatusMapping, 4> kChunkStatusMappings{{
            {ChunkStatus::Pending, "pending"},
            {ChunkStatus::Uploading, "uploading"},
            {ChunkStatus::Completed, "completed"},
            {ChunkStatus::Failed, "failed"},
        }};

        struct TransferStatusMapping
        {
            TransferStatus status;
            std::string_view label;
        };

        constexpr std::array<TransferStatusMapping, 7> kTransferStatusMappings{{
            {TransferStatus::Pending, "pending"},
            {TransferStatus::Starting, "starting"},
            {TransferStatus::InProgress, "in_progress"},
            {TransferStatus::Paused, "paused"},
            {TransferStatus::Completed, "completed"},
            {TransferStatus::Failed, "failed"},
            {TransferStatus::Cancelled, "cancelled"},
        }};

        struct EventTypeMapping
        {
            EventType type;
            std::string_view label;
        };

        constexpr std::array<EventTypeMapping, 9> kEventTypeMappings{{
            {EventType::TransferStarted, "transfer_started"},
            {EventType::ProgressUpdated, "progress_updated"},
            {EventType::TransferPaused, "transfer_paused"},
            {EventType::TransferResumed, "transfer_resumed"},
            {EventType::TransferCompleted, "transfer_completed"},
            {EventType::TransferFailed, "transfer_failed"},
            {EventType::TransferCancelled, "transfer_cancelled"},
            {EventType::TransferError, "transfer_error"},
            {EventType::TransferRetry, "transfer_retry"},
        }};

    } // namespace

    std::string_view to_string(ChunkStatus status) noexcept
    {
        for (const auto &mapping : kChunkStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ChunkStatus> chunk_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kChunkStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(TransferStatus status) noexcept
    {
        for (const auto &mapping : kTransferStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kTransferStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_terminal(TransferStatus status) noexcept
    {
        switch (status)
        {
        case TransferStatus::Completed:
        case TransferStatus::Failed:
        case TransferStatus::Cancelled:
            return true;
        case TransferStatus::Pending:
        case TransferStatus::Starting:
        case TransferStatus::InProgress:
        case TransferStatus::Paused:
            return false;
        }
        return false;
    }

    bool can_transition(TransferStatus from, TransferStatus to) noexcept
    {
        switch (from)
        {
        case TransferStatus::Pending:
            return to == TransferStatus::Starting || to == TransferStatus::Failed || to == TransferStatus::Cancelled;
        case TransferStatus::Starting:
            return to == TransferStatus::InProgress || to == TransferStatus::Paused || is_terminal(to);
        case TransferStatus::InProgress:
            return to == TransferStatus::Paused || is_terminal(to);
        case TransferStatus::Paused:
            return to == TransferStatus::InProgress || is_terminal(to);
        case TransferStatus::Completed:
        case TransferStatus::Failed:
        case TransferStatus::Cancelled:
            return false;
        }
        return false;
    }

    std::string_view to_string(EventType type) noexcept
    {
        for (const auto &mapping : kEventTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<EventType> event_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kEventTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::int64_t to_unix_millis(std::chrono::system_clock::time_point time)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis)
    {
        return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds{millis})};
    }

    void to_json(nlohmann::json &json, const ProgressSnapshot &snapshot)
    {
        json = {
            {"transfer_id", snapshot.transfer_id},
            {"filename", snapshot.filename},
            {"total_size", snapshot.total_size},
            {"transferred_size", snapshot.transferred_size},
            {"progress_percent", snapshot.progress_percent},
            {"transfer_speed", snapshot.transfer_speed},
            {"eta_seconds", nullptr},
            {"status", std::string(to_string(snapshot.status))},
            {"error_count", snapshot.error_count},
            {"retry_count", snapshot.retry_count},
            {"started_at", to_unix_millis(snapshot.started_at)},
            {"updated_at", to_unix_millis(snapshot.updated_at)},
        };
        if (snapshot.eta_seconds)
        {
            json["eta_seconds"] = *snapshot.eta_seconds;
        }
        if (snapshot.last_error)
        {
            json["last_error"] = *snapshot.last_error;
        }
    }

    void from_json(const nlohmann::json &json, ProgressSnapshot &snapshot)
    {
        snapshot.transfer_id = json.at("transfer_id").get<std::string>();
        snapshot.filename = json.value("filename", std::string{});
        snapshot.total_size = json.value("total_size", 0ULL);
        snapshot.transferred_size = json.value("transferred_size", 0ULL);
        snapshot.progress_percent = json.value("progress_percent", 0.0);
        snapshot.transfer_speed = json.value("transfer_speed", 0.0);
        if (auto it = json.find("eta_seconds"); it != json.end() && !it->is_null())
        {
            snapshot.eta_seconds = it->get<double>();
        }
        else
        {
            snapshot.eta_seconds.reset();
        }
        const auto status_label = json.value("status", std::string{"pending"});
        auto status = transfer_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown transfer status: " + status_label);
        }
        snapshot.status = *status;
        snapshot.error_count = json.value("error_count", 0u);
        snapshot.retry_count = json.value("retry_count", 0u);
        if (auto it = json.find("last_error"); it != json.end())
        {
            snapshot.last_error = it->get<std::string>();
        }
        else
        {
            snapshot.last_error.reset();
        }
        snapshot.started_at = from_unix_millis(json.value("started_at", 0LL));
        snapshot.updated_at = from_unix_millis(json.value("updated_at", 0LL));
    }

    void to_json(nlohmann::json &json, const TransferEvent &event)
    {
        json = {
            {"event", std::string(to_string(event.type))},
            {"timestamp", to_unix_millis(event.timestamp)},
            {"snapshot", event.snapshot},
        };
        if (event.message)
        {
            json["message"] = *event.message;
        }
    }

    void from_json(const nlohmann::json &json, TransferEvent &event)
    {
        const auto label = json.at("event").get<std::string>();
        auto type = event_type_from_string(label);
        if (!type)
        {
            throw std::runtime_error("Unknown event type: " + label);
        }
        event.type = *type;
        event.timestamp = from_unix_millis(json.value("timestamp", 0LL));
        event.snapshot = json.at("snapshot").get<ProgressSnapshot>();
        if (auto it = json.find("message"); it != json.end())
        {
            event.message = it->get<std::string>();
        }
        else
        {
            event.message.reset();
        }
    }

} // namespace chunkdrive
