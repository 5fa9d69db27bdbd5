#include "chunkdrive/server/event_log.hpp"

#include <array>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    std::string format_bytes(std::uint64_t bytes)
    {
        static constexpr std::array<const char *, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
        auto value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }
        if (unit == 0)
        {
            return spdlog::fmt_lib::format("{} {}", bytes, kUnits[unit]);
        }
        return spdlog::fmt_lib::format("{:.1f} {}", value, kUnits[unit]);
    }

    EventDispatcher::Listener make_logging_listener()
    {
        return [](const TransferEvent &event)
        {
            const auto &snapshot = event.snapshot;
            switch (event.type)
            {
            case EventType::ProgressUpdated:
            {
                const auto eta = snapshot.eta_seconds
                                     ? spdlog::fmt_lib::format("{:.0f}s", *snapshot.eta_seconds)
                                     : std::string("unknown");
                spdlog::debug("[{}] {} {:.1f}% ({} of {}) at {}/s, eta {}", snapshot.transfer_id, snapshot.filename,
                              snapshot.progress_percent, format_bytes(snapshot.transferred_size),
                              format_bytes(snapshot.total_size),
                              format_bytes(static_cast<std::uint64_t>(snapshot.transfer_speed)), eta);
                break;
            }
            case EventType::TransferStarted:
                spdlog::info("[{}] started {} ({})", snapshot.transfer_id, snapshot.filename,
                             format_bytes(snapshot.total_size));
                break;
            case EventType::TransferPaused:
            case EventType::TransferResumed:
            case EventType::TransferCancelled:
            case EventType::TransferRetry:
                spdlog::info("[{}] {} {}", snapshot.transfer_id, to_string(event.type), snapshot.filename);
                break;
            case EventType::TransferCompleted:
                spdlog::info("[{}] completed {} ({})", snapshot.transfer_id, snapshot.filename,
                             format_bytes(snapshot.total_size));
                break;
            case EventType::TransferFailed:
            case EventType::TransferError:
                spdlog::warn("[{}] {} {}: {}", snapshot.transfer_id, to_string(event.type), snapshot.filename,
                             event.message.value_or(snapshot.last_error.value_or("unknown error")));
                break;
            }
        };
    }

} // namespace chunkdrive::server
