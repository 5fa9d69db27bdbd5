#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/transfer_types.hpp"

namespace chunkdrive::server
{

    struct ChunkInfo
    {
        std::uint64_t chunk_id{};
        std::uint64_t start_offset{};
        std::uint64_t end_offset{};
        ChunkStatus status{ChunkStatus::Pending};
        std::string checksum;
        std::uint32_t retry_count{};

        std::uint64_t size() const noexcept { return end_offset - start_offset; }
    };

    enum class SessionPhase : std::uint8_t
    {
        Active,
        Finalizing,
        Closed
    };

    std::uint64_t count_chunks(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

    // Full chunk table for a file; the last range is clamped to total_size.
    std::vector<ChunkInfo> plan_chunks(std::uint64_t total_size, std::uint64_t chunk_size);

    struct TransferSession
    {
        TransferSession(std::string session_id, std::string file_id, std::string filename, std::uint64_t total_size,
                        std::uint64_t chunk_size, std::optional<std::string> expected_checksum,
                        std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now());

        const std::string session_id;
        const std::string file_id;
        const std::string filename;
        const std::uint64_t total_size;
        const std::uint64_t chunk_size;
        const std::uint64_t total_chunks;
        const std::optional<std::string> expected_checksum;
        const std::chrono::system_clock::time_point created_at;

        // Everything below is guarded by mutex.
        mutable std::mutex mutex;
        std::vector<ChunkInfo> chunks;
        std::uint64_t uploaded_chunks{};
        std::uint64_t uploaded_bytes{};
        std::chrono::system_clock::time_point last_activity;
        SessionPhase phase{SessionPhase::Active};
        // Bumped on every chunk-table change recorded for the sidecar index.
        std::uint64_t index_version{};

        // Caller must hold mutex.
        std::vector<std::uint64_t> missing_chunks() const;
    };

    struct ProgressSummary
    {
        std::string session_id;
        std::string file_id;
        std::string filename;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t uploaded_chunks{};
        std::uint64_t uploaded_bytes{};
        double progress_percent{};
        std::vector<std::uint64_t> missing_chunks;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_activity{};
    };

    void to_json(nlohmann::json &json, const ProgressSummary &summary);

} // namespace chunkdrive::server
