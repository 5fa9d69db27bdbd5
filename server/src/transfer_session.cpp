#include "chunkdrive/server/transfer_session.hpp"

namespace chunkdrive::server
{

    std::uint64_t count_chunks(std::uint64_t total_size, std::uint64_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return total_size / chunk_size + (total_size % chunk_size == 0 ? 0 : 1);
    }

    std::vector<ChunkInfo> plan_chunks(std::uint64_t total_size, std::uint64_t chunk_size)
    {
        const auto total_chunks = count_chunks(total_size, chunk_size);
        std::vector<ChunkInfo> chunks;
        chunks.reserve(static_cast<std::size_t>(total_chunks));
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            ChunkInfo chunk{};
            chunk.chunk_id = index;
            chunk.start_offset = index * chunk_size;
            chunk.end_offset = chunk_size >= total_size - chunk.start_offset ? total_size
                                                                              : chunk.start_offset + chunk_size;
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    }

    TransferSession::TransferSession(std::string session_id, std::string file_id, std::string filename,
                                     std::uint64_t total_size, std::uint64_t chunk_size,
                                     std::optional<std::string> expected_checksum,
                                     std::chrono::system_clock::time_point created_at)
        : session_id(std::move(session_id)),
          file_id(std::move(file_id)),
          filename(std::move(filename)),
          total_size(total_size),
          chunk_size(chunk_size),
          total_chunks(count_chunks(total_size, chunk_size)),
          expected_checksum(std::move(expected_checksum)),
          created_at(created_at),
          chunks(plan_chunks(total_size, chunk_size)),
          last_activity(this->created_at)
    {
    }

    std::vector<std::uint64_t> TransferSession::missing_chunks() const
    {
        std::vector<std::uint64_t> missing;
        for (const auto &chunk : chunks)
        {
            if (chunk.status != ChunkStatus::Completed)
            {
                missing.push_back(chunk.chunk_id);
            }
        }
        return missing;
    }

    void to_json(nlohmann::json &json, const ProgressSummary &summary)
    {
        json = {
            {"session_id", summary.session_id},
            {"file_id", summary.file_id},
            {"filename", summary.filename},
            {"total_size", summary.total_size},
            {"chunk_size", summary.chunk_size},
            {"total_chunks", summary.total_chunks},
            {"uploaded_chunks", summary.uploaded_chunks},
            {"uploaded_bytes", summary.uploaded_bytes},
            {"progress_percent", summary.progress_percent},
            {"missing_chunks", summary.missing_chunks},
            {"created_at", to_unix_millis(summary.created_at)},
            {"last_activity", to_unix_millis(summary.last_activity)},
        };
    }

} // namespace chunkdrive::server
