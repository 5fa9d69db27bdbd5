#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/progress_tracker.hpp"
#include "chunkdrive/server/session_index.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/transfer_session.hpp"

namespace chunkdrive::server
{

    struct ChunkAck
    {
        bool ok{};
        bool duplicate{};
        std::string message;
    };

    struct CompletionResult
    {
        bool ok{};
        std::string message;
        std::filesystem::path final_path;
        std::string checksum;
    };

    // Session lifecycle for chunked uploads: create, accept chunks in any order
    // and from any number of threads, resume, complete and cancel.
    //
    // Session state lives in memory and is lost when the process exits unless
    // EngineConfig::persist_index is set, in which case restore_sessions()
    // reloads it from the staging directory.
    //
    // Failures are reported by throwing TransferError subclasses (errors.hpp).
    class ChunkedUploadEngine
    {
    public:
        ChunkedUploadEngine(EngineConfig config, ChunkStore &store, SessionRegistry &registry,
                            ProgressTracker &tracker);

        // Returns the new session id.
        std::string create_session(const std::string &file_id, const std::string &filename, std::uint64_t total_size,
                                   std::uint64_t chunk_size,
                                   const std::optional<std::string> &expected_checksum = std::nullopt);

        ChunkAck upload_chunk(const std::string &session_id, std::uint64_t chunk_id, std::span<const std::byte> data);

        CompletionResult complete_upload(const std::string &session_id);

        // Completes without comparing against the expected checksum.
        CompletionResult force_complete(const std::string &session_id);

        // Ascending ids of chunks that are not yet completed.
        std::vector<std::uint64_t> resume_upload(const std::string &session_id);

        bool cancel_upload(const std::string &session_id);

        ProgressSummary get_upload_progress(const std::string &session_id) const;

        std::vector<ChunkInfo> chunk_table(const std::string &session_id) const;

        bool pause_upload(const std::string &session_id);
        bool unpause_upload(const std::string &session_id);

        std::vector<std::string> expire_idle_sessions();
        std::vector<std::string> expire_idle_sessions(std::chrono::seconds ttl);

        std::size_t restore_sessions();

        std::vector<std::string> list_sessions() const;

        const EngineConfig &config() const noexcept { return config_; }

    private:
        std::shared_ptr<TransferSession> require(const std::string &session_id) const;
        CompletionResult finish(const std::string &session_id, bool verify_checksum);
        void validate_new_session(const std::string &file_id, const std::string &filename, std::uint64_t total_size,
                                  std::uint64_t chunk_size) const;
        // Caller must hold session.mutex.
        std::optional<IndexRecord> record_locked(TransferSession &session);
        void persist(const std::string &session_id, const std::optional<IndexRecord> &record);
        void forget(const std::string &session_id);

        EngineConfig config_;
        ChunkStore &store_;
        SessionRegistry &registry_;
        ProgressTracker &tracker_;
        std::optional<SessionIndex> index_;
    };

} // namespace chunkdrive::server
