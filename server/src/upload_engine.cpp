#include "chunkdrive/server/upload_engine.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/errors.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::size_t kSessionIdBytes = 16;

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        // Session ids double as staging file names.
        bool is_well_formed_id(const std::string &session_id)
        {
            return !session_id.empty() && std::all_of(session_id.begin(), session_id.end(), [](unsigned char c)
                                                      { return std::isxdigit(c) != 0; });
        }

    } // namespace

    ChunkedUploadEngine::ChunkedUploadEngine(EngineConfig config, ChunkStore &store, SessionRegistry &registry,
                                             ProgressTracker &tracker)
        : config_(std::move(config)), store_(store), registry_(registry), tracker_(tracker)
    {
        if (config_.persist_index)
        {
            index_.emplace(store_.staging_dir());
        }
    }

    std::string ChunkedUploadEngine::create_session(const std::string &file_id, const std::string &filename,
                                                    std::uint64_t total_size, std::uint64_t chunk_size,
                                                    const std::optional<std::string> &expected_checksum)
    {
        validate_new_session(file_id, filename, total_size, chunk_size);

        std::optional<std::string> checksum;
        if (expected_checksum && !expected_checksum->empty())
        {
            checksum = to_lower(*expected_checksum);
        }

        auto session = std::make_shared<TransferSession>(crypto::random_hex(kSessionIdBytes), file_id, filename,
                                                         total_size, chunk_size, std::move(checksum));
        const auto session_id = session->session_id;

        store_.allocate(session_id, total_size);
        if (!registry_.insert(session))
        {
            store_.release(session_id);
            throw TransferError(chunkdrive::ErrorCode::InternalError, "Session id collision: " + session_id);
        }
        std::optional<IndexRecord> record;
        {
            std::lock_guard lock(session->mutex);
            record = record_locked(*session);
        }
        persist(session_id, record);

        tracker_.track(session_id, filename, total_size);
        tracker_.start_transfer(session_id);
        spdlog::info("Created upload session {} for {} ({} bytes, {} chunks of {} bytes)", session_id, filename,
                     total_size, session->total_chunks, chunk_size);
        return session_id;
    }

    ChunkAck ChunkedUploadEngine::upload_chunk(const std::string &session_id, std::uint64_t chunk_id,
                                               std::span<const std::byte> data)
    {
        auto session = require(session_id);
        if (chunk_id >= session->total_chunks)
        {
            throw InvalidChunkError(chunk_id, session->total_chunks);
        }
        const auto index = static_cast<std::size_t>(chunk_id);

        std::uint64_t offset{};
        std::uint64_t size{};
        bool retrying = false;
        {
            std::lock_guard lock(session->mutex);
            if (session->phase == SessionPhase::Closed)
            {
                throw SessionNotFoundError(session_id);
            }
            auto &chunk = session->chunks[index];
            if (data.size() != chunk.size())
            {
                throw SizeMismatchError(chunk_id, chunk.size(), data.size());
            }
            switch (chunk.status)
            {
            case ChunkStatus::Completed:
                spdlog::debug("Chunk {} of session {} already stored, ignoring resend", chunk_id, session_id);
                return ChunkAck{.ok = true, .duplicate = true, .message = "Chunk already uploaded"};
            case ChunkStatus::Uploading:
                throw ChunkBusyError(chunk_id);
            case ChunkStatus::Failed:
                retrying = true;
                chunk.status = ChunkStatus::Uploading;
                break;
            case ChunkStatus::Pending:
                chunk.status = ChunkStatus::Uploading;
                break;
            }
            offset = chunk.start_offset;
            size = chunk.size();
        }

        if (retrying)
        {
            tracker_.record_retry(session_id);
        }

        std::string checksum;
        try
        {
            checksum = crypto::hash_bytes(data);
            store_.write_at(session_id, offset, data);
            if (index_)
            {
                // The sidecar must never list a chunk whose bytes are not durable.
                store_.sync(session_id);
            }
        }
        catch (const std::exception &ex)
        {
            std::optional<IndexRecord> record;
            bool closed = false;
            {
                std::lock_guard lock(session->mutex);
                auto &chunk = session->chunks[index];
                if (chunk.status == ChunkStatus::Uploading)
                {
                    chunk.status = ChunkStatus::Failed;
                    ++chunk.retry_count;
                }
                closed = session->phase == SessionPhase::Closed;
                if (!closed)
                {
                    record = record_locked(*session);
                }
            }
            if (closed)
            {
                // Cancellation released the staging file underneath this write.
                spdlog::debug("Discarding chunk {} of closed session {}: {}", chunk_id, session_id, ex.what());
                return ChunkAck{.ok = false, .duplicate = false, .message = "Session closed, chunk discarded"};
            }
            persist(session_id, record);
            spdlog::warn("Chunk {} of session {} failed: {}", chunk_id, session_id, ex.what());
            tracker_.record_error(session_id, ex.what());
            throw;
        }

        std::uint64_t transferred{};
        std::optional<IndexRecord> record;
        {
            std::lock_guard lock(session->mutex);
            if (session->phase == SessionPhase::Closed)
            {
                spdlog::debug("Discarding chunk {} written after session {} closed", chunk_id, session_id);
                return ChunkAck{.ok = false, .duplicate = false, .message = "Session closed, chunk discarded"};
            }
            auto &chunk = session->chunks[index];
            chunk.status = ChunkStatus::Completed;
            chunk.checksum = std::move(checksum);
            ++session->uploaded_chunks;
            session->uploaded_bytes += size;
            session->last_activity = std::chrono::system_clock::now();
            transferred = session->uploaded_bytes;
            record = record_locked(*session);
        }
        persist(session_id, record);

        tracker_.update_progress(session_id, transferred);
        return ChunkAck{.ok = true, .duplicate = false, .message = "Chunk stored"};
    }

    CompletionResult ChunkedUploadEngine::complete_upload(const std::string &session_id)
    {
        return finish(session_id, true);
    }

    CompletionResult ChunkedUploadEngine::force_complete(const std::string &session_id)
    {
        return finish(session_id, false);
    }

    std::vector<std::uint64_t> ChunkedUploadEngine::resume_upload(const std::string &session_id)
    {
        auto session = require(session_id);
        std::vector<std::uint64_t> missing;
        {
            std::lock_guard lock(session->mutex);
            missing = session->missing_chunks();
        }
        if (tracker_.resume_transfer(session_id))
        {
            spdlog::info("Resumed paused upload session {}", session_id);
        }
        spdlog::debug("Session {} resume requested, {} chunk(s) missing", session_id, missing.size());
        return missing;
    }

    bool ChunkedUploadEngine::cancel_upload(const std::string &session_id)
    {
        if (!is_well_formed_id(session_id))
        {
            return true;
        }
        auto session = registry_.remove(session_id);
        if (session)
        {
            std::lock_guard lock(session->mutex);
            session->phase = SessionPhase::Closed;
        }
        store_.release(session_id);
        if (index_)
        {
            index_->remove(session_id);
        }
        if (session)
        {
            tracker_.cancel_transfer(session_id);
            spdlog::info("Cancelled upload session {} ({})", session_id, session->filename);
        }
        return true;
    }

    ProgressSummary ChunkedUploadEngine::get_upload_progress(const std::string &session_id) const
    {
        auto session = require(session_id);
        ProgressSummary summary{};
        summary.session_id = session->session_id;
        summary.file_id = session->file_id;
        summary.filename = session->filename;
        summary.total_size = session->total_size;
        summary.chunk_size = session->chunk_size;
        summary.total_chunks = session->total_chunks;
        summary.created_at = session->created_at;

        std::lock_guard lock(session->mutex);
        summary.uploaded_chunks = session->uploaded_chunks;
        summary.uploaded_bytes = session->uploaded_bytes;
        summary.missing_chunks = session->missing_chunks();
        summary.last_activity = session->last_activity;
        summary.progress_percent = session->total_size == 0
                                       ? 100.0
                                       : static_cast<double>(session->uploaded_bytes) /
                                             static_cast<double>(session->total_size) * 100.0;
        return summary;
    }

    std::vector<ChunkInfo> ChunkedUploadEngine::chunk_table(const std::string &session_id) const
    {
        auto session = require(session_id);
        std::lock_guard lock(session->mutex);
        return session->chunks;
    }

    bool ChunkedUploadEngine::pause_upload(const std::string &session_id)
    {
        (void)require(session_id);
        return tracker_.pause_transfer(session_id);
    }

    bool ChunkedUploadEngine::unpause_upload(const std::string &session_id)
    {
        (void)require(session_id);
        return tracker_.resume_transfer(session_id);
    }

    std::vector<std::string> ChunkedUploadEngine::expire_idle_sessions()
    {
        return expire_idle_sessions(config_.idle_ttl);
    }

    std::vector<std::string> ChunkedUploadEngine::expire_idle_sessions(std::chrono::seconds ttl)
    {
        const auto now = std::chrono::system_clock::now();
        std::vector<std::string> expired;
        for (const auto &session : registry_.snapshot())
        {
            std::lock_guard lock(session->mutex);
            if (session->phase == SessionPhase::Active && now - session->last_activity > ttl)
            {
                expired.push_back(session->session_id);
            }
        }

        for (const auto &session_id : expired)
        {
            auto session = registry_.remove(session_id);
            if (!session)
            {
                continue;
            }
            {
                std::lock_guard lock(session->mutex);
                session->phase = SessionPhase::Closed;
            }
            store_.release(session_id);
            if (index_)
            {
                index_->remove(session_id);
            }
            tracker_.fail_transfer(session_id, "Session expired after " + std::to_string(ttl.count()) +
                                                   "s without activity");
            spdlog::info("Expired idle upload session {} ({})", session_id, session->filename);
        }
        return expired;
    }

    std::size_t ChunkedUploadEngine::restore_sessions()
    {
        if (!index_)
        {
            return 0;
        }
        std::size_t restored = 0;
        for (auto &session : index_->load_all())
        {
            const auto session_id = session->session_id;
            if (registry_.find(session_id))
            {
                continue;
            }
            try
            {
                store_.attach(session_id, session->total_size);
            }
            catch (const AllocationError &ex)
            {
                spdlog::warn("Dropping persisted session {}: {}", session_id, ex.what());
                index_->remove(session_id);
                continue;
            }

            const auto uploaded = session->uploaded_bytes;
            const auto total_size = session->total_size;
            const auto filename = session->filename;
            if (!registry_.insert(std::move(session)))
            {
                continue;
            }
            tracker_.track(session_id, filename, total_size);
            tracker_.start_transfer(session_id);
            if (uploaded > 0)
            {
                tracker_.update_progress(session_id, uploaded);
            }
            ++restored;
        }
        if (restored > 0)
        {
            spdlog::info("Restored {} upload session(s) from {}", restored, store_.staging_dir().string());
        }
        return restored;
    }

    std::vector<std::string> ChunkedUploadEngine::list_sessions() const
    {
        std::vector<std::string> ids;
        for (const auto &session : registry_.snapshot())
        {
            ids.push_back(session->session_id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    std::shared_ptr<TransferSession> ChunkedUploadEngine::require(const std::string &session_id) const
    {
        auto session = registry_.find(session_id);
        if (!session)
        {
            throw SessionNotFoundError(session_id);
        }
        return session;
    }

    CompletionResult ChunkedUploadEngine::finish(const std::string &session_id, bool verify_checksum)
    {
        auto session = require(session_id);
        {
            std::lock_guard lock(session->mutex);
            switch (session->phase)
            {
            case SessionPhase::Active:
                break;
            case SessionPhase::Finalizing:
                throw TransferError(chunkdrive::ErrorCode::Busy, "Session " + session_id + " is already completing");
            case SessionPhase::Closed:
                throw SessionNotFoundError(session_id);
            }
            auto missing = session->missing_chunks();
            if (!missing.empty())
            {
                throw IncompleteTransferError(std::move(missing));
            }
            session->phase = SessionPhase::Finalizing;
        }

        const auto reopen = [&session]()
        {
            std::lock_guard lock(session->mutex);
            if (session->phase == SessionPhase::Finalizing)
            {
                session->phase = SessionPhase::Active;
            }
        };

        std::string computed;
        try
        {
            computed = crypto::hash_file(store_.staging_path(session_id));
        }
        catch (const std::exception &ex)
        {
            reopen();
            tracker_.record_error(session_id, ex.what());
            throw ChunkIoError(std::string("Failed to checksum staged file: ") + ex.what());
        }

        if (verify_checksum && session->expected_checksum && computed != *session->expected_checksum)
        {
            reopen();
            IntegrityError error(*session->expected_checksum, computed);
            spdlog::warn("Session {}: {}", session_id, error.what());
            tracker_.record_error(session_id, error.what());
            throw error;
        }

        std::filesystem::path final_path;
        try
        {
            final_path = store_.merge(session_id, store_.destination_path(session->file_id, session->filename));
        }
        catch (const TransferError &ex)
        {
            reopen();
            tracker_.record_error(session_id, ex.what());
            throw;
        }
        catch (const std::exception &ex)
        {
            reopen();
            tracker_.record_error(session_id, ex.what());
            throw ChunkIoError(std::string("Failed to publish staged file: ") + ex.what());
        }

        {
            std::lock_guard lock(session->mutex);
            session->phase = SessionPhase::Closed;
        }
        forget(session_id);
        tracker_.complete_transfer(session_id);
        spdlog::info("Completed upload session {} -> {}", session_id, final_path.string());

        return CompletionResult{
            .ok = true,
            .message = verify_checksum ? "Upload completed" : "Upload completed without checksum verification",
            .final_path = final_path,
            .checksum = computed,
        };
    }

    void ChunkedUploadEngine::validate_new_session(const std::string &file_id, const std::string &filename,
                                                   std::uint64_t total_size, std::uint64_t chunk_size) const
    {
        validate_destination_names(file_id, filename);
        if (chunk_size == 0)
        {
            throw InvalidArgumentError("Chunk size must be greater than zero");
        }
        if (config_.max_file_size > 0 && total_size > config_.max_file_size)
        {
            throw FileTooLargeError(total_size, config_.max_file_size);
        }
        const auto chunks = count_chunks(total_size, chunk_size);
        if (config_.max_chunks > 0 && chunks > config_.max_chunks)
        {
            throw InvalidArgumentError("Chunk size " + std::to_string(chunk_size) + " splits " +
                                       std::to_string(total_size) + " bytes into " + std::to_string(chunks) +
                                       " chunks, limit is " + std::to_string(config_.max_chunks));
        }
        if (!config_.allowed_extensions.empty())
        {
            const auto extension = to_lower(std::filesystem::path(filename).extension().string());
            if (std::find(config_.allowed_extensions.begin(), config_.allowed_extensions.end(), extension) ==
                config_.allowed_extensions.end())
            {
                throw InvalidArgumentError("File type not allowed: " + (extension.empty() ? filename : extension));
            }
        }
    }

    std::optional<IndexRecord> ChunkedUploadEngine::record_locked(TransferSession &session)
    {
        if (!index_)
        {
            return std::nullopt;
        }
        return SessionIndex::record(session);
    }

    void ChunkedUploadEngine::persist(const std::string &session_id, const std::optional<IndexRecord> &record)
    {
        if (!index_ || !record)
        {
            return;
        }
        try
        {
            index_->write(session_id, *record);
        }
        catch (const TransferError &ex)
        {
            // The chunk data is already durable; a stale index only costs a re-upload.
            spdlog::warn("Failed to persist index for session {}: {}", session_id, ex.what());
        }
    }

    void ChunkedUploadEngine::forget(const std::string &session_id)
    {
        registry_.remove(session_id);
        if (index_)
        {
            index_->remove(session_id);
        }
    }

} // namespace chunkdrive::server
