#include "chunkdrive/server/session_index.hpp"

#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/server/errors.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kIndexSuffix = ".json";
        constexpr auto kPartialSuffix = ".part";
        constexpr auto kRemoved = std::numeric_limits<std::uint64_t>::max();

        nlohmann::json to_json(const TransferSession &session)
        {
            nlohmann::json chunks = nlohmann::json::array();
            for (const auto &chunk : session.chunks)
            {
                nlohmann::json entry = {
                    {"id", chunk.chunk_id},
                    {"status", std::string(to_string(chunk.status))},
                    {"retries", chunk.retry_count},
                };
                if (!chunk.checksum.empty())
                {
                    entry["checksum"] = chunk.checksum;
                }
                chunks.push_back(std::move(entry));
            }

            nlohmann::json json = {
                {"session_id", session.session_id},
                {"file_id", session.file_id},
                {"filename", session.filename},
                {"total_size", session.total_size},
                {"chunk_size", session.chunk_size},
                {"created_at", to_unix_millis(session.created_at)},
                {"last_activity", to_unix_millis(session.last_activity)},
                {"chunks", std::move(chunks)},
            };
            if (session.expected_checksum)
            {
                json["expected_checksum"] = *session.expected_checksum;
            }
            return json;
        }

        std::shared_ptr<TransferSession> session_from_json(const nlohmann::json &json)
        {
            std::optional<std::string> expected;
            if (auto it = json.find("expected_checksum"); it != json.end())
            {
                expected = it->get<std::string>();
            }
            auto session = std::make_shared<TransferSession>(
                json.at("session_id").get<std::string>(), json.at("file_id").get<std::string>(),
                json.at("filename").get<std::string>(), json.at("total_size").get<std::uint64_t>(),
                json.at("chunk_size").get<std::uint64_t>(), std::move(expected),
                from_unix_millis(json.value("created_at", 0LL)));
            if (session->chunk_size == 0)
            {
                throw std::runtime_error("Persisted session has zero chunk size");
            }

            session->last_activity = from_unix_millis(json.value("last_activity", 0LL));
            for (const auto &entry : json.at("chunks"))
            {
                const auto id = entry.at("id").get<std::uint64_t>();
                if (id >= session->total_chunks)
                {
                    throw std::runtime_error("Persisted chunk id out of range");
                }
                auto &chunk = session->chunks[static_cast<std::size_t>(id)];
                const auto status = chunk_status_from_string(entry.value("status", std::string{}));
                chunk.retry_count = entry.value("retries", 0u);
                // An interrupted write cannot be trusted.
                chunk.status = (!status || *status == ChunkStatus::Uploading) ? ChunkStatus::Pending : *status;
                if (chunk.status == ChunkStatus::Completed)
                {
                    chunk.checksum = entry.value("checksum", std::string{});
                    ++session->uploaded_chunks;
                    session->uploaded_bytes += chunk.size();
                }
            }
            return session;
        }

    } // namespace

    SessionIndex::SessionIndex(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    IndexRecord SessionIndex::record(TransferSession &session)
    {
        return IndexRecord{.version = ++session.index_version, .document = to_json(session)};
    }

    void SessionIndex::write(const std::string &session_id, const IndexRecord &record)
    {
        if (is_stale(session_id, record.version))
        {
            return;
        }

        const auto path = path_for(session_id);
        auto temp_path = path;
        temp_path += "." + std::to_string(record.version) + kPartialSuffix;
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw ChunkIoError("Failed to write session index " + temp_path.string());
            }
            out << record.document.dump(2);
            if (!out)
            {
                throw ChunkIoError("Failed to write session index " + temp_path.string());
            }
        }

        std::error_code ec;
        std::lock_guard lock(mutex_);
        auto &latest = written_[session_id];
        if (record.version <= latest)
        {
            std::filesystem::remove(temp_path, ec);
            return;
        }
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            const auto message = ec.message();
            std::filesystem::remove(temp_path, ec);
            throw ChunkIoError("Failed to replace session index: " + message);
        }
        latest = record.version;
    }

    void SessionIndex::remove(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        written_[session_id] = kRemoved;
        std::error_code ec;
        std::filesystem::remove(path_for(session_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove session index for {}: {}", session_id, ec.message());
        }
    }

    std::vector<std::shared_ptr<TransferSession>> SessionIndex::load_all()
    {
        std::vector<std::shared_ptr<TransferSession>> sessions;
        for (const auto &entry : std::filesystem::directory_iterator(directory_))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            if (entry.path().extension() == kPartialSuffix)
            {
                // Left behind by a write that never completed.
                std::error_code ec;
                std::filesystem::remove(entry.path(), ec);
                continue;
            }
            if (entry.path().extension() != kIndexSuffix)
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                sessions.push_back(session_from_json(json));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping unreadable session index {}: {}", entry.path().string(), ex.what());
            }
        }
        return sessions;
    }

    bool SessionIndex::is_stale(const std::string &session_id, std::uint64_t version) const
    {
        std::lock_guard lock(mutex_);
        auto it = written_.find(session_id);
        return it != written_.end() && version <= it->second;
    }

    std::filesystem::path SessionIndex::path_for(const std::string &session_id) const
    {
        return directory_ / (session_id + kIndexSuffix);
    }

} // namespace chunkdrive::server
