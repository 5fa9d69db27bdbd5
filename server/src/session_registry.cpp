#include "chunkdrive/server/session_registry.hpp"

#include <functional>

namespace chunkdrive::server
{

    bool SessionRegistry::insert(std::shared_ptr<TransferSession> session)
    {
        auto &shard = shard_for(session->session_id);
        std::lock_guard lock(shard.mutex);
        const auto key = session->session_id;
        return shard.sessions.emplace(key, std::move(session)).second;
    }

    std::shared_ptr<TransferSession> SessionRegistry::find(const std::string &session_id) const
    {
        const auto &shard = shard_for(session_id);
        std::lock_guard lock(shard.mutex);
        auto it = shard.sessions.find(session_id);
        if (it != shard.sessions.end())
        {
            return it->second;
        }
        return nullptr;
    }

    std::shared_ptr<TransferSession> SessionRegistry::remove(const std::string &session_id)
    {
        auto &shard = shard_for(session_id);
        std::lock_guard lock(shard.mutex);
        auto it = shard.sessions.find(session_id);
        if (it == shard.sessions.end())
        {
            return nullptr;
        }
        auto session = std::move(it->second);
        shard.sessions.erase(it);
        return session;
    }

    std::vector<std::shared_ptr<TransferSession>> SessionRegistry::snapshot() const
    {
        std::vector<std::shared_ptr<TransferSession>> result;
        for (const auto &shard : shards_)
        {
            std::lock_guard lock(shard.mutex);
            for (const auto &[id, session] : shard.sessions)
            {
                result.push_back(session);
            }
        }
        return result;
    }

    std::size_t SessionRegistry::size() const
    {
        std::size_t total = 0;
        for (const auto &shard : shards_)
        {
            std::lock_guard lock(shard.mutex);
            total += shard.sessions.size();
        }
        return total;
    }

    SessionRegistry::Shard &SessionRegistry::shard_for(const std::string &session_id)
    {
        return shards_[std::hash<std::string>{}(session_id) % kShardCount];
    }

    const SessionRegistry::Shard &SessionRegistry::shard_for(const std::string &session_id) const
    {
        return shards_[std::hash<std::string>{}(session_id) % kShardCount];
    }

} // namespace chunkdrive::server
