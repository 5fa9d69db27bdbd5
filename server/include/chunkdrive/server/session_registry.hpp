#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkdrive/server/transfer_session.hpp"

namespace chunkdrive::server
{

    // Table of live sessions. Entries are spread over independently locked
    // shards so lookups for unrelated sessions do not contend.
    class SessionRegistry
    {
    public:
        static constexpr std::size_t kShardCount = 16;

        bool insert(std::shared_ptr<TransferSession> session);

        std::shared_ptr<TransferSession> find(const std::string &session_id) const;

        std::shared_ptr<TransferSession> remove(const std::string &session_id);

        std::vector<std::shared_ptr<TransferSession>> snapshot() const;

        std::size_t size() const;

    private:
        struct Shard
        {
            mutable std::mutex mutex;
            std::unordered_map<std::string, std::shared_ptr<TransferSession>> sessions;
        };

        Shard &shard_for(const std::string &session_id);
        const Shard &shard_for(const std::string &session_id) const;

        std::array<Shard, kShardCount> shards_;
    };

} // namespace chunkdrive::server
