#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/server/transfer_session.hpp"

namespace chunkdrive::server
{

    struct IndexRecord
    {
        std::uint64_t version{};
        nlohmann::json document;
    };

    // Sidecar persistence of chunk tables, one <session_id>.json beside each
    // staging file. Lets a restarted process resume sessions it did not create.
    //
    // Records are taken under the session lock and written after it is released;
    // a record older than the last one written, or written after remove(), is dropped.
    class SessionIndex
    {
    public:
        explicit SessionIndex(std::filesystem::path directory);

        // Caller must hold session.mutex.
        static IndexRecord record(TransferSession &session);

        void write(const std::string &session_id, const IndexRecord &record);

        void remove(const std::string &session_id);

        std::vector<std::shared_ptr<TransferSession>> load_all();

    private:
        std::filesystem::path path_for(const std::string &session_id) const;
        bool is_stale(const std::string &session_id, std::uint64_t version) const;

        std::filesystem::path directory_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::uint64_t> written_;
    };

} // namespace chunkdrive::server
