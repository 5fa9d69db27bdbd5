#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkdrive::server
{

    struct EngineConfig
    {
        std::filesystem::path staging_dir{"staging"};
        std::filesystem::path upload_dir{"uploads"};
        // 0 disables the limit.
        std::uint64_t max_file_size{100ULL * 1024 * 1024};
        // Upper bound on chunks per session, which bounds the chunk table. 0 disables the limit.
        std::uint64_t max_chunks{1ULL << 20};
        // Lowercase extensions including the dot; empty accepts any name.
        std::vector<std::string> allowed_extensions;
        std::chrono::seconds idle_ttl{std::chrono::seconds{3600}};
        bool persist_index{false};
    };

    struct ServiceConfig
    {
        EngineConfig engine;
        std::size_t worker_threads{0};
        std::uint64_t ingest_chunk_size{8192};
        std::chrono::seconds sweep_interval{std::chrono::seconds{60}};
        std::chrono::seconds progress_retention{std::chrono::seconds{300}};
        std::size_t speed_window{10};
        std::size_t event_queue_capacity{1024};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        std::vector<std::filesystem::path> ingest_files;
    };

    // Reads a JSON config file; keys that are absent keep their defaults.
    ServiceConfig load_config_file(const std::filesystem::path &path, ServiceConfig defaults = {});

} // namespace chunkdrive::server
