#include "chunkdrive/server/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkdrive::server
{

    namespace
    {

        std::string normalize_extension(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (!value.empty() && value.front() != '.')
            {
                value.insert(value.begin(), '.');
            }
            return value;
        }

    } // namespace

    ServiceConfig load_config_file(const std::filesystem::path &path, ServiceConfig defaults)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open config file: " + path.string());
        }
        nlohmann::json json;
        in >> json;
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object: " + path.string());
        }

        ServiceConfig config = std::move(defaults);
        if (auto storage = json.find("storage"); storage != json.end())
        {
            auto &engine = config.engine;
            engine.staging_dir = storage->value("staging_dir", engine.staging_dir.string());
            engine.upload_dir = storage->value("upload_dir", engine.upload_dir.string());
            engine.max_file_size = storage->value("max_file_size", engine.max_file_size);
            engine.persist_index = storage->value("persist_index", engine.persist_index);
            engine.max_chunks = storage->value("max_chunks", engine.max_chunks);
            engine.idle_ttl = std::chrono::seconds(storage->value("idle_ttl", engine.idle_ttl.count()));
            if (auto extensions = storage->find("allowed_extensions"); extensions != storage->end())
            {
                engine.allowed_extensions.clear();
                for (const auto &item : *extensions)
                {
                    engine.allowed_extensions.push_back(normalize_extension(item.get<std::string>()));
                }
            }
        }
        if (auto service = json.find("service"); service != json.end())
        {
            config.worker_threads = service->value("worker_threads", config.worker_threads);
            config.ingest_chunk_size = service->value("chunk_size", config.ingest_chunk_size);
            config.sweep_interval = std::chrono::seconds(service->value("sweep_interval", config.sweep_interval.count()));
            config.progress_retention =
                std::chrono::seconds(service->value("progress_retention", config.progress_retention.count()));
            config.speed_window = service->value("speed_window", config.speed_window);
            config.event_queue_capacity = service->value("event_queue_capacity", config.event_queue_capacity);
        }
        if (auto logging = json.find("logging"); logging != json.end())
        {
            if (auto file = logging->find("file"); file != logging->end() && !file->is_null())
            {
                config.log_file = std::filesystem::path(file->get<std::string>());
            }
            config.verbose = logging->value("verbose", config.verbose);
        }
        return config;
    }

} // namespace chunkdrive::server
