#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/upload_service.hpp"
#include "chunkdrive/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChunkDrive upload service " << chunkdrive::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] [--staging <DIR>] [--uploads <DIR>] [--threads <N>]"
                     " [--idle-ttl <seconds>] [--sweep-interval <seconds>] [--max-file-size <bytes>]"
                     " [--chunk-size <bytes>] [--persist-index] [--log <FILE>] [--verbose]"
                     " [--ingest <FILE>]...\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::filesystem::path> find_config_path(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkdrive::server::ServiceConfig;
    using chunkdrive::server::UploadService;

    ServiceConfig config;
    try
    {
        if (const auto config_path = find_config_path(argc, argv))
        {
            config = chunkdrive::server::load_config_file(*config_path);
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--persist-index")
            {
                config.engine.persist_index = true;
                continue;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
                continue;
            }

            const bool takes_value = arg == "--config" || arg == "--staging" || arg == "--uploads" ||
                                     arg == "--threads" || arg == "--idle-ttl" || arg == "--sweep-interval" ||
                                     arg == "--max-file-size" || arg == "--chunk-size" || arg == "--log" ||
                                     arg == "--ingest";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--staging")
            {
                config.engine.staging_dir = std::filesystem::path(*value);
            }
            else if (arg == "--uploads")
            {
                config.engine.upload_dir = std::filesystem::path(*value);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--idle-ttl")
            {
                config.engine.idle_ttl = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--max-file-size")
            {
                config.engine.max_file_size = std::stoull(*value);
            }
            else if (arg == "--chunk-size")
            {
                config.ingest_chunk_size = std::stoull(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--ingest")
            {
                config.ingest_files.emplace_back(*value);
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.ingest_chunk_size == 0)
    {
        std::cerr << "Chunk size must be greater than zero" << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("chunkdrive", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChunkDrive upload service {}", chunkdrive::version());

        UploadService service(std::move(config));
        if (!service.run())
        {
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Service failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
