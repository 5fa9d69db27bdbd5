/**
 * ChunkDrive - Checksum and identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace chunkdrive::crypto
{

    // BLAKE2b digests, lowercase hex.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    std::string random_hex(std::size_t byte_count);

} // namespace chunkdrive::crypto
