#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::server
{

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(chunkdrive::ErrorCode code, std::string message);

        chunkdrive::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrive::ErrorCode code_;
    };

    class InvalidArgumentError : public TransferError
    {
    public:
        explicit InvalidArgumentError(std::string message);
    };

    class FileTooLargeError : public TransferError
    {
    public:
        FileTooLargeError(std::uint64_t requested, std::uint64_t limit);
    };

    class AllocationError : public TransferError
    {
    public:
        explicit AllocationError(std::string message);
    };

    class SessionNotFoundError : public TransferError
    {
    public:
        explicit SessionNotFoundError(const std::string &session_id);
    };

    class InvalidChunkError : public TransferError
    {
    public:
        InvalidChunkError(std::uint64_t chunk_id, std::uint64_t total_chunks);
    };

    class SizeMismatchError : public TransferError
    {
    public:
        SizeMismatchError(std::uint64_t chunk_id, std::uint64_t expected, std::uint64_t actual);
    };

    class ChunkIoError : public TransferError
    {
    public:
        explicit ChunkIoError(std::string message);
    };

    class ChunkBusyError : public TransferError
    {
    public:
        explicit ChunkBusyError(std::uint64_t chunk_id);
    };

    class IncompleteTransferError : public TransferError
    {
    public:
        explicit IncompleteTransferError(std::vector<std::uint64_t> missing_chunks);

        const std::vector<std::uint64_t> &missing_chunks() const noexcept { return missing_; }

    private:
        std::vector<std::uint64_t> missing_;
    };

    class IntegrityError : public TransferError
    {
    public:
        IntegrityError(std::string expected, std::string computed);

        const std::string &expected() const noexcept { return expected_; }
        const std::string &computed() const noexcept { return computed_; }

    private:
        std::string expected_;
        std::string computed_;
    };

} // namespace chunkdrive::server
