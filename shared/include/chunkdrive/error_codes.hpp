/**
 * ChunkDrive - Shared error codes used across the engine and its hosts.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        InvalidChunk = 2,
        SizeMismatch = 3,
        NotFound = 4,
        FileTooLarge = 5,
        AllocationFailed = 6,
        IoFailure = 7,
        Busy = 8,
        IncompleteTransfer = 9,
        IntegrityMismatch = 10,
        InternalError = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace chunkdrive
