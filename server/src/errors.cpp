#include "chunkdrive/server/errors.hpp"

#include <sstream>

namespace chunkdrive::server
{

    namespace
    {

        std::string describe_missing(const std::vector<std::uint64_t> &missing)
        {
            std::ostringstream oss;
            oss << "Upload incomplete, missing " << missing.size() << " chunk(s): [";
            for (std::size_t i = 0; i < missing.size(); ++i)
            {
                if (i > 0)
                {
                    oss << ", ";
                }
                oss << missing[i];
            }
            oss << "]";
            return oss.str();
        }

    } // namespace

    TransferError::TransferError(chunkdrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    InvalidArgumentError::InvalidArgumentError(std::string message)
        : TransferError(chunkdrive::ErrorCode::InvalidArgument, std::move(message)) {}

    FileTooLargeError::FileTooLargeError(std::uint64_t requested, std::uint64_t limit)
        : TransferError(chunkdrive::ErrorCode::FileTooLarge,
                        "File size " + std::to_string(requested) + " exceeds limit of " + std::to_string(limit) +
                            " bytes") {}

    AllocationError::AllocationError(std::string message)
        : TransferError(chunkdrive::ErrorCode::AllocationFailed, std::move(message)) {}

    SessionNotFoundError::SessionNotFoundError(const std::string &session_id)
        : TransferError(chunkdrive::ErrorCode::NotFound, "Session not found: " + session_id) {}

    InvalidChunkError::InvalidChunkError(std::uint64_t chunk_id, std::uint64_t total_chunks)
        : TransferError(chunkdrive::ErrorCode::InvalidChunk,
                        "Invalid chunk id " + std::to_string(chunk_id) + " (session has " +
                            std::to_string(total_chunks) + " chunks)") {}

    SizeMismatchError::SizeMismatchError(std::uint64_t chunk_id, std::uint64_t expected, std::uint64_t actual)
        : TransferError(chunkdrive::ErrorCode::SizeMismatch,
                        "Chunk " + std::to_string(chunk_id) + " expects " + std::to_string(expected) +
                            " bytes, got " + std::to_string(actual)) {}

    ChunkIoError::ChunkIoError(std::string message)
        : TransferError(chunkdrive::ErrorCode::IoFailure, std::move(message)) {}

    ChunkBusyError::ChunkBusyError(std::uint64_t chunk_id)
        : TransferError(chunkdrive::ErrorCode::Busy,
                        "Chunk " + std::to_string(chunk_id) + " upload already in progress") {}

    IncompleteTransferError::IncompleteTransferError(std::vector<std::uint64_t> missing_chunks)
        : TransferError(chunkdrive::ErrorCode::IncompleteTransfer, describe_missing(missing_chunks)),
          missing_(std::move(missing_chunks)) {}

    IntegrityError::IntegrityError(std::string expected, std::string computed)
        : TransferError(chunkdrive::ErrorCode::IntegrityMismatch,
                        "File checksum mismatch: expected " + expected + ", computed " + computed),
          expected_(std::move(expected)), computed_(std::move(computed)) {}

} // namespace chunkdrive::server
