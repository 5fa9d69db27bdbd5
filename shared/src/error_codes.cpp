#include "chunkdrive/error_codes.hpp"

#include <array>

namespace chunkdrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::InvalidChunk, "invalid_chunk"},
            {ErrorCode::SizeMismatch, "size_mismatch"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::FileTooLarge, "file_too_large"},
            {ErrorCode::AllocationFailed, "allocation_failed"},
            {ErrorCode::IoFailure, "io_failure"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::IncompleteTransfer, "incomplete_transfer"},
            {ErrorCode::IntegrityMismatch, "integrity_mismatch"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace chunkdrive
