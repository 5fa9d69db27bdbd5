#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

namespace chunkdrive::server
{

    // Throws InvalidArgumentError unless both names are usable as a single path component.
    void validate_destination_names(const std::string &file_id, const std::string &filename);

    // Byte-range staging storage. One pre-sized file per session under the
    // staging directory; writers share the descriptor through pwrite, so writes
    // to disjoint ranges of the same file need no lock.
    class ChunkStore
    {
    public:
        ChunkStore(std::filesystem::path staging_dir, std::filesystem::path upload_dir);
        virtual ~ChunkStore();

        ChunkStore(const ChunkStore &) = delete;
        ChunkStore &operator=(const ChunkStore &) = delete;

        const std::filesystem::path &staging_dir() const noexcept { return staging_dir_; }
        const std::filesystem::path &upload_dir() const noexcept { return upload_dir_; }

        std::filesystem::path staging_path(const std::string &session_id) const;

        // <upload_dir>/<file_id>_<filename>; throws InvalidArgumentError for
        // names that would escape the upload directory.
        std::filesystem::path destination_path(const std::string &file_id, const std::string &filename) const;

        // Creates and pre-sizes the staging file. Throws AllocationError.
        void allocate(const std::string &session_id, std::uint64_t size);

        // Reopens an existing staging file without truncating it. Throws AllocationError.
        void attach(const std::string &session_id, std::uint64_t size);

        // Positioned write inside the allocated range. Throws ChunkIoError.
        virtual void write_at(const std::string &session_id, std::uint64_t offset, std::span<const std::byte> data);

        // Flushes written data to disk. Throws ChunkIoError.
        void sync(const std::string &session_id);

        // Flushes and relocates the staging file, then closes it. On failure the
        // staging file stays open and in place. Throws ChunkIoError.
        std::filesystem::path merge(const std::string &session_id, const std::filesystem::path &destination);

        // Closes the handle and deletes the staging file. Returns whether a file was removed.
        bool release(const std::string &session_id);

        bool contains(const std::string &session_id) const;

    private:
        class StagingFile;

        std::shared_ptr<StagingFile> open_file(const std::string &session_id, std::uint64_t size, bool truncate);
        std::shared_ptr<StagingFile> lookup(const std::string &session_id) const;
        std::shared_ptr<StagingFile> detach(const std::string &session_id);

        std::filesystem::path staging_dir_;
        std::filesystem::path upload_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<StagingFile>> files_;
    };

} // namespace chunkdrive::server
