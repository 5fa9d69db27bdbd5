#include "chunkdrive/server/chunk_store.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/errors.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kStagingSuffix = ".tmp";

        std::string errno_message(const std::string &what, int error)
        {
            return what + ": " + std::strerror(error);
        }

        bool same_contents(const std::filesystem::path &left, const std::filesystem::path &right)
        {
            std::error_code left_ec;
            std::error_code right_ec;
            const auto left_size = std::filesystem::file_size(left, left_ec);
            const auto right_size = std::filesystem::file_size(right, right_ec);
            if (left_ec || right_ec || left_size != right_size)
            {
                return false;
            }
            try
            {
                return crypto::hash_file(left) == crypto::hash_file(right);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Failed to compare {} with {}: {}", left.string(), right.string(), ex.what());
                return false;
            }
        }

    } // namespace

    void validate_destination_names(const std::string &file_id, const std::string &filename)
    {
        const auto check = [](const std::string &value, const char *label)
        {
            if (value.empty())
            {
                throw InvalidArgumentError(std::string(label) + " must not be empty");
            }
            if (value == "." || value == "..")
            {
                throw InvalidArgumentError(std::string(label) + " must not be a relative path component");
            }
            if (value.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
            {
                throw InvalidArgumentError(std::string(label) + " must not contain path separators");
            }
        };
        check(file_id, "file id");
        check(filename, "filename");
    }

    class ChunkStore::StagingFile
    {
    public:
        StagingFile(int fd, std::uint64_t size) : fd_(fd), size_(size) {}

        ~StagingFile()
        {
            if (fd_ >= 0)
            {
                ::close(fd_);
            }
        }

        StagingFile(const StagingFile &) = delete;
        StagingFile &operator=(const StagingFile &) = delete;

        int fd() const noexcept { return fd_; }
        std::uint64_t size() const noexcept { return size_; }

    private:
        int fd_;
        std::uint64_t size_;
    };

    ChunkStore::ChunkStore(std::filesystem::path staging_dir, std::filesystem::path upload_dir)
        : staging_dir_(std::move(staging_dir)), upload_dir_(std::move(upload_dir))
    {
        std::filesystem::create_directories(staging_dir_);
        std::filesystem::create_directories(upload_dir_);
    }

    ChunkStore::~ChunkStore() = default;

    std::filesystem::path ChunkStore::staging_path(const std::string &session_id) const
    {
        return staging_dir_ / (session_id + kStagingSuffix);
    }

    std::filesystem::path ChunkStore::destination_path(const std::string &file_id, const std::string &filename) const
    {
        validate_destination_names(file_id, filename);
        return upload_dir_ / (file_id + "_" + filename);
    }

    void ChunkStore::allocate(const std::string &session_id, std::uint64_t size)
    {
        if (contains(session_id))
        {
            throw AllocationError("Staging file already allocated for session " + session_id);
        }
        std::error_code ec;
        const auto info = std::filesystem::space(staging_dir_, ec);
        if (!ec && info.available < size)
        {
            throw AllocationError("Insufficient space in staging area: need " + std::to_string(size) +
                                  " bytes, " + std::to_string(info.available) + " available");
        }

        auto file = open_file(session_id, size, true);
        if (size > 0)
        {
            const auto length = static_cast<off_t>(size);
            const int rc = ::posix_fallocate(file->fd(), 0, length);
            if (rc == ENOSPC || rc == EFBIG)
            {
                file.reset();
                std::filesystem::remove(staging_path(session_id), ec);
                throw AllocationError(errno_message("Failed to pre-allocate staging file", rc));
            }
            if (rc != 0 && ::ftruncate(file->fd(), length) != 0)
            {
                const int error = errno;
                file.reset();
                std::filesystem::remove(staging_path(session_id), ec);
                throw AllocationError(errno_message("Failed to size staging file", error));
            }
        }

        std::lock_guard lock(mutex_);
        if (!files_.emplace(session_id, std::move(file)).second)
        {
            throw AllocationError("Staging file already allocated for session " + session_id);
        }
        spdlog::debug("Allocated {} bytes for session {}", size, session_id);
    }

    void ChunkStore::attach(const std::string &session_id, std::uint64_t size)
    {
        const auto path = staging_path(session_id);
        std::error_code ec;
        const auto existing = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw AllocationError("Staging file missing for session " + session_id + ": " + ec.message());
        }
        if (existing != size)
        {
            throw AllocationError("Staging file for session " + session_id + " has size " +
                                  std::to_string(existing) + ", expected " + std::to_string(size));
        }
        auto file = open_file(session_id, size, false);
        std::lock_guard lock(mutex_);
        files_[session_id] = std::move(file);
    }

    void ChunkStore::write_at(const std::string &session_id, std::uint64_t offset, std::span<const std::byte> data)
    {
        const auto file = lookup(session_id);
        if (!file)
        {
            throw ChunkIoError("No staging file open for session " + session_id);
        }
        if (offset > file->size() || data.size() > file->size() - offset)
        {
            throw ChunkIoError("Write of " + std::to_string(data.size()) + " bytes at offset " +
                               std::to_string(offset) + " exceeds staging file size " +
                               std::to_string(file->size()));
        }

        const auto *cursor = reinterpret_cast<const char *>(data.data());
        std::size_t remaining = data.size();
        auto position = static_cast<off_t>(offset);
        while (remaining > 0)
        {
            const auto written = ::pwrite(file->fd(), cursor, remaining, position);
            if (written < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw ChunkIoError(errno_message("Write to staging file failed", errno));
            }
            cursor += written;
            remaining -= static_cast<std::size_t>(written);
            position += written;
        }
    }

    void ChunkStore::sync(const std::string &session_id)
    {
        const auto file = lookup(session_id);
        if (!file)
        {
            throw ChunkIoError("No staging file open for session " + session_id);
        }
        if (::fdatasync(file->fd()) != 0)
        {
            throw ChunkIoError(errno_message("Failed to flush staging file", errno));
        }
    }

    std::filesystem::path ChunkStore::merge(const std::string &session_id, const std::filesystem::path &destination)
    {
        if (const auto file = lookup(session_id); file && ::fsync(file->fd()) != 0)
        {
            throw ChunkIoError(errno_message("Failed to flush staging file", errno));
        }

        const auto source = staging_path(session_id);
        std::error_code ec;
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            throw ChunkIoError("Failed to create upload directory: " + ec.message());
        }

        // rename replaces an existing destination atomically.
        std::filesystem::rename(source, destination, ec);
        if (!ec)
        {
            detach(session_id);
            return destination;
        }
        if (ec != std::errc::cross_device_link)
        {
            throw ChunkIoError("Failed to move staging file into place: " + ec.message());
        }

        spdlog::debug("Staging area and upload directory are on different filesystems, copying {}", source.string());
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            throw ChunkIoError("Failed to copy staging file: " + ec.message());
        }
        if (!same_contents(source, destination))
        {
            std::filesystem::remove(destination, ec);
            throw ChunkIoError("Copied file does not match staging file");
        }
        detach(session_id);
        std::filesystem::remove(source, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove staging file {}: {}", source.string(), ec.message());
        }
        return destination;
    }

    bool ChunkStore::release(const std::string &session_id)
    {
        detach(session_id);
        std::error_code ec;
        const bool removed = std::filesystem::remove(staging_path(session_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove staging file for session {}: {}", session_id, ec.message());
        }
        return removed;
    }

    bool ChunkStore::contains(const std::string &session_id) const
    {
        return lookup(session_id) != nullptr;
    }

    std::shared_ptr<ChunkStore::StagingFile> ChunkStore::open_file(const std::string &session_id,
                                                                   std::uint64_t size, bool truncate)
    {
        const auto path = staging_path(session_id);
        int flags = O_RDWR | O_CLOEXEC;
        if (truncate)
        {
            flags |= O_CREAT | O_TRUNC;
        }
        const int fd = ::open(path.c_str(), flags, 0644);
        if (fd < 0)
        {
            throw AllocationError(errno_message("Failed to open staging file " + path.string(), errno));
        }
        return std::make_shared<StagingFile>(fd, size);
    }

    std::shared_ptr<ChunkStore::StagingFile> ChunkStore::lookup(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(session_id);
        if (it == files_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::shared_ptr<ChunkStore::StagingFile> ChunkStore::detach(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = files_.find(session_id);
        if (it == files_.end())
        {
            return nullptr;
        }
        auto file = std::move(it->second);
        files_.erase(it);
        return file;
    }

} // namespace chunkdrive::server
