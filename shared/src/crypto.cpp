#include "chunkdrive/crypto.hpp"

#include <array>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace chunkdrive::crypto
{

    namespace
    {
        constexpr std::size_t kReadBlockSize = 64 * 1024;

        void require_sodium()
        {
            static const int status = sodium_init();
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string bin_to_hex(const unsigned char *data, std::size_t size)
        {
            std::string hex(size * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), data, size);
            hex.pop_back();
            return hex;
        }

        // Incremental BLAKE2b with the default digest length.
        class Blake2b
        {
        public:
            Blake2b()
            {
                require_sodium();
                if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
                {
                    throw std::runtime_error("crypto_generichash_init failed");
                }
            }

            void update(const void *data, std::size_t size)
            {
                if (size == 0)
                {
                    return;
                }
                if (crypto_generichash_update(&state_, static_cast<const unsigned char *>(data), size) != 0)
                {
                    throw std::runtime_error("crypto_generichash_update failed");
                }
            }

            std::string hex_digest()
            {
                std::array<unsigned char, crypto_generichash_BYTES> digest{};
                if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
                {
                    throw std::runtime_error("crypto_generichash_final failed");
                }
                return bin_to_hex(digest.data(), digest.size());
            }

        private:
            crypto_generichash_state state_{};
        };

    } // namespace

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Blake2b hasher;
        hasher.update(data.data(), data.size());
        return hasher.hex_digest();
    }

    std::string hash_stream(std::istream &input)
    {
        Blake2b hasher;
        std::vector<char> block(kReadBlockSize);
        while (input.read(block.data(), static_cast<std::streamsize>(block.size())) || input.gcount() > 0)
        {
            hasher.update(block.data(), static_cast<std::size_t>(input.gcount()));
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }
        return hasher.hex_digest();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string random_hex(std::size_t byte_count)
    {
        require_sodium();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return bin_to_hex(bytes.data(), bytes.size());
    }

} // namespace chunkdrive::crypto
