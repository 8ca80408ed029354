#include "dropcode/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace dropcode::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::uint32_t random_uniform(std::uint32_t upper_bound)
    {
        ensure_initialized_once();
        if (upper_bound == 0)
        {
            throw std::invalid_argument("random_uniform requires a positive bound");
        }
        return randombytes_uniform(upper_bound);
    }

    std::string random_hex(std::size_t length)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes((length + 1) / 2);
        randombytes_buf(bytes.data(), bytes.size());
        auto hex = to_hex(bytes);
        hex.resize(length);
        return hex;
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        StreamingHash hash;
        hash.update(data);
        return hash.finish();
    }

    std::string hash_stream(std::istream &input)
    {
        StreamingHash hash;
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hash.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return hash.finish();
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

    struct StreamingHash::State
    {
        crypto_generichash_state hash{};
        bool finished{false};
    };

    StreamingHash::StreamingHash()
        : state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_->hash, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    StreamingHash::~StreamingHash() = default;

    void StreamingHash::update(std::span<const std::byte> data)
    {
        if (state_->finished)
        {
            throw std::logic_error("StreamingHash updated after finish");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_->hash, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string StreamingHash::finish()
    {
        if (state_->finished)
        {
            throw std::logic_error("StreamingHash finished twice");
        }
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_->hash, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        state_->finished = true;
        return to_hex(digest);
    }

} // namespace dropcode::crypto
