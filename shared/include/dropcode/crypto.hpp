/**
 * DropCode - Randomness and content hashing built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

namespace dropcode::crypto
{

    void ensure_sodium_init();

    // Uniformly distributed value in [0, upper_bound).
    std::uint32_t random_uniform(std::uint32_t upper_bound);

    // `length` lowercase hex characters drawn from the CSPRNG.
    std::string random_hex(std::size_t length);

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /**
     * Incremental BLAKE2b digest, fed while bytes are streamed elsewhere.
     */
    class StreamingHash
    {
    public:
        StreamingHash();
        ~StreamingHash();

        StreamingHash(const StreamingHash &) = delete;
        StreamingHash &operator=(const StreamingHash &) = delete;

        void update(std::span<const std::byte> data);

        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

} // namespace dropcode::crypto
