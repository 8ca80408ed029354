#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>

namespace dropcode::server
{

    /**
     * Per-session chunk staging under `<root>/tmp/<session>/<index>.part`.
     * Each write lands in a private temporary file and is renamed into place,
     * so concurrent writers of one index never leave a torn chunk behind.
     */
    class StagingArea
    {
    public:
        explicit StagingArea(std::filesystem::path root);

        std::filesystem::path session_dir(const std::string &session_id) const;
        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t index) const;

        void provision(const std::string &session_id);

        void write_chunk(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data);

        bool has_chunk(const std::string &session_id, std::uint64_t index) const;

        // The returned stream is not open when the chunk is absent.
        std::ifstream open_chunk(const std::string &session_id, std::uint64_t index) const;

        bool exists(const std::string &session_id) const;

        void discard(const std::string &session_id);

    private:
        std::filesystem::path base_;
    };

} // namespace dropcode::server
