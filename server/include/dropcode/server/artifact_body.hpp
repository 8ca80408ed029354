#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/file.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

namespace dropcode::server
{

    /**
     * Beast body streaming `length` bytes of a file starting at `offset`, used for
     * both full and partial (206) artifact responses.
     */
    struct ArtifactBody
    {
        struct value_type
        {
            boost::beast::file file;
            std::uint64_t offset{};
            std::uint64_t length{};

            void open(const std::filesystem::path &path, std::uint64_t start, std::uint64_t count,
                      boost::beast::error_code &ec)
            {
                file.open(path.c_str(), boost::beast::file_mode::scan, ec);
                if (ec)
                {
                    return;
                }
                const auto size = file.size(ec);
                if (ec)
                {
                    return;
                }
                if (start > size || count > size - start)
                {
                    ec = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
                    return;
                }
                offset = start;
                length = count;
            }

            bool is_open() const { return file.is_open(); }
        };

        static std::uint64_t size(const value_type &body)
        {
            return body.length;
        }

        class writer
        {
        public:
            using const_buffers_type = boost::asio::const_buffer;

            template <bool isRequest, class Fields>
            writer(boost::beast::http::header<isRequest, Fields> &, value_type &body)
                : body_(body), remain_(body.length)
            {
            }

            void init(boost::beast::error_code &ec)
            {
                body_.file.seek(body_.offset, ec);
            }

            boost::optional<std::pair<const_buffers_type, bool>> get(boost::beast::error_code &ec)
            {
                const auto amount = static_cast<std::size_t>(std::min<std::uint64_t>(remain_, buffer_.size()));
                if (amount == 0)
                {
                    ec = {};
                    return boost::none;
                }
                const auto read = body_.file.read(buffer_.data(), amount, ec);
                if (ec)
                {
                    return boost::none;
                }
                if (read == 0)
                {
                    ec = boost::beast::http::error::short_read;
                    return boost::none;
                }
                remain_ -= read;
                return {{const_buffers_type{buffer_.data(), read}, remain_ > 0}};
            }

        private:
            value_type &body_;
            std::uint64_t remain_;
            std::array<char, 16 * 1024> buffer_{};
        };
    };

} // namespace dropcode::server
