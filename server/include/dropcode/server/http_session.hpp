#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "dropcode/server/api_handler.hpp"

namespace dropcode::server
{

    // One accepted connection; serves keep-alive requests until the peer leaves.
    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(boost::asio::ip::tcp::socket socket, ApiHandler &handler, std::uint64_t body_limit,
                    std::chrono::seconds timeout);

        void start();

    private:
        void read_request();
        void on_read(const boost::beast::error_code &ec, std::size_t bytes_transferred);
        void send(HttpResponse response);
        void on_write(bool close, const boost::beast::error_code &ec, std::size_t bytes_transferred);
        void close();

        std::string remote_endpoint() const;

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        std::shared_ptr<void> in_flight_;
        ApiHandler &handler_;
        std::uint64_t body_limit_;
        std::chrono::seconds timeout_;
        std::string request_line_;
    };

} // namespace dropcode::server
