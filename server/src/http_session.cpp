#include "dropcode/server/http_session.hpp"

#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/dispatch.hpp>
#include <spdlog/spdlog.h>

namespace dropcode::server
{

    namespace beast = boost::beast;

    HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, ApiHandler &handler, std::uint64_t body_limit,
                             std::chrono::seconds timeout)
        : stream_(std::move(socket)), handler_(handler), body_limit_(body_limit), timeout_(timeout)
    {
    }

    void HttpSession::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()]
                              { self->read_request(); });
    }

    void HttpSession::read_request()
    {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, *parser_,
                         [self = shared_from_this()](const beast::error_code &ec, std::size_t bytes)
                         { self->on_read(ec, bytes); });
    }

    void HttpSession::on_read(const beast::error_code &ec, std::size_t /*bytes_transferred*/)
    {
        if (ec == http::error::end_of_stream || ec == beast::error::timeout)
        {
            close();
            return;
        }
        if (ec == http::error::body_limit)
        {
            const auto &header = parser_->get();
            HttpRequest request{header.method(), header.target(), header.version()};
            request.keep_alive(false);
            send(ApiHandler::error_response(ErrorCode::InvalidRequest, request, "Request body too large"));
            return;
        }
        if (ec)
        {
            spdlog::debug("Read from {} failed: {}", remote_endpoint(), ec.message());
            close();
            return;
        }

        auto request = parser_->release();
        request_line_ = std::string(request.method_string()) + " " + std::string(request.target());
        send(handler_.handle(request));
    }

    void HttpSession::send(HttpResponse response)
    {
        spdlog::debug("{} {} -> {}", remote_endpoint(), request_line_, response_status(response));
        std::visit(
            [this](auto &message)
            {
                using Message = std::decay_t<decltype(message)>;
                auto shared = std::make_shared<Message>(std::move(message));
                in_flight_ = shared;
                stream_.expires_after(timeout_);
                http::async_write(stream_, *shared,
                                  [self = shared_from_this(), close_after = shared->need_eof()](
                                      const beast::error_code &ec, std::size_t bytes)
                                  { self->on_write(close_after, ec, bytes); });
            },
            response);
    }

    void HttpSession::on_write(bool close_after, const beast::error_code &ec, std::size_t /*bytes_transferred*/)
    {
        in_flight_.reset();
        if (ec)
        {
            spdlog::debug("Write to {} failed: {}", remote_endpoint(), ec.message());
            close();
            return;
        }
        if (close_after)
        {
            close();
            return;
        }
        read_request();
    }

    void HttpSession::close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        stream_.close();
    }

    std::string HttpSession::remote_endpoint() const
    {
        beast::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace dropcode::server
