#include "dropcode/client/http_client.hpp"

#include <array>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace dropcode::client
{

    namespace
    {
        constexpr auto kUserAgent = "dropcode-client";
        constexpr std::size_t kDownloadBufferSize = 64 * 1024;
    } // namespace

    std::string HttpResult::error_message() const
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_object() && json.contains("error") && json.at("error").is_string())
        {
            return json.at("error").get<std::string>();
        }
        return body.empty() ? "HTTP " + std::to_string(status) : body;
    }

    HttpClient::HttpClient(std::string host, std::uint16_t port)
        : host_(std::move(host)), port_(port), stream_(io_context_)
    {
    }

    HttpClient::~HttpClient()
    {
        disconnect();
    }

    HttpResult HttpClient::get(const std::string &target)
    {
        auto request = make_request(http::verb::get, target);
        return perform(request);
    }

    HttpResult HttpClient::post_json(const std::string &target, const nlohmann::json &body)
    {
        auto request = make_request(http::verb::post, target);
        request.set(http::field::content_type, "application/json");
        request.body() = body.dump();
        request.prepare_payload();
        return perform(request);
    }

    HttpResult HttpClient::post_bytes(const std::string &target, std::span<const std::byte> body)
    {
        auto request = make_request(http::verb::post, target);
        request.set(http::field::content_type, "application/octet-stream");
        request.body().assign(reinterpret_cast<const char *>(body.data()), body.size());
        request.prepare_payload();
        return perform(request);
    }

    DownloadResult HttpClient::download(const std::string &target, const std::optional<std::string> &range,
                                        const HeaderHandler &on_header, const Sink &sink)
    {
        auto request = make_request(http::verb::get, target);
        if (range)
        {
            request.set(http::field::range, *range);
        }
        std::optional<http::response_parser<http::buffer_body>> parser_slot;
        for (int attempt = 0;; ++attempt)
        {
            const bool reused = connected_;
            ensure_connected();
            try
            {
                parser_slot.emplace();
                parser_slot->body_limit(boost::none);
                http::write(stream_, request);
                http::read_header(stream_, buffer_, *parser_slot);
                break;
            }
            catch (const boost::system::system_error &)
            {
                disconnect();
                if (!reused || attempt > 0)
                {
                    throw;
                }
            }
        }
        auto &parser = *parser_slot;

        DownloadResult result;
        result.status = parser.get().result_int();
        result.header = parser.get().base();
        const bool success = result.status >= 200 && result.status < 300;
        if (success && on_header)
        {
            on_header(result.header);
        }

        std::array<char, kDownloadBufferSize> chunk{};
        while (!parser.is_done())
        {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            boost::beast::error_code ec;
            http::read(stream_, buffer_, parser, ec);
            if (ec == http::error::need_buffer)
            {
                ec = {};
            }
            if (ec)
            {
                disconnect();
                throw boost::system::system_error(ec);
            }
            const auto received = chunk.size() - parser.get().body().size;
            if (received == 0)
            {
                continue;
            }
            if (success)
            {
                sink(chunk.data(), received);
                result.bytes_written += received;
            }
            else
            {
                result.error_body.append(chunk.data(), received);
            }
        }
        if (!parser.keep_alive())
        {
            disconnect();
        }
        return result;
    }

    std::string HttpClient::endpoint() const
    {
        return host_ + ":" + std::to_string(port_);
    }

    HttpResult HttpClient::perform(http::request<http::string_body> &request)
    {
        for (int attempt = 0;; ++attempt)
        {
            const bool reused = connected_;
            ensure_connected();
            try
            {
                http::write(stream_, request);
                http::response<http::string_body> response;
                http::read(stream_, buffer_, response);
                if (!response.keep_alive())
                {
                    disconnect();
                }
                return HttpResult{response.result_int(), std::move(response.body())};
            }
            catch (const boost::system::system_error &)
            {
                disconnect();
                if (!reused || attempt > 0)
                {
                    throw;
                }
            }
        }
    }

    http::request<http::string_body> HttpClient::make_request(http::verb method, const std::string &target) const
    {
        http::request<http::string_body> request{method, target, 11};
        request.set(http::field::host, host_);
        request.set(http::field::user_agent, kUserAgent);
        request.keep_alive(true);
        return request;
    }

    void HttpClient::ensure_connected()
    {
        if (connected_)
        {
            return;
        }
        boost::asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host_, std::to_string(port_));
        stream_.connect(endpoints);
        buffer_.clear();
        connected_ = true;
    }

    void HttpClient::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        boost::beast::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.close();
        connected_ = false;
    }

} // namespace dropcode::client
