#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace dropcode::client
{

    namespace http = boost::beast::http;

    struct HttpResult
    {
        unsigned status{};
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }

        // `error` field of a JSON error body, or the raw body.
        std::string error_message() const;
    };

    struct DownloadResult
    {
        unsigned status{};
        http::response_header<> header;
        std::uint64_t bytes_written{};
        // Body of a non-2xx response.
        std::string error_body;
    };

    /**
     * Blocking HTTP/1.1 client holding one keep-alive connection. A request that
     * fails on a reused connection is retried once on a fresh one.
     */
    class HttpClient
    {
    public:
        using Sink = std::function<void(const char *data, std::size_t size)>;
        // Called once with the header of a successful response, before any body bytes.
        using HeaderHandler = std::function<void(const http::response_header<> &header)>;

        HttpClient(std::string host, std::uint16_t port);
        ~HttpClient();

        HttpResult get(const std::string &target);
        HttpResult post_json(const std::string &target, const nlohmann::json &body);
        HttpResult post_bytes(const std::string &target, std::span<const std::byte> body);

        // Streams a response body into `sink` without buffering it whole.
        DownloadResult download(const std::string &target, const std::optional<std::string> &range,
                                const HeaderHandler &on_header, const Sink &sink);

        std::string endpoint() const;

    private:
        HttpResult perform(http::request<http::string_body> &request);
        http::request<http::string_body> make_request(http::verb method, const std::string &target) const;
        void ensure_connected();
        void disconnect();

        std::string host_;
        std::uint16_t port_;
        boost::asio::io_context io_context_;
        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        bool connected_{false};
    };

} // namespace dropcode::client
