#include <cassert>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "dropcode/client/http_client.hpp"
#include "dropcode/server/api_handler.hpp"
#include "dropcode/server/code_generator.hpp"
#include "dropcode/server/config.hpp"
#include "dropcode/server/download_server.hpp"
#include "dropcode/server/merger.hpp"
#include "dropcode/server/server.hpp"
#include "dropcode/server/session_store.hpp"
#include "dropcode/server/staging_area.hpp"
#include "dropcode/server/upload_coordinator.hpp"

using namespace dropcode;
using namespace dropcode::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string pattern_string(std::size_t size, unsigned seed)
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>((i * 131 + seed) & 0xFF);
        }
        return data;
    }

    struct Api
    {
        explicit Api(const std::filesystem::path &root)
            : store(root),
              staging(root),
              merger(staging),
              uploads(CoordinatorServices{store, staging, merger, codes}, root / "files", 8 * 1024 * 1024),
              downloads(store),
              handler(uploads, downloads)
        {
        }

        HttpResponse call(http::verb method, const std::string &target, std::string body = {},
                          std::optional<std::string> range = std::nullopt)
        {
            HttpRequest request{method, target, 11};
            request.set(http::field::host, "localhost");
            if (range)
            {
                request.set(http::field::range, *range);
            }
            request.body() = std::move(body);
            request.prepare_payload();
            return handler.handle(request);
        }

        nlohmann::json json_call(http::verb method, const std::string &target, unsigned expected_status,
                                 std::string body = {})
        {
            auto response = call(method, target, std::move(body));
            assert(response_status(response) == expected_status);
            const auto &json_response = std::get<JsonResponse>(response);
            assert(json_response[http::field::content_type] == "application/json; charset=utf-8");
            return nlohmann::json::parse(json_response.body());
        }

        SessionStore store;
        StagingArea staging;
        Merger merger;
        CodeGenerator codes;
        UploadCoordinator uploads;
        DownloadServer downloads;
        ApiHandler handler;
    };

    std::string read_body(FileResponse &response)
    {
        auto &body = response.body();
        std::string data(static_cast<std::size_t>(body.length), '\0');
        boost::beast::error_code ec;
        body.file.seek(body.offset, ec);
        assert(!ec);
        std::size_t filled = 0;
        while (filled < data.size())
        {
            const auto read = body.file.read(data.data() + filled, data.size() - filled, ec);
            assert(!ec);
            assert(read > 0);
            filled += read;
        }
        return data;
    }

    nlohmann::json init_body(const std::string &name, std::uint64_t size, std::uint64_t chunk_size)
    {
        return {
            {"fileName", name},
            {"fileSize", size},
            {"mimeType", "application/octet-stream"},
            {"totalChunks", (size + chunk_size - 1) / chunk_size},
            {"chunkSize", chunk_size},
            {"fingerprint", name + "_" + std::to_string(size) + "_1"},
        };
    }

    void test_api_upload_and_download_flow()
    {
        const auto root = std::filesystem::temp_directory_path() / "dropcode_api_flow";
        cleanup_path(root);
        Api api(root);

        constexpr std::uint64_t kSize = 12000000;
        constexpr std::uint64_t kChunk = 5000000;
        const auto data = pattern_string(kSize, 3);

        const auto init = api.json_call(http::verb::post, "/api/upload/init", 200,
                                        init_body("archive.zip", kSize, kChunk).dump());
        const auto upload_id = init.at("uploadId").get<std::string>();
        const auto code = init.at("code").get<std::string>();
        assert(upload_id.size() == 20);
        assert(CodeGenerator::is_well_formed(code));
        assert(init.at("uploadedChunks").empty());
        assert(init.at("chunkSize") == kChunk);
        assert(init.at("totalChunks") == 3);

        const std::string chunk_base = "/api/upload/" + upload_id + "/chunk?index=";
        api.json_call(http::verb::post, chunk_base + "2", 200, data.substr(2 * kChunk));
        api.json_call(http::verb::post, chunk_base + "0", 200, data.substr(0, kChunk));

        const auto incomplete = api.json_call(http::verb::post, "/api/upload/" + upload_id + "/complete", 400);
        assert(incomplete.at("code") == "incomplete_upload");

        const auto status = api.json_call(http::verb::get, "/api/upload/status/" + upload_id, 200);
        assert(status.at("uploadedChunks") == nlohmann::json::array({0, 2}));
        assert(status.at("totalChunks") == 3);
        assert(status.at("complete") == false);
        assert(status.at("code") == code);

        auto resume_body = init_body("archive.zip", kSize, kChunk);
        resume_body["uploadId"] = upload_id;
        const auto resumed = api.json_call(http::verb::post, "/api/upload/init", 200, resume_body.dump());
        assert(resumed.at("uploadId") == upload_id);
        assert(resumed.at("code") == code);
        assert(resumed.at("uploadedChunks") == nlohmann::json::array({0, 2}));

        api.json_call(http::verb::post, chunk_base + "1", 200, data.substr(kChunk, kChunk));
        const auto completed = api.json_call(http::verb::post, "/api/upload/" + upload_id + "/complete", 200);
        assert(completed.at("ok") == true);
        assert(completed.at("code") == code);
        const auto repeated = api.json_call(http::verb::post, "/api/upload/" + upload_id + "/complete", 200);
        assert(repeated.at("code") == code);

        const auto meta = api.json_call(http::verb::get, "/api/download/" + code + "/meta", 200);
        assert(meta.at("fileName") == "archive.zip");
        assert(meta.at("fileSize") == kSize);
        assert(meta.at("remainingDownloads") == 1);

        auto download = api.call(http::verb::get, "/api/download/" + code);
        assert(response_status(download) == 200);
        auto &file = std::get<FileResponse>(download);
        assert(file[http::field::content_length] == std::to_string(kSize));
        assert(file[http::field::accept_ranges] == "bytes");
        assert(file[http::field::content_disposition] == "attachment; filename*=UTF-8''archive.zip");
        assert(file[http::field::etag] == "\"" + meta.at("checksum").get<std::string>() + "\"");
        assert(read_body(file) == data);

        cleanup_path(root);
    }

    void test_api_range_requests()
    {
        const auto root = std::filesystem::temp_directory_path() / "dropcode_api_range";
        cleanup_path(root);
        Api api(root);

        const auto data = pattern_string(1000, 8);
        const auto init =
            api.json_call(http::verb::post, "/api/upload/init", 200, init_body("notes.txt", 1000, 1000).dump());
        const auto upload_id = init.at("uploadId").get<std::string>();
        const auto code = init.at("code").get<std::string>();
        api.json_call(http::verb::post, "/api/upload/" + upload_id + "/chunk?index=0", 200, data);
        api.json_call(http::verb::post, "/api/upload/" + upload_id + "/complete", 200);

        auto partial = api.call(http::verb::get, "/api/download/" + code, {}, std::string("bytes=0-99"));
        assert(response_status(partial) == 206);
        auto &head = std::get<FileResponse>(partial);
        assert(head[http::field::content_length] == "100");
        assert(head[http::field::content_range] == "bytes 0-99/1000");
        assert(read_body(head) == data.substr(0, 100));

        auto tail = api.call(http::verb::get, "/api/download/" + code, {}, std::string("bytes=-10"));
        assert(response_status(tail) == 206);
        assert(read_body(std::get<FileResponse>(tail)) == data.substr(990));

        auto past_end = api.call(http::verb::get, "/api/download/" + code, {}, std::string("bytes=1000-"));
        assert(response_status(past_end) == 416);
        assert(std::get<JsonResponse>(past_end)[http::field::content_range] == "bytes */1000");

        auto multi = api.call(http::verb::get, "/api/download/" + code, {}, std::string("bytes=0-1,4-5"));
        assert(response_status(multi) == 416);

        std::string lower = code;
        for (auto &ch : lower)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        assert(response_status(api.call(http::verb::get, "/api/download/" + lower)) == 200);

        cleanup_path(root);
    }

    void test_api_error_mapping()
    {
        const auto root = std::filesystem::temp_directory_path() / "dropcode_api_errors";
        cleanup_path(root);
        Api api(root);

        const auto unknown_code = api.json_call(http::verb::get, "/api/download/ZZZZZZZZ/meta", 404);
        assert(unknown_code.at("code") == "code_not_found");
        assert(!unknown_code.at("error").get<std::string>().empty());
        assert(response_status(api.call(http::verb::get, "/api/download/ZZZZZZZZ")) == 404);

        assert(api.json_call(http::verb::get, "/api/upload/status/nope", 404).at("code") == "session_not_found");
        assert(api.json_call(http::verb::post, "/api/upload/nope/chunk?index=0", 404, "x").at("code") ==
               "session_not_found");
        assert(api.json_call(http::verb::post, "/api/upload/nope/complete", 404).at("code") == "session_not_found");

        assert(api.json_call(http::verb::post, "/api/upload/init", 400, "{not json").at("code") == "invalid_request");
        assert(api.json_call(http::verb::post, "/api/upload/init", 400, R"({"fileName":"a"})").at("code") ==
               "invalid_request");
        assert(api.json_call(http::verb::post, "/api/upload/init", 400,
                             R"({"fileName":"a","fileSize":1e30,"totalChunks":1,"chunkSize":4})")
                   .at("code") == "invalid_request");
        assert(api.json_call(http::verb::get, "/api/upload/init", 405).at("code") == "method_not_allowed");
        assert(api.json_call(http::verb::get, "/api/nothing", 404).at("code") == "not_found");
        assert(api.json_call(http::verb::get, "/index.html", 404).at("code") == "not_found");

        const auto init = api.json_call(http::verb::post, "/api/upload/init", 200, init_body("a.bin", 8, 4).dump());
        const auto chunk_base = "/api/upload/" + init.at("uploadId").get<std::string>() + "/chunk";
        assert(api.json_call(http::verb::post, chunk_base, 400, "abcd").at("code") == "invalid_request");
        assert(api.json_call(http::verb::post, chunk_base + "?index=abc", 400, "abcd").at("code") ==
               "invalid_request");
        assert(api.json_call(http::verb::post, chunk_base + "?index=-1", 400, "abcd").at("code") ==
               "index_out_of_range");
        assert(api.json_call(http::verb::post, chunk_base + "?index=2", 400, "abcd").at("code") ==
               "index_out_of_range");
        assert(api.json_call(http::verb::post, chunk_base + "?index=1", 400, "ab").at("code") == "invalid_request");

        cleanup_path(root);
    }

    void test_server_over_socket()
    {
        const auto root = std::filesystem::temp_directory_path() / "dropcode_server_socket";
        cleanup_path(root);

        ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = root;
        config.worker_threads = 2;
        Server server(config);
        const auto port = server.port();
        std::thread runner([&server]
                           { server.run(); });

        {
            client::HttpClient http("127.0.0.1", port);
            const auto data = pattern_string(10, 4);
            const auto init = http.post_json("/api/upload/init", init_body("hello.txt", 10, 4));
            assert(init.status == 200);
            const auto session = nlohmann::json::parse(init.body);
            const auto upload_id = session.at("uploadId").get<std::string>();
            const auto code = session.at("code").get<std::string>();

            for (std::uint64_t index = 0; index < 3; ++index)
            {
                const auto piece = data.substr(index * 4, 4);
                const auto result = http.post_bytes("/api/upload/" + upload_id + "/chunk?index=" +
                                                        std::to_string(index),
                                                    std::as_bytes(std::span(piece.data(), piece.size())));
                assert(result.ok());
            }
            assert(http.post_bytes("/api/upload/" + upload_id + "/complete", {}).ok());

            std::string received;
            const auto download = http.download("/api/download/" + code, std::string("bytes=4-"), nullptr,
                                                [&received](const char *bytes, std::size_t size)
                                                { received.append(bytes, size); });
            assert(download.status == 206);
            assert(received == data.substr(4));

            const auto missing = http.get("/api/download/ZZZZZZZZ/meta");
            assert(missing.status == 404);
            assert(missing.error_message() == "No completed upload for this code");
        }

        server.stop();
        runner.join();

        SessionStore reloaded(root);
        assert(reloaded.size() == 1);
        cleanup_path(root);
    }

    void test_server_concurrent_connections()
    {
        const auto root = std::filesystem::temp_directory_path() / "dropcode_server_concurrent";
        cleanup_path(root);

        ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = root;
        config.worker_threads = 4;
        config.request_timeout = std::chrono::seconds(1);
        Server server(config);
        const auto port = server.port();
        std::thread runner([&server]
                           { server.run(); });

        // A connection that never sends a request is closed once the timeout expires.
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket idle(io);
        idle.connect({boost::asio::ip::make_address("127.0.0.1"), port});

        constexpr std::size_t kClients = 6;
        std::vector<std::string> codes(kClients);
        std::vector<std::thread> clients;
        for (std::size_t worker = 0; worker < kClients; ++worker)
        {
            clients.emplace_back(
                [&codes, port, worker]
                {
                    client::HttpClient http("127.0.0.1", port);
                    const auto name = "file" + std::to_string(worker) + ".bin";
                    const auto data = pattern_string(4096, static_cast<unsigned>(worker));
                    const auto init = http.post_json("/api/upload/init", init_body(name, data.size(), 1024));
                    assert(init.ok());
                    const auto upload_id = nlohmann::json::parse(init.body).at("uploadId").get<std::string>();
                    for (std::uint64_t index = 0; index < 4; ++index)
                    {
                        const auto piece = data.substr(index * 1024, 1024);
                        assert(http.post_bytes("/api/upload/" + upload_id + "/chunk?index=" + std::to_string(index),
                                               std::as_bytes(std::span(piece.data(), piece.size())))
                                   .ok());
                        assert(http.get("/api/upload/status/" + upload_id).ok());
                    }
                    const auto complete = http.post_bytes("/api/upload/" + upload_id + "/complete", {});
                    assert(complete.ok());
                    codes[worker] = nlohmann::json::parse(complete.body).at("code").get<std::string>();
                });
        }
        for (auto &thread : clients)
        {
            thread.join();
        }

        char byte = 0;
        boost::system::error_code ec;
        const auto read = idle.read_some(boost::asio::buffer(&byte, 1), ec);
        assert(read == 0);
        assert(ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset);

        // The server keeps serving after the idle connection was dropped.
        client::HttpClient late("127.0.0.1", port);
        for (std::size_t worker = 0; worker < kClients; ++worker)
        {
            const auto meta = late.get("/api/download/" + codes[worker] + "/meta");
            assert(meta.ok());
            assert(nlohmann::json::parse(meta.body).at("fileSize") == 4096);
        }

        server.stop();
        runner.join();

        SessionStore reloaded(root);
        assert(reloaded.size() == kClients);
        cleanup_path(root);
    }

} // namespace

void run_server_api_tests()
{
    test_api_upload_and_download_flow();
    test_api_range_requests();
    test_api_error_mapping();
    test_server_over_socket();
    test_server_concurrent_connections();
}
