#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropcode/crypto.hpp"
#include "dropcode/error_codes.hpp"
#include "dropcode/http_fields.hpp"
#include "dropcode/protocol.hpp"
#include "dropcode/version.hpp"

using namespace dropcode;
using namespace dropcode::protocol;

void run_server_component_tests();
void run_server_api_tests();
void run_client_component_tests();

namespace
{

    void test_init_request_parsing()
    {
        const auto json = nlohmann::json::parse(R"({
            "fileName": "holiday.mov",
            "fileSize": 12000000,
            "mimeType": "video/quicktime",
            "totalChunks": 3,
            "chunkSize": 5000000,
            "fingerprint": "holiday.mov_12000000_1700000000000",
            "uploadId": "abc123"
        })");
        const auto request = json.get<UploadInitRequest>();
        assert(request.file_name == "holiday.mov");
        assert(request.file_size == 12000000);
        assert(request.total_chunks == 3);
        assert(request.chunk_size == 5000000);
        assert(request.mime_type == "video/quicktime");
        assert(request.upload_id == std::optional<std::string>("abc123"));
        assert(!request.max_downloads);

        const auto encoded = nlohmann::json(request);
        assert(encoded.at("fileName") == "holiday.mov");
        assert(encoded.at("uploadId") == "abc123");
        assert(!encoded.contains("maxDownloads"));
    }

    void test_init_request_lenient_numbers()
    {
        const auto json = nlohmann::json::parse(R"({
            "fileName": "a.txt",
            "fileSize": -5,
            "totalChunks": 2.5,
            "chunkSize": null,
            "maxDownloads": 4.0,
            "uploadId": ""
        })");
        const auto request = json.get<UploadInitRequest>();
        assert(request.file_size == 0);
        assert(request.total_chunks == 0);
        assert(request.chunk_size == 0);
        assert(request.max_downloads == std::optional<std::uint64_t>(4));
        assert(!request.upload_id);
        assert(request.mime_type.empty());

        bool caught = false;
        try
        {
            (void)nlohmann::json::parse(R"({"fileName": "a", "fileSize": "big"})").get<UploadInitRequest>();
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            (void)nlohmann::json::parse(R"({"fileName": "a", "fileSize": 1e30})").get<UploadInitRequest>();
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);

        const auto largest = nlohmann::json::parse(R"({"fileSize": 9007199254740992.0})").get<UploadInitRequest>();
        assert(largest.file_size == 9007199254740992ULL);

        caught = false;
        try
        {
            (void)nlohmann::json::parse("[1, 2]").get<UploadInitRequest>();
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_response_shapes()
    {
        const UploadStatusResponse status{
            .upload_id = "u1",
            .code = "ABCD2345",
            .complete = false,
            .uploaded_chunks = {0, 2},
            .total_chunks = 3,
        };
        const auto status_json = nlohmann::json(status);
        assert(status_json.at("uploadId") == "u1");
        assert(status_json.at("uploadedChunks") == nlohmann::json::array({0, 2}));
        assert(status_json.at("totalChunks") == 3);
        assert(status_json.at("complete") == false);

        const DownloadMeta meta{
            .code = "ABCD2345",
            .file_name = "a.txt",
            .file_size = 10,
            .mime_type = "text/plain",
            .remaining_downloads = 2,
            .checksum = "ff",
        };
        const auto decoded = nlohmann::json(meta).get<DownloadMeta>();
        assert(decoded.file_name == "a.txt");
        assert(decoded.remaining_downloads == 2);
        assert(decoded.checksum == "ff");

        const auto error_json = nlohmann::json(ErrorBody{.code = ErrorCode::IncompleteUpload, .message = "2 of 3"});
        assert(error_json.at("error") == "2 of 3");
        assert(error_json.at("code") == "incomplete_upload");
        assert(error_json.get<ErrorBody>().code == ErrorCode::IncompleteUpload);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::SessionNotFound) == "session_not_found");
        assert(error_code_from_string("range_not_satisfiable") == ErrorCode::RangeNotSatisfiable);
        assert(!error_code_from_string("nonsense"));
        assert(http_status(ErrorCode::InvalidRequest) == 400);
        assert(http_status(ErrorCode::IndexOutOfRange) == 400);
        assert(http_status(ErrorCode::IncompleteUpload) == 400);
        assert(http_status(ErrorCode::CodeNotFound) == 404);
        assert(http_status(ErrorCode::RangeNotSatisfiable) == 416);
        assert(http_status(ErrorCode::MissingChunk) == 500);

        const ServiceError error(ErrorCode::IoError, "disk full");
        assert(error.code() == ErrorCode::IoError);
        assert(std::string(error.what()) == "disk full");

        assert(normalize_code("ab2cd3ef") == "AB2CD3EF");
        assert(!version().empty());
    }

    void test_range_parsing()
    {
        using http_fields::parse_range;

        const auto first = parse_range("bytes=0-99", 1000);
        assert(first && first->start == 0 && first->end == 99 && first->length() == 100);

        const auto open = parse_range("bytes=500-", 1000);
        assert(open && open->start == 500 && open->end == 999);

        const auto suffix = parse_range("bytes=-100", 1000);
        assert(suffix && suffix->start == 900 && suffix->end == 999);

        const auto large_suffix = parse_range("bytes=-5000", 1000);
        assert(large_suffix && large_suffix->start == 0);

        const auto clamped = parse_range("bytes=990-2000", 1000);
        assert(clamped && clamped->end == 999);

        assert(!parse_range("bytes=1000-", 1000));
        assert(!parse_range("bytes=50-10", 1000));
        assert(!parse_range("bytes=0-1,5-9", 1000));
        assert(!parse_range("items=0-1", 1000));
        assert(!parse_range("bytes=abc", 1000));
        assert(!parse_range("bytes=-0", 1000));
        assert(!parse_range("bytes=0-", 0));

        assert(http_fields::content_range(*first, 1000) == "bytes 0-99/1000");
        assert(http_fields::unsatisfied_range(1000) == "bytes */1000");
        assert(http_fields::range_from(42) == "bytes=42-");
    }

    void test_content_disposition()
    {
        assert(http_fields::content_disposition("report.pdf") == "attachment; filename*=UTF-8''report.pdf");
        assert(http_fields::content_disposition("my file.txt") == "attachment; filename*=UTF-8''my%20file.txt");
        // "résumé.pdf" in UTF-8
        assert(http_fields::content_disposition("r\xC3\xA9sum\xC3\xA9.pdf") ==
               "attachment; filename*=UTF-8''r%C3%A9sum%C3%A9.pdf");
        assert(http_fields::percent_encode("a/b;c") == "a%2Fb%3Bc");
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_stream(stream) == chunk_hash);

        crypto::StreamingHash streaming;
        streaming.update(std::span(chunk).first(1));
        streaming.update(std::span(chunk).subspan(1));
        assert(streaming.finish() == chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "dropcode_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);
        std::filesystem::remove(file_path);

        const auto id = crypto::random_hex(20);
        assert(id.size() == 20);
        assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(crypto::random_hex(20) != id);

        std::set<std::uint32_t> seen;
        for (int i = 0; i < 500; ++i)
        {
            const auto value = crypto::random_uniform(32);
            assert(value < 32);
            seen.insert(value);
        }
        assert(seen.size() > 16);
    }

} // namespace

int main()
{
    try
    {
        crypto::ensure_sodium_init();
        test_init_request_parsing();
        test_init_request_lenient_numbers();
        test_response_shapes();
        test_error_codes();
        test_range_parsing();
        test_content_disposition();
        test_crypto();
        run_server_component_tests();
        run_server_api_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
