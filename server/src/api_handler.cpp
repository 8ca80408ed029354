#include "dropcode/server/api_handler.hpp"

#include <charconv>
#include <optional>
#include <span>

#include <spdlog/spdlog.h>

#include "dropcode/http_fields.hpp"
#include "dropcode/protocol.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr auto kJsonContentType = "application/json; charset=utf-8";
        constexpr auto kServerName = "DropCode";

        std::vector<std::string> split_path(std::string_view path)
        {
            std::vector<std::string> segments;
            while (!path.empty())
            {
                const auto slash = path.find('/');
                const auto segment = path.substr(0, slash);
                if (!segment.empty())
                {
                    segments.emplace_back(segment);
                }
                if (slash == std::string_view::npos)
                {
                    break;
                }
                path.remove_prefix(slash + 1);
            }
            return segments;
        }

        std::optional<std::string_view> query_parameter(std::string_view query, std::string_view name)
        {
            while (!query.empty())
            {
                const auto amp = query.find('&');
                const auto pair = query.substr(0, amp);
                const auto eq = pair.find('=');
                if (pair.substr(0, eq) == name)
                {
                    return eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
                }
                if (amp == std::string_view::npos)
                {
                    break;
                }
                query.remove_prefix(amp + 1);
            }
            return std::nullopt;
        }

        std::uint64_t parse_chunk_index(std::string_view query)
        {
            const auto raw = query_parameter(query, "index");
            if (!raw || raw->empty())
            {
                throw ServiceError(ErrorCode::InvalidRequest, "Missing chunk index");
            }
            std::int64_t value = 0;
            const auto *end = raw->data() + raw->size();
            const auto [ptr, ec] = std::from_chars(raw->data(), end, value);
            if (ec != std::errc{} || ptr != end)
            {
                throw ServiceError(ErrorCode::InvalidRequest, "Invalid chunk index");
            }
            if (value < 0)
            {
                throw ServiceError(ErrorCode::IndexOutOfRange, "Chunk index must not be negative");
            }
            return static_cast<std::uint64_t>(value);
        }

        void require_method(const HttpRequest &request, http::verb verb)
        {
            if (request.method() != verb)
            {
                throw ServiceError(ErrorCode::MethodNotAllowed,
                                   "Method " + std::string(request.method_string()) + " not allowed");
            }
        }

    } // namespace

    ApiHandler::ApiHandler(UploadCoordinator &uploads, const DownloadServer &downloads)
        : uploads_(uploads), downloads_(downloads)
    {
    }

    HttpResponse ApiHandler::handle(const HttpRequest &request)
    {
        const std::string_view target(request.target().data(), request.target().size());
        const auto question = target.find('?');
        const auto path = target.substr(0, question);
        const auto query = question == std::string_view::npos ? std::string_view{} : target.substr(question + 1);

        try
        {
            const auto segments = split_path(path);
            if (segments.size() < 2 || segments[0] != "api")
            {
                throw ServiceError(ErrorCode::NotFound, "Not Found");
            }
            return route(request, segments, query);
        }
        catch (const RangeError &ex)
        {
            auto response = error_response(ex.code(), request, ex.what());
            response.set(http::field::content_range, http_fields::unsatisfied_range(ex.total_size()));
            return response;
        }
        catch (const ServiceError &ex)
        {
            if (http_status(ex.code()) >= 500)
            {
                spdlog::error("{} {} failed: {} ({})", std::string(request.method_string()), target, ex.what(),
                              to_string(ex.code()));
            }
            return error_response(ex.code(), request, ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            return error_response(ErrorCode::InvalidRequest, request, std::string("Malformed JSON: ") + ex.what());
        }
        catch (const std::invalid_argument &ex)
        {
            return error_response(ErrorCode::InvalidRequest, request, ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed unexpectedly: {}", std::string(request.method_string()), target, ex.what());
            return error_response(ErrorCode::InternalError, request, ex.what());
        }
    }

    HttpResponse ApiHandler::route(const HttpRequest &request, const std::vector<std::string> &segments,
                                   std::string_view query)
    {
        if (segments[1] == "upload")
        {
            if (segments.size() == 3 && segments[2] == "init")
            {
                require_method(request, http::verb::post);
                return handle_upload_init(request);
            }
            if (segments.size() == 4 && segments[2] == "status")
            {
                require_method(request, http::verb::get);
                return handle_upload_status(request, segments[3]);
            }
            if (segments.size() == 4 && segments[3] == "chunk")
            {
                require_method(request, http::verb::post);
                return handle_upload_chunk(request, segments[2], query);
            }
            if (segments.size() == 4 && segments[3] == "complete")
            {
                require_method(request, http::verb::post);
                return handle_upload_complete(request, segments[2]);
            }
        }
        else if (segments[1] == "download")
        {
            if (segments.size() == 4 && segments[3] == "meta")
            {
                require_method(request, http::verb::get);
                return handle_download_meta(request, segments[2]);
            }
            if (segments.size() == 3)
            {
                require_method(request, http::verb::get);
                return handle_download(request, segments[2]);
            }
        }
        throw ServiceError(ErrorCode::NotFound, "Not Found");
    }

    JsonResponse ApiHandler::handle_upload_init(const HttpRequest &request)
    {
        const auto body = nlohmann::json::parse(request.body());
        const auto init = body.get<protocol::UploadInitRequest>();
        const auto info = uploads_.init(init);

        const protocol::UploadInitResponse response{
            .upload_id = info.session.session_id,
            .code = info.session.code,
            .uploaded_chunks = {info.session.uploaded_chunks.begin(), info.session.uploaded_chunks.end()},
            .chunk_size = info.session.chunk_size,
            .total_chunks = info.session.total_chunks,
        };
        return json_response(http::status::ok, request, response);
    }

    JsonResponse ApiHandler::handle_upload_status(const HttpRequest &request, const std::string &session_id)
    {
        const auto session = uploads_.status(session_id);
        const protocol::UploadStatusResponse response{
            .upload_id = session.session_id,
            .code = session.code,
            .complete = session.complete,
            .uploaded_chunks = {session.uploaded_chunks.begin(), session.uploaded_chunks.end()},
            .total_chunks = session.total_chunks,
        };
        return json_response(http::status::ok, request, response);
    }

    JsonResponse ApiHandler::handle_upload_chunk(const HttpRequest &request, const std::string &session_id,
                                                 std::string_view query)
    {
        const auto index = parse_chunk_index(query);
        const auto &body = request.body();
        uploads_.accept_chunk(session_id, index, std::as_bytes(std::span<const char>(body.data(), body.size())));
        return json_response(http::status::ok, request, nlohmann::json{{"ok", true}});
    }

    JsonResponse ApiHandler::handle_upload_complete(const HttpRequest &request, const std::string &session_id)
    {
        const auto session = uploads_.complete(session_id);
        const protocol::CompleteResponse response{.ok = true, .code = session.code};
        return json_response(http::status::ok, request, response);
    }

    JsonResponse ApiHandler::handle_download_meta(const HttpRequest &request, const std::string &code)
    {
        return json_response(http::status::ok, request, downloads_.meta(code));
    }

    FileResponse ApiHandler::handle_download(const HttpRequest &request, const std::string &code)
    {
        std::optional<std::string> range_header;
        if (const auto it = request.find(http::field::range); it != request.end())
        {
            range_header = std::string(it->value());
        }
        const auto plan = downloads_.plan(code, range_header);

        FileResponse response{plan.range ? http::status::partial_content : http::status::ok, request.version()};
        boost::beast::error_code ec;
        response.body().open(plan.path, plan.range ? plan.range->start : 0, plan.content_length(), ec);
        if (ec)
        {
            throw ServiceError(ErrorCode::IoError, "Failed to open stored file: " + ec.message());
        }

        response.set(http::field::server, kServerName);
        response.set(http::field::content_type, plan.mime_type);
        response.set(http::field::accept_ranges, "bytes");
        response.set(http::field::content_disposition, http_fields::content_disposition(plan.file_name));
        if (!plan.checksum.empty())
        {
            response.set(http::field::etag, "\"" + plan.checksum + "\"");
        }
        if (plan.range)
        {
            response.set(http::field::content_range, http_fields::content_range(*plan.range, plan.total_size));
        }
        response.content_length(plan.content_length());
        response.keep_alive(request.keep_alive());
        return response;
    }

    JsonResponse ApiHandler::json_response(http::status status, const HttpRequest &request,
                                           const nlohmann::json &body)
    {
        JsonResponse response{status, request.version()};
        response.set(http::field::server, kServerName);
        response.set(http::field::content_type, kJsonContentType);
        response.keep_alive(request.keep_alive());
        response.body() = body.dump();
        response.prepare_payload();
        return response;
    }

    JsonResponse ApiHandler::error_response(ErrorCode code, const HttpRequest &request, const std::string &message)
    {
        const protocol::ErrorBody body{.code = code, .message = message};
        return json_response(static_cast<http::status>(http_status(code)), request, body);
    }

    unsigned response_status(const HttpResponse &response)
    {
        return std::visit([](const auto &message)
                          { return message.result_int(); },
                          response);
    }

} // namespace dropcode::server
