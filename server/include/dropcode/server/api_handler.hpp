#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "dropcode/error_codes.hpp"
#include "dropcode/server/artifact_body.hpp"
#include "dropcode/server/download_server.hpp"
#include "dropcode/server/upload_coordinator.hpp"

namespace dropcode::server
{

    namespace http = boost::beast::http;

    using HttpRequest = http::request<http::string_body>;
    using JsonResponse = http::response<http::string_body>;
    using FileResponse = http::response<ArtifactBody>;
    using HttpResponse = std::variant<JsonResponse, FileResponse>;

    /**
     * Routes `/api/...` requests onto the upload coordinator and download server.
     * Independent of the transport so it can be driven directly from tests.
     */
    class ApiHandler
    {
    public:
        ApiHandler(UploadCoordinator &uploads, const DownloadServer &downloads);

        HttpResponse handle(const HttpRequest &request);

        static JsonResponse error_response(ErrorCode code, const HttpRequest &request, const std::string &message);

    private:
        HttpResponse route(const HttpRequest &request, const std::vector<std::string> &segments,
                           std::string_view query);

        JsonResponse handle_upload_init(const HttpRequest &request);
        JsonResponse handle_upload_status(const HttpRequest &request, const std::string &session_id);
        JsonResponse handle_upload_chunk(const HttpRequest &request, const std::string &session_id,
                                         std::string_view query);
        JsonResponse handle_upload_complete(const HttpRequest &request, const std::string &session_id);
        JsonResponse handle_download_meta(const HttpRequest &request, const std::string &code);
        FileResponse handle_download(const HttpRequest &request, const std::string &code);

        static JsonResponse json_response(http::status status, const HttpRequest &request,
                                          const nlohmann::json &body);

        UploadCoordinator &uploads_;
        const DownloadServer &downloads_;
    };

    // Status code of either response alternative.
    unsigned response_status(const HttpResponse &response);

} // namespace dropcode::server
