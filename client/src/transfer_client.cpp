#include "dropcode/client/transfer_client.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>

#include "dropcode/crypto.hpp"
#include "dropcode/error_codes.hpp"
#include "dropcode/http_fields.hpp"
#include "dropcode/protocol.hpp"

namespace dropcode::client
{

    namespace
    {

        struct MimeMapping
        {
            std::string_view extension;
            std::string_view type;
        };

        constexpr MimeMapping kMimeTypes[] = {
            {".txt", "text/plain"},        {".html", "text/html"},       {".css", "text/css"},
            {".js", "text/javascript"},    {".json", "application/json"}, {".pdf", "application/pdf"},
            {".zip", "application/zip"},   {".gz", "application/gzip"},  {".tar", "application/x-tar"},
            {".png", "image/png"},         {".jpg", "image/jpeg"},       {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},         {".svg", "image/svg+xml"},    {".webp", "image/webp"},
            {".mp3", "audio/mpeg"},        {".wav", "audio/wav"},        {".mp4", "video/mp4"},
            {".webm", "video/webm"},       {".csv", "text/csv"},         {".xml", "application/xml"},
        };

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        std::string chunk_target(const std::string &upload_id, std::uint64_t index)
        {
            return "/api/upload/" + upload_id + "/chunk?index=" + std::to_string(index);
        }

    } // namespace

    std::string fingerprint_of(const std::filesystem::path &path)
    {
        const auto size = std::filesystem::file_size(path);
        const auto modified = std::filesystem::last_write_time(path);
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(modified.time_since_epoch()).count();
        return path.filename().string() + "_" + std::to_string(size) + "_" + std::to_string(millis);
    }

    std::string guess_mime_type(const std::filesystem::path &path)
    {
        const auto extension = lowercase(path.extension().string());
        for (const auto &mapping : kMimeTypes)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.type);
            }
        }
        return protocol::kDefaultMimeType;
    }

    std::filesystem::path safe_file_name(const std::string &name)
    {
        std::string cleaned = std::filesystem::path(name).filename().string();
        for (auto &ch : cleaned)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (byte < 0x20 || ch == '/' || ch == '\\' || ch == ':')
            {
                ch = '_';
            }
        }
        if (cleaned.empty() || cleaned == "." || cleaned == "..")
        {
            cleaned = "download.bin";
        }
        return std::filesystem::path(cleaned);
    }

    TransferClient::TransferClient(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          http_(config_.host, config_.port),
          state_store_(config_.state_path ? UploadStateStore(*config_.state_path) : UploadStateStore())
    {
    }

    int TransferClient::run()
    {
        try
        {
            switch (config_.command)
            {
            case ClientCommand::Send:
                return send(std::filesystem::path(config_.subject));
            case ClientCommand::Info:
                return info(config_.subject);
            case ClientCommand::Receive:
                return receive(config_.subject);
            }
        }
        catch (const boost::system::system_error &ex)
        {
            logger_.failure("network", "cannot reach {}: {}", http_.endpoint(), ex.code().message());
            std::cout << "ERROR: network" << std::endl;
            std::cout << "Could not reach " << http_.endpoint() << ": " << ex.code().message() << std::endl;
            return 1;
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.failure("protocol", "malformed response: {}", ex.what());
            std::cout << "ERROR: protocol" << std::endl;
            std::cout << "Unexpected response from server: " << ex.what() << std::endl;
            return 1;
        }
        return 1;
    }

    int TransferClient::send(const std::filesystem::path &local_path)
    {
        const auto absolute_local = std::filesystem::absolute(local_path);
        if (!std::filesystem::is_regular_file(absolute_local))
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            std::cout << "Local path is not a readable file." << std::endl;
            return 1;
        }

        const auto file_size = std::filesystem::file_size(absolute_local);
        const auto fingerprint = fingerprint_of(absolute_local);
        const auto server = http_.endpoint();
        const auto saved_upload = state_store_.find(server, fingerprint);

        protocol::UploadInitRequest init{
            .file_name = absolute_local.filename().string(),
            .file_size = file_size,
            .mime_type = guess_mime_type(absolute_local),
            .total_chunks = (file_size + config_.chunk_size - 1) / config_.chunk_size,
            .chunk_size = config_.chunk_size,
            .fingerprint = fingerprint,
            .max_downloads = config_.max_downloads,
            .upload_id = saved_upload,
        };

        const auto init_result = http_.post_json("/api/upload/init", nlohmann::json(init));
        if (!init_result.ok())
        {
            print_error(init_result);
            return 1;
        }
        const auto session = nlohmann::json::parse(init_result.body).get<protocol::UploadInitResponse>();
        state_store_.remember(server, fingerprint, session.upload_id, absolute_local);

        // A resumed session keeps the slicing it was created with, whatever --chunk-size says now.
        const auto chunk_size = session.chunk_size != 0 ? session.chunk_size : init.chunk_size;
        const auto total_chunks = session.total_chunks != 0 ? session.total_chunks : init.total_chunks;
        if (chunk_size == 0 || total_chunks != (file_size + chunk_size - 1) / chunk_size)
        {
            std::cout << "ERROR: protocol" << std::endl;
            std::cout << "Server session " << session.upload_id << " does not match the local file." << std::endl;
            return 1;
        }

        const std::set<std::uint64_t> uploaded(session.uploaded_chunks.begin(), session.uploaded_chunks.end());
        if (saved_upload && *saved_upload == session.upload_id)
        {
            std::cout << "Resuming upload " << session.upload_id << ": " << uploaded.size() << " of " << total_chunks
                      << " chunks already on the server" << std::endl;
            logger_.log("upload", "resuming {} with {} of {} chunks present", session.upload_id, uploaded.size(),
                        total_chunks);
        }
        logger_.log("upload", "session {} code {} for {} ({} bytes, {} x {})", session.upload_id, session.code,
                    absolute_local.string(), file_size, total_chunks, chunk_size);

        std::ifstream in(absolute_local, std::ios::binary);
        if (!in.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Could not open local file for reading." << std::endl;
            return 1;
        }

        std::vector<char> buffer(static_cast<std::size_t>(chunk_size));
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            if (uploaded.contains(index))
            {
                continue;
            }
            const auto offset = index * chunk_size;
            const auto length = std::min<std::uint64_t>(chunk_size, file_size - offset);
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(buffer.data(), static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(in.gcount()) != length)
            {
                std::cout << "ERROR: file_io" << std::endl;
                std::cout << "Local file changed while sending; chunk " << index << " is short." << std::endl;
                return 1;
            }

            HttpResult chunk_result;
            try
            {
                chunk_result = http_.post_bytes(chunk_target(session.upload_id, index),
                                                std::as_bytes(std::span(buffer.data(), length)));
            }
            catch (const boost::system::system_error &ex)
            {
                chunk_result = HttpResult{0, ex.code().message()};
            }
            if (!chunk_result.ok())
            {
                logger_.failure("upload", "chunk {} of {} failed: {}", index + 1, total_chunks,
                                chunk_result.error_message());
                std::cout << std::endl;
                std::cout << "ERROR: chunk " << index << " failed: " << chunk_result.error_message() << std::endl;
                std::cout << "Run the same command again to retry the missing chunks." << std::endl;
                return 1;
            }
            std::cout << "\rUploaded chunk " << index + 1 << " / " << total_chunks << std::flush;
        }
        std::cout << std::endl;

        const auto complete_result = http_.post_bytes("/api/upload/" + session.upload_id + "/complete", {});
        if (!complete_result.ok())
        {
            print_error(complete_result);
            return 1;
        }
        const auto completed = nlohmann::json::parse(complete_result.body).get<protocol::CompleteResponse>();
        state_store_.forget(server, fingerprint);
        logger_.log("upload", "completed {} as {}", session.upload_id, completed.code);

        std::cout << "Code: " << completed.code << std::endl;
        std::cout << "Downloads allowed: " << config_.max_downloads << std::endl;
        return 0;
    }

    int TransferClient::info(const std::string &code)
    {
        const auto result = http_.get("/api/download/" + http_fields::percent_encode(code) + "/meta");
        if (!result.ok())
        {
            print_error(result);
            return 1;
        }
        const auto meta = nlohmann::json::parse(result.body).get<protocol::DownloadMeta>();
        std::cout << "Code:      " << meta.code << std::endl;
        std::cout << "Name:      " << meta.file_name << std::endl;
        std::cout << "Size:      " << meta.file_size << " bytes" << std::endl;
        std::cout << "Type:      " << meta.mime_type << std::endl;
        std::cout << "Downloads: " << meta.remaining_downloads << std::endl;
        if (!meta.checksum.empty())
        {
            std::cout << "Checksum:  " << meta.checksum << std::endl;
        }
        return 0;
    }

    int TransferClient::receive(const std::string &code)
    {
        const auto encoded_code = http_fields::percent_encode(code);
        const auto meta_result = http_.get("/api/download/" + encoded_code + "/meta");
        if (!meta_result.ok())
        {
            print_error(meta_result);
            return 1;
        }
        const auto meta = nlohmann::json::parse(meta_result.body).get<protocol::DownloadMeta>();

        std::filesystem::path target = config_.output.value_or(safe_file_name(meta.file_name));
        if (std::filesystem::is_directory(target))
        {
            target /= safe_file_name(meta.file_name);
        }
        auto partial = target;
        partial += ".part";

        std::uint64_t offset = 0;
        if (std::filesystem::is_regular_file(partial))
        {
            offset = std::filesystem::file_size(partial);
            if (offset > meta.file_size)
            {
                std::filesystem::remove(partial);
                offset = 0;
            }
        }

        if (offset < meta.file_size || !std::filesystem::exists(partial))
        {
            std::optional<std::string> range;
            if (offset > 0)
            {
                range = http_fields::range_from(offset);
                std::cout << "Resuming download from byte " << offset << std::endl;
            }

            std::ofstream out;
            std::uint64_t received = offset;
            const auto on_header = [&](const http::response_header<> &header)
            {
                auto mode = std::ios::binary | std::ios::out;
                if (header.result() == http::status::partial_content)
                {
                    mode |= std::ios::app;
                }
                else
                {
                    mode |= std::ios::trunc;
                    received = 0;
                }
                out.open(partial, mode);
                if (!out.is_open())
                {
                    throw std::runtime_error("Could not open " + partial.string() + " for writing");
                }
            };
            const auto sink = [&](const char *data, std::size_t size)
            {
                out.write(data, static_cast<std::streamsize>(size));
                if (!out)
                {
                    throw std::runtime_error("Failed writing " + partial.string());
                }
                received += size;
                std::cout << "\rDownloaded " << received << " / " << meta.file_size << " bytes" << std::flush;
            };

            const auto download = http_.download("/api/download/" + encoded_code, range, on_header, sink);
            std::cout << std::endl;
            if (download.status == static_cast<unsigned>(http::status::range_not_satisfiable))
            {
                // The partial file no longer matches the artifact; start over next run.
                std::filesystem::remove(partial);
                std::cout << "ERROR: range_not_satisfiable" << std::endl;
                std::cout << "Stale partial download discarded, run the command again." << std::endl;
                return 1;
            }
            if (download.status < 200 || download.status >= 300)
            {
                print_error(HttpResult{download.status, download.error_body});
                return 1;
            }
            out.close();
            if (!out)
            {
                std::cout << "ERROR: file_io" << std::endl;
                std::cout << "Could not finish writing " << partial.string() << std::endl;
                return 1;
            }
        }

        if (!meta.checksum.empty() && crypto::hash_file(partial) != meta.checksum)
        {
            std::filesystem::remove(partial);
            logger_.failure("download", "checksum mismatch for {}, expected {}", meta.code, meta.checksum);
            std::cout << "ERROR: checksum_mismatch" << std::endl;
            std::cout << "Downloaded data does not match the published checksum; partial file removed." << std::endl;
            return 1;
        }

        std::filesystem::rename(partial, target);
        logger_.log("download", "received {} into {} ({} bytes)", meta.code, target.string(), meta.file_size);
        std::cout << "Saved " << meta.file_name << " (" << meta.file_size << " bytes) to " << target.string()
                  << std::endl;
        return 0;
    }

    void TransferClient::print_error(const HttpResult &result) const
    {
        const auto json = nlohmann::json::parse(result.body, nullptr, false);
        if (json.is_object() && json.contains("error"))
        {
            const auto body = json.get<protocol::ErrorBody>();
            std::cout << "ERROR: " << to_string(body.code) << std::endl;
            std::cout << body.message << std::endl;
            return;
        }
        std::cout << "ERROR: http_" << result.status << std::endl;
        if (!result.body.empty())
        {
            std::cout << result.body << std::endl;
        }
    }

} // namespace dropcode::client
