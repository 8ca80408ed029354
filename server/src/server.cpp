#include "dropcode/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "dropcode/server/http_session.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr auto kArtifactDir = "files";

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          store_(config_.root),
          staging_(config_.root),
          merger_(staging_),
          uploads_(CoordinatorServices{store_, staging_, merger_, codes_}, config_.root / kArtifactDir,
                   config_.max_chunk_size),
          downloads_(store_),
          api_(uploads_, downloads_)
    {
        const auto address = boost::asio::ip::make_address(config_.address);
        const boost::asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with storage root {}", config_.address, port(), config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            spdlog::info("Signal received, shutting down");
            shutdown();
        } });
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::stop()
    {
        boost::asio::post(io_context_, [this]
                          { shutdown(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        // Each connection gets its own strand; its timeout timer and I/O must not run concurrently.
        acceptor_.async_accept(boost::asio::make_strand(io_context_),
                               [this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            std::make_shared<HttpSession>(std::move(socket), api_, request_body_limit(config_),
                                          config_.request_timeout)
                ->start();
        }
        if (!acceptor_.is_open())
        {
            return;
        }
        if (ec && ec != boost::asio::error::operation_aborted)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void Server::shutdown()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        io_context_.stop();
    }

} // namespace dropcode::server
