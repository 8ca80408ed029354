#pragma once

#include <cstdint>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "dropcode/server/api_handler.hpp"
#include "dropcode/server/code_generator.hpp"
#include "dropcode/server/config.hpp"
#include "dropcode/server/download_server.hpp"
#include "dropcode/server/merger.hpp"
#include "dropcode/server/session_store.hpp"
#include "dropcode/server/staging_area.hpp"
#include "dropcode/server/upload_coordinator.hpp"

namespace dropcode::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket);
        void shutdown();

        ServerConfig config_;
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;

        SessionStore store_;
        StagingArea staging_;
        Merger merger_;
        CodeGenerator codes_;
        UploadCoordinator uploads_;
        DownloadServer downloads_;
        ApiHandler api_;

        std::vector<std::thread> workers_;
    };

} // namespace dropcode::server
