#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "sharerelay/server/config.hpp"
#include "sharerelay/server/connection_registry.hpp"
#include "sharerelay/server/message_router.hpp"
#include "sharerelay/server/sync_supervisor.hpp"
#include "sharerelay/server/transfer_tracker.hpp"

namespace sharerelay::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void schedule_maintenance();
        void schedule_supervision();

        ServerConfig config_;

        // Declared before the io_context so sessions released with its pending
        // handlers can still unregister during shutdown. The registry only
        // observes sessions; run() closes and drains them before returning.
        ConnectionRegistry registry_;
        TransferTracker tracker_;
        MessageRouter router_;
        SyncSupervisor supervisor_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer maintenance_timer_;
        asio::steady_timer supervisor_timer_;

        std::vector<std::thread> workers_;
        std::atomic<bool> stopping_{false};
    };

} // namespace sharerelay::server
