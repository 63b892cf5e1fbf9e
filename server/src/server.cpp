#include "sharerelay/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <exception>
#include <thread>

#include <spdlog/spdlog.h>

#include "sharerelay/server/session.hpp"

namespace sharerelay::server
{

    namespace
    {

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
          router_(registry_, tracker_, config_.supervisor),
          supervisor_(tracker_, router_, config_.supervisor),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          maintenance_timer_(io_context_),
          supervisor_timer_(io_context_)
    {
        router_.attach();

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} (device timeout {}s, stall timeout {}s)", config_.address, config_.port,
                     config_.device_timeout.count(), config_.supervisor.stall_timeout.count());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_maintenance();
        schedule_supervision();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Relay event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }

        // Close every live session and let their handlers finish while the
        // registry, tracker and router are still alive.
        const auto closing = registry_.close_all();
        spdlog::info("Closing {} sessions", closing);
        io_context_.restart();
        io_context_.run();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            RelayServices services{registry_, router_, config_.max_frame_bytes};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_maintenance()
    {
        maintenance_timer_.expires_after(config_.sweep_interval);
        maintenance_timer_.async_wait([this](const std::error_code &ec)
                                      {
            if (ec || stopping_)
            {
                return;
            }
            try
            {
                const auto stale = registry_.sweep_stale(config_.device_timeout);
                const auto purged = tracker_.purge_completed(config_.completed_grace);
                if (stale > 0 || purged > 0)
                {
                    spdlog::info("Maintenance removed {} stale devices and {} completed transfers", stale, purged);
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Maintenance pass failed: {}", ex.what());
            }
            schedule_maintenance(); });
    }

    void Server::schedule_supervision()
    {
        supervisor_timer_.expires_after(config_.supervisor.check_interval);
        supervisor_timer_.async_wait([this](const std::error_code &ec)
                                     {
            if (ec || stopping_)
            {
                return;
            }
            try
            {
                const auto report = supervisor_.run_cycle();
                if (report.stalled > 0)
                {
                    spdlog::debug("Supervisor checked {} transfers: {} stalled, {} resumed, {} failed",
                                  report.checked, report.stalled, report.resumed, report.failed);
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Supervisor cycle failed: {}", ex.what());
            }
            schedule_supervision(); });
    }

    void Server::handle_signal()
    {
        stopping_ = true;
        std::error_code ec;
        acceptor_.close(ec);
        maintenance_timer_.cancel();
        supervisor_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace sharerelay::server
