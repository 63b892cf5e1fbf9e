#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/strand.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharerelay/framing.hpp"
#include "sharerelay/server/connection_registry.hpp"
#include "sharerelay/server/message_router.hpp"

namespace sharerelay::server
{

    struct RelayServices
    {
        ConnectionRegistry &registry;
        MessageRouter &router;
        std::size_t max_frame_bytes;
    };

    // One device connection. Inbound frames go to the router; outbound messages
    // are queued and written one at a time on the session strand.
    class Session : public MessageSink, public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, RelayServices services);
        ~Session() override;

        void start();

        void stop();

        bool deliver(const nlohmann::json &message) override;

        void close() override;

        const std::string &device_id() const noexcept { return device_id_; }

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_frame();
        void write_next();
        void on_disconnect();

        asio::ip::tcp::socket socket_;
        asio::strand<asio::any_io_executor> strand_;
        RelayServices services_;
        std::string endpoint_;
        std::string device_id_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        // Header followed by payload of the frame being read.
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbox_;

        std::atomic<bool> open_{true};
        std::atomic<bool> disconnected_{false};
    };

} // namespace sharerelay::server
