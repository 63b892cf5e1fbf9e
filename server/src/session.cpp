#include "sharerelay/server/session.hpp"

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <optional>
#include <span>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "sharerelay/crypto.hpp"

namespace sharerelay::server
{

    namespace
    {

        std::string describe_endpoint(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, RelayServices services)
        : socket_(std::move(socket)),
          strand_(asio::make_strand(socket_.get_executor())),
          services_(services),
          endpoint_(describe_endpoint(socket_)) {}

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        do
        {
            device_id_ = crypto::generate_device_id();
        } while (services_.registry.is_reachable(device_id_));

        spdlog::info("Device {} connected from {}", device_id_, endpoint_);

        nlohmann::json fields;
        fields["userId"] = device_id_;
        deliver(protocol::make_message(protocol::MessageType::Registered, std::move(fields)));
        services_.registry.register_device(device_id_, shared_from_this());

        asio::post(strand_, [self = shared_from_this()]
                   { self->read_frame_header(); });
    }

    void Session::stop()
    {
        if (open_.exchange(false))
        {
            std::error_code ec;
            spdlog::info("Closing connection for {} ({})", device_id_, endpoint_);
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }
        on_disconnect();
    }

    bool Session::deliver(const nlohmann::json &message)
    {
        if (!open_)
        {
            return false;
        }
        std::vector<std::uint8_t> frame;
        try
        {
            frame = protocol::encode_frame(message);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot frame message for {}: {}", device_id_, ex.what());
            return false;
        }

        asio::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable
                   {
            if (!self->open_)
            {
                return;
            }
            self->outbox_.push_back(std::move(frame));
            if (self->outbox_.size() == 1)
            {
                self->write_next();
            } });
        return true;
    }

    void Session::close()
    {
        asio::post(strand_, [self = shared_from_this()]
                   { self->stop(); });
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         asio::bind_executor(strand_, [this, self](const std::error_code &ec, std::size_t /*bytes*/)
                                             {
            if (ec)
            {
                stop();
                return;
            }
            const auto payload_size = protocol::read_frame_length(header_buffer_);
            if (payload_size == 0)
            {
                read_frame_header();
                return;
            }
            if (payload_size > services_.max_frame_bytes)
            {
                spdlog::warn("Frame of {} bytes from {} exceeds limit of {}", payload_size, device_id_,
                             services_.max_frame_bytes);
                stop();
                return;
            }
            buffer_.assign(header_buffer_.begin(), header_buffer_.end());
            buffer_.resize(protocol::kFrameHeaderSize + payload_size);
            read_frame_payload(payload_size); }));
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data() + protocol::kFrameHeaderSize, size),
                         asio::bind_executor(strand_, [this, self](const std::error_code &ec, std::size_t /*bytes*/)
                                             {
            if (ec)
            {
                stop();
                return;
            }
            process_frame();
            read_frame_header(); }));
    }

    void Session::process_frame()
    {
        std::optional<protocol::DecodedFrame> frame;
        try
        {
            frame = protocol::try_decode_frame(buffer_);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            spdlog::warn("Dropping unparsable frame from {}: {}", device_id_, ex.what());
            return;
        }
        if (!frame)
        {
            spdlog::warn("Dropping truncated frame from {}", device_id_);
            return;
        }

        try
        {
            services_.router.handle_message(device_id_, frame->message);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to handle message from {}: {}", device_id_, ex.what());
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_.front()),
                          asio::bind_executor(strand_, [this, self](const std::error_code &ec, std::size_t /*bytes*/)
                                              {
            if (ec)
            {
                spdlog::debug("Write to {} failed: {}", device_id_, ec.message());
                outbox_.clear();
                stop();
                return;
            }
            outbox_.pop_front();
            if (!outbox_.empty())
            {
                write_next();
            } }));
    }

    void Session::on_disconnect()
    {
        if (disconnected_.exchange(true) || device_id_.empty())
        {
            return;
        }
        services_.registry.unregister(device_id_, this);
    }

} // namespace sharerelay::server
