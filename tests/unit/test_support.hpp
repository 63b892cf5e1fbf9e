#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharerelay/server/clock.hpp"
#include "sharerelay/server/config.hpp"
#include "sharerelay/server/connection_registry.hpp"
#include "sharerelay/server/message_router.hpp"
#include "sharerelay/server/sync_supervisor.hpp"
#include "sharerelay/server/transfer_tracker.hpp"

namespace sharerelay::testing
{

    class RecordingSink : public server::MessageSink
    {
    public:
        bool deliver(const nlohmann::json &message) override
        {
            if (!writable)
            {
                return false;
            }
            messages.push_back(message);
            return true;
        }

        void close() override
        {
            closed = true;
            writable = false;
        }

        std::vector<nlohmann::json> of_type(std::string_view type) const
        {
            std::vector<nlohmann::json> matching;
            for (const auto &message : messages)
            {
                if (message.value("type", std::string{}) == type)
                {
                    matching.push_back(message);
                }
            }
            return matching;
        }

        std::optional<nlohmann::json> last_of_type(std::string_view type) const
        {
            for (auto it = messages.rbegin(); it != messages.rend(); ++it)
            {
                if (it->value("type", std::string{}) == type)
                {
                    return *it;
                }
            }
            return std::nullopt;
        }

        std::size_t count(std::string_view type) const { return of_type(type).size(); }

        std::vector<nlohmann::json> messages;
        bool writable{true};
        bool closed{false};
    };

    struct ManualClock
    {
        server::TimePoint now{server::TimePoint{} + std::chrono::hours{1}};

        void advance(std::chrono::milliseconds delta) { now += delta; }

        server::ClockSource source()
        {
            return [this]
            { return now; };
        }
    };

    // Registry, tracker, router and supervisor wired together on a manual clock.
    struct RelayHarness
    {
        ManualClock clock;
        server::SupervisorConfig config{};
        server::ConnectionRegistry registry{clock.source()};
        server::TransferTracker tracker{clock.source()};
        server::MessageRouter router{registry, tracker, config};
        server::SyncSupervisor supervisor{tracker, router, config, clock.source()};

        RelayHarness() { router.attach(); }

        std::shared_ptr<RecordingSink> connect(const std::string &device_id)
        {
            auto sink = std::make_shared<RecordingSink>();
            registry.register_device(device_id, sink);
            return sink;
        }

        void receive(const std::string &device_id, const nlohmann::json &message)
        {
            router.handle_message(device_id, message);
        }
    };

    inline bool near(double actual, double expected)
    {
        return std::fabs(actual - expected) < 1e-6;
    }

    inline nlohmann::json transfer_request(const std::string &to, const std::string &file_id,
                                           std::uint32_t total_chunks = 3, std::uint64_t size = 300)
    {
        return {
            {"type", "transfer-request"},
            {"toUserId", to},
            {"fileId", file_id},
            {"fileInfo",
             {
                 {"name", "a.txt"},
                 {"size", size},
                 {"type", "text/plain"},
                 {"totalChunks", total_chunks},
                 {"chunkSize", 100},
             }},
        };
    }

    inline nlohmann::json transfer_response(const std::string &to, const std::string &file_id, bool accepted,
                                            const std::string &reason = {})
    {
        nlohmann::json message = {
            {"type", "transfer-response"},
            {"toUserId", to},
            {"fileId", file_id},
            {"accepted", accepted},
        };
        if (!reason.empty())
        {
            message["reason"] = reason;
        }
        return message;
    }

    inline nlohmann::json file_chunk(const std::string &to, const std::string &file_id, std::int64_t index,
                                     std::int64_t total = 3)
    {
        return {
            {"type", "file-chunk"},
            {"toUserId", to},
            {"fileId", file_id},
            {"chunkIndex", index},
            {"totalChunks", total},
            {"chunk", "aGk="},
        };
    }

    inline nlohmann::json chunk_ack(const std::string &to, const std::string &file_id, std::int64_t index,
                                    const std::string &status = "received")
    {
        return {
            {"type", "chunk-ack"},
            {"toUserId", to},
            {"fileId", file_id},
            {"chunkIndex", index},
            {"status", status},
        };
    }

    inline nlohmann::json transfer_complete(const std::string &to, const std::string &file_id)
    {
        return {
            {"type", "transfer-complete"},
            {"toUserId", to},
            {"fileId", file_id},
        };
    }

} // namespace sharerelay::testing
