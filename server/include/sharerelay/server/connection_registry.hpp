#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharerelay/protocol.hpp"
#include "sharerelay/server/clock.hpp"

namespace sharerelay::server
{

    // Outbound side of one device connection.
    class MessageSink
    {
    public:
        virtual ~MessageSink() = default;

        // Queues the message behind earlier ones for this device. Returns false
        // once the underlying connection can no longer be written; never throws.
        virtual bool deliver(const nlohmann::json &message) = 0;

        virtual void close() {}
    };

    struct DeviceInfo
    {
        std::string id;
        std::optional<std::string> name;
        TimePoint last_seen{};
    };

    // Short label for the device list, numbered per device family
    // ("PC2", "Mac1", "Android") or "Device <id prefix>" when unnamed.
    std::string device_display_name(const std::optional<std::string> &name, const std::string &device_id,
                                    const std::vector<std::string> &connected_names);

    // Maps device IDs to their sink. Registration is an upsert: the last
    // registration for an ID wins and the replaced sink is closed. Sinks are
    // observed, not owned; an expired sink counts as not writable.
    class ConnectionRegistry
    {
    public:
        using DisconnectListener = std::function<void(const std::string &device_id)>;

        explicit ConnectionRegistry(ClockSource clock = steady_clock_source());

        void register_device(const std::string &device_id, std::shared_ptr<MessageSink> sink);

        // With a sink pointer, only removes the entry if that sink is still the registered one.
        bool unregister(const std::string &device_id, const MessageSink *sink = nullptr);

        bool touch(const std::string &device_id);
        bool set_device_name(const std::string &device_id, std::string name);

        bool send(const std::string &device_id, const nlohmann::json &message);
        bool send(const std::string &device_id, protocol::MessageType type, nlohmann::json fields);

        bool is_reachable(const std::string &device_id) const;
        std::optional<DeviceInfo> find(const std::string &device_id) const;
        std::vector<std::string> device_ids() const;
        std::size_t size() const;

        std::size_t sweep_stale(std::chrono::milliseconds timeout);

        // Closes every live sink without removing entries; returns how many were closed.
        std::size_t close_all();

        // Invoked after a device has been removed, outside the registry lock.
        void set_disconnect_listener(DisconnectListener listener);

    private:
        struct Entry
        {
            DeviceInfo info;
            std::weak_ptr<MessageSink> sink;
            const MessageSink *key{nullptr};
        };

        nlohmann::json devices_message_locked() const;
        void broadcast_devices_locked();

        ClockSource clock_;
        mutable std::mutex mutex_;
        std::map<std::string, Entry> devices_;
        DisconnectListener on_disconnect_;
    };

} // namespace sharerelay::server
