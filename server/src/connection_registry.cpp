#include "sharerelay/server/connection_registry.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace sharerelay::server
{

    namespace
    {

        struct DeviceFamily
        {
            std::string_view marker;
            std::string_view label;
            std::string_view single;
        };

        constexpr std::array<DeviceFamily, 6> kDeviceFamilies{{
            {"Windows PC", "PC", "PC1"},
            {"Mac", "Mac", "Mac1"},
            {"iPhone", "iPhone", "iPhone"},
            {"iPad", "iPad", "iPad"},
            {"Android", "Android", "Android"},
            {"Linux PC", "Linux", "Linux1"},
        }};

    } // namespace

    std::string device_display_name(const std::optional<std::string> &name, const std::string &device_id,
                                    const std::vector<std::string> &connected_names)
    {
        if (!name || name->empty())
        {
            return "Device " + (device_id.empty() ? std::string("Unknown") : device_id.substr(0, 6));
        }

        // Devices sharing the first word of the name count as the same family.
        const auto first_word = name->substr(0, name->find(' '));
        const auto same_family = std::count_if(connected_names.begin(), connected_names.end(),
                                               [&](const std::string &other)
                                               { return other.find(first_word) != std::string::npos; });

        for (const auto &family : kDeviceFamilies)
        {
            if (name->find(family.marker) != std::string::npos)
            {
                return same_family > 1 ? std::string(family.label) + std::to_string(same_family)
                                       : std::string(family.single);
            }
        }
        return *name;
    }

    ConnectionRegistry::ConnectionRegistry(ClockSource clock)
        : clock_(std::move(clock)) {}

    void ConnectionRegistry::register_device(const std::string &device_id, std::shared_ptr<MessageSink> sink)
    {
        std::shared_ptr<MessageSink> replaced;
        {
            std::lock_guard lock(mutex_);
            auto &entry = devices_[device_id];
            if (entry.key != nullptr && entry.key != sink.get())
            {
                replaced = entry.sink.lock();
            }
            entry.info.id = device_id;
            entry.info.last_seen = clock_();
            entry.sink = sink;
            entry.key = sink.get();
            broadcast_devices_locked();
        }
        if (replaced)
        {
            spdlog::info("Device {} re-registered, closing previous connection", device_id);
            replaced->close();
        }
        else
        {
            spdlog::info("Device {} registered", device_id);
        }
    }

    bool ConnectionRegistry::unregister(const std::string &device_id, const MessageSink *sink)
    {
        DisconnectListener listener;
        {
            std::lock_guard lock(mutex_);
            auto it = devices_.find(device_id);
            if (it == devices_.end())
            {
                return false;
            }
            if (sink != nullptr && it->second.key != sink)
            {
                return false;
            }
            devices_.erase(it);
            broadcast_devices_locked();
            listener = on_disconnect_;
        }
        spdlog::info("Device {} unregistered", device_id);
        if (listener)
        {
            listener(device_id);
        }
        return true;
    }

    bool ConnectionRegistry::touch(const std::string &device_id)
    {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end())
        {
            return false;
        }
        it->second.info.last_seen = clock_();
        return true;
    }

    bool ConnectionRegistry::set_device_name(const std::string &device_id, std::string name)
    {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end())
        {
            return false;
        }
        if (it->second.info.name == name)
        {
            return true;
        }
        spdlog::info("Device {} is now named '{}'", device_id, name);
        it->second.info.name = std::move(name);
        broadcast_devices_locked();
        return true;
    }

    bool ConnectionRegistry::send(const std::string &device_id, const nlohmann::json &message)
    {
        std::shared_ptr<MessageSink> sink;
        {
            std::lock_guard lock(mutex_);
            auto it = devices_.find(device_id);
            if (it == devices_.end())
            {
                spdlog::debug("Cannot deliver {} to {}: device not registered", message.value("type", std::string{}),
                              device_id);
                return false;
            }
            sink = it->second.sink.lock();
        }
        if (!sink || !sink->deliver(message))
        {
            spdlog::debug("Cannot deliver {} to {}: sink not writable", message.value("type", std::string{}),
                          device_id);
            return false;
        }
        return true;
    }

    bool ConnectionRegistry::send(const std::string &device_id, protocol::MessageType type, nlohmann::json fields)
    {
        return send(device_id, protocol::make_message(type, std::move(fields)));
    }

    bool ConnectionRegistry::is_reachable(const std::string &device_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(device_id);
        return it != devices_.end() && !it->second.sink.expired();
    }

    std::optional<DeviceInfo> ConnectionRegistry::find(const std::string &device_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(device_id);
        if (it != devices_.end())
        {
            return it->second.info;
        }
        return std::nullopt;
    }

    std::vector<std::string> ConnectionRegistry::device_ids() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(devices_.size());
        for (const auto &[id, entry] : devices_)
        {
            ids.push_back(id);
        }
        return ids;
    }

    std::size_t ConnectionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return devices_.size();
    }

    std::size_t ConnectionRegistry::sweep_stale(std::chrono::milliseconds timeout)
    {
        struct StaleEntry
        {
            std::string id;
            const MessageSink *key;
            std::shared_ptr<MessageSink> sink;
        };
        std::vector<StaleEntry> stale;
        {
            std::lock_guard lock(mutex_);
            const auto now = clock_();
            for (const auto &[id, entry] : devices_)
            {
                if (now - entry.info.last_seen > timeout)
                {
                    stale.push_back({id, entry.key, entry.sink.lock()});
                }
            }
        }

        std::size_t removed = 0;
        for (auto &entry : stale)
        {
            spdlog::info("Removing stale device {}", entry.id);
            if (unregister(entry.id, entry.key))
            {
                ++removed;
            }
            if (entry.sink)
            {
                entry.sink->close();
            }
        }
        return removed;
    }

    std::size_t ConnectionRegistry::close_all()
    {
        std::vector<std::shared_ptr<MessageSink>> live;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[id, entry] : devices_)
            {
                if (auto sink = entry.sink.lock())
                {
                    live.push_back(std::move(sink));
                }
            }
        }
        for (const auto &sink : live)
        {
            sink->close();
        }
        return live.size();
    }

    void ConnectionRegistry::set_disconnect_listener(DisconnectListener listener)
    {
        std::lock_guard lock(mutex_);
        on_disconnect_ = std::move(listener);
    }

    nlohmann::json ConnectionRegistry::devices_message_locked() const
    {
        std::vector<std::string> connected_names;
        for (const auto &[id, entry] : devices_)
        {
            if (entry.info.name)
            {
                connected_names.push_back(*entry.info.name);
            }
        }

        auto ids = nlohmann::json::array();
        auto names = nlohmann::json::object();
        auto display_names = nlohmann::json::object();
        for (const auto &[id, entry] : devices_)
        {
            ids.push_back(id);
            if (entry.info.name)
            {
                names[id] = *entry.info.name;
            }
            display_names[id] = device_display_name(entry.info.name, id, connected_names);
        }
        nlohmann::json fields;
        fields["devices"] = std::move(ids);
        fields["deviceNames"] = std::move(names);
        fields["displayNames"] = std::move(display_names);
        return protocol::make_message(protocol::MessageType::Devices, std::move(fields));
    }

    // Delivery only enqueues, so broadcasting under the lock keeps device
    // lists from reaching a device out of order.
    void ConnectionRegistry::broadcast_devices_locked()
    {
        const auto message = devices_message_locked();
        for (const auto &[id, entry] : devices_)
        {
            const auto sink = entry.sink.lock();
            if (sink && !sink->deliver(message))
            {
                spdlog::debug("Device list not delivered to {}", id);
            }
        }
    }

} // namespace sharerelay::server
