#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sharerelay::server
{

    struct SupervisorConfig
    {
        std::chrono::seconds check_interval{std::chrono::seconds{5}};
        std::chrono::seconds stall_timeout{std::chrono::seconds{15}};
        std::uint32_t max_recovery_attempts{5};
        double lag_warning_threshold{10.0};
        std::uint64_t duplicate_warning_threshold{100};
        // Largest totalChunks a transfer-request may declare.
        std::uint32_t max_chunks{1u << 20};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        std::chrono::seconds device_timeout{std::chrono::seconds{60}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{30}};
        std::chrono::seconds completed_grace{std::chrono::seconds{30}};
        std::size_t max_frame_bytes{16u << 20};
        SupervisorConfig supervisor{};
        bool show_help{false};
    };

    // Throws std::runtime_error on unknown flags, missing values or a missing --port.
    ServerConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace sharerelay::server
