#include "sharerelay/server/config.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "sharerelay/version.hpp"

namespace sharerelay::server
{

    namespace
    {

        std::string take_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + flag);
            }
            ++index;
            return std::string(argv[index]);
        }

        std::chrono::seconds take_seconds(int &index, int argc, char *argv[], const std::string &flag)
        {
            const auto value = std::stoll(take_value(index, argc, argv, flag));
            if (value <= 0)
            {
                throw std::runtime_error(flag + " must be positive");
            }
            return std::chrono::seconds{value};
        }

    } // namespace

    ServerConfig parse_arguments(int argc, char *argv[])
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                const auto port = std::stoi(take_value(i, argc, argv, arg));
                if (port <= 0 || port > 65535)
                {
                    throw std::runtime_error("--port must be between 1 and 65535");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--address")
            {
                config.address = take_value(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(take_value(i, argc, argv, arg)));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(take_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                config.log_level = take_value(i, argc, argv, arg);
            }
            else if (arg == "--device-timeout")
            {
                config.device_timeout = take_seconds(i, argc, argv, arg);
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = take_seconds(i, argc, argv, arg);
            }
            else if (arg == "--completed-grace")
            {
                config.completed_grace = take_seconds(i, argc, argv, arg);
            }
            else if (arg == "--check-interval")
            {
                config.supervisor.check_interval = take_seconds(i, argc, argv, arg);
            }
            else if (arg == "--stall-timeout")
            {
                config.supervisor.stall_timeout = take_seconds(i, argc, argv, arg);
            }
            else if (arg == "--max-recovery")
            {
                config.supervisor.max_recovery_attempts =
                    static_cast<std::uint32_t>(std::stoul(take_value(i, argc, argv, arg)));
                if (config.supervisor.max_recovery_attempts == 0)
                {
                    throw std::runtime_error("--max-recovery must be at least 1");
                }
            }
            else if (arg == "--lag-threshold")
            {
                config.supervisor.lag_warning_threshold = std::stod(take_value(i, argc, argv, arg));
            }
            else if (arg == "--duplicate-threshold")
            {
                config.supervisor.duplicate_warning_threshold = std::stoull(take_value(i, argc, argv, arg));
            }
            else if (arg == "--max-chunks")
            {
                const auto value = std::stoull(take_value(i, argc, argv, arg));
                if (value == 0 || value > std::numeric_limits<std::uint32_t>::max())
                {
                    throw std::runtime_error("--max-chunks must be between 1 and 4294967295");
                }
                config.supervisor.max_chunks = static_cast<std::uint32_t>(value);
            }
            else if (arg == "--max-frame")
            {
                config.max_frame_bytes = static_cast<std::size_t>(std::stoull(take_value(i, argc, argv, arg)));
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.port == 0)
        {
            throw std::runtime_error("--port is required");
        }
        return config;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "ShareRelay server " << sharerelay::version() << "\n"
            << "Usage: " << program_name << " --port <PORT> [--address <ADDRESS>] [--threads <N>] [--log <FILE>]\n"
            << "       [--log-level <trace|debug|info|warn|error>] [--device-timeout <s>] [--sweep-interval <s>]\n"
            << "       [--completed-grace <s>] [--check-interval <s>] [--stall-timeout <s>] [--max-recovery <N>]\n"
            << "       [--lag-threshold <points>] [--duplicate-threshold <N>] [--max-frame <bytes>]\n"
            << "       [--max-chunks <N>]\n";
        return out.str();
    }

} // namespace sharerelay::server
