/**
 * @file config.hpp
 * @brief memqueued configuration and CLI parsing
 */

#pragma once

#include "memqueue/core/queue_config.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace memqueue {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    core::QueueConfig queue;                  ///< Passed to MemQueue
    std::string bind_addr = "0.0.0.0";
    uint16_t port = 7711;                     ///< gRPC port of QueueService
    int cache_timeout_ms = 3000;              ///< Per-step memcached timeout
    std::string log_level = "INFO";
    bool help = false;
    std::string error;                        ///< Set when parsing failed
};

/**
 * @brief Split "a,b,c" into its non-empty parts.
 */
inline std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (end > start) {
            parts.push_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "memqueued - message queue service over memcached\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --servers <list>         Comma separated memcached endpoints (default: 127.0.0.1:11211)\n"
              << "  --backup-servers <list>  Mirroring endpoints (not supported, rejected at startup)\n"
              << "  --autodelete             Delete messages after their first read\n"
              << "  --client-lag <seconds>   Silence before a client is fast-forwarded (default: 120)\n"
              << "  --cache-timeout <ms>     memcached connect/read/write timeout (default: 3000)\n"
              << "  --bind <addr>            Bind address for the gRPC server (default: 0.0.0.0)\n"
              << "  --port <port>            gRPC port (default: 7711)\n"
              << "  --log-level <level>      TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "\n  --help                   Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --servers 10.0.0.1:11211,10.0.0.2 --client-lag 300\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set and error filled on bad input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto reject = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--autodelete") == 0) {
            config.queue.autodelete = true;
            continue;
        }

        if (i + 1 >= argc) {
            return reject(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--servers") == 0) {
                config.queue.servers = splitList(value);
                if (config.queue.servers.empty()) {
                    return reject("--servers needs at least one endpoint");
                }
            } else if (std::strcmp(arg, "--backup-servers") == 0) {
                config.queue.backup_servers = splitList(value);
            } else if (std::strcmp(arg, "--client-lag") == 0) {
                config.queue.client_lag_seconds = std::stoi(value);
            } else if (std::strcmp(arg, "--cache-timeout") == 0) {
                config.cache_timeout_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                int port = std::stoi(value);
                if (port <= 0 || port > 65535) {
                    return reject(std::string("Invalid port ") + value);
                }
                config.port = static_cast<uint16_t>(port);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                return reject(std::string("Unknown option ") + arg);
            }
        } catch (const std::exception&) {
            return reject(std::string("Invalid value '") + value + "' for " + arg);
        }
    }

    return config;
}

} // namespace daemon
} // namespace memqueue
