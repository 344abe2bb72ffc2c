/**
 * @file main.cpp
 * @brief memqueued entry point
 *
 * Wires a MemcacheStore, a MemQueue and the QueueService gRPC front end.
 */

#include <memqueue/core/errors.hpp>
#include <memqueue/core/mem_queue.hpp>
#include <memqueue/daemon/config.hpp>
#include <memqueue/net/memcache_store.hpp>
#include <memqueue/net/platform.hpp>
#include <memqueue/services/queue_service.hpp>
#include <memqueue/utils/logger.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace memqueue;
using namespace memqueue::daemon;

static std::atomic<bool> g_shutdown{false};

extern "C" void signalHandler(int) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        if (!config.error.empty()) {
            std::cerr << "Error: " << config.error << "\n\n";
        }
        printUsage(argv[0]);
        return config.error.empty() ? 0 : 2;
    }

    utils::Logger::instance().setLevel(utils::Logger::parseLevel(config.log_level));

    LOG_INFO("Daemon", "memqueued starting...");
    LOG_INFO("Daemon", "Cache servers: {}", config.queue.servers.size());
    LOG_INFO("Daemon", "Listen: {}:{}", config.bind_addr, config.port);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Daemon", "Socket layer initialization failed");
        return 1;
    }

    try {
        auto store = std::make_shared<net::MemcacheStore>(config.queue.servers,
                                                           config.cache_timeout_ms);
        auto queue = std::make_shared<core::MemQueue>(store, config.queue);
        auto service = std::make_unique<services::QueueServiceImpl>(queue);

        std::string addr = config.bind_addr + ":" + std::to_string(config.port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(addr, grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start gRPC server on {}", addr);
            return 1;
        }
        LOG_INFO("Daemon", "memqueued is ready on {}", addr);

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Daemon", "Shutting down...");
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
        LOG_INFO("Daemon", "memqueued stopped");
        return 0;

    } catch (const core::NotSupportedError& e) {
        LOG_ERROR("Daemon", "Unsupported configuration: {}", e.what());
        return 2;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Daemon", "Invalid configuration: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
