#include "config.hpp"
#include "gateway.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "provider.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: hookgate [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Load JSON config from PATH\n"
              << "  --host HOST          Bind address (default: 0.0.0.0)\n"
              << "  --port PORT          Listen port (default: 5000)\n"
              << "  --debug              Enable debug logging\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  GET  /                   Health check\n"
              << "  POST /webhook            Generic webhook receiver\n"
              << "  POST /webhook/<provider> Provider webhook receiver (github)\n"
              << "\n"
              << "Environment variables:\n"
              << "  HOST, PORT           Listen address overrides\n"
              << "  DEBUG                \"true\" enables debug logging\n"
              << "  SECRET_KEY           Application secret\n"
              << "  HOOKGATE_MAX_BODY    Maximum request body in bytes\n"
              << "  GITHUB_WEBHOOK_SECRET  Enables X-Hub-Signature-256 verification\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string host;
    int port = 0;
    bool debug = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            const char* value = argv[++i];
            uint64_t parsed = 0;
            if (!hookgate::parse_unsigned(value, 65535, parsed) || parsed == 0) {
                std::cerr << "Invalid port: " << value << "\n";
                return 1;
            }
            port = static_cast<int>(parsed);
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = hookgate::Config::load(config_path);

    // Override config with CLI args
    if (!host.empty()) config.host = host;
    if (port != 0) config.port = static_cast<uint16_t>(port);
    if (debug) config.debug = true;

    hookgate::Logger logger(std::cerr,
                            config.debug ? hookgate::LogLevel::Debug : hookgate::LogLevel::Info);

    if (config.secret_key == hookgate::Config().secret_key) {
        logger.warn("main", "SECRET_KEY is not set, using the built-in default");
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    hookgate::Gateway gateway(config, logger);
    hookgate::HttpServer server(
        config.listen_addr(), config.max_body, config.max_connections,
        [&gateway](const hookgate::HttpRequest& req) { return gateway.handle(req); },
        [&gateway](int status) { return gateway.reject(status); },
        logger);

    std::string error;
    if (!server.start(error)) {
        logger.error("main", "Failed to start: " + error);
        return 1;
    }

    std::string providers;
    for (const auto& name : hookgate::ProviderRegistry::instance().names()) {
        if (!providers.empty()) providers += ", ";
        providers += name;
    }
    logger.info("main", "Starting webhook gateway on " + config.listen_addr() +
                " (providers: " + providers + ")");

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger.info("main", "Shutting down.");
    server.stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
