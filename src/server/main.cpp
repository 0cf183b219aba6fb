/**
 * @file main.cpp
 * @brief Main entry point for the Shiori manga server
 *
 * Serves the source extension REST API: installing, updating and removing
 * source extensions and browsing their catalogs.
 */

#include "atom/log/spdlog_logger.hpp"
#include "logging/logging.hpp"
#include "main_server.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct CommandLine {
    std::string configPath = shiori::config::DEFAULT_CONFIG_PATH;
    bool configRequired = false;
    std::optional<int> port;
    bool help = false;
    bool printSchema = false;
};

auto parsePort(std::string_view text) -> std::optional<int> {
    int port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return port;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <file>     Configuration file (default: "
              << shiori::config::DEFAULT_CONFIG_PATH << ")\n"
              << "  --port <number>     Server port, overrides the file\n"
              << "  --print-schema      Print the configuration JSON schema\n"
              << "  --help, -h          Show this help message\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.configPath = argv[++i];
            cli.configRequired = true;
        } else if (arg == "--port" && i + 1 < argc) {
            cli.port = parsePort(argv[++i]);
            if (!cli.port) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--print-schema") {
            cli.printSchema = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }
    if (cli.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (cli.printSchema) {
        std::cout << shiori::config::ConfigLoader::schema().dump(2) << "\n";
        return 0;
    }

    try {
        auto config = shiori::config::ConfigLoader::loadFile(
            cli.configPath, cli.configRequired);
        if (cli.port) {
            config.server.port = *cli.port;
            config.server.validate();
        }

        shiori::logging::initialize(config.logging);

        LOG_INFO("==============================================");
        LOG_INFO("  Shiori manga server                         ");
        LOG_INFO("==============================================");
        LOG_INFO("Server configuration:");
        LOG_INFO("  Port: {}", config.server.port);
        LOG_INFO("  Threads: {}", config.server.threads);
        LOG_INFO("  Repository: {}", config.extensions.repository);
        LOG_INFO("  Extensions: {}", config.extensions.directory);

        shiori::server::MainServer server(config);
        LOG_INFO("REST API available at http://localhost:{}/api/source",
                 config.server.port);
        LOG_INFO("Press Ctrl+C to stop the server");

        // Blocks until SIGINT or SIGTERM
        server.start();
    } catch (const shiori::config::BadConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        shiori::logging::shutdown();
        return 1;
    }

    LOG_INFO("Server shutdown complete");
    shiori::logging::shutdown();
    return 0;
}
