#ifndef SHIORI_SERVER_MAIN_SERVER_HPP
#define SHIORI_SERVER_MAIN_SERVER_HPP

#include <chrono>
#include <format>
#include <memory>
#include <vector>

#include "app.hpp"

#include "atom/log/spdlog_logger.hpp"
#include "config/config_loader.hpp"
#include "extension/extension.hpp"

// Base Controller
#include "controller/controller.hpp"

// Source Controllers
#include "controller/source/source.hpp"

namespace shiori::server {

/**
 * @brief Main server application class
 *
 * Owns the extension stack (transport, runtime, registry, lifecycle,
 * catalog) and exposes it through the HTTP controllers.
 */
class MainServer {
public:
    /**
     * @brief Construct main server with configuration
     * @throws InvalidConfigException for an unknown update strategy
     */
    explicit MainServer(const config::ShioriConfig& config)
        : config_(config),
          transport_(extension::CurlTransport::createShared(
              {std::chrono::seconds(config.extensions.fetchTimeoutSeconds),
               config.extensions.userAgent})),
          indexClient_(transport_),
          runtime_(extension::NativeRuntime::createShared(
              {config.extensions.directory,
               extension::HostIdentity::current()},
              transport_)),
          lifecycle_(registry_, indexClient_, *runtime_,
                     extension::HostIdentity::current(),
                     parseStrategy(config.extensions.updateStrategy)),
          catalog_(registry_),
          service_(lifecycle_, catalog_) {
        LOG_INFO("Initializing Shiori server");
        initializeExtensions();
        initializeControllers();
    }

    ~MainServer() { registry_.clear(); }

    MainServer(const MainServer&) = delete;
    MainServer& operator=(const MainServer&) = delete;

    /**
     * @brief Start the server, blocking until it is stopped
     *
     * Crow stops on SIGINT and SIGTERM.
     */
    void start() {
        LOG_INFO("Starting server on {}:{} with {} threads",
                 config_.server.host, config_.server.port,
                 config_.server.threads);
        app_.bindaddr(config_.server.host)
            .port(static_cast<uint16_t>(config_.server.port))
            .concurrency(static_cast<uint16_t>(config_.server.threads))
            .run();
    }

private:
    config::ShioriConfig config_;
    ServerApp app_;

    std::shared_ptr<extension::CurlTransport> transport_;
    extension::RemoteIndexClient indexClient_;
    std::shared_ptr<extension::NativeRuntime> runtime_;
    extension::ExtensionRegistry registry_;
    extension::LifecycleOrchestrator lifecycle_;
    extension::CatalogService catalog_;
    extension::SourceService service_;

    std::vector<std::unique_ptr<controller::Controller>> controllers_;

    static auto parseStrategy(const std::string& value)
        -> extension::UpdateStrategy {
        auto strategy = extension::updateStrategyFromString(value);
        if (!strategy) {
            THROW_INVALID_CONFIG_EXCEPTION(
                std::format("Unknown update strategy '{}'", value));
        }
        return *strategy;
    }

    /**
     * @brief Reload packages installed by a previous run
     */
    void initializeExtensions() {
        if (config_.extensions.repository.empty()) {
            LOG_WARN("No extension repository configured");
        }
        if (config_.extensions.restoreOnStartup) {
            auto restored = lifecycle_.restore();
            LOG_INFO("{} sources available after restore", restored);
        }
    }

    /**
     * @brief Initialize all HTTP controllers
     */
    void initializeControllers() {
        controllers_.push_back(std::make_unique<controller::SourceController>(
            service_, config_.extensions.repository));

        for (auto& controller : controllers_) {
            controller->registerRoutes(app_);
        }
        LOG_INFO("Registered {} controllers", controllers_.size());
    }
};

}  // namespace shiori::server

#endif  // SHIORI_SERVER_MAIN_SERVER_HPP
