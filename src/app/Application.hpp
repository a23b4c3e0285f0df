#pragma once

#include "infrastructure/api/HostController.hpp"
#include "infrastructure/api/RestApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AddressResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/PingService.hpp"
#include "infrastructure/network/StatusPoller.hpp"
#include "infrastructure/network/WakeOnLanService.hpp"
#include "infrastructure/registry/HostRegistry.hpp"

#include <filesystem>
#include <memory>

namespace hostwake::app {

/**
 * @brief Wires the registry, network services and HTTP server together.
 *
 * Construction loads the configuration and the registry; run() starts the
 * poller and the server and blocks until SIGINT or SIGTERM. Probes block the
 * thread running them, so the poller gets a context of its own and never
 * occupies an HTTP worker.
 */
class Application {
public:
    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::HostRegistry& registry() { return *registry_; }
    infra::AsioContext& asioContext() { return *asioContext_; }

private:
    void initializeLogging();
    void initializeComponents();
    void shutdown();

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::AsioContext> pollerContext_;
    std::shared_ptr<infra::HostRegistry> registry_;
    std::shared_ptr<infra::PingService> pingService_;
    std::shared_ptr<infra::AddressResolver> resolver_;
    std::shared_ptr<infra::WakeOnLanService> wakeService_;
    std::shared_ptr<infra::HostController> controller_;
    std::shared_ptr<infra::StatusPoller> poller_;
    std::shared_ptr<infra::RestApiServer> restApiServer_;
};

} // namespace hostwake::app
