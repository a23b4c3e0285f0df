#include "app/Application.hpp"

#include "infrastructure/network/NeighborTable.hpp"
#include "infrastructure/storage/JsonRegistryStorage.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostwake::app {

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    shutdown();
}

void Application::initializeLogging() {
    auto logPath = config_->logFilePath();
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path());
    }

    auto level = spdlog::level::from_str(config_->config().logLevel);

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("hostwake", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(std::min(level, spdlog::level::debug));
    spdlog::set_default_logger(logger);

    spdlog::info("hostwake starting, configuration in {}", config_->configDir().string());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    asioContext_ = std::make_unique<infra::AsioContext>(static_cast<size_t>(cfg.workerThreads));
    pollerContext_ = std::make_unique<infra::AsioContext>(1);

    // Registry
    auto storage = std::make_shared<infra::JsonRegistryStorage>(config_->dataFilePath());
    registry_ = std::make_shared<infra::HostRegistry>(storage);
    registry_->load();

    // Network services
    pingService_ = std::make_shared<infra::PingService>();
    resolver_ = std::make_shared<infra::AddressResolver>(
        pingService_, std::make_shared<infra::NeighborTable>(cfg.neighborTablePath),
        std::chrono::milliseconds(cfg.primeTimeoutMs));
    wakeService_ = std::make_shared<infra::WakeOnLanService>(*asioContext_, cfg.wakeBroadcastAddress,
                                                             cfg.wakePort);

    controller_ = std::make_shared<infra::HostController>(registry_, resolver_, wakeService_);

    infra::PollerSettings pollerSettings;
    pollerSettings.interval = std::chrono::seconds(cfg.pollIntervalSeconds);
    pollerSettings.probeTimeout = std::chrono::milliseconds(cfg.probeTimeoutMs);
    poller_ = std::make_shared<infra::StatusPoller>(*pollerContext_, registry_, pingService_,
                                                    pollerSettings);

    restApiServer_ = std::make_shared<infra::RestApiServer>(
        *asioContext_, controller_, cfg.serverPort, cfg.bindAddress, config_->staticDirPath());

    spdlog::info("Application components initialized");
}

int Application::run() {
    asioContext_->start();
    pollerContext_->start();
    restApiServer_->start();
    poller_->start();

    asioContext_->waitForTerminationSignal();

    shutdown();
    return 0;
}

void Application::shutdown() {
    if (poller_) {
        poller_->stop();
    }
    if (restApiServer_) {
        restApiServer_->stop();
    }
    if (pollerContext_) {
        pollerContext_->stop();
    }
    if (asioContext_) {
        asioContext_->stop();
    }
}

} // namespace hostwake::app
