#include "app/Application.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    std::filesystem::path configDir = argc > 1 ? argv[1] : ".";

    try {
        hostwake::app::Application app(configDir);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
