#include <catch2/catch_test_macros.hpp>

#include "infrastructure/api/HostController.hpp"
#include "infrastructure/network/StatusPoller.hpp"
#include "infrastructure/storage/JsonRegistryStorage.hpp"
#include "support/FakeServices.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

using namespace hostwake::core;
using namespace hostwake::infra;
using hostwake::testing::FakeNeighborTable;
using hostwake::testing::FakePingService;

namespace {

class IntegrationDataFile {
public:
    IntegrationDataFile()
        : path_(std::filesystem::temp_directory_path() / "hostwake_lifecycle_test.json") {
        std::filesystem::remove(path_);
    }

    ~IntegrationDataFile() { std::filesystem::remove(path_); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

HostFields fields(const std::string& ip, const std::string& name) {
    HostFields f;
    f.ipAddress = ip;
    f.name = name;
    return f;
}

} // namespace

TEST_CASE("Registry survives a restart with polled statuses", "[Integration]") {
    IntegrationDataFile dataFile;
    AsioContext context(2);
    context.start();

    auto ping = std::make_shared<FakePingService>();
    auto table = std::make_shared<FakeNeighborTable>();
    table->requirePrimingBy(ping);
    table->set("192.168.1.10", "aa:bb:cc:dd:ee:ff");
    ping->setAlive("192.168.1.10");

    int64_t officeId = 0;
    int64_t printerId = 0;
    {
        auto registry = std::make_shared<HostRegistry>(std::make_shared<JsonRegistryStorage>(dataFile.path()));
        registry->load();
        REQUIRE(registry->size() == 0);

        HostController controller(registry, std::make_shared<AddressResolver>(ping, table),
                                  std::make_shared<WakeOnLanService>(context, "127.0.0.1", 9));

        auto office = controller.addHost(fields("192.168.1.10", "Γραφείο"));
        REQUIRE(office.ok());
        REQUIRE(office.host->macAddress == "aa:bb:cc:dd:ee:ff");
        officeId = office.host->id;

        auto printer = controller.addHost(fields("192.168.1.20", "Printer"));
        REQUIRE(printer.ok());
        REQUIRE(printer.host->macAddress.empty());
        printerId = printer.host->id;

        PollerSettings settings;
        settings.interval = std::chrono::milliseconds(20);
        auto poller = std::make_shared<StatusPoller>(context, registry, ping, settings);
        poller->start();

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (poller->completedCycles() < 1 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        poller->stop();
        REQUIRE(poller->completedCycles() >= 1);

        REQUIRE(registry->find(officeId)->status == HostStatus::Online);
        REQUIRE(registry->find(printerId)->status == HostStatus::Offline);

        // Polling alone writes nothing; the next structural change carries the statuses.
        REQUIRE(JsonRegistryStorage(dataFile.path()).load()[0].status == HostStatus::Offline);

        HostUpdate update;
        update.owner = "IT";
        REQUIRE(controller.updateHost(printerId, update).ok());
    }

    auto reloaded = std::make_shared<HostRegistry>(std::make_shared<JsonRegistryStorage>(dataFile.path()));
    reloaded->load();

    auto hosts = reloaded->list();
    REQUIRE(hosts.size() == 2);
    REQUIRE(hosts[0].id == officeId);
    REQUIRE(hosts[0].name == "Γραφείο");
    REQUIRE(hosts[0].macAddress == "aa:bb:cc:dd:ee:ff");
    REQUIRE(hosts[0].status == HostStatus::Online);
    REQUIRE(hosts[1].owner == "IT");

    SECTION("Ids continue after the reloaded maximum") {
        reloaded->remove(officeId);
        auto next = reloaded->add(fields("192.168.1.30", "Laptop"));
        REQUIRE(next.id == printerId + 1);
    }

    context.stop();
}
