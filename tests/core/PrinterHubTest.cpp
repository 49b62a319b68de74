#include "core/PrinterHub.hpp"
#include "core/events/EventSystem.hpp"
#include "fakes/FakeDeviceScanner.hpp"
#include "fakes/FakeTransportDriver.hpp"

#include <gtest/gtest.h>

#include <map>
#include <mutex>

using namespace core;
using namespace testing_support;
using registry::ConnectionState;

namespace {

    class StaticStore : public store::ConfigurationStore {
    public:
        explicit StaticStore(std::vector<types::PrinterConfiguration> configs) : configs_(std::move(configs)) {}

        std::vector<types::PrinterConfiguration> list() const override {
            return configs_;
        }

    private:
        std::vector<types::PrinterConfiguration> configs_;
    };

    class RecordingObserver : public events::IEventObserver {
    public:
        void onEvent(const events::Event &event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.emplace_back(event.type, event.source);
        }

        int count(events::EventType type, const std::string &source) const {
            std::lock_guard<std::mutex> lock(mutex_);
            int n = 0;
            for (const auto &[t, s]: seen_) {
                if (t == type && s == source) n++;
            }
            return n;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::pair<events::EventType, std::string>> seen_;
    };

}

class PrinterHubTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransportDriver> driver = std::make_shared<FakeTransportDriver>();
    std::shared_ptr<FakeDeviceScanner> scanner = std::make_shared<FakeDeviceScanner>(
            "fake", std::vector<ScriptedObservation>{
                    {std::chrono::milliseconds(0), makeDevice("/dev/rfcomm0", "Bar")},
                    {std::chrono::milliseconds(0), makeDevice("/dev/rfcomm0", "Bar TM-m30")},
            });
    std::shared_ptr<discovery::DiscoveryService> discovery =
            std::make_shared<discovery::DiscoveryService>(
                    std::vector<std::shared_ptr<discovery::DeviceScanner>>{scanner});
    PrinterHub hub{driver, discovery};
};

TEST_F(PrinterHubTest, RejectsMissingCollaborators) {
    EXPECT_THROW(PrinterHub(driver, nullptr), std::invalid_argument);
    EXPECT_THROW(PrinterHub(nullptr, discovery), std::invalid_argument);
}

TEST_F(PrinterHubTest, DiscoverDeduplicatesAdvertisements) {
    auto devices = hub.discover(std::chrono::milliseconds(200));
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name, "Bar TM-m30");
}

TEST_F(PrinterHubTest, ValidAndUnreachablePrinterScenario) {
    driver->makeUnreachable("bad-address");

    auto outcome = hub.connectMany({makeConfig("A", "good-address"), makeConfig("B", "bad-address")});
    EXPECT_EQ(outcome, (std::map<types::PrinterId, bool>{{"A", true}, {"B", false}}));

    EXPECT_EQ(hub.connectionState("A").state, ConnectionState::Connected);
    auto b = hub.connectionState("B");
    EXPECT_EQ(b.state, ConnectionState::Idle);
    ASSERT_TRUE(b.lastError.has_value());
    EXPECT_EQ(b.lastError->code, types::ResultCode::ConnectFailed);
}

TEST_F(PrinterHubTest, WriteFailureThenNotConnectedScenario) {
    ASSERT_TRUE(hub.connect(makeConfig("A", "addr-a")).isSuccess());
    driver->failWrites("addr-a");

    EXPECT_TRUE(hub.printTo("A", types::payloadFromString("payload")).isTransmissionFailed());
    EXPECT_TRUE(hub.printTo("A", types::payloadFromString("payload2")).isNotConnected());
}

TEST_F(PrinterHubTest, ReconnectAfterConnectionLossOpensFreshHandle) {
    ASSERT_TRUE(hub.connect(makeConfig("A", "addr-a")).isSuccess());
    driver->failWrites("addr-a");
    hub.printTo("A", types::payloadFromString("x"));

    auto again = hub.connect(makeConfig("A", "addr-a"));
    EXPECT_EQ(again.code, types::ResultCode::Success);
    EXPECT_EQ(driver->openCalls("addr-a"), 2);
}

TEST_F(PrinterHubTest, DisconnectReleasesThePrinterQueue) {
    ASSERT_TRUE(hub.connect(makeConfig("A", "addr-a")).isSuccess());
    ASSERT_TRUE(hub.printTo("A", types::payloadFromString("x")).isSuccess());
    EXPECT_EQ(hub.getDispatchStatistics().activeQueues, 1u);

    EXPECT_TRUE(hub.disconnect("A"));
    auto stats = hub.getDispatchStatistics();
    EXPECT_EQ(stats.activeQueues, 0u);
    EXPECT_EQ(stats.totalTransmitted, 1u);
}

TEST_F(PrinterHubTest, ConnectConfiguredSkipsInactivePrinters) {
    auto inactive = makeConfig("off", "addr-off");
    inactive.active = false;
    StaticStore store({makeConfig("on", "addr-on"), inactive});

    auto results = hub.connectConfigured(store);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results.at("on").isSuccess());
    EXPECT_EQ(driver->openCalls("addr-off"), 0);
    ASSERT_TRUE(store.find("off").has_value());
    EXPECT_FALSE(store.find("missing").has_value());
}

TEST_F(PrinterHubTest, ConnectionStatesListEveryKnownPrinter) {
    driver->makeUnreachable("addr-b");
    hub.connectMany({makeConfig("A", "addr-a"), makeConfig("B", "addr-b")});

    auto states = hub.connectionStates();
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(hub.connectionState("never-seen").state, ConnectionState::Idle);
}

TEST_F(PrinterHubTest, PublishesLifecycleEvents) {
    auto observer = std::make_shared<RecordingObserver>();
    events::EventBus::getInstance().subscribe(observer);

    ASSERT_TRUE(hub.connect(makeConfig("evt", "addr-evt")).isSuccess());
    ASSERT_TRUE(hub.printTo("evt", types::payloadFromString("x")).isSuccess());
    driver->failWrites("addr-evt");
    hub.printTo("evt", types::payloadFromString("y"));

    EXPECT_EQ(observer->count(events::EventType::PRINTER_CONNECTED, "evt"), 1);
    EXPECT_EQ(observer->count(events::EventType::PRINT_JOB_COMPLETED, "evt"), 1);
    EXPECT_EQ(observer->count(events::EventType::PRINT_JOB_FAILED, "evt"), 1);
    EXPECT_EQ(observer->count(events::EventType::PRINTER_CONNECTION_LOST, "evt"), 1);
}

TEST_F(PrinterHubTest, ShutdownClosesConnectionsAndStopsPrinting) {
    hub.connectMany({makeConfig("A", "addr-a"), makeConfig("B", "addr-b")});

    hub.shutdown();
    EXPECT_TRUE(hub.connectionStates().size() == 2u);
    EXPECT_EQ(hub.connectionState("A").state, ConnectionState::Idle);
    EXPECT_EQ(driver->closedAddresses().size(), 2u);
    EXPECT_TRUE(hub.printTo("A", types::payloadFromString("x")).isCancelled());

    hub.shutdown();
    EXPECT_EQ(driver->closedAddresses().size(), 2u);
}
