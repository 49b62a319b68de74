#include "core/connection/ConnectionManager.hpp"
#include "fakes/FakeTransportDriver.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <thread>

using namespace core;
using namespace testing_support;
using connection::ConnectionManager;
using connection::ConnectOptions;
using registry::ConnectionState;

class ConnectionManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<registry::ConnectionRegistry> registry = std::make_shared<registry::ConnectionRegistry>();
    std::shared_ptr<FakeTransportDriver> driver = std::make_shared<FakeTransportDriver>();
    ConnectionManager manager{registry, driver};
};

TEST_F(ConnectionManagerTest, RejectsNullCollaborators) {
    EXPECT_THROW(ConnectionManager(nullptr, driver), std::invalid_argument);
    EXPECT_THROW(ConnectionManager(registry, nullptr), std::invalid_argument);
}

TEST_F(ConnectionManagerTest, ConnectStoresHandleInRegistry) {
    auto result = manager.connect(makeConfig("p1", "10.0.0.1"));

    EXPECT_EQ(result.code, types::ResultCode::Success);
    EXPECT_EQ(result.printerId, "p1");
    auto snapshot = registry->get("p1");
    EXPECT_EQ(snapshot.state, ConnectionState::Connected);
    EXPECT_EQ(snapshot.address, "10.0.0.1");
}

TEST_F(ConnectionManagerTest, ReconnectingIsIdempotentAndSkipsTheDriver) {
    ASSERT_TRUE(manager.connect(makeConfig("p1", "10.0.0.1")).isSuccess());

    auto again = manager.connect(makeConfig("p1", "10.0.0.1"));
    EXPECT_TRUE(again.isAlreadyConnected());
    EXPECT_TRUE(again.isSuccess());
    EXPECT_EQ(driver->openCalls("10.0.0.1"), 1);
}

TEST_F(ConnectionManagerTest, InvalidConfigurationFailsWithoutOpening) {
    auto config = makeConfig("p1", "");
    auto result = manager.connect(config);
    EXPECT_TRUE(result.isConnectFailed());
    EXPECT_EQ(driver->openCalls(""), 0);

    auto snapshot = registry->get("p1");
    EXPECT_EQ(snapshot.state, ConnectionState::Idle);
    ASSERT_TRUE(snapshot.lastError.has_value());
    EXPECT_TRUE(snapshot.lastError->isConnectFailed());
}

TEST_F(ConnectionManagerTest, BatchRecordsInvalidAndCancelledSlotsInRegistry) {
    auto outcome = manager.connectMany({makeConfig("A", "10.0.0.1"), makeConfig("B", "")});
    EXPECT_TRUE(outcome.at("A"));
    EXPECT_FALSE(outcome.at("B"));
    auto invalid = registry->get("B");
    EXPECT_EQ(invalid.state, ConnectionState::Idle);
    ASSERT_TRUE(invalid.lastError.has_value());
    EXPECT_TRUE(invalid.lastError->isConnectFailed());

    ConnectOptions cancelled;
    cancelled.cancellation = types::CancellationToken::create();
    cancelled.cancellation->cancel();
    auto skipped = manager.connectMany({makeConfig("C", "10.0.0.3")}, cancelled);
    EXPECT_FALSE(skipped.at("C"));
    auto record = registry->get("C");
    EXPECT_EQ(record.state, ConnectionState::Idle);
    ASSERT_TRUE(record.lastError.has_value());
    EXPECT_TRUE(record.lastError->isCancelled());
    EXPECT_EQ(driver->openCalls("10.0.0.3"), 0);
}

TEST_F(ConnectionManagerTest, CancelledTokenStillReportsLiveConnection) {
    ASSERT_TRUE(manager.connect(makeConfig("p1", "a")).isSuccess());

    ConnectOptions options;
    options.cancellation = types::CancellationToken::create();
    options.cancellation->cancel();

    EXPECT_TRUE(manager.connect(makeConfig("p1", "a"), options).isAlreadyConnected());
    EXPECT_EQ(registry->get("p1").state, ConnectionState::Connected);
    EXPECT_EQ(driver->openCalls("a"), 1);
}

TEST_F(ConnectionManagerTest, BatchReportsOneOutcomePerConfiguration) {
    driver->makeUnreachable("10.0.0.2");

    auto outcome = manager.connectMany({makeConfig("A", "10.0.0.1"), makeConfig("B", "10.0.0.2")});

    ASSERT_EQ(outcome.size(), 2u);
    EXPECT_TRUE(outcome.at("A"));
    EXPECT_FALSE(outcome.at("B"));

    EXPECT_EQ(registry->get("A").state, ConnectionState::Connected);
    auto failed = registry->get("B");
    EXPECT_EQ(failed.state, ConnectionState::Idle);
    ASSERT_TRUE(failed.lastError.has_value());
    EXPECT_TRUE(failed.lastError->isConnectFailed());
}

TEST_F(ConnectionManagerTest, BatchAttemptsRunConcurrently) {
    std::vector<types::PrinterConfiguration> configs;
    for (int i = 0; i < 4; ++i) {
        auto address = "10.0.0." + std::to_string(i + 1);
        driver->setOpenDelay(address, std::chrono::milliseconds(200));
        configs.push_back(makeConfig("p" + std::to_string(i), address));
    }

    auto start = std::chrono::steady_clock::now();
    auto outcome = manager.connectMany(configs);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.size(), 4u);
    for (const auto &[id, connected]: outcome) {
        EXPECT_TRUE(connected) << id;
    }
    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
}

TEST_F(ConnectionManagerTest, SlowFailureDoesNotHoldBackOthersOutcome) {
    driver->makeUnreachable("slow");
    driver->setOpenDelay("slow", std::chrono::milliseconds(150));

    auto results = manager.connectManyDetailed({makeConfig("fast", "fast"), makeConfig("slow", "slow")});
    EXPECT_TRUE(results.at("fast").isSuccess());
    EXPECT_TRUE(results.at("slow").isConnectFailed());
    EXPECT_EQ(results.at("slow").printerId, "slow");
}

TEST_F(ConnectionManagerTest, DuplicateIdentityInBatchOpensOnce) {
    driver->setOpenDelay("10.0.0.1", std::chrono::milliseconds(100));

    auto outcome = manager.connectMany({makeConfig("p1", "10.0.0.1"), makeConfig("p1", "10.0.0.1")});

    ASSERT_EQ(outcome.size(), 1u);
    EXPECT_TRUE(outcome.at("p1"));
    EXPECT_EQ(driver->openCalls("10.0.0.1"), 1);
}

TEST_F(ConnectionManagerTest, TimeoutLeavesPrinterIdleAndClosesLateHandle) {
    driver->setOpenDelay("slow", std::chrono::milliseconds(300));

    ConnectOptions options;
    options.timeout = std::chrono::milliseconds(50);
    auto result = manager.connect(makeConfig("p1", "slow"), options);

    EXPECT_TRUE(result.isTimeout());
    auto snapshot = registry->get("p1");
    EXPECT_EQ(snapshot.state, ConnectionState::Idle);
    ASSERT_TRUE(snapshot.lastError.has_value());
    EXPECT_TRUE(snapshot.lastError->isTimeout());

    // The opener finishes later and must not resurrect the connection
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_EQ(registry->get("p1").state, ConnectionState::Idle);
    auto closed = driver->closedAddresses();
    EXPECT_EQ(std::count(closed.begin(), closed.end(), "slow"), 1);
}

TEST_F(ConnectionManagerTest, CancelledTokenStopsPendingAttemptsOnly) {
    driver->setOpenDelay("slow", std::chrono::milliseconds(400));

    ConnectOptions options;
    options.cancellation = types::CancellationToken::create();

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        options.cancellation->cancel();
    });
    auto results = manager.connectManyDetailed({makeConfig("fast", "fast"), makeConfig("slow", "slow")}, options);
    canceller.join();

    EXPECT_TRUE(results.at("fast").isSuccess());
    EXPECT_TRUE(results.at("slow").isCancelled());
    EXPECT_EQ(registry->get("fast").state, ConnectionState::Connected);
    EXPECT_EQ(registry->get("slow").state, ConnectionState::Idle);

    std::this_thread::sleep_for(std::chrono::milliseconds(450));
}

TEST_F(ConnectionManagerTest, AlreadyCancelledTokenNeverOpens) {
    ConnectOptions options;
    options.cancellation = types::CancellationToken::create();
    options.cancellation->cancel();

    EXPECT_TRUE(manager.connect(makeConfig("p1", "a"), options).isCancelled());
    EXPECT_EQ(driver->openCalls("a"), 0);

    auto snapshot = registry->get("p1");
    EXPECT_EQ(snapshot.state, ConnectionState::Idle);
    ASSERT_TRUE(snapshot.lastError.has_value());
    EXPECT_TRUE(snapshot.lastError->isCancelled());
}

TEST_F(ConnectionManagerTest, ConcurrentConnectWaitsForTheRunningAttempt) {
    driver->setOpenDelay("a", std::chrono::milliseconds(150));

    auto first = std::async(std::launch::async, [&]() { return manager.connect(makeConfig("p1", "a")); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    auto second = manager.connect(makeConfig("p1", "a"));

    EXPECT_TRUE(first.get().isSuccess());
    EXPECT_TRUE(second.isSuccess());
    EXPECT_EQ(driver->openCalls("a"), 1);
}

TEST_F(ConnectionManagerTest, DisconnectClosesAndReturnsTrueOnce) {
    ASSERT_TRUE(manager.connect(makeConfig("p1", "a")).isSuccess());

    EXPECT_TRUE(manager.disconnect("p1"));
    EXPECT_EQ(registry->get("p1").state, ConnectionState::Idle);
    EXPECT_EQ(driver->closedAddresses(), std::vector<std::string>{"a"});

    EXPECT_FALSE(manager.disconnect("p1"));
    EXPECT_EQ(driver->closedAddresses().size(), 1u);
}

TEST_F(ConnectionManagerTest, DisconnectUnknownPrinterIsBenign) {
    EXPECT_FALSE(manager.disconnect("ghost"));
    EXPECT_EQ(registry->get("ghost").state, ConnectionState::Idle);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(ConnectionManagerTest, DisconnectAllClosesEveryConnection) {
    manager.connectMany({makeConfig("p1", "a"), makeConfig("p2", "b")});
    EXPECT_EQ(manager.disconnectAll(), 2u);
    EXPECT_TRUE(registry->connectedPrinters().empty());
}

TEST(ConnectionManagerMockTest, DriverExceptionBecomesConnectFailed) {
    using ::testing::_;
    using ::testing::Throw;

    auto registry = std::make_shared<registry::ConnectionRegistry>();
    auto driver = std::make_shared<::testing::StrictMock<MockTransportDriver>>();
    ConnectionManager manager(registry, driver);

    EXPECT_CALL(*driver, open(_)).WillOnce(Throw(std::runtime_error("socket exploded")));

    auto result = manager.connect(makeConfig("p1", "a"));
    EXPECT_TRUE(result.isConnectFailed());
    EXPECT_NE(result.message.find("socket exploded"), std::string::npos);
    EXPECT_EQ(registry->get("p1").state, ConnectionState::Idle);
}
