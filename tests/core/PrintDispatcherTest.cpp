#include "core/connection/ConnectionManager.hpp"
#include "core/dispatch/PrintDispatcher.hpp"
#include "fakes/FakeTransportDriver.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using namespace core;
using namespace testing_support;
using dispatch::PrintDispatcher;
using dispatch::PrintOptions;
using registry::ConnectionState;

class PrintDispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<registry::ConnectionRegistry> registry = std::make_shared<registry::ConnectionRegistry>();
    std::shared_ptr<FakeTransportDriver> driver = std::make_shared<FakeTransportDriver>();
    connection::ConnectionManager connections{registry, driver};
    PrintDispatcher dispatcher{registry, driver};

    void connect(const std::string &id) {
        ASSERT_TRUE(connections.connect(makeConfig(id, id)).isSuccess());
    }
};

TEST_F(PrintDispatcherTest, NotConnectedNeverTouchesTheDriver) {
    auto result = dispatcher.printTo("offline", types::payloadFromString("hello"));

    EXPECT_TRUE(result.isNotConnected());
    EXPECT_EQ(result.printerId, "offline");
    EXPECT_FALSE(result.jobId.empty());
    EXPECT_EQ(driver->writeAttempts(), 0u);
    EXPECT_EQ(dispatcher.getStatistics().totalRejected, 1u);
    EXPECT_EQ(dispatcher.getStatistics().activeQueues, 0u);
}

TEST_F(PrintDispatcherTest, PrintToTransmitsPayload) {
    connect("p1");

    auto result = dispatcher.printTo("p1", types::payloadFromString("receipt"));

    EXPECT_EQ(result.code, types::ResultCode::Success);
    auto writes = driver->writesTo("p1");
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].payload, types::payloadFromString("receipt"));

    auto stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.totalEnqueued, 1u);
    EXPECT_EQ(stats.totalTransmitted, 1u);
}

TEST_F(PrintDispatcherTest, SamePrinterWritesAreSerializedInSubmissionOrder) {
    connect("p1");
    driver->setWriteDelay("p1", std::chrono::milliseconds(60));

    auto first = dispatcher.submit("p1", types::payloadFromString("first"));
    auto second = dispatcher.submit("p1", types::payloadFromString("second"));
    auto third = dispatcher.submit("p1", types::payloadFromString("third"));

    EXPECT_TRUE(first.get().isSuccess());
    EXPECT_TRUE(second.get().isSuccess());
    EXPECT_TRUE(third.get().isSuccess());

    auto writes = driver->writesTo("p1");
    ASSERT_EQ(writes.size(), 3u);
    EXPECT_EQ(writes[0].payload, types::payloadFromString("first"));
    EXPECT_EQ(writes[1].payload, types::payloadFromString("second"));
    EXPECT_EQ(writes[2].payload, types::payloadFromString("third"));
    EXPECT_LE(writes[0].finishedAt, writes[1].startedAt);
    EXPECT_LE(writes[1].finishedAt, writes[2].startedAt);
    EXPECT_FALSE(driver->overlapDetected());
}

TEST_F(PrintDispatcherTest, ConcurrentCallersNeverOverlapOnOnePrinter) {
    connect("p1");
    driver->setWriteDelay("p1", std::chrono::milliseconds(20));

    std::vector<std::thread> callers;
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([this, i]() {
            EXPECT_TRUE(dispatcher.printTo("p1", types::payloadFromString("job " + std::to_string(i))).isSuccess());
        });
    }
    for (auto &caller: callers) caller.join();

    EXPECT_EQ(driver->writesTo("p1").size(), 6u);
    EXPECT_FALSE(driver->overlapDetected());
}

TEST_F(PrintDispatcherTest, DifferentPrintersTransmitInParallel) {
    connect("p1");
    connect("p2");
    driver->setWriteDelay("p1", std::chrono::milliseconds(200));
    driver->setWriteDelay("p2", std::chrono::milliseconds(200));

    auto start = std::chrono::steady_clock::now();
    auto results = dispatcher.printToAll(types::payloadFromString("x"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(results.size(), 2u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(380));
}

TEST_F(PrintDispatcherTest, BroadcastKeepsPartialSuccess) {
    connect("A");
    connect("B");
    connect("C");
    driver->failWrites("B");
    driver->setWriteDelay("B", std::chrono::milliseconds(250));

    auto results = dispatcher.printToAll(types::payloadFromString("menu"));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results.at("A").isSuccess());
    EXPECT_TRUE(results.at("B").isTransmissionFailed());
    EXPECT_TRUE(results.at("C").isSuccess());

    // The successful writes did not wait behind the slow failing printer
    auto a = driver->writesTo("A");
    auto c = driver->writesTo("C");
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_LT(a[0].finishedAt - a[0].startedAt, std::chrono::milliseconds(200));

    std::set<std::string> jobIds;
    for (const auto &[id, result]: results) jobIds.insert(result.jobId);
    EXPECT_EQ(jobIds.size(), 1u);
}

TEST_F(PrintDispatcherTest, BroadcastWithNothingConnectedIsEmpty) {
    EXPECT_TRUE(dispatcher.printToAll(types::payloadFromString("x")).empty());
}

TEST_F(PrintDispatcherTest, BroadcastSkipsPrintersNotConnectedAtSnapshot) {
    connect("A");
    connect("B");
    ASSERT_TRUE(connections.disconnect("B"));

    auto results = dispatcher.printToAll(types::payloadFromString("x"));
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results.count("A"));
}

TEST_F(PrintDispatcherTest, TransmissionFailureDegradesConnection) {
    connect("A");
    driver->failWrites("A");

    auto failed = dispatcher.printTo("A", types::payloadFromString("payload"));
    EXPECT_TRUE(failed.isTransmissionFailed());

    auto snapshot = registry->get("A");
    EXPECT_EQ(snapshot.state, ConnectionState::Idle);
    EXPECT_FALSE(snapshot.hasHandle);
    ASSERT_TRUE(snapshot.lastError.has_value());
    EXPECT_TRUE(snapshot.lastError->isTransmissionFailed());
    EXPECT_EQ(driver->closedAddresses(), std::vector<std::string>{"A"});

    auto next = dispatcher.printTo("A", types::payloadFromString("payload2"));
    EXPECT_TRUE(next.isNotConnected());
    EXPECT_EQ(driver->writeAttempts(), 1u);
}

TEST_F(PrintDispatcherTest, JobQueuedBehindAFailureReportsNotConnected) {
    connect("A");
    driver->failWrites("A");
    driver->setWriteDelay("A", std::chrono::milliseconds(80));

    auto first = dispatcher.submit("A", types::payloadFromString("1"));
    auto second = dispatcher.submit("A", types::payloadFromString("2"));

    EXPECT_TRUE(first.get().isTransmissionFailed());
    EXPECT_TRUE(second.get().isNotConnected());
    EXPECT_EQ(driver->writeAttempts(), 1u);
}

TEST_F(PrintDispatcherTest, DeadlineExpiresJobWithoutTransmittingIt) {
    connect("A");
    driver->setWriteDelay("A", std::chrono::milliseconds(300));

    auto blocker = dispatcher.submit("A", types::payloadFromString("long"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    PrintOptions options;
    options.timeout = std::chrono::milliseconds(60);
    auto result = dispatcher.printTo("A", types::payloadFromString("late"), options);
    EXPECT_TRUE(result.isTimeout());

    EXPECT_TRUE(blocker.get().isSuccess());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto writes = driver->writesTo("A");
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].payload, types::payloadFromString("long"));
    EXPECT_EQ(registry->get("A").state, ConnectionState::Connected);
}

TEST_F(PrintDispatcherTest, CancellationResolvesPendingJobs) {
    connect("A");
    driver->setWriteDelay("A", std::chrono::milliseconds(200));

    auto blocker = dispatcher.submit("A", types::payloadFromString("first"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    PrintOptions options;
    options.cancellation = types::CancellationToken::create();
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        options.cancellation->cancel();
    });
    auto result = dispatcher.printTo("A", types::payloadFromString("second"), options);
    canceller.join();

    EXPECT_TRUE(result.isCancelled());
    EXPECT_TRUE(blocker.get().isSuccess());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(driver->writesTo("A").size(), 1u);
}

TEST_F(PrintDispatcherTest, AlreadyCancelledTokenIsRejected) {
    connect("A");
    PrintOptions options;
    options.cancellation = types::CancellationToken::create();
    options.cancellation->cancel();

    EXPECT_TRUE(dispatcher.printTo("A", types::payloadFromString("x"), options).isCancelled());
    EXPECT_EQ(driver->writeAttempts(), 0u);
}

TEST_F(PrintDispatcherTest, WildcardJobFansOut) {
    connect("A");
    connect("B");

    types::PrintJob job;
    job.target = types::PrintJob::ALL_PRINTERS;
    job.payload = types::payloadFromString("all");
    EXPECT_EQ(dispatcher.print(job).size(), 2u);

    job.target = "A";
    auto single = dispatcher.print(job);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_TRUE(single.at("A").isSuccess());
}

TEST_F(PrintDispatcherTest, ShutdownRejectsNewJobs) {
    connect("A");
    ASSERT_TRUE(dispatcher.printTo("A", types::payloadFromString("x")).isSuccess());

    dispatcher.shutdown();
    EXPECT_TRUE(dispatcher.printTo("A", types::payloadFromString("y")).isCancelled());
    EXPECT_EQ(dispatcher.getStatistics().activeQueues, 0u);
    dispatcher.shutdown();
}

TEST_F(PrintDispatcherTest, DisconnectedPrinterQueueIsReleasedAndRecreated) {
    connect("A");
    ASSERT_TRUE(dispatcher.printTo("A", types::payloadFromString("one")).isSuccess());
    EXPECT_EQ(dispatcher.getStatistics().activeQueues, 1u);

    ASSERT_TRUE(connections.disconnect("A"));
    EXPECT_EQ(dispatcher.releaseIdleQueues(), 1u);

    auto stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.activeQueues, 0u);
    EXPECT_EQ(stats.totalEnqueued, 1u);
    EXPECT_EQ(stats.totalTransmitted, 1u);

    connect("A");
    EXPECT_TRUE(dispatcher.printTo("A", types::payloadFromString("two")).isSuccess());
    stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.activeQueues, 1u);
    EXPECT_EQ(stats.totalTransmitted, 2u);
    EXPECT_EQ(driver->writesTo("A").size(), 2u);
}

TEST_F(PrintDispatcherTest, ConnectedOrBusyQueuesAreNotReleased) {
    connect("A");
    connect("B");
    driver->setWriteDelay("B", std::chrono::milliseconds(150));
    ASSERT_TRUE(dispatcher.printTo("A", types::payloadFromString("a")).isSuccess());
    auto pending = dispatcher.submit("B", types::payloadFromString("b"));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_EQ(dispatcher.releaseIdleQueues(), 0u);
    EXPECT_EQ(dispatcher.getStatistics().activeQueues, 2u);
    EXPECT_TRUE(pending.get().isSuccess());
}

TEST_F(PrintDispatcherTest, RejectionReleasesQueuesOfLostPrinters) {
    connect("A");
    driver->failWrites("A");
    EXPECT_TRUE(dispatcher.printTo("A", types::payloadFromString("x")).isTransmissionFailed());
    EXPECT_EQ(dispatcher.getStatistics().activeQueues, 1u);

    EXPECT_TRUE(dispatcher.printTo("A", types::payloadFromString("y")).isNotConnected());
    auto stats = dispatcher.getStatistics();
    EXPECT_EQ(stats.activeQueues, 0u);
    EXPECT_EQ(stats.totalFailed, 1u);
}

TEST(PrintDispatcherIdTest, JobIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(PrintDispatcher::generateJobId());
    }
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(ids.begin()->rfind("job-", 0), 0u);
}
