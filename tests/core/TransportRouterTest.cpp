#include "core/transport/TransportRouter.hpp"
#include "core/transport/impl/NetworkTransportDriver.hpp"
#include "core/types/Error.hpp"
#include "fakes/FakeTransportDriver.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace core;
using namespace testing_support;
using ::testing::_;
using ::testing::ByMove;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

    std::shared_ptr<NiceMock<MockTransportDriver>> makeMock(std::vector<types::TransportKind> kinds,
                                                           const std::string &name) {
        auto driver = std::make_shared<NiceMock<MockTransportDriver>>();
        ON_CALL(*driver, supports(_)).WillByDefault(Return(false));
        for (auto kind: kinds) {
            ON_CALL(*driver, supports(kind)).WillByDefault(Return(true));
        }
        ON_CALL(*driver, getDriverName()).WillByDefault(Return(name));
        return driver;
    }

}

TEST(TransportRouterTest, OpensThroughTheDriverForTheConfiguredKind) {
    auto serial = makeMock({types::TransportKind::Bluetooth, types::TransportKind::Usb}, "serial");
    auto network = makeMock({types::TransportKind::Network}, "network");

    transport::TransportRouter router;
    router.addDriver(serial);
    router.addDriver(network);

    auto config = makeConfig("lan", "10.0.0.5", types::TransportKind::Network);
    EXPECT_CALL(*network, open(_))
            .WillOnce(Return(ByMove(std::make_unique<FakeHandle>("10.0.0.5", types::TransportKind::Network, 1))));
    EXPECT_CALL(*serial, open(_)).Times(0);

    auto handle = router.open(config);
    ASSERT_NE(handle, nullptr);

    EXPECT_CALL(*network, write(_, _)).Times(1);
    EXPECT_CALL(*network, close(_)).Times(1);
    router.write(*handle, types::payloadFromString("x"));
    router.close(*handle);

    EXPECT_TRUE(router.supports(types::TransportKind::Usb));
    EXPECT_FALSE(router.supports(types::TransportKind::Serial));
}

TEST(TransportRouterTest, FirstRegisteredDriverWinsForAKind) {
    auto first = makeMock({types::TransportKind::Network}, "first");
    auto second = makeMock({types::TransportKind::Network}, "second");

    transport::TransportRouter router;
    router.addDriver(first);
    router.addDriver(second);

    EXPECT_CALL(*first, open(_))
            .WillOnce(Return(ByMove(std::make_unique<FakeHandle>("h", types::TransportKind::Network, 1))));
    EXPECT_CALL(*second, open(_)).Times(0);
    router.open(makeConfig("p", "h"));
}

TEST(TransportRouterTest, UnsupportedKindFailsToConnect) {
    transport::TransportRouter router;
    router.addDriver(makeMock({types::TransportKind::Network}, "network"));

    EXPECT_THROW(router.open(makeConfig("bt", "/dev/rfcomm0", types::TransportKind::Bluetooth)),
                 types::ConnectFailedException);

    FakeHandle orphan("/dev/rfcomm0", types::TransportKind::Bluetooth, 1);
    EXPECT_THROW(router.write(orphan, types::payloadFromString("x")), types::TransmissionFailedException);
    EXPECT_NO_THROW(router.close(orphan));
}

TEST(TransportRouterTest, RejectsNullDriver) {
    transport::TransportRouter router;
    EXPECT_THROW(router.addDriver(nullptr), std::invalid_argument);
}

TEST(NetworkTransportDriverTest, SplitsHostAndPort) {
    using transport::NetworkTransportDriver;

    EXPECT_EQ(NetworkTransportDriver::splitHostPort("192.168.1.50", 9100),
              std::make_pair(std::string("192.168.1.50"), uint16_t(9100)));
    EXPECT_EQ(NetworkTransportDriver::splitHostPort("192.168.1.50:9101", 9100),
              std::make_pair(std::string("192.168.1.50"), uint16_t(9101)));
    EXPECT_EQ(NetworkTransportDriver::splitHostPort("[fe80::1]:515", 9100),
              std::make_pair(std::string("fe80::1"), uint16_t(515)));
    EXPECT_EQ(NetworkTransportDriver::splitHostPort("fe80::1", 9100),
              std::make_pair(std::string("fe80::1"), uint16_t(9100)));
}

TEST(NetworkTransportDriverTest, RejectsInvalidPort) {
    using transport::NetworkTransportDriver;

    EXPECT_THROW(NetworkTransportDriver::splitHostPort("printer:0", 9100), types::ConnectFailedException);
    EXPECT_THROW(NetworkTransportDriver::splitHostPort("printer:70000", 9100), types::ConnectFailedException);
    EXPECT_THROW(NetworkTransportDriver::splitHostPort("printer:abc", 9100), types::ConnectFailedException);
}
