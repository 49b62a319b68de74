#include "core/discovery/impl/NetworkDeviceScanner.hpp"
#include "core/types/Error.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

using namespace core;
using boost::asio::ip::tcp;

TEST(NetworkDeviceScannerTest, TargetsCombineHostsAndSubnetWithoutDuplicates) {
    discovery::NetworkScanConfig config;
    config.hosts = {"192.168.1.3", "printer.local", "10.0.0.7"};
    config.subnetPrefix = "192.168.1.";
    config.rangeStart = 2;
    config.rangeEnd = 4;

    discovery::NetworkDeviceScanner scanner(config);
    std::vector<std::string> expected{"192.168.1.3", "10.0.0.7", "192.168.1.2", "192.168.1.4"};
    EXPECT_EQ(scanner.targets(), expected);
}

TEST(NetworkDeviceScannerTest, NothingToProbeIsUnavailable) {
    discovery::NetworkDeviceScanner scanner(discovery::NetworkScanConfig{});
    EXPECT_THROW(scanner.startScan(), types::DiscoveryUnavailableException);
}

TEST(NetworkDeviceScannerTest, FindsListeningPrinterPort) {
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    discovery::NetworkScanConfig config;
    config.hosts = {"127.0.0.1"};
    config.port = acceptor.local_endpoint().port();
    config.probeTimeout = std::chrono::milliseconds(500);

    discovery::NetworkDeviceScanner scanner(config);
    std::vector<types::DiscoveredDevice> found;
    std::atomic<bool> stop{false};
    scanner.startScan();
    scanner.scan(std::chrono::steady_clock::now() + std::chrono::seconds(2),
                 [&found](const types::DiscoveredDevice &device) { found.push_back(device); }, stop);

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].address, "127.0.0.1:" + std::to_string(config.port));
    EXPECT_EQ(found[0].kind, types::TransportKind::Network);
}
