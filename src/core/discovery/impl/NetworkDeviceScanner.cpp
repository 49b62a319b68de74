//
// Created by Andrea on 15/10/2025.
//

#include "core/discovery/impl/NetworkDeviceScanner.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <boost/asio.hpp>
#include <algorithm>
#include <functional>
#include <memory>
#include <unordered_set>

namespace core::discovery {

    using boost::asio::ip::tcp;

    namespace {
        struct Probe {
            Probe(boost::asio::io_context &io, std::string target)
                    : socket(io), timer(io), host(std::move(target)) {}

            tcp::socket socket;
            boost::asio::steady_timer timer;
            std::string host;
            bool finished = false;
        };
    }

    NetworkDeviceScanner::NetworkDeviceScanner(NetworkScanConfig config) : config_(std::move(config)) {
        if (config_.maxConcurrentProbes == 0) {
            config_.maxConcurrentProbes = 1;
        }
    }

    std::vector<std::string> NetworkDeviceScanner::targets() const {
        std::vector<std::string> result;
        std::unordered_set<std::string> seen;

        auto add = [&](const std::string &host) {
            boost::system::error_code ec;
            boost::asio::ip::make_address(host, ec);
            if (ec) {
                Logger::logWarning("[NetworkDeviceScanner] Skipping non-IP host: " + host);
                return;
            }
            if (seen.insert(host).second) {
                result.push_back(host);
            }
        };

        for (const auto &host: config_.hosts) {
            add(host);
        }
        if (!config_.subnetPrefix.empty()) {
            int first = std::max(1, config_.rangeStart);
            int last = std::min(254, config_.rangeEnd);
            for (int i = first; i <= last; ++i) {
                add(config_.subnetPrefix + std::to_string(i));
            }
        }
        return result;
    }

    void NetworkDeviceScanner::startScan() {
        if (targets().empty()) {
            throw types::DiscoveryUnavailableException("no network hosts or subnet configured");
        }
    }

    void NetworkDeviceScanner::scan(std::chrono::steady_clock::time_point deadline, const DeviceSink &sink,
                                    const std::atomic<bool> &stopRequested) {
        const auto hosts = targets();
        boost::asio::io_context io;
        std::vector<std::shared_ptr<Probe>> probes;
        size_t next = 0;

        std::function<void()> launchNext;
        launchNext = [&]() {
            if (next >= hosts.size() || stopRequested) return;

            auto probe = std::make_shared<Probe>(io, hosts[next++]);
            probes.push_back(probe);

            boost::system::error_code ec;
            tcp::endpoint endpoint(boost::asio::ip::make_address(probe->host, ec), config_.port);

            probe->timer.expires_after(config_.probeTimeout);
            probe->timer.async_wait([probe](const boost::system::error_code &error) {
                if (!error && !probe->finished) {
                    boost::system::error_code ignored;
                    probe->socket.close(ignored);
                }
            });

            probe->socket.async_connect(endpoint, [&, probe](const boost::system::error_code &error) {
                probe->finished = true;
                probe->timer.cancel();

                if (!error && !stopRequested) {
                    types::DiscoveredDevice device;
                    device.address = probe->host + ":" + std::to_string(config_.port);
                    device.name = "Network Printer (" + probe->host + ")";
                    device.kind = types::TransportKind::Network;
                    device.lastSeen = std::chrono::steady_clock::now();
                    sink(device);
                }

                boost::system::error_code ignored;
                probe->socket.close(ignored);
                launchNext();
            });
        };

        for (size_t i = 0; i < config_.maxConcurrentProbes; ++i) {
            launchNext();
        }

        Logger::logInfo("[NetworkDeviceScanner] Probing " + std::to_string(hosts.size()) + " host(s) on port " +
                        std::to_string(config_.port));

        while (!stopRequested && !io.stopped()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;
            io.run_for(std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(50)));
        }

        // Abort what is still in flight and drain the aborted handlers
        for (const auto &probe: probes) {
            boost::system::error_code ignored;
            probe->finished = true;
            probe->timer.cancel();
            probe->socket.close(ignored);
        }
        next = hosts.size();
        io.restart();
        io.run();
    }

} // namespace core::discovery
