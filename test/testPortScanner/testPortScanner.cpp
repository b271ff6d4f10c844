/**
 * @file testPortScanner.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 */
#include "mock_collaborators.hpp"
#include "camera_ports.hpp"
#include "port_scanner.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <set>

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

using namespace camscout;
using namespace std::chrono_literals;

namespace
{

/// Prober answering for a fixed set of open endpoints and recording every batch it sees.
struct FakeNetwork
{
    std::set<std::pair<std::string, uint16_t>> open;
    std::vector<std::chrono::milliseconds> timeouts;
    std::size_t largest_batch { 0 };
    std::set<uint16_t> probed_ports;

    std::vector<ProbeHit> probe(const std::vector<ScanEndpoint>& endpoints, std::chrono::milliseconds timeout)
    {
        timeouts.push_back(timeout);
        largest_batch = std::max(largest_batch, endpoints.size());
        std::vector<ProbeHit> hits;
        for (const auto& e : endpoints)
        {
            probed_ports.insert(e.port);
            if (open.count({ e.ip, e.port }))
            {
                hits.push_back({ e.ip, e.port, 15ms });
            }
        }
        return hits;
    }
};

} // namespace

TEST(testPortScanner, expandRange)
{
    EXPECT_EQ(PortScanner::expand_range("192.168.1").size(), 254u);
    EXPECT_EQ(PortScanner::expand_range("192.168.1").front(), "192.168.1.1");
    EXPECT_EQ(PortScanner::expand_range("192.168.1").back(), "192.168.1.254");
    EXPECT_EQ(PortScanner::expand_range("10.0").size(), 2540u);
    EXPECT_EQ(PortScanner::expand_range("10.0").front(), "10.0.1.1");
    EXPECT_EQ(PortScanner::expand_range("192.168.1.7"), std::vector<std::string> { "192.168.1.7" });

    EXPECT_THROW(PortScanner::expand_range(""), std::invalid_argument);
    EXPECT_THROW(PortScanner::expand_range("camera"), std::invalid_argument);
    EXPECT_THROW(PortScanner::expand_range("300.1.1"), std::invalid_argument);
    EXPECT_THROW(PortScanner::expand_range("192.168..1"), std::invalid_argument);
    EXPECT_THROW(PortScanner::expand_range("1.2.3.4.5"), std::invalid_argument);
    EXPECT_THROW(PortScanner::expand_range("10"), std::invalid_argument);
}

TEST(testPortScanner, phaseOneHitShortCircuits)
{
    FakeNetwork net;
    net.open = { { "192.168.1.64", 554 } };
    auto prober = std::make_shared<NiceMock<MockTcpProber>>();
    ON_CALL(*prober, probe_batch(_, _)).WillByDefault(Invoke(&net, &FakeNetwork::probe));

    PortScanner uit(prober);
    auto found = uit.scan("192.168.1");

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].ip, "192.168.1.64");
    EXPECT_EQ(found[0].port, 554);
    EXPECT_EQ(found[0].protocol, "RTSP");
    EXPECT_EQ(found[0].method, DiscoveryMethod::port_scan);
    EXPECT_EQ(found[0].response_time, 15ms);
    EXPECT_EQ(uit.last_phase(), 1u);

    for (auto t : net.timeouts)
    {
        EXPECT_EQ(t, 2000ms) << "only the priority phase may run";
    }
    EXPECT_EQ(net.probed_ports, (std::set<uint16_t> { 554, 8554, 1935 }));
    EXPECT_LE(net.largest_batch, 50u);
}

TEST(testPortScanner, escalatesToLaterPhases)
{
    FakeNetwork net;
    net.open = { { "192.168.1.80", 34567 } };
    auto prober = std::make_shared<NiceMock<MockTcpProber>>();
    ON_CALL(*prober, probe_batch(_, _)).WillByDefault(Invoke(&net, &FakeNetwork::probe));

    ScanConfig cfg;
    cfg.max_concurrency = 200;
    PortScanner uit(prober, cfg);
    auto found = uit.scan("192.168.1");

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].protocol, "TCP");
    EXPECT_EQ(uit.last_phase(), 2u);
    EXPECT_EQ(std::count(net.timeouts.begin(), net.timeouts.end(), 5000ms), 0)
        << "phase 3 is skipped after a phase 2 hit";
    EXPECT_LE(net.largest_batch, 200u);
}

TEST(testPortScanner, emptyNetworkRunsAllPhases)
{
    FakeNetwork net;
    auto prober = std::make_shared<NiceMock<MockTcpProber>>();
    ON_CALL(*prober, probe_batch(_, _)).WillByDefault(Invoke(&net, &FakeNetwork::probe));

    PortScanner uit(prober);
    EXPECT_TRUE(uit.scan("172.16.5.9").empty());
    EXPECT_EQ(uit.last_phase(), 0u);
    EXPECT_EQ(net.timeouts, (std::vector<std::chrono::milliseconds> { 2000ms, 3000ms, 5000ms }));
    EXPECT_EQ(net.probed_ports.size(), ports::all_ports().size()) << "every port is probed exactly once";
}

TEST(testPortScanner, withoutShortCircuitLaterDevicesAreFound)
{
    FakeNetwork net;
    net.open = { { "192.168.1.64", 554 }, { "192.168.1.90", 37777 }, { "192.168.1.91", 88 } };
    auto prober = std::make_shared<NiceMock<MockTcpProber>>();
    ON_CALL(*prober, probe_batch(_, _)).WillByDefault(Invoke(&net, &FakeNetwork::probe));

    ScanConfig cfg;
    cfg.short_circuit = false;
    PortScanner uit(prober, cfg);
    auto found = uit.scan("192.168.1");

    EXPECT_EQ(found.size(), 3u);
    EXPECT_EQ(uit.last_phase(), 1u) << "reports the first phase with a hit";
}

TEST(testPortScanner, cancelledScanProbesNothing)
{
    auto prober = std::make_shared<MockTcpProber>();
    EXPECT_CALL(*prober, probe_batch(_, _)).Times(0);

    CancellationSource source;
    source.cancel();
    PortScanner uit(prober);
    EXPECT_TRUE(uit.scan("192.168.1", source.token()).empty());
}

TEST(testPortScanner, specificIpUsesManufacturerPorts)
{
    FakeNetwork net;
    net.open = { { "10.0.0.8", 37777 } };
    auto prober = std::make_shared<NiceMock<MockTcpProber>>();
    ON_CALL(*prober, probe_batch(_, _)).WillByDefault(Invoke(&net, &FakeNetwork::probe));

    PortScanner uit(prober);
    auto found = uit.scan_specific_ip("10.0.0.8", std::string("Dahua"));
    EXPECT_EQ(net.probed_ports, (std::set<uint16_t> { 37777, 554, 8080 }));
    ASSERT_EQ(found.size(), 1u);
    ASSERT_TRUE(found[0].manufacturer.has_value());
    EXPECT_EQ(*found[0].manufacturer, "Dahua");

    net.probed_ports.clear();
    uit.scan_specific_ip("10.0.0.8", std::string("NoSuchBrand"));
    const auto fast = ports::fast_discovery_ports();
    EXPECT_EQ(net.probed_ports, std::set<uint16_t>(fast.begin(), fast.end()));
}

TEST(testPortScanner, streamingScanUsesPriorityPortsOnly)
{
    FakeNetwork net;
    auto prober = std::make_shared<NiceMock<MockTcpProber>>();
    ON_CALL(*prober, probe_batch(_, _)).WillByDefault(Invoke(&net, &FakeNetwork::probe));

    PortScanner uit(prober);
    uit.scan_for_streaming("192.168.0");
    EXPECT_EQ(net.probed_ports, (std::set<uint16_t> { 554, 8554, 1935 }));
}

TEST(testPortScanner, isPortOpen)
{
    auto prober = std::make_shared<MockTcpProber>();
    EXPECT_CALL(*prober, probe_batch(_, 750ms))
        .WillOnce(Return(std::vector<ProbeHit> { { "10.1.1.1", 80, 3ms } }))
        .WillOnce(Return(std::vector<ProbeHit> {}));

    PortScanner uit(prober);
    EXPECT_TRUE(uit.is_port_open("10.1.1.1", 80, 750ms));
    EXPECT_FALSE(uit.is_port_open("10.1.1.1", 80, 750ms));
}

TEST(testPortScanner, requiresProber)
{
    EXPECT_THROW({ PortScanner uit(nullptr); }, std::invalid_argument);
}
