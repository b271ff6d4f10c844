/**
 * @file cam-discovery.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Test program that uses libcamscout to find cameras on the local network.
 */
#include "dbg_out.hpp"
#include "po_count.hpp"
#include "camscout/device_validator.hpp"
#include "camscout/discovery_orchestrator.hpp"
#include "camscout/mdns_probe.hpp"
#include "camscout/ssdp_probe.hpp"
#include "camscout/ws_discovery_probe.hpp"
#include <csignal>
#include <iomanip>

using namespace tools;
using namespace camscout;

static DebugOutput dbg_out {};
static ErrorOutput err_out {};

static std::string cacheFile { "camscout-cache.json" };
static bool continuous { false };
static uint32_t debugLevel { 0 };
static uint32_t deadlineMs { 5000 };
static volatile bool exitRequested { false };
static bool forceRefresh { false };
static std::string manufacturer { };
static bool mediaOnly { false };
static std::string networkBase { };
static bool noPortScan { false };
static bool quickRtsp { false };
static std::string specificIp { };
static bool validateDevices { false };

static void parseArgs(int argc, char *argv[])
{
    po::options_description desc("Discover cameras on the local network");
    desc.add_options()
        ("cache-file", po::value<std::string>(&cacheFile)->default_value(cacheFile), "File the discovery cache is kept in")
        ("continuous,c", po::bool_switch(&continuous), "Repeat discovery until the process is killed")
        ("deadline,t", po::value<uint32_t>(&deadlineMs)->default_value(deadlineMs), "Discovery deadline in milliseconds")
        ("debug,G", new CountValue(&debugLevel), "Increase debug level of libcamscout")
        ("force,f", po::bool_switch(&forceRefresh), "Ignore cached devices and scan anyway")
        ("help,h", "produce help message")
        ("ip,i", po::value<std::string>(&specificIp), "Scan a single address instead of a subnet")
        ("manufacturer,m", po::value<std::string>(&manufacturer), "Manufacturer hint for --ip")
        ("media", po::bool_switch(&mediaOnly), "Only search UPnP media servers and camera-like root devices")
        ("network-base,n", po::value<std::string>(&networkBase), "First three octets of the subnet, e.g. 192.168.1")
        ("no-port-scan", po::bool_switch(&noPortScan), "Use the multicast probes only")
        ("quick-rtsp,r", po::bool_switch(&quickRtsp), "Only scan the RTSP ports of --network-base")
        ("quiet,q", po::bool_switch(&dbg_out.quiet)->default_value(false), "Disable output")
        ("validate,v", po::bool_switch(&validateDevices), "Validate every device found")
        ;

    parse_options(argc, argv, desc);
    if (quickRtsp && networkBase.empty())
    {
        err_out << "--quick-rtsp requires --network-base\n";
        exit(1);
    }
}

static void signalHandler(int signum)
{
    (void)signum;
    exitRequested = true;
}

static void printDevice(const DiscoveredCandidate& device)
{
    dbg_out << std::left << std::setw(16) << device.ip << " "
            << std::setw(6) << device.port << " "
            << std::setw(6) << device.protocol << " "
            << std::setw(13) << to_string(device.method) << " "
            << device.manufacturer.value_or("-") << " "
            << device.model.value_or("-") << " "
            << device.name.value_or("") << "\n";
}

int main(int argc, char *argv[])
{
    parseArgs(argc, argv);
    /*
     * Change default action of ^C, ^\ from abnormal termination in order to
     * perform a controlled shutdown.
     */
    signal(SIGINT, signalHandler);
    #if defined(SIGQUIT)
    signal(SIGQUIT, signalHandler);
    #endif

    auto logger = make_tool_logger(dbg_out, debugLevel);
    try
    {
        AsioScheduler scheduler { logger };
        auto http = std::make_shared<BeastHttpClient>(logger);
        auto prober = std::make_shared<AsioTcpProber>(logger);

        auto cache = std::make_shared<DiscoveryCache>(std::make_shared<JsonFileStore>(cacheFile, logger),
                                                      scheduler, CacheConfig {}, logger);
        const auto loaded = cache->initialize();
        dbg_out << "Loaded " << loaded << " cached device(s) from " << cacheFile << "\n";

        auto wsProbe = std::make_shared<WsDiscoveryProbe>(WsDiscoveryConfig {}, logger);
        auto ssdpProbe = std::make_shared<SsdpProbe>(http, SsdpConfig {}, logger);
        std::vector<std::shared_ptr<DiscoveryProbe_T>> probes {
            std::make_shared<MdnsProbe>(MdnsConfig {}, logger),
            wsProbe,
            ssdpProbe,
        };
        auto scanner = std::make_shared<PortScanner>(prober, ScanConfig {}, logger);
        auto validator = std::make_shared<DeviceValidator>(prober, http, std::make_shared<AsioTcpExchange>(logger),
                                                           ValidatorConfig {}, logger);

        DiscoveryConfig config {};
        config.deadline = std::chrono::milliseconds(deadlineMs);
        config.port_scan_enabled = !noPortScan;
        DiscoveryOrchestrator orchestrator { probes, scanner, cache, validator, scheduler, config, logger };

        std::optional<std::string> base;
        if (!networkBase.empty())
        {
            base = networkBase;
        }

        do
        {
            candidate_list_t devices;
            if (!specificIp.empty())
            {
                std::optional<std::string> hint;
                if (!manufacturer.empty())
                {
                    hint = manufacturer;
                }
                devices = orchestrator.discover_specific_ip(specificIp, hint);
                for (const auto& onvif : wsProbe->probe_specific_device(specificIp))
                {
                    devices.push_back(onvif);
                }
            }
            else if (mediaOnly)
            {
                devices = ssdpProbe->discover_media_devices(CancellationToken {});
            }
            else if (quickRtsp)
            {
                devices = orchestrator.quick_rtsp_discovery(networkBase);
            }
            else
            {
                devices = orchestrator.discover(base, forceRefresh);
                if (validateDevices)
                {
                    devices = orchestrator.validate(devices);
                }
            }

            dbg_out << "------------------------\n";
            for (const auto& device : devices)
            {
                printDevice(device);
            }
            const auto stats = orchestrator.statistics();
            dbg_out << devices.size() << " device(s) in " << stats.last_run_duration.count() << " ms";
            for (const auto& source : stats.last_counts_by_source)
            {
                dbg_out << ", " << source.first << "=" << source.second;
            }
            dbg_out << "\n";
        } while (continuous && !exitRequested);
    }
    catch (const std::exception& e)
    {
        err_out << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
