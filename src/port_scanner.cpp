/**
 * @file port_scanner.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Three phase TCP port scanner
 */
#include "port_scanner.hpp"
#include "camera_ports.hpp"
#include "log_macros.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

namespace camscout
{

using namespace std::string_literals;

constexpr int MAX_OCTET { 255 };
constexpr int FIRST_HOST { 1 };
constexpr int LAST_HOST { 254 };
constexpr int MAX_SUBNETS_PER_16 { 10 };

PortScanner::PortScanner(std::shared_ptr<TcpProber_T> prober, ScanConfig config, log_callback_t log_callback) :
    m_prober(std::move(prober)),
    m_config(config),
    m_log_callback(log_callback)
{
    if (!m_prober)
    {
        throw std::invalid_argument("PortScanner requires a prober");
    }
    if (m_config.max_concurrency == 0)
    {
        m_config.max_concurrency = 1;
    }
}

std::vector<std::string> PortScanner::expand_range(const std::string& network_base)
{
    std::vector<int> octets;
    std::stringstream in { network_base };
    std::string part;
    while (std::getline(in, part, '.'))
    {
        if (part.empty() || part.size() > 3 ||
            !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); }))
        {
            throw std::invalid_argument("malformed network base: "s + network_base);
        }
        const int value = std::stoi(part);
        if (value > MAX_OCTET)
        {
            throw std::invalid_argument("malformed network base: "s + network_base);
        }
        octets.push_back(value);
    }

    std::vector<std::string> hosts;
    switch (octets.size())
    {
        case 4:
            hosts.push_back(network_base);
            break;
        case 3:
            for (int h = FIRST_HOST; h <= LAST_HOST; ++h)
            {
                hosts.push_back(network_base + "." + std::to_string(h));
            }
            break;
        case 2:
            for (int s = 1; s <= MAX_SUBNETS_PER_16; ++s)
            {
                for (int h = FIRST_HOST; h <= LAST_HOST; ++h)
                {
                    hosts.push_back(network_base + "." + std::to_string(s) + "." + std::to_string(h));
                }
            }
            break;
        default:
            throw std::invalid_argument("malformed network base: "s + network_base);
    }
    return hosts;
}

candidate_list_t PortScanner::scan_ports(const std::vector<std::string>& hosts,
                                         const std::vector<uint16_t>& ports,
                                         std::chrono::milliseconds timeout,
                                         const CancellationToken& token)
{
    candidate_list_t found;
    std::vector<ScanEndpoint> batch;
    batch.reserve(m_config.max_concurrency);

    auto flush = [&]()
    {
        if (batch.empty())
        {
            return;
        }
        for (const auto& hit : m_prober->probe_batch(batch, timeout))
        {
            DiscoveredCandidate candidate;
            candidate.ip = hit.ip;
            candidate.port = hit.port;
            candidate.protocol = ports::classify_port(hit.port);
            candidate.method = DiscoveryMethod::port_scan;
            candidate.response_time = hit.response_time;
            DBG("Open port " << hit.ip << ":" << hit.port << " (" << candidate.protocol << ")", LOG_LVL_DBG_HI);
            found.push_back(candidate);
        }
        batch.clear();
    };

    for (const auto& host : hosts)
    {
        for (auto port : ports)
        {
            if (token.is_cancelled())
            {
                DBG("Port scan cancelled", LOG_LVL_DBG_MID);
                return found;
            }
            batch.push_back({ host, port });
            if (batch.size() >= m_config.max_concurrency)
            {
                flush();
            }
        }
    }
    if (!token.is_cancelled())
    {
        flush();
    }
    return found;
}

candidate_list_t PortScanner::scan(const std::string& network_base, CancellationToken token)
{
    const auto hosts = expand_range(network_base);
    m_lastPhase = 0;
    candidate_list_t result;

    const auto& phase1_ports = ports::rtsp_priority_ports();
    std::set<uint16_t> scanned(phase1_ports.begin(), phase1_ports.end());

    std::vector<uint16_t> phase2_ports;
    for (auto port : ports::most_common_ports())
    {
        if (scanned.insert(port).second)
        {
            phase2_ports.push_back(port);
        }
    }

    std::vector<uint16_t> phase3_ports;
    for (auto port : ports::all_ports())
    {
        if (scanned.insert(port).second)
        {
            phase3_ports.push_back(port);
        }
    }

    struct Phase
    {
        uint32_t number;
        const std::vector<uint16_t>& ports;
        std::chrono::milliseconds timeout;
    };
    const Phase phases[] {
        { 1, phase1_ports, m_config.priority_timeout },
        { 2, phase2_ports, m_config.common_timeout },
        { 3, phase3_ports, m_config.full_timeout },
    };

    for (const auto& phase : phases)
    {
        if (token.is_cancelled())
        {
            break;
        }
        DBG("Scan phase " << phase.number << " of " << network_base << ": " << hosts.size()
            << " hosts x " << phase.ports.size() << " ports", LOG_LVL_DBG_MID);
        auto found = scan_ports(hosts, phase.ports, phase.timeout, token);
        if (!found.empty())
        {
            if (m_lastPhase == 0)
            {
                m_lastPhase = phase.number;
            }
            result.insert(result.end(), found.begin(), found.end());
            if (m_config.short_circuit)
            {
                DBG("Phase " << phase.number << " found " << found.size() << " open ports, stopping", LOG_LVL_DBG_MID);
                break;
            }
        }
    }
    DBG("Scan of " << network_base << " found " << result.size() << " open ports", LOG_LVL_INFO);
    return result;
}

candidate_list_t PortScanner::scan_specific_ip(const std::string& ip,
                                               const std::optional<std::string>& manufacturer,
                                               CancellationToken token)
{
    std::vector<uint16_t> targets;
    if (manufacturer)
    {
        if (auto known = ports::manufacturer_ports(*manufacturer))
        {
            targets = *known;
        }
    }
    if (targets.empty())
    {
        targets = ports::fast_discovery_ports();
    }
    auto found = scan_ports({ ip }, targets, m_config.specific_ip_timeout, token);
    if (manufacturer)
    {
        for (auto& candidate : found)
        {
            candidate.manufacturer = manufacturer;
        }
    }
    return found;
}

candidate_list_t PortScanner::scan_for_streaming(const std::string& network_base, CancellationToken token)
{
    return scan_ports(expand_range(network_base), ports::rtsp_priority_ports(), m_config.priority_timeout, token);
}

bool PortScanner::is_port_open(const std::string& ip, uint16_t port, std::optional<std::chrono::milliseconds> timeout)
{
    auto hits = m_prober->probe_batch({ { ip, port } }, timeout.value_or(m_config.specific_ip_timeout));
    return !hits.empty();
}

} // namespace camscout
