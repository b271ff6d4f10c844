/**
 * @file camera_ports.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Port tables for camera discovery
 */
#include "camera_ports.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace camscout
{
namespace ports
{

static std::vector<uint16_t> make_http_ports()
{
    std::vector<uint16_t> result { 8899, 8080, 8081, 8000, 8008, 8888, 9000, 81, 82, 83 };
    for (uint16_t p = 8082; p <= 8099; ++p)
    {
        result.push_back(p);
    }
    return result;
}

static const std::map<std::string, std::vector<uint16_t>> s_manufacturerPorts
{
    { "hikvision", { 8000, 554, 8080 } },
    { "dahua",     { 37777, 554, 8080 } },
    { "axis",      { 554, 8080, 8000 } },
    { "foscam",    { 88, 554, 8080 } },
    { "tp-link",   { 554, 8080, 9000 } },
    { "xiaomi",    { 554, 8080, 8000 } },
    { "reolink",   { 554, 9000, 8000 } },
    { "amcrest",   { 554, 37777, 8080 } },
    { "generic",   { 554, 8080, 8899, 34567, 37777, 9000, 6036 } },
};

const std::vector<uint16_t>& rtsp_priority_ports()
{
    static const std::vector<uint16_t> s_ports { 554, 8554, 1935 };
    return s_ports;
}

const std::vector<uint16_t>& rtsp_ports()
{
    static const std::vector<uint16_t> s_ports { 554, 8554, 1935, 7001, 5554, 8000, 8080 };
    return s_ports;
}

const std::vector<uint16_t>& http_ports()
{
    static const std::vector<uint16_t> s_ports = make_http_ports();
    return s_ports;
}

const std::vector<uint16_t>& onvif_ports()
{
    static const std::vector<uint16_t> s_ports { 8080, 8000, 8899, 554, 8554, 3702 };
    return s_ports;
}

const std::vector<uint16_t>& most_common_ports()
{
    static const std::vector<uint16_t> s_ports { 8899, 554, 8080, 8081, 37777, 34567, 8000, 9000 };
    return s_ports;
}

std::optional<std::vector<uint16_t>> manufacturer_ports(const std::string& manufacturer)
{
    std::string key { manufacturer };
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = s_manufacturerPorts.find(key);
    if (it == s_manufacturerPorts.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<uint16_t> fast_discovery_ports()
{
    std::vector<uint16_t> result { rtsp_priority_ports() };
    for (auto port : most_common_ports())
    {
        if (std::find(result.begin(), result.end(), port) == result.end())
        {
            result.push_back(port);
        }
    }
    return result;
}

std::vector<uint16_t> all_ports()
{
    std::set<uint16_t> all;
    for (const auto* table : { &rtsp_priority_ports(), &rtsp_ports(), &http_ports(),
                               &onvif_ports(), &most_common_ports() })
    {
        all.insert(table->begin(), table->end());
    }
    for (const auto& entry : s_manufacturerPorts)
    {
        all.insert(entry.second.begin(), entry.second.end());
    }
    return { all.begin(), all.end() };
}

static bool contains(const std::vector<uint16_t>& table, uint16_t port)
{
    return std::find(table.begin(), table.end(), port) != table.end();
}

bool is_rtsp_port(uint16_t port)  { return contains(rtsp_ports(), port); }
bool is_http_port(uint16_t port)  { return contains(http_ports(), port); }
bool is_onvif_port(uint16_t port) { return contains(onvif_ports(), port); }

std::string classify_port(uint16_t port)
{
    if (is_rtsp_port(port))
    {
        return "RTSP";
    }
    if (is_http_port(port))
    {
        return "HTTP";
    }
    if (is_onvif_port(port))
    {
        return "ONVIF";
    }
    return "TCP";
}

} // namespace ports
} // namespace camscout
