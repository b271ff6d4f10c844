/**
 * @file device_blacklist.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Rule tables and matching for the non-camera device classifier
 */
#include "device_blacklist.hpp"
#include "log_macros.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <set>
#include <sstream>
#include <string_view>
#include <vector>

namespace camscout
{

using namespace std::string_literals;

static const std::vector<std::string> s_manufacturers
{
    // Network equipment
    "tp-link", "tplink", "tp link", "linksys", "netgear", "asus", "dlink", "d-link", "d link",
    "belkin", "cisco", "ubiquiti", "mikrotik", "buffalo", "zyxel", "tenda", "mercusys",
    "huawei router", "huawei wifi",
    // Printers
    "hp", "hewlett-packard", "hewlett packard", "canon", "epson", "brother", "samsung printer",
    "samsung scx", "lexmark", "xerox", "ricoh", "kyocera", "oki", "okidata",
    // TVs and media players
    "samsung tv", "samsung smart", "lg tv", "lg smart", "sony tv", "sony bravia", "tcl tv",
    "roku", "apple tv", "chromecast", "fire tv", "nvidia shield",
    // IoT and hubs
    "raspberry pi", "arduino", "esp32", "esp8266", "sonos", "philips hue", "amazon echo",
    "alexa", "google home", "google nest",
    // Storage
    "nas synology", "qnap",
};

static const std::vector<std::string> s_deviceNames
{
    "router", "roteador", "wifi", "wireless", "access point", "ap", "gateway", "modem",
    "repeater", "repetidor", "extender",
    "printer", "impressora", "scanner", "multifunction", "multifuncional", "laserjet",
    "inkjet", "deskjet", "officejet",
    "smart tv", "tv", "chromecast", "roku", "fire stick", "apple tv", "media player",
    "streaming device",
    "nas", "server", "servidor", "workstation", "desktop", "laptop", "tablet", "smartphone",
    "smart speaker", "voice assistant",
};

static const std::set<std::string> s_serviceTypes
{
    "_printer._tcp", "_ipp._tcp", "_airplay._tcp", "_googlecast._tcp", "_spotify-connect._tcp",
    "_workstation._tcp", "_smb._tcp", "_afpovertcp._tcp", "_ssh._tcp", "_telnet._tcp",
    "_ftp._tcp", "_nfs._tcp", "_upnp._tcp", "_dlna._tcp",
};

static const std::vector<std::string> s_httpKeywords
{
    "router configuration", "wireless settings", "network settings", "router admin",
    "wifi configuration", "access point", "gateway settings", "dhcp settings",
    "port forwarding", "firewall settings",
    "printer status", "print queue", "scanner settings", "ink levels", "toner levels",
    "paper settings", "print settings",
    "smart tv", "media player", "streaming device", "netflix", "youtube", "amazon prime",
    "file server", "nas settings", "workstation", "desktop computer",
};

static const std::map<uint16_t, std::set<std::string>> s_portServices
{
    { 21,   { "ftp" } },
    { 22,   { "ssh" } },
    { 23,   { "telnet" } },
    { 25,   { "smtp" } },
    { 53,   { "dns" } },
    { 80,   { "router", "printer", "nas" } },
    { 110,  { "pop3" } },
    { 139,  { "netbios" } },
    { 143,  { "imap" } },
    { 443,  { "https" } },
    { 445,  { "smb" } },
    { 515,  { "printer" } },
    { 631,  { "ipp", "printer" } },
    { 993,  { "imaps" } },
    { 995,  { "pop3s" } },
    { 5000, { "upnp" } },
    { 8080, { "router", "nas" } },
    { 9100, { "printer" } },
};

/// Ports filtered even when nothing is known about the service behind them.
static const std::set<uint16_t> s_unconditionalPorts
{
    21, 22, 23, 25, 53, 110, 139, 143, 445, 515, 631, 993, 995, 9100
};

/// Entries this short only match as a whole word ("ap" must not match "camera app").
constexpr std::size_t SHORT_TERM_LENGTH { 3 };

static std::string to_lower(std::string_view s)
{
    std::string result { s };
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

static bool is_word_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

static bool contains_word(const std::string& haystack, const std::string& word)
{
    for (auto pos = haystack.find(word); pos != std::string::npos; pos = haystack.find(word, pos + 1))
    {
        const bool startOk = (pos == 0) || !is_word_char(haystack[pos - 1]);
        const auto end = pos + word.size();
        const bool endOk = (end == haystack.size()) || !is_word_char(haystack[end]);
        if (startOk && endOk)
        {
            return true;
        }
    }
    return false;
}

static bool matches_any(const std::string& value, const std::vector<std::string>& terms)
{
    const auto lower = to_lower(value);
    return std::any_of(terms.begin(), terms.end(), [&lower](const std::string& term)
        {
            if (term.size() <= SHORT_TERM_LENGTH)
            {
                return contains_word(lower, term);
            }
            return lower.find(term) != std::string::npos;
        });
}

DeviceSignals DeviceSignals::from_candidate(const DiscoveredCandidate& candidate)
{
    DeviceSignals signals;
    signals.ip = candidate.ip;
    signals.manufacturer = candidate.manufacturer;
    signals.device_name = candidate.name;
    if (!candidate.service_type.empty())
    {
        signals.service_type = candidate.service_type;
    }
    if (candidate.port != 0)
    {
        signals.port = candidate.port;
    }
    auto it = candidate.metadata.find("http_response");
    if (it != candidate.metadata.end())
    {
        signals.http_response = it->second;
    }
    it = candidate.metadata.find("service_name");
    if (it != candidate.metadata.end())
    {
        signals.service_name = it->second;
    }
    signals.txt_records = candidate.metadata;
    return signals;
}


DeviceBlacklist::DeviceBlacklist(log_callback_t log_callback) :
    m_log_callback(log_callback)
{
}


bool DeviceBlacklist::is_gateway_ip(const std::string& ip)
{
    std::array<int, 4> octets {};
    char dot1 {}, dot2 {}, dot3 {};
    std::istringstream in { ip };
    in >> octets[0] >> dot1 >> octets[1] >> dot2 >> octets[2] >> dot3 >> octets[3];
    if (in.fail() || dot1 != '.' || dot2 != '.' || dot3 != '.' || !in.eof())
    {
        return false;
    }
    if (octets[3] != 1)
    {
        return false;
    }
    if (octets[0] == 192 && octets[1] == 168)
    {
        return true;
    }
    if (octets[0] == 10)
    {
        return true;
    }
    return (octets[0] == 172) && (octets[1] >= 16) && (octets[1] <= 31);
}

bool DeviceBlacklist::is_blacklisted_manufacturer(const std::string& manufacturer)
{
    return matches_any(manufacturer, s_manufacturers);
}

bool DeviceBlacklist::is_blacklisted_device_name(const std::string& name)
{
    return matches_any(name, s_deviceNames);
}

bool DeviceBlacklist::is_blacklisted_service_type(const std::string& service_type)
{
    return s_serviceTypes.count(to_lower(service_type)) > 0;
}

bool DeviceBlacklist::is_non_camera_http_response(const std::string& response)
{
    return matches_any(response, s_httpKeywords);
}

bool DeviceBlacklist::is_non_camera_port_service(uint16_t port, const std::optional<std::string>& service_name)
{
    auto it = s_portServices.find(port);
    if (it == s_portServices.end())
    {
        return false;
    }
    if (!service_name || service_name->empty())
    {
        return s_unconditionalPorts.count(port) > 0;
    }
    const auto lower = to_lower(*service_name);
    return std::any_of(it->second.begin(), it->second.end(),
                       [&lower](const std::string& s) { return lower.find(s) != std::string::npos; });
}

bool DeviceBlacklist::is_non_camera_txt(const std::map<std::string, std::string>& txt_records)
{
    for (const auto& [key, value] : txt_records)
    {
        const auto k = to_lower(key);
        if (k.find("device") == std::string::npos &&
            k.find("type") == std::string::npos &&
            k.find("model") == std::string::npos)
        {
            continue;
        }
        const auto v = to_lower(value);
        if (v.find("router") != std::string::npos ||
            v.find("printer") != std::string::npos ||
            contains_word(v, "nas"))
        {
            return true;
        }
    }
    return false;
}

std::optional<std::string> DeviceBlacklist::filter_reason(const DeviceSignals& signals) const
{
    if (is_gateway_ip(signals.ip))
    {
        return "gateway address "s + signals.ip;
    }
    if (signals.manufacturer && is_blacklisted_manufacturer(*signals.manufacturer))
    {
        return "non-camera manufacturer '"s + *signals.manufacturer + "'";
    }
    if (signals.device_name && is_blacklisted_device_name(*signals.device_name))
    {
        return "non-camera device name '"s + *signals.device_name + "'";
    }
    if (signals.service_type && is_blacklisted_service_type(*signals.service_type))
    {
        return "non-camera service type "s + *signals.service_type;
    }
    if (signals.http_response && is_non_camera_http_response(*signals.http_response))
    {
        return "non-camera HTTP content"s;
    }
    if (signals.port && is_non_camera_port_service(*signals.port, signals.service_name))
    {
        return "non-camera port "s + std::to_string(*signals.port);
    }
    if (is_non_camera_txt(signals.txt_records))
    {
        return "non-camera TXT record"s;
    }
    return std::nullopt;
}

bool DeviceBlacklist::should_filter(const DeviceSignals& signals) const
{
    auto reason = filter_reason(signals);
    if (reason)
    {
        DBG("Filtered " << signals.ip << ": " << *reason, LOG_LVL_DBG_MID);
        return true;
    }
    return false;
}

bool DeviceBlacklist::should_filter(const DiscoveredCandidate& candidate) const
{
    return should_filter(DeviceSignals::from_candidate(candidate));
}

BlacklistStats DeviceBlacklist::stats()
{
    BlacklistStats result;
    result.manufacturers = s_manufacturers.size();
    result.device_names = s_deviceNames.size();
    result.service_types = s_serviceTypes.size();
    result.http_keywords = s_httpKeywords.size();
    result.port_services = s_portServices.size();
    return result;
}

} // namespace camscout
