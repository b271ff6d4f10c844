/**
 * @file device_blacklist.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Heuristic classifier for devices that are certainly not cameras
 * (routers, printers, NAS boxes, media players, ...).
 * @{
 */
#ifndef CAMSCOUT_DEVICE_BLACKLIST_HPP
#define CAMSCOUT_DEVICE_BLACKLIST_HPP

#include "CommonTypes.hpp"
#include "discovery_types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace camscout
{

/// Everything a probe learned about a device that the classifier can use.
struct DeviceSignals
{
    std::string ip;
    std::optional<std::string> manufacturer;
    std::optional<std::string> device_name;
    std::optional<std::string> service_type;
    std::optional<std::string> http_response;
    std::optional<uint16_t> port;
    std::optional<std::string> service_name;
    std::map<std::string, std::string> txt_records;

    static DeviceSignals from_candidate(const DiscoveredCandidate& candidate);
};

struct BlacklistStats
{
    std::size_t manufacturers { 0 };
    std::size_t device_names { 0 };
    std::size_t service_types { 0 };
    std::size_t http_keywords { 0 };
    std::size_t port_services { 0 };
};

/// @brief Ordered short-circuit rule chain deciding whether a device is a non-camera.
///  Rules are evaluated in a fixed order and the first match wins:
///  gateway address, manufacturer, device name, service type, HTTP content,
///  port/service combination, TXT records.
///  False negatives are expected; protocol validation catches them later.
class DeviceBlacklist
{
public:
    explicit DeviceBlacklist(log_callback_t log_callback = nullptr);

    bool should_filter(const DeviceSignals& signals) const;
    bool should_filter(const DiscoveredCandidate& candidate) const;

    /// @return A description of the rule that matched, or std::nullopt if none matched.
    std::optional<std::string> filter_reason(const DeviceSignals& signals) const;

    /// Last octet .1 inside 192.168.0.0/16, 10.0.0.0/8 or 172.16.0.0/12.
    static bool is_gateway_ip(const std::string& ip);

    static bool is_blacklisted_manufacturer(const std::string& manufacturer);
    static bool is_blacklisted_device_name(const std::string& name);
    static bool is_blacklisted_service_type(const std::string& service_type);
    static bool is_non_camera_http_response(const std::string& response);
    static bool is_non_camera_port_service(uint16_t port, const std::optional<std::string>& service_name);
    static bool is_non_camera_txt(const std::map<std::string, std::string>& txt_records);

    static BlacklistStats stats();

private:
    log_callback_t m_log_callback;
};

} // namespace camscout

#endif // CAMSCOUT_DEVICE_BLACKLIST_HPP

/** @} */
