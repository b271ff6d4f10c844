/**
 * @file discovery_types.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Records produced by the discovery probes and the port scanner.
 * @{
 */
#ifndef CAMSCOUT_DISCOVERY_TYPES_HPP
#define CAMSCOUT_DISCOVERY_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace camscout
{

enum class DiscoveryMethod : uint8_t
{
    port_scan,
    mdns,
    ssdp,
    ws_discovery,
    manual,
    cache
};

const char* to_string(DiscoveryMethod method);

/// @brief Transient record produced by a probe or by the port scanner.
///  Folded into a CachedDevice by the orchestrator, never persisted directly.
struct DiscoveredCandidate
{
    std::string ip;
    uint16_t port { 0 };
    std::string protocol;                       ///< "RTSP", "HTTP", "ONVIF", "TCP", ...
    DiscoveryMethod method { DiscoveryMethod::port_scan };
    std::optional<std::string> manufacturer;
    std::optional<std::string> model;
    std::optional<std::string> name;
    std::string service_type;                   ///< e.g. _onvif._tcp or a UPnP device type
    std::chrono::milliseconds response_time { 0 };
    std::map<std::string, std::string> metadata;

    /// Deduplication key, a device is identified by address and port.
    std::tuple<std::string, uint16_t> key() const { return { ip, port }; }
};

typedef std::vector<DiscoveredCandidate> candidate_list_t;

} // namespace camscout

#endif // CAMSCOUT_DISCOVERY_TYPES_HPP

/** @} */
