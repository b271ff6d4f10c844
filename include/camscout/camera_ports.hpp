/**
 * @file camera_ports.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Static port tables used to choose scan targets and to infer the protocol
 * spoken on an open port.
 * @{
 */
#ifndef CAMSCOUT_CAMERA_PORTS_HPP
#define CAMSCOUT_CAMERA_PORTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{
namespace ports
{
    /// Ports that answer RTSP on most cameras. Scanned first.
    const std::vector<uint16_t>& rtsp_priority_ports();

    const std::vector<uint16_t>& rtsp_ports();
    const std::vector<uint16_t>& http_ports();
    const std::vector<uint16_t>& onvif_ports();

    /// Web and vendor ports seen on the majority of consumer cameras.
    const std::vector<uint16_t>& most_common_ports();

    /// @brief Ports a given manufacturer is known to use.
    /// @param manufacturer Case insensitive manufacturer name (e.g. "hikvision", "dahua")
    /// @return The manufacturer's ports or std::nullopt for an unknown manufacturer.
    std::optional<std::vector<uint16_t>> manufacturer_ports(const std::string& manufacturer);

    /// RTSP priority ports followed by the most common ports, without duplicates.
    std::vector<uint16_t> fast_discovery_ports();

    /// Sorted union of every port table.
    std::vector<uint16_t> all_ports();

    /// @brief Infer the protocol tag for a port.
    /// @return "RTSP", "HTTP", "ONVIF" or "TCP" checked in that order.
    std::string classify_port(uint16_t port);

    bool is_rtsp_port(uint16_t port);
    bool is_http_port(uint16_t port);
    bool is_onvif_port(uint16_t port);

} // namespace ports
} // namespace camscout

#endif // CAMSCOUT_CAMERA_PORTS_HPP

/** @} */
