/**
 * @file ssdp_probe.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * UPnP discovery: SSDP M-SEARCH followed by a fetch of every device descriptor.
 * @{
 */
#ifndef CAMSCOUT_SSDP_PROBE_HPP
#define CAMSCOUT_SSDP_PROBE_HPP

#include "CommonTypes.hpp"
#include "discovery_probe.hpp"
#include "http_client.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{

inline constexpr auto SSDP_ADDRESS { "239.255.255.250" };
inline constexpr uint16_t SSDP_PORT { 1900 };

struct SsdpConfig
{
    std::string search_target { "upnp:rootdevice" };
    std::chrono::milliseconds timeout { 15000 };
    std::chrono::milliseconds resend_interval { 100 };
    std::chrono::milliseconds http_timeout { 10000 };
    unsigned mx { 3 };

    /// Only report devices whose descriptor looks like a camera, NVR or DVR.
    bool cameras_only { true };
};

struct SsdpResponse
{
    std::string location;
    std::string server;
    std::string usn;
    std::string st;
    std::string ext;
    std::optional<uint32_t> max_age;
    std::string sender;
};

struct UpnpService
{
    std::string service_type;
    std::string service_id;
    std::string control_url;
    std::string event_sub_url;
    std::string scpd_url;
};

struct UpnpDeviceDescription
{
    std::string device_type;
    std::string friendly_name;
    std::string manufacturer;
    std::string manufacturer_url;
    std::string model_description;
    std::string model_name;
    std::string model_number;
    std::string model_url;
    std::string serial_number;
    std::string udn;
    std::string presentation_url;
    std::vector<UpnpService> services;

    /// Device type names a media server/renderer, camera, video device, NVR or DVR.
    bool is_media_device() const;
    /// Any service type names camera, video, imaging or media.
    bool has_camera_services() const;
    bool is_probable_camera() const { return is_media_device() || has_camera_services(); }
};

std::string build_msearch(const std::string& search_target, unsigned mx = 3);

/// @return The parsed response, or std::nullopt unless the datagram is a 200 OK with a LOCATION.
std::optional<SsdpResponse> parse_ssdp_response(const std::string& datagram);

/// @return The root device description, or std::nullopt for malformed XML or a missing device element.
std::optional<UpnpDeviceDescription> parse_device_description(const std::string& xml);


class SsdpProbe : public DiscoveryProbe_T
{
public:
    SsdpProbe(std::shared_ptr<HttpClient_T> http, SsdpConfig config = {}, log_callback_t log_callback = nullptr);

    const char* name() const override { return "ssdp"; }
    candidate_list_t discover(const CancellationToken& token) override;

    /// Collect the answers to one search, unique by LOCATION.
    std::vector<SsdpResponse> search(const std::string& search_target,
                                     std::chrono::milliseconds window,
                                     const CancellationToken& token);

    /// MediaServer devices plus root devices that look like cameras, each search given half the timeout.
    candidate_list_t discover_media_devices(const CancellationToken& token);

    /// Fetch and parse each descriptor, then convert it to a candidate.
    candidate_list_t describe(const std::vector<SsdpResponse>& responses, const CancellationToken& token);

private:
    candidate_list_t describe(const std::vector<SsdpResponse>& responses,
                              const CancellationToken& token,
                              bool cameras_only);

    std::shared_ptr<HttpClient_T> m_http;
    SsdpConfig m_config;
    log_callback_t m_log_callback;
};

} // namespace camscout

#endif // CAMSCOUT_SSDP_PROBE_HPP

/** @} */
