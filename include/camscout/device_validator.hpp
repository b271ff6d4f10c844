/**
 * @file device_validator.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Layered checks that weed out probing false positives.
 * @{
 */
#ifndef CAMSCOUT_DEVICE_VALIDATOR_HPP
#define CAMSCOUT_DEVICE_VALIDATOR_HPP

#include "CommonTypes.hpp"
#include "device_blacklist.hpp"
#include "discovery_types.hpp"
#include "http_client.hpp"
#include "port_scanner.hpp"
#include "tcp_exchange.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace camscout
{

struct ValidationLayer
{
    std::string name;           ///< "blacklist", "connectivity", "protocol"
    bool valid { false };
    std::string message;
};

struct ValidationResult
{
    DiscoveredCandidate device;
    bool valid { false };
    std::string reason;
    std::vector<ValidationLayer> layers;
};

class DeviceValidator_T
{
public:
    virtual ~DeviceValidator_T() = default;

    /// Must be safe to call concurrently for different devices.
    virtual ValidationResult validate(const DiscoveredCandidate& device) = 0;
};

struct ValidatorConfig
{
    std::chrono::milliseconds quick_timeout { 2000 };       ///< connectivity layer
    std::chrono::milliseconds validation_timeout { 5000 };  ///< protocol layer
};

/**
 * @brief Blacklist, then TCP connectivity, then a protocol specific exchange.
 *
 * RTSP candidates must answer OPTIONS with "RTSP/1.0" and "200 OK". HTTP
 * candidates are rejected when the root page looks like a router or another
 * non-camera device. ONVIF candidates must answer GetDeviceInformation.
 * Generic TCP candidates on a DVRIP port must answer a DVRIP login with a
 * valid header. UPnP candidates were already confirmed by their descriptor.
 */
class DeviceValidator : public DeviceValidator_T
{
public:
    DeviceValidator(std::shared_ptr<TcpProber_T> prober,
                    std::shared_ptr<HttpClient_T> http,
                    std::shared_ptr<TcpExchange_T> exchange,
                    ValidatorConfig config = {},
                    log_callback_t log_callback = nullptr);

    ValidationResult validate(const DiscoveredCandidate& device) override;

    /// Router admin pages, judged by body and Server header.
    static bool is_router_response(const HttpResponse& response);
    static bool is_likely_camera_response(const HttpResponse& response);

private:
    ValidationLayer check_connectivity(const DiscoveredCandidate& device);
    ValidationLayer check_protocol(const DiscoveredCandidate& device);
    ValidationLayer check_rtsp(const DiscoveredCandidate& device);
    ValidationLayer check_http(const DiscoveredCandidate& device);
    ValidationLayer check_onvif(const DiscoveredCandidate& device);
    ValidationLayer check_dvrip(const DiscoveredCandidate& device);

    std::shared_ptr<TcpProber_T> m_prober;
    std::shared_ptr<HttpClient_T> m_http;
    std::shared_ptr<TcpExchange_T> m_exchange;
    DeviceBlacklist m_blacklist;
    ValidatorConfig m_config;
    log_callback_t m_log_callback;
};

} // namespace camscout

#endif // CAMSCOUT_DEVICE_VALIDATOR_HPP

/** @} */
