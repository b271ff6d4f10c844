/**
 * @file ws_discovery_probe.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * ONVIF WS-Discovery: SOAP Probe to the discovery multicast group and
 * parsing of ProbeMatch and Hello messages.
 * @{
 */
#ifndef CAMSCOUT_WS_DISCOVERY_PROBE_HPP
#define CAMSCOUT_WS_DISCOVERY_PROBE_HPP

#include "CommonTypes.hpp"
#include "discovery_probe.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{

inline constexpr auto WS_DISCOVERY_ADDRESS { "239.255.255.250" };
inline constexpr uint16_t WS_DISCOVERY_PORT { 3702 };

struct WsDiscoveryConfig
{
    std::chrono::milliseconds timeout { 10000 };
    std::chrono::milliseconds unicast_timeout { 5000 };
    std::string types { "dn:NetworkVideoTransmitter" };
};

struct WsProbeMatch
{
    std::string endpoint_reference;
    std::vector<std::string> types;
    std::vector<std::string> scopes;
    std::vector<std::string> xaddrs;
    std::optional<uint32_t> metadata_version;
    bool is_hello { false };
    std::string sender;

    /// A type token references NetworkVideoTransmitter, Device or onvif.
    bool is_onvif() const;

    std::optional<std::string> name() const;
    std::optional<std::string> manufacturer() const;
    std::optional<std::string> model() const;
};

/// @brief SOAP 1.2 Probe envelope.
/// @param message_id Value for wsa:MessageID, normally "urn:uuid:<uuid>".
std::string build_probe(const std::string& message_id, const std::string& types = "dn:NetworkVideoTransmitter");

/// "urn:uuid:" followed by a random UUID.
std::string make_message_id();

/// @return Every ProbeMatch or Hello in the message. Empty for malformed XML or other messages.
std::vector<WsProbeMatch> parse_probe_matches(const std::string& xml);

/// @brief Find a value in a scope list.
///  Understands "key=value" tokens as well as the ONVIF form onvif://www.onvif.org/key/value.
///  The value is URL decoded.
std::optional<std::string> extract_scope_value(const std::vector<std::string>& scopes, const std::string& key);

std::string url_decode(const std::string& value);


class WsDiscoveryProbe : public DiscoveryProbe_T
{
public:
    explicit WsDiscoveryProbe(WsDiscoveryConfig config = {}, log_callback_t log_callback = nullptr);

    const char* name() const override { return "ws-discovery"; }
    candidate_list_t discover(const CancellationToken& token) override;

    /// Unicast probe of a single address.
    candidate_list_t probe_specific_device(const std::string& ip, const CancellationToken& token = {});

    /// ONVIF-eligible matches converted to candidates, unique by (ip, port).
    static candidate_list_t to_candidates(const std::vector<WsProbeMatch>& matches);

private:
    std::vector<WsProbeMatch> probe(const std::string& destination,
                                    std::chrono::milliseconds window,
                                    const CancellationToken& token);

    WsDiscoveryConfig m_config;
    log_callback_t m_log_callback;
};

} // namespace camscout

#endif // CAMSCOUT_WS_DISCOVERY_PROBE_HPP

/** @} */
