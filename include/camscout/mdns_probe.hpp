/**
 * @file mdns_probe.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Multicast DNS service discovery of ONVIF and HTTP devices.
 * @{
 */
#ifndef CAMSCOUT_MDNS_PROBE_HPP
#define CAMSCOUT_MDNS_PROBE_HPP

#include "CommonTypes.hpp"
#include "discovery_probe.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace camscout
{

struct MdnsConfig
{
    std::vector<std::string> service_types { "_onvif._tcp.local", "_http._tcp.local" };

    /// Nothing received within this window marks mDNS degraded for the run.
    std::chrono::milliseconds fast_fail_timeout { 3000 };
    std::chrono::milliseconds discovery_timeout { 8000 };

    /// Used after the socket could not be bound exclusively (another responder owns port 5353).
    std::string fallback_service_type { "_onvif._tcp.local" };
    std::chrono::milliseconds fallback_delay { 500 };
    std::chrono::milliseconds fallback_window { 4000 };
    std::chrono::milliseconds fallback_cap { 5000 };
};

class MdnsProbe : public DiscoveryProbe_T
{
public:
    explicit MdnsProbe(MdnsConfig config = {}, log_callback_t log_callback = nullptr);

    const char* name() const override { return "mdns"; }
    candidate_list_t discover(const CancellationToken& token) override;

    /// True when the last run received nothing before the fast-fail timeout.
    bool degraded() const override { return m_degraded; }

    /// True once an exclusive bind has failed and the shared-address fallback was used.
    bool had_bind_conflict() const { return m_bindConflict; }

private:
    MdnsConfig m_config;
    log_callback_t m_log_callback;
    std::atomic<bool> m_degraded { false };
    std::atomic<bool> m_bindConflict { false };
};

} // namespace camscout

#endif // CAMSCOUT_MDNS_PROBE_HPP

/** @} */
