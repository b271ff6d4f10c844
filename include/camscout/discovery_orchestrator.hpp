/**
 * @file discovery_orchestrator.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Runs the discovery probes and the port scanner against one subnet,
 * merges what they find and keeps the discovery cache up to date.
 * @{
 */
#ifndef CAMSCOUT_DISCOVERY_ORCHESTRATOR_HPP
#define CAMSCOUT_DISCOVERY_ORCHESTRATOR_HPP

#include "CommonTypes.hpp"
#include "device_blacklist.hpp"
#include "device_validator.hpp"
#include "discovery_cache.hpp"
#include "discovery_probe.hpp"
#include "discovery_types.hpp"
#include "port_scanner.hpp"
#include "scheduler.hpp"
#include <boost/signals2.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace camscout
{

/// Environment variable naming a camera that is added to every discovery result.
inline constexpr auto DEVICE_URI_ENV { "CAMSCOUT_DEVICE_URI" };

struct DiscoveryConfig
{
    std::chrono::milliseconds deadline { 5000 };            ///< the probes and the scan race against this
    std::chrono::milliseconds scan_cooldown { 120000 };     ///< a subnet is port scanned at most once per cooldown
    std::string fallback_network_base { "192.168.1" };
    bool port_scan_enabled { true };
    /// Replaces the interface lookup, mainly for tests.
    std::function<std::optional<std::string>()> network_base_detector;
    /// Camera added to every result. When empty the DEVICE_URI_ENV variable is consulted.
    std::optional<std::string> manual_device_uri;
};

struct DiscoveryStatistics
{
    std::size_t runs { 0 };
    std::size_t networks_scanned { 0 };
    std::size_t cached_devices { 0 };
    std::size_t last_result_count { 0 };
    std::chrono::milliseconds last_run_duration { 0 };
    std::map<std::string, std::size_t> last_counts_by_source;   ///< probe name or "port_scan" -> candidates
    std::set<std::string> last_degraded_sources;                ///< probes that reported degraded() in the last race
};

/// @brief Candidate for a camera given as "rtsp://host:port/..." or a bare "host[:port]" (RTSP assumed).
/// @return std::nullopt if the text has no usable host.
std::optional<DiscoveredCandidate> candidate_from_uri(const std::string& text);

class DiscoveryOrchestrator
{
public:
    typedef boost::signals2::signal<void (const DiscoveredCandidate&)> device_signal_t;

    /// @param probes Multicast probes raced alongside the port scan (mDNS, WS-Discovery, SSDP).
    /// @param validator May be null, validate() then passes every device through.
    DiscoveryOrchestrator(std::vector<std::shared_ptr<DiscoveryProbe_T>> probes,
                          std::shared_ptr<PortScanner> scanner,
                          std::shared_ptr<DiscoveryCache> cache,
                          std::shared_ptr<DeviceValidator_T> validator,
                          Scheduler_T& scheduler,
                          DiscoveryConfig config = {},
                          log_callback_t log_callback = nullptr);
    ~DiscoveryOrchestrator();

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    /**
     * @brief Discover devices on a subnet.
     *
     * Cached devices of the subnet are returned straight away unless
     * force_refresh is set. Otherwise every probe and the port scan run
     * concurrently until all finish or the deadline passes; whatever a late
     * task finds afterwards is dropped. Results are deduplicated by (ip, port),
     * blacklisted devices are removed and the rest is merged into the cache.
     *
     * @param network_base "a.b.c"; detected from the host interfaces when not given.
     * @return An empty list when another discovery is already running.
     */
    candidate_list_t discover(std::optional<std::string> network_base = std::nullopt, bool force_refresh = false);

    /// @brief Protocol level validation of every device, in parallel.
    ///  A device whose validation throws is dropped without affecting the others.
    candidate_list_t validate(const candidate_list_t& devices);

    /// Scan the RTSP priority ports only, then validate.
    candidate_list_t quick_rtsp_discovery(const std::string& network_base);

    /// Scan one address (manufacturer ports first when known), then validate.
    candidate_list_t discover_specific_ip(const std::string& ip,
                                          const std::optional<std::string>& manufacturer = std::nullopt);

    /// Forget when each subnet was last scanned.
    void clear_history();

    bool is_discovering() const;
    DiscoveryStatistics statistics() const;

    /// Every device a discover() run returns, in result order.
    boost::signals2::connection on_device_discovered(const device_signal_t::slot_type& slot);

private:
    std::string resolve_network_base(const std::optional<std::string>& network_base) const;
    candidate_list_t race(const std::string& network_base);
    candidate_list_t finalize(candidate_list_t found);
    void join_finished_tasks();

    std::vector<std::shared_ptr<DiscoveryProbe_T>> m_probes;
    std::shared_ptr<PortScanner> m_scanner;
    std::shared_ptr<DiscoveryCache> m_cache;
    std::shared_ptr<DeviceValidator_T> m_validator;
    Scheduler_T& m_scheduler;
    DiscoveryConfig m_config;
    log_callback_t m_log_callback;
    DeviceBlacklist m_blacklist;

    mutable std::mutex m_mutex;
    bool m_discovering { false };
    std::map<std::string, Clock::time_point> m_scanHistory;
    DiscoveryStatistics m_stats;
    std::vector<std::thread> m_tasks;   ///< tasks of earlier runs that may outlive their deadline

    device_signal_t m_deviceDiscovered;
};

} // namespace camscout

#endif // CAMSCOUT_DISCOVERY_ORCHESTRATOR_HPP

/** @} */
