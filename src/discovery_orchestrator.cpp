/**
 * @file discovery_orchestrator.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Races the discovery probes and the port scanner against a deadline
 */
#include "discovery_orchestrator.hpp"
#include "comm_ip/network_interfaces.hpp"
#include "log_macros.hpp"
#include "uri.hpp"
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <cstdlib>
#include <future>
#include <stdexcept>

namespace camscout
{

using namespace std::string_literals;

constexpr auto PORT_SCAN_SOURCE { "port_scan" };
constexpr std::size_t MAX_PARALLEL_VALIDATIONS { 16 };

namespace
{

uri parse_as_uri(const std::string& text)
{
    try
    {
        uri parsed(text);
        if (!parsed.get_host().empty())
        {
            return parsed;
        }
    }
    catch (std::invalid_argument&)
    {
        // No scheme, handled below
    }
    // A bare "host[:port]" is taken to be an RTSP camera
    return uri("rtsp://" + text);
}

std::optional<uint16_t> default_port_for(const std::string& scheme)
{
    if (scheme == "rtsp")
    {
        return 554;
    }
    if (scheme == "http" || scheme == "onvif")
    {
        return 80;
    }
    if (scheme == "dvrip")
    {
        return 34567;
    }
    return std::nullopt;
}

std::vector<CachedDevice> to_cached_devices(const candidate_list_t& candidates, Clock::time_point now)
{
    std::vector<CachedDevice> devices;
    devices.reserve(candidates.size());
    for (const auto& c : candidates)
    {
        CachedDevice d;
        d.ip = c.ip;
        d.name = c.name;
        d.manufacturer = c.manufacturer;
        d.protocol = c.protocol;
        d.ports.insert(c.port);
        d.discovered_at = now;
        d.last_seen = now;
        d.response_time = c.response_time;
        d.is_online = true;
        d.metadata = c.metadata;
        d.metadata["discoveryMethod"] = to_string(c.method);
        if (c.model)
        {
            d.metadata["model"] = *c.model;
        }
        if (!c.service_type.empty())
        {
            d.metadata["serviceType"] = c.service_type;
        }
        devices.push_back(std::move(d));
    }
    return devices;
}

candidate_list_t to_candidates(const std::vector<CachedDevice>& devices)
{
    candidate_list_t result;
    for (const auto& d : devices)
    {
        for (auto port : d.ports)
        {
            DiscoveredCandidate c;
            c.ip = d.ip;
            c.port = port;
            c.protocol = d.protocol;
            c.method = DiscoveryMethod::cache;
            c.manufacturer = d.manufacturer;
            c.name = d.name;
            c.response_time = d.response_time;
            c.metadata = d.metadata;
            auto model = d.metadata.find("model");
            if (model != d.metadata.end())
            {
                c.model = model->second;
            }
            auto service = d.metadata.find("serviceType");
            if (service != d.metadata.end())
            {
                c.service_type = service->second;
            }
            result.push_back(std::move(c));
        }
    }
    return result;
}

/// Keep the first sighting of every (ip, port), completing it from later duplicates.
candidate_list_t remove_duplicates(candidate_list_t found)
{
    candidate_list_t unique;
    std::map<std::tuple<std::string, uint16_t>, std::size_t> index;
    for (auto& c : found)
    {
        auto it = index.find(c.key());
        if (it == index.end())
        {
            index.emplace(c.key(), unique.size());
            unique.push_back(std::move(c));
            continue;
        }
        auto& kept = unique[it->second];
        if (!kept.manufacturer) kept.manufacturer = c.manufacturer;
        if (!kept.model) kept.model = c.model;
        if (!kept.name) kept.name = c.name;
        if (kept.service_type.empty()) kept.service_type = c.service_type;
        if (kept.response_time.count() == 0) kept.response_time = c.response_time;
        kept.metadata.insert(c.metadata.begin(), c.metadata.end());
    }
    return unique;
}

} // namespace


std::optional<DiscoveredCandidate> candidate_from_uri(const std::string& text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    try
    {
        const auto parsed = parse_as_uri(text);
        if (parsed.get_host().empty())
        {
            return std::nullopt;
        }
        std::string scheme = parsed.get_scheme();
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::optional<uint16_t> port;
        if (parsed.get_port() != 0)
        {
            port = static_cast<uint16_t>(parsed.get_port());
        }
        else
        {
            port = default_port_for(scheme);
        }
        if (!port)
        {
            return std::nullopt;
        }

        DiscoveredCandidate c;
        c.ip = parsed.get_host();
        c.port = *port;
        c.protocol = (scheme == "dvrip") ? "TCP"s : scheme;
        std::transform(c.protocol.begin(), c.protocol.end(), c.protocol.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        c.method = DiscoveryMethod::manual;
        c.metadata["uri"] = text;
        return c;
    }
    catch (std::invalid_argument&)
    {
        return std::nullopt;
    }
}


DiscoveryOrchestrator::DiscoveryOrchestrator(std::vector<std::shared_ptr<DiscoveryProbe_T>> probes,
                                             std::shared_ptr<PortScanner> scanner,
                                             std::shared_ptr<DiscoveryCache> cache,
                                             std::shared_ptr<DeviceValidator_T> validator,
                                             Scheduler_T& scheduler,
                                             DiscoveryConfig config,
                                             log_callback_t log_callback) :
    m_probes(std::move(probes)),
    m_scanner(std::move(scanner)),
    m_cache(std::move(cache)),
    m_validator(std::move(validator)),
    m_scheduler(scheduler),
    m_config(std::move(config)),
    m_log_callback(log_callback),
    m_blacklist(log_callback)
{
    if (!m_cache)
    {
        throw std::invalid_argument("DiscoveryOrchestrator requires a cache");
    }
    m_probes.erase(std::remove(m_probes.begin(), m_probes.end(), nullptr), m_probes.end());
}

DiscoveryOrchestrator::~DiscoveryOrchestrator()
{
    std::vector<std::thread> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.swap(m_tasks);
    }
    for (auto& t : tasks)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}

std::string DiscoveryOrchestrator::resolve_network_base(const std::optional<std::string>& network_base) const
{
    if (network_base && !network_base->empty())
    {
        return *network_base;
    }
    std::optional<std::string> detected;
    if (m_config.network_base_detector)
    {
        detected = m_config.network_base_detector();
    }
    else
    {
        detected = detect_network_base(m_log_callback);
    }
    if (detected)
    {
        return *detected;
    }
    DBG("No usable network interface, falling back to " << m_config.fallback_network_base, LOG_LVL_INFO);
    return m_config.fallback_network_base;
}

void DiscoveryOrchestrator::join_finished_tasks()
{
    std::vector<std::thread> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        tasks.swap(m_tasks);
    }
    // Tasks of earlier runs were cancelled at their deadline and return promptly
    for (auto& t : tasks)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}

candidate_list_t DiscoveryOrchestrator::discover(std::optional<std::string> network_base, bool force_refresh)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_discovering)
        {
            DBG("Discovery already running", LOG_LVL_INFO);
            return {};
        }
        m_discovering = true;
    }
    struct RunGuard
    {
        DiscoveryOrchestrator& self;
        ~RunGuard()
        {
            std::lock_guard<std::mutex> lock(self.m_mutex);
            self.m_discovering = false;
        }
    } guard { *this };

    join_finished_tasks();
    const auto started = std::chrono::steady_clock::now();
    const auto base = resolve_network_base(network_base);

    candidate_list_t found;
    if (!force_refresh)
    {
        found = to_candidates(m_cache->by_subnet(base));
        if (!found.empty())
        {
            DBG("Using " << found.size() << " cached endpoints for " << base, LOG_LVL_INFO);
        }
    }
    const bool from_cache = !found.empty();
    if (!from_cache)
    {
        found = race(base);
    }

    auto manual_uri = m_config.manual_device_uri;
    if (!manual_uri)
    {
        if (const char* env_p = std::getenv(DEVICE_URI_ENV))
        {
            manual_uri = env_p;
        }
    }
    std::optional<DiscoveredCandidate> manual;
    if (manual_uri)
    {
        manual = candidate_from_uri(*manual_uri);
        if (!manual)
        {
            ERR("Ignoring unusable device uri: " << *manual_uri);
        }
    }

    candidate_list_t result;
    if (from_cache)
    {
        if (manual)
        {
            found.push_back(*manual);
        }
        result = remove_duplicates(std::move(found));
    }
    else
    {
        result = finalize(std::move(found));
        if (manual)
        {
            const auto key = manual->key();
            auto dup = std::find_if(result.begin(), result.end(),
                                    [&key](const DiscoveredCandidate& c) { return c.key() == key; });
            if (dup == result.end())
            {
                m_cache->upsert(to_cached_devices({ *manual }, m_scheduler.now()).front());
                result.push_back(*manual);
            }
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.runs;
        m_stats.last_result_count = result.size();
        m_stats.last_run_duration = elapsed;
        if (from_cache)
        {
            m_stats.last_counts_by_source.clear();
            m_stats.last_counts_by_source[to_string(DiscoveryMethod::cache)] = result.size();
            m_stats.last_degraded_sources.clear();
        }
    }
    DBG("Discovery of " << base << " finished in " << elapsed.count() << "ms with "
        << result.size() << " devices", LOG_LVL_INFO);

    for (const auto& c : result)
    {
        m_deviceDiscovered(c);
    }
    return result;
}

candidate_list_t DiscoveryOrchestrator::race(const std::string& network_base)
{
    struct RunState
    {
        std::mutex mutex;
        std::condition_variable done;
        candidate_list_t results;
        std::map<std::string, std::size_t> counts;
        std::set<std::string> degraded;
        std::size_t pending { 0 };
    };
    auto state = std::make_shared<RunState>();
    CancellationSource source;
    auto token = source.token();
    auto log_callback = m_log_callback;

    auto deliver = [state, token](const std::string& source_name, candidate_list_t found, bool degraded)
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!token.is_cancelled())
        {
            state->counts[source_name] = found.size();
            if (degraded)
            {
                state->degraded.insert(source_name);
            }
            state->results.insert(state->results.end(),
                                  std::make_move_iterator(found.begin()),
                                  std::make_move_iterator(found.end()));
        }
        --state->pending;
        state->done.notify_all();
    };

    bool scan_now = false;
    if (m_config.port_scan_enabled && m_scanner)
    {
        const auto now = m_scheduler.now();
        std::lock_guard<std::mutex> lock(m_mutex);
        auto last = m_scanHistory.find(network_base);
        if (last != m_scanHistory.end() && now - last->second < m_config.scan_cooldown)
        {
            DBG("Network " << network_base << " was scanned recently, skipping the port scan", LOG_LVL_DBG_HI);
        }
        else
        {
            m_scanHistory[network_base] = now;
            scan_now = true;
        }
    }

    std::vector<std::thread> tasks;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->pending = m_probes.size() + (scan_now ? 1 : 0);
    }
    for (const auto& probe : m_probes)
    {
        tasks.emplace_back([probe, token, deliver, log_callback]()
        {
            auto& m_log_callback = log_callback;
            candidate_list_t found;
            try
            {
                found = probe->discover(token);
            }
            catch (std::exception& e)
            {
                ERR(probe->name() << " probe failed: " << e.what());
            }
            DBG(probe->name() << " found " << found.size() << " devices", LOG_LVL_DBG_MID);
            const bool degraded = probe->degraded();
            if (degraded)
            {
                DBG(probe->name() << " probe degraded this run", LOG_LVL_INFO);
            }
            deliver(probe->name(), std::move(found), degraded);
        });
    }
    if (scan_now)
    {
        auto scanner = m_scanner;
        tasks.emplace_back([scanner, network_base, token, deliver, log_callback]()
        {
            auto& m_log_callback = log_callback;
            candidate_list_t found;
            try
            {
                found = scanner->scan(network_base, token);
            }
            catch (std::exception& e)
            {
                ERR("Port scan of " << network_base << " failed: " << e.what());
            }
            DBG("Port scan found " << found.size() << " devices", LOG_LVL_DBG_MID);
            deliver(PORT_SCAN_SOURCE, std::move(found), false);
        });
    }

    candidate_list_t results;
    std::map<std::string, std::size_t> counts;
    std::set<std::string> degraded;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        const bool all_done = state->done.wait_for(lock, m_config.deadline,
                                                   [&state]() { return state->pending == 0; });
        if (!all_done)
        {
            DBG("Discovery deadline reached with " << state->pending << " tasks outstanding", LOG_LVL_INFO);
        }
        // Under the state lock, so nothing is delivered after this point
        source.cancel();
        results.swap(state->results);
        counts.swap(state->counts);
        degraded.swap(state->degraded);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.last_counts_by_source = counts;
        m_stats.last_degraded_sources = degraded;
        for (auto& t : tasks)
        {
            m_tasks.push_back(std::move(t));
        }
    }
    return results;
}

candidate_list_t DiscoveryOrchestrator::finalize(candidate_list_t found)
{
    auto unique = remove_duplicates(std::move(found));
    candidate_list_t accepted;
    accepted.reserve(unique.size());
    for (auto& c : unique)
    {
        auto reason = m_blacklist.filter_reason(DeviceSignals::from_candidate(c));
        if (reason)
        {
            DBG("Filtered " << c.ip << ":" << c.port << " (" << *reason << ")", LOG_LVL_DBG_MID);
            continue;
        }
        accepted.push_back(std::move(c));
    }
    if (!accepted.empty())
    {
        m_cache->upsert_all(to_cached_devices(accepted, m_scheduler.now()));
    }
    return accepted;
}

candidate_list_t DiscoveryOrchestrator::validate(const candidate_list_t& devices)
{
    if (!m_validator)
    {
        return devices;
    }
    DBG("Validating " << devices.size() << " devices", LOG_LVL_INFO);
    candidate_list_t valid;
    for (std::size_t first = 0; first < devices.size(); first += MAX_PARALLEL_VALIDATIONS)
    {
        const auto last = std::min(devices.size(), first + MAX_PARALLEL_VALIDATIONS);
        std::vector<std::future<ValidationResult>> pending;
        for (auto i = first; i < last; ++i)
        {
            auto validator = m_validator;
            const auto& device = devices[i];
            pending.push_back(std::async(std::launch::async,
                                         [validator, &device]() { return validator->validate(device); }));
        }
        for (auto i = first; i < last; ++i)
        {
            const auto& device = devices[i];
            try
            {
                auto result = pending[i - first].get();
                if (result.valid)
                {
                    DBG("Validated " << device.ip << ":" << device.port, LOG_LVL_DBG_HI);
                    valid.push_back(device);
                }
                else
                {
                    DBG("Rejected " << device.ip << ":" << device.port << " - " << result.reason, LOG_LVL_DBG_HI);
                }
            }
            catch (std::exception& e)
            {
                ERR("Validation of " << device.ip << ":" << device.port << " failed: " << e.what());
            }
        }
    }
    DBG(valid.size() << "/" << devices.size() << " devices validated", LOG_LVL_INFO);
    return valid;
}

candidate_list_t DiscoveryOrchestrator::quick_rtsp_discovery(const std::string& network_base)
{
    if (!m_scanner)
    {
        return {};
    }
    join_finished_tasks();
    candidate_list_t found;
    try
    {
        found = m_scanner->scan_for_streaming(network_base);
    }
    catch (std::invalid_argument& e)
    {
        ERR("Quick RTSP discovery failed: " << e.what());
        return {};
    }
    return validate(found);
}

candidate_list_t DiscoveryOrchestrator::discover_specific_ip(const std::string& ip,
                                                             const std::optional<std::string>& manufacturer)
{
    if (!m_scanner)
    {
        return {};
    }
    join_finished_tasks();
    auto found = m_scanner->scan_specific_ip(ip, manufacturer);
    auto valid = validate(found);
    if (!valid.empty())
    {
        m_cache->upsert_all(to_cached_devices(valid, m_scheduler.now()));
    }
    return valid;
}

void DiscoveryOrchestrator::clear_history()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scanHistory.clear();
}

bool DiscoveryOrchestrator::is_discovering() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_discovering;
}

DiscoveryStatistics DiscoveryOrchestrator::statistics() const
{
    DiscoveryStatistics result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result = m_stats;
        result.networks_scanned = m_scanHistory.size();
    }
    result.cached_devices = m_cache->statistics().total_devices;
    return result;
}

boost::signals2::connection DiscoveryOrchestrator::on_device_discovered(const device_signal_t::slot_type& slot)
{
    return m_deviceDiscovered.connect(slot);
}

} // namespace camscout
