/**
 * @file discovery_cache.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Implements the discovery cache and its JSON persistence
 */
#include "discovery_cache.hpp"
#include "log_macros.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <numeric>
#include <sstream>

namespace camscout
{

using json = nlohmann::json;
using namespace std::chrono;

static int64_t to_epoch_ms(Clock::time_point t)
{
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

static Clock::time_point from_epoch_ms(int64_t ms)
{
    return Clock::time_point { duration_cast<Clock::duration>(milliseconds { ms }) };
}

void to_json(json& j, const CachedDevice& d)
{
    j = json {
        { "ip", d.ip },
        { "protocol", d.protocol },
        { "ports", std::vector<uint16_t>(d.ports.begin(), d.ports.end()) },
        { "discoveredAt", to_epoch_ms(d.discovered_at) },
        { "lastSeen", to_epoch_ms(d.last_seen) },
        { "responseTime", d.response_time.count() },
        { "isOnline", d.is_online },
        { "metadata", d.metadata },
    };
    if (d.name)
    {
        j["name"] = *d.name;
    }
    if (d.manufacturer)
    {
        j["manufacturer"] = *d.manufacturer;
    }
}

void from_json(const json& j, CachedDevice& d)
{
    d.ip = j.at("ip").get<std::string>();
    if (j.contains("name") && j["name"].is_string())
    {
        d.name = j["name"].get<std::string>();
    }
    if (j.contains("manufacturer") && j["manufacturer"].is_string())
    {
        d.manufacturer = j["manufacturer"].get<std::string>();
    }
    d.protocol = j.at("protocol").get<std::string>();
    auto ports = j.at("ports").get<std::vector<uint16_t>>();
    d.ports = { ports.begin(), ports.end() };
    d.discovered_at = from_epoch_ms(j.at("discoveredAt").get<int64_t>());
    d.last_seen = from_epoch_ms(j.at("lastSeen").get<int64_t>());
    d.response_time = milliseconds { j.at("responseTime").get<int64_t>() };
    d.is_online = j.at("isOnline").get<bool>();
    if (j.contains("metadata") && j["metadata"].is_object())
    {
        for (const auto& item : j["metadata"].items())
        {
            d.metadata[item.key()] = item.value().is_string() ? item.value().get<std::string>()
                                                              : item.value().dump();
        }
    }
}


double CachedDevice::priority(Clock::time_point now) const
{
    const double latency_ms = static_cast<double>(response_time.count());
    const double age_hours = std::max(0.0, duration<double, std::ratio<3600>>(now - last_seen).count());
    const double latency_score = 1000.0 / (latency_ms + 100.0);
    const double recency_score = 1.0 / (age_hours + 1.0);
    const double online_score = is_online ? 2.0 : 0.5;
    return latency_score * recency_score * online_score;
}


JsonFileStore::JsonFileStore(std::string path, log_callback_t log_callback) :
    m_path(std::move(path)),
    m_log_callback(log_callback)
{
}

std::optional<std::string> JsonFileStore::load()
{
    std::ifstream in { m_path };
    if (!in)
    {
        DBG("No cache file at " << m_path, LOG_LVL_DBG_HI);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool JsonFileStore::save(const std::string& document)
{
    std::ofstream out { m_path, std::ios::trunc };
    if (!out)
    {
        ERR("Unable to open cache file " << m_path << " for writing");
        return false;
    }
    out << document;
    return static_cast<bool>(out);
}


DiscoveryCache::DiscoveryCache(std::shared_ptr<DeviceStore_T> store,
                               Scheduler_T& scheduler,
                               CacheConfig config,
                               log_callback_t log_callback) :
    m_store(std::move(store)),
    m_scheduler(scheduler),
    m_config(config),
    m_log_callback(log_callback),
    m_sweepLifetime(std::make_shared<SweepLifetime>())
{
}

DiscoveryCache::~DiscoveryCache()
{
    {
        // Waits for a sweep already running on the scheduler thread.
        std::lock_guard<std::mutex> lifetime(m_sweepLifetime->mutex);
        m_sweepLifetime->alive = false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sweepTimer != Scheduler_T::INVALID_TIMER)
    {
        m_scheduler.cancel(m_sweepTimer);
        m_sweepTimer = Scheduler_T::INVALID_TIMER;
    }
}

std::size_t DiscoveryCache::initialize()
{
    std::size_t loaded { 0 };
    std::optional<std::string> document;
    if (m_store)
    {
        document = m_store->load();
    }
    if (document && !document->empty())
    {
        try
        {
            auto root = json::parse(*document);
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& item : root.items())
            {
                try
                {
                    auto device = item.value().get<CachedDevice>();
                    m_devices[device.ip] = device;
                    ++loaded;
                }
                catch (json::exception& e)
                {
                    ERR("Skipping cached device " << item.key() << ": " << e.what());
                }
            }
        }
        catch (json::exception& e)
        {
            ERR("Discarding unreadable discovery cache: " << e.what());
        }
    }
    DBG("Loaded " << loaded << " cached devices", LOG_LVL_INFO);
    schedule_sweep();
    return loaded;
}

void DiscoveryCache::schedule_sweep()
{
    auto lifetime = m_sweepLifetime;
    auto timer = m_scheduler.schedule_after(duration_cast<milliseconds>(m_config.sweep_interval), [this, lifetime]()
        {
            std::lock_guard<std::mutex> alive(lifetime->mutex);
            if (!lifetime->alive)
            {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_sweepTimer = Scheduler_T::INVALID_TIMER;
            }
            auto removed = this->sweep_expired();
            if (removed > 0)
            {
                DBG("Cache sweep removed " << removed << " expired devices", LOG_LVL_INFO);
            }
            this->schedule_sweep();
        });
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sweepTimer = timer;
}

static void merge_into(CachedDevice& existing, const CachedDevice& update)
{
    if (update.name)
    {
        existing.name = update.name;
    }
    if (update.manufacturer)
    {
        existing.manufacturer = update.manufacturer;
    }
    if (!update.protocol.empty())
    {
        existing.protocol = update.protocol;
    }
    existing.ports.insert(update.ports.begin(), update.ports.end());
    existing.last_seen = std::max(existing.last_seen, update.last_seen);
    if (update.response_time.count() > 0)
    {
        existing.response_time = update.response_time;
    }
    existing.is_online = update.is_online;
    for (const auto& [key, value] : update.metadata)
    {
        existing.metadata[key] = value;
    }
}

void DiscoveryCache::upsert(const CachedDevice& device)
{
    upsert_all({ device });
}

void DiscoveryCache::upsert_all(const std::vector<CachedDevice>& devices)
{
    if (devices.empty())
    {
        return;
    }
    std::lock_guard<std::mutex> publish(m_publishMutex);
    std::unique_lock<std::mutex> lock(m_mutex);
    const auto now = m_scheduler.now();
    for (const auto& device : devices)
    {
        auto it = m_devices.find(device.ip);
        if (it == m_devices.end())
        {
            auto entry = device;
            if (entry.discovered_at == Clock::time_point {})
            {
                entry.discovered_at = now;
            }
            if (entry.last_seen == Clock::time_point {})
            {
                entry.last_seen = now;
            }
            m_devices.emplace(device.ip, entry);
        }
        else
        {
            merge_into(it->second, device);
        }
    }
    commit(lock);
}

std::optional<CachedDevice> DiscoveryCache::get(const std::string& ip) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(ip);
    if (it == m_devices.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CachedDevice> DiscoveryCache::all_devices(bool online_only) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CachedDevice> result;
    for (const auto& entry : m_devices)
    {
        if (!online_only || entry.second.is_online)
        {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<CachedDevice> DiscoveryCache::by_protocol(const std::string& protocol) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CachedDevice> result;
    for (const auto& entry : m_devices)
    {
        if (entry.second.protocol == protocol)
        {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<CachedDevice> DiscoveryCache::by_subnet(const std::string& network_base) const
{
    const auto prefix = network_base + ".";
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CachedDevice> result;
    for (const auto& entry : m_devices)
    {
        if (entry.first.compare(0, prefix.size(), prefix) == 0)
        {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<CachedDevice> DiscoveryCache::by_priority(std::optional<std::size_t> limit) const
{
    auto devices = all_devices();
    const auto now = m_scheduler.now();
    std::stable_sort(devices.begin(), devices.end(), [now](const CachedDevice& a, const CachedDevice& b)
        {
            return a.priority(now) > b.priority(now);
        });
    if (limit && devices.size() > *limit)
    {
        devices.resize(*limit);
    }
    return devices;
}

bool DiscoveryCache::mark_offline(const std::string& ip)
{
    std::lock_guard<std::mutex> publish(m_publishMutex);
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_devices.find(ip);
    if (it == m_devices.end())
    {
        return false;
    }
    it->second.is_online = false;
    commit(lock);
    return true;
}

bool DiscoveryCache::remove(const std::string& ip)
{
    std::lock_guard<std::mutex> publish(m_publishMutex);
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_devices.erase(ip) == 0)
    {
        return false;
    }
    commit(lock);
    return true;
}

std::size_t DiscoveryCache::sweep_expired(std::chrono::milliseconds max_age)
{
    std::lock_guard<std::mutex> publish(m_publishMutex);
    std::unique_lock<std::mutex> lock(m_mutex);
    const auto now = m_scheduler.now();
    std::size_t removed { 0 };
    for (auto it = m_devices.begin(); it != m_devices.end();)
    {
        if ((now - it->second.last_seen) > max_age)
        {
            DBG("Expiring cached device " << it->first, LOG_LVL_DBG_MID);
            it = m_devices.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    if (removed > 0)
    {
        commit(lock);
    }
    return removed;
}

std::size_t DiscoveryCache::sweep_expired()
{
    return sweep_expired(duration_cast<milliseconds>(m_config.max_age));
}

milliseconds DiscoveryCache::adaptive_timeout(const std::string& ip,
                                              std::optional<milliseconds> default_timeout) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(ip);
    if (it == m_devices.end())
    {
        return default_timeout.value_or(m_config.default_timeout);
    }
    return std::clamp(it->second.response_time * 2, m_config.min_timeout, m_config.max_timeout);
}

CacheStatistics DiscoveryCache::statistics() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStatistics stats;
    stats.total_devices = m_devices.size();
    int64_t total_response_ms { 0 };
    for (const auto& entry : m_devices)
    {
        const auto& d = entry.second;
        if (d.is_online)
        {
            ++stats.online_devices;
        }
        ++stats.protocols[d.protocol];
        total_response_ms += d.response_time.count();
    }
    stats.offline_devices = stats.total_devices - stats.online_devices;
    if (stats.total_devices > 0)
    {
        stats.average_response_time_ms = static_cast<double>(total_response_ms) / stats.total_devices;
    }
    stats.cache_size_bytes = serialize_locked().size();
    return stats;
}

void DiscoveryCache::clear()
{
    std::lock_guard<std::mutex> publish(m_publishMutex);
    std::unique_lock<std::mutex> lock(m_mutex);
    m_devices.clear();
    commit(lock);
}

boost::signals2::connection DiscoveryCache::subscribe(const devices_changed_signal_t::slot_type& slot)
{
    return m_devicesChanged.connect(slot);
}

std::string DiscoveryCache::serialize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return serialize_locked();
}

std::vector<CachedDevice> DiscoveryCache::snapshot_locked() const
{
    std::vector<CachedDevice> result;
    result.reserve(m_devices.size());
    for (const auto& entry : m_devices)
    {
        result.push_back(entry.second);
    }
    return result;
}

std::string DiscoveryCache::serialize_locked() const
{
    json root = json::object();
    for (const auto& entry : m_devices)
    {
        root[entry.first] = entry.second;
    }
    return root.dump();
}

/*
 * Persist and publish the state reached by a mutation. Called with both the
 * publish mutex and the data mutex held; the data mutex is released before
 * subscribers run so they may query the cache.
 */
void DiscoveryCache::commit(std::unique_lock<std::mutex>& lock)
{
    auto document = serialize_locked();
    auto devices = snapshot_locked();
    lock.unlock();

    if (m_store && !m_store->save(document))
    {
        ERR("Failed to persist discovery cache");
    }
    m_devicesChanged(devices);
}

} // namespace camscout
