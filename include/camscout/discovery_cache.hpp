/**
 * @file discovery_cache.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Keyed store of previously seen devices with expiry, priority scoring and
 * adaptive timeout hints.
 * @{
 */
#ifndef CAMSCOUT_DISCOVERY_CACHE_HPP
#define CAMSCOUT_DISCOVERY_CACHE_HPP

#include "CommonTypes.hpp"
#include "scheduler.hpp"
#include <boost/signals2.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace camscout
{

struct CachedDevice
{
    std::string ip;
    std::optional<std::string> name;
    std::optional<std::string> manufacturer;
    std::string protocol;
    std::set<uint16_t> ports;
    Clock::time_point discovered_at {};
    Clock::time_point last_seen {};
    std::chrono::milliseconds response_time { 0 };
    bool is_online { true };
    std::map<std::string, std::string> metadata;

    /// @brief Ranking score, higher is better.
    ///  (1000 / (latency_ms + 100)) * (1 / (age_hours + 1)) * (online ? 2.0 : 0.5)
    double priority(Clock::time_point now) const;
};

struct CacheConfig
{
    std::chrono::hours max_age { 24 };
    std::chrono::hours sweep_interval { 6 };
    std::chrono::milliseconds default_timeout { 5000 };
    std::chrono::milliseconds min_timeout { 1000 };
    std::chrono::milliseconds max_timeout { 30000 };
};

struct CacheStatistics
{
    std::size_t total_devices { 0 };
    std::size_t online_devices { 0 };
    std::size_t offline_devices { 0 };
    std::map<std::string, std::size_t> protocols;
    double average_response_time_ms { 0.0 };
    std::size_t cache_size_bytes { 0 };
};

/// Persistence for the serialized cache document.
class DeviceStore_T
{
public:
    virtual ~DeviceStore_T() = default;

    /// @return The stored document, or std::nullopt if nothing has been stored yet.
    virtual std::optional<std::string> load() = 0;
    virtual bool save(const std::string& document) = 0;
};

/// @brief Stores the cache document in a single file.
class JsonFileStore : public DeviceStore_T
{
public:
    explicit JsonFileStore(std::string path, log_callback_t log_callback = nullptr);

    std::optional<std::string> load() override;
    bool save(const std::string& document) override;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    log_callback_t m_log_callback;
};


class DiscoveryCache
{
public:
    typedef boost::signals2::signal<void (const std::vector<CachedDevice>&)> devices_changed_signal_t;

    DiscoveryCache(std::shared_ptr<DeviceStore_T> store,
                   Scheduler_T& scheduler,
                   CacheConfig config = {},
                   log_callback_t log_callback = nullptr);
    ~DiscoveryCache();

    DiscoveryCache(const DiscoveryCache&) = delete;
    DiscoveryCache& operator=(const DiscoveryCache&) = delete;

    /// @brief Load persisted devices and start the periodic expiry sweep.
    ///  Records that fail to parse are skipped individually.
    /// @return The number of devices loaded.
    std::size_t initialize();

    /// @brief Merge a sighting into the record for its IP.
    ///  Fields the sighting lacks keep their previous values, metadata maps merge key-wise,
    ///  ports accumulate and last_seen never moves backwards.
    void upsert(const CachedDevice& device);

    /// @brief Merge several sightings as one commit: a single persist and a single notification.
    void upsert_all(const std::vector<CachedDevice>& devices);

    std::optional<CachedDevice> get(const std::string& ip) const;
    std::vector<CachedDevice> all_devices(bool online_only = false) const;
    std::vector<CachedDevice> by_protocol(const std::string& protocol) const;

    /// Devices whose address starts with "<network_base>."
    std::vector<CachedDevice> by_subnet(const std::string& network_base) const;

    /// Devices sorted by descending priority.
    std::vector<CachedDevice> by_priority(std::optional<std::size_t> limit = std::nullopt) const;

    bool mark_offline(const std::string& ip);
    bool remove(const std::string& ip);

    /// @brief Remove every device whose last sighting is older than max_age.
    /// @return The number of removed devices.
    std::size_t sweep_expired(std::chrono::milliseconds max_age);
    std::size_t sweep_expired();

    /// @brief Connect timeout suggestion: twice the last measured latency clamped to
    ///  [min_timeout, max_timeout], or default_timeout for an unknown device.
    std::chrono::milliseconds adaptive_timeout(const std::string& ip,
                                               std::optional<std::chrono::milliseconds> default_timeout = std::nullopt) const;

    CacheStatistics statistics() const;
    void clear();

    /// Subscribers receive the full device list after every mutation, in mutation order.
    /// Subscribers must not mutate the cache from the callback.
    boost::signals2::connection subscribe(const devices_changed_signal_t::slot_type& slot);

    /// Serialized form, a JSON object keyed by IP.
    std::string serialize() const;

private:
    /// Shared with queued sweep tasks, which must not touch the cache once it is destroyed.
    struct SweepLifetime
    {
        std::mutex mutex;
        bool alive { true };
    };

    void schedule_sweep();
    std::vector<CachedDevice> snapshot_locked() const;
    std::string serialize_locked() const;
    void commit(std::unique_lock<std::mutex>& lock);

    std::shared_ptr<DeviceStore_T> m_store;
    Scheduler_T& m_scheduler;
    CacheConfig m_config;
    log_callback_t m_log_callback;

    mutable std::mutex m_mutex;
    std::mutex m_publishMutex;
    std::map<std::string, CachedDevice> m_devices;
    Scheduler_T::timer_id_t m_sweepTimer { Scheduler_T::INVALID_TIMER };
    std::shared_ptr<SweepLifetime> m_sweepLifetime;
    devices_changed_signal_t m_devicesChanged;
};

} // namespace camscout

#endif // CAMSCOUT_DISCOVERY_CACHE_HPP

/** @} */
