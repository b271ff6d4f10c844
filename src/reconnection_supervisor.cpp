/**
 * @file reconnection_supervisor.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Backoff scheduling of reconnection attempts
 */
#include "reconnection_supervisor.hpp"
#include "log_macros.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>

namespace camscout
{
using json = nlohmann::json;
using namespace std::chrono;

std::chrono::milliseconds backoff_delay(const ReconnectionConfig& config, unsigned attempt, double jitter_sample)
{
    if (attempt == 0)
    {
        attempt = 1;
    }
    if (attempt <= config.custom_delays.size())
    {
        return config.custom_delays[attempt - 1];
    }
    double delay_ms = static_cast<double>(config.initial_delay.count()) *
                      std::pow(config.backoff_multiplier, static_cast<double>(attempt - 1));
    if (config.jitter_enabled)
    {
        delay_ms *= 1.0 + jitter_sample * 0.1 - 0.05;
    }
    const double max_ms = static_cast<double>(config.max_delay.count());
    return milliseconds(static_cast<milliseconds::rep>(std::llround(std::min(delay_ms, max_ms))));
}


namespace
{

/// Bookkeeping next to the public snapshot.
struct SessionEntry
{
    ReconnectionSession session;
    Scheduler_T::timer_id_t timer { Scheduler_T::INVALID_TIMER };
    uint64_t generation { 0 };
    bool in_attempt { false };
};

struct WatchedCamera
{
    std::shared_ptr<ConnectionManager> manager;
    boost::signals2::scoped_connection state_connection;
};

int64_t epoch_ms(Clock::time_point t)
{
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

} // namespace


struct ReconnectionSupervisor::Impl : public std::enable_shared_from_this<ReconnectionSupervisor::Impl>
{
    Scheduler_T& m_scheduler;
    log_callback_t m_log_callback;

    mutable std::mutex m_mutex;
    bool m_enabled { true };
    bool m_closed { false };
    uint64_t m_next_generation { 1 };
    std::map<std::string, SessionEntry> m_sessions;
    std::map<std::string, ReconnectionConfig> m_configs;
    std::map<std::string, std::unique_ptr<WatchedCamera>> m_cameras;
    Scheduler_T::timer_id_t m_health_timer { Scheduler_T::INVALID_TIMER };
    std::mt19937 m_rng { std::random_device{}() };

    Impl(Scheduler_T& scheduler, log_callback_t log_callback) :
        m_scheduler(scheduler),
        m_log_callback(log_callback)
    {
    }

    ReconnectionConfig config_for(const std::string& id) const
    {
        auto it = m_configs.find(id);
        return it == m_configs.end() ? ReconnectionConfig {} : it->second;
    }

    /// Create a session and schedule its first attempt. Caller holds m_mutex.
    void start_locked(const std::string& id, const std::string& reason);
    /// Cancel timers and drop a session. Caller holds m_mutex.
    void dispose_locked(const std::string& id);
    void schedule_attempt_locked(SessionEntry& entry, milliseconds delay);

    bool run_attempt(const std::string& id, uint64_t generation);
    void on_state_change(const std::string& id, ConnectionState state);
    void schedule_health_check();
    void check_health();
};


void ReconnectionSupervisor::Impl::start_locked(const std::string& id, const std::string& reason)
{
    dispose_locked(id);
    SessionEntry entry {};
    entry.session.camera_id = id;
    entry.session.start_time = m_scheduler.now();
    entry.session.config = config_for(id);
    entry.session.state = ReconnectionState::attempting;
    entry.generation = m_next_generation++;
    auto& stored = m_sessions.emplace(id, std::move(entry)).first->second;
    DBG("Starting reconnection of " << id << (reason.empty() ? "" : ": ") << reason, LOG_LVL_INFO);
    schedule_attempt_locked(stored, milliseconds(0));
}


void ReconnectionSupervisor::Impl::dispose_locked(const std::string& id)
{
    auto it = m_sessions.find(id);
    if (it == m_sessions.end())
    {
        return;
    }
    if (it->second.timer != Scheduler_T::INVALID_TIMER)
    {
        m_scheduler.cancel(it->second.timer);
    }
    it->second.session.state = ReconnectionState::disabled;
    m_sessions.erase(it);
    DBG("Reconnection of " << id << " stopped", LOG_LVL_DBG_HI);
}


void ReconnectionSupervisor::Impl::schedule_attempt_locked(SessionEntry& entry, milliseconds delay)
{
    std::weak_ptr<Impl> weak = shared_from_this();
    const auto id = entry.session.camera_id;
    const auto generation = entry.generation;
    entry.timer = m_scheduler.schedule_after(delay, [weak, id, generation]()
        {
            if (auto self = weak.lock())
            {
                self->run_attempt(id, generation);
            }
        });
}


bool ReconnectionSupervisor::Impl::run_attempt(const std::string& id, uint64_t generation)
{
    std::shared_ptr<ConnectionManager> manager;
    ReconnectionConfig config;
    unsigned attempt_number { 0 };
    milliseconds delay { 0 };
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(id);
        if (m_closed || it == m_sessions.end() || it->second.generation != generation || it->second.in_attempt)
        {
            return false;
        }
        auto& entry = it->second;
        entry.timer = Scheduler_T::INVALID_TIMER;
        config = entry.session.config;
        if (entry.session.current_attempt >= config.max_attempts)
        {
            entry.session.state = ReconnectionState::failed;
            ERR("Maximum reconnection attempts reached for " << id);
            return false;
        }
        auto cam = m_cameras.find(id);
        if (cam == m_cameras.end())
        {
            dispose_locked(id);
            return false;
        }
        manager = cam->second->manager;
        attempt_number = entry.session.current_attempt + 1;
        std::uniform_real_distribution<double> jitter(0.0, 1.0);
        delay = backoff_delay(config, attempt_number, jitter(m_rng));
        entry.session.state = ReconnectionState::attempting;
        entry.in_attempt = true;
    }

    DBG("Reconnection attempt " << attempt_number << " for " << id, LOG_LVL_INFO);
    bool ok { false };
    std::string error;
    try
    {
        ok = manager->reconnect(config.settle_delay, config.connection_timeout);
        if (!ok)
        {
            error = to_string(manager->last_status());
        }
    }
    catch (const std::exception& e)
    {
        error = e.what();
        ERR("Reconnection attempt " << attempt_number << " for " << id << " raised " << e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(id);
    if (it == m_sessions.end() || it->second.generation != generation)
    {
        // Stopped or restarted while the attempt was running.
        return ok;
    }
    auto& entry = it->second;
    entry.in_attempt = false;

    ReconnectionAttempt attempt {};
    attempt.attempt_number = attempt_number;
    attempt.timestamp = m_scheduler.now();
    attempt.backoff_delay = delay;
    attempt.error = error;
    attempt.successful = ok;
    entry.session.attempts.push_back(attempt);
    entry.session.current_attempt = attempt_number;
    entry.session.last_attempt_time = attempt.timestamp;
    entry.session.last_error = error;

    if (ok)
    {
        DBG("Reconnected " << id << " on attempt " << attempt_number, LOG_LVL_INFO);
        entry.session.state = ReconnectionState::idle;
        m_sessions.erase(it);
        return true;
    }

    if (attempt_number >= config.max_attempts)
    {
        entry.session.state = ReconnectionState::failed;
        ERR("Maximum reconnection attempts reached for " << id);
        return false;
    }
    DBG("Attempt " << attempt_number << " for " << id << " failed (" << error << "), next in "
        << delay.count() << "ms", LOG_LVL_DBG_HI);
    entry.session.state = ReconnectionState::backing_off;
    schedule_attempt_locked(entry, delay);
    return false;
}


void ReconnectionSupervisor::Impl::on_state_change(const std::string& id, ConnectionState state)
{
    if (state != ConnectionState::error)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed || !m_enabled || m_cameras.count(id) == 0)
    {
        return;
    }
    // Failures inside our own attempt are handled by the attempt itself.
    if (m_sessions.count(id) != 0)
    {
        return;
    }
    start_locked(id, "connection error");
}


void ReconnectionSupervisor::Impl::schedule_health_check()
{
    std::weak_ptr<Impl> weak = shared_from_this();
    m_health_timer = m_scheduler.schedule_after(HEALTH_CHECK_INTERVAL, [weak]()
        {
            if (auto self = weak.lock())
            {
                self->check_health();
                std::lock_guard<std::mutex> lock(self->m_mutex);
                if (!self->m_closed)
                {
                    self->schedule_health_check();
                }
            }
        });
}


void ReconnectionSupervisor::Impl::check_health()
{
    std::vector<std::shared_ptr<ConnectionManager>> connected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || !m_enabled)
        {
            return;
        }
        for (const auto& cam : m_cameras)
        {
            if (m_sessions.count(cam.first) == 0 && cam.second->manager->is_connected())
            {
                connected.push_back(cam.second->manager);
            }
        }
    }

    for (const auto& manager : connected)
    {
        bool healthy { false };
        try
        {
            healthy = manager->test_connection();
        }
        catch (const std::exception& e)
        {
            ERR("Health check of " << manager->camera_id() << " raised " << e.what());
        }
        if (healthy)
        {
            continue;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto& id = manager->camera_id();
        if (!m_closed && m_enabled && m_cameras.count(id) != 0 && m_sessions.count(id) == 0)
        {
            DBG("Health check found " << id << " unresponsive", LOG_LVL_INFO);
            start_locked(id, "health check failed");
        }
    }
}


ReconnectionSupervisor::ReconnectionSupervisor(Scheduler_T& scheduler, log_callback_t log_callback) :
    pimpl { std::make_shared<Impl>(scheduler, log_callback) }
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    pimpl->schedule_health_check();
}


ReconnectionSupervisor::~ReconnectionSupervisor()
{
    std::map<std::string, std::unique_ptr<WatchedCamera>> cameras;
    {
        std::lock_guard<std::mutex> lock(pimpl->m_mutex);
        pimpl->m_closed = true;
        pimpl->m_scheduler.cancel(pimpl->m_health_timer);
        for (auto& entry : pimpl->m_sessions)
        {
            if (entry.second.timer != Scheduler_T::INVALID_TIMER)
            {
                pimpl->m_scheduler.cancel(entry.second.timer);
            }
        }
        pimpl->m_sessions.clear();
        cameras.swap(pimpl->m_cameras);
    }
    // Disconnect the slots outside the lock, a slot may be waiting on it.
    cameras.clear();
}


void ReconnectionSupervisor::watch(std::shared_ptr<ConnectionManager> manager)
{
    const auto id = manager->camera_id();
    auto watched = std::make_unique<WatchedCamera>();
    watched->manager = manager;
    std::weak_ptr<Impl> weak = pimpl;
    watched->state_connection = manager->on_state_change([weak, id](ConnectionState state)
        {
            if (auto self = weak.lock())
            {
                self->on_state_change(id, state);
            }
        });

    std::unique_ptr<WatchedCamera> previous;
    {
        std::lock_guard<std::mutex> lock(pimpl->m_mutex);
        pimpl->dispose_locked(id);
        auto& slot = pimpl->m_cameras[id];
        previous = std::move(slot);
        slot = std::move(watched);
    }
    auto& m_log_callback = pimpl->m_log_callback;
    DBG("Watching " << id, LOG_LVL_DBG_HI);
}


void ReconnectionSupervisor::unwatch(const std::string& camera_id)
{
    std::unique_ptr<WatchedCamera> previous;
    {
        std::lock_guard<std::mutex> lock(pimpl->m_mutex);
        pimpl->dispose_locked(camera_id);
        auto it = pimpl->m_cameras.find(camera_id);
        if (it == pimpl->m_cameras.end())
        {
            return;
        }
        previous = std::move(it->second);
        pimpl->m_cameras.erase(it);
    }
}


void ReconnectionSupervisor::configure_camera(const std::string& camera_id, const ReconnectionConfig& config)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    pimpl->m_configs[camera_id] = config;
}


bool ReconnectionSupervisor::start_reconnection(const std::string& camera_id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto& m_log_callback = pimpl->m_log_callback;
    if (!pimpl->m_enabled)
    {
        DBG("Reconnection is disabled, not starting " << camera_id, LOG_LVL_INFO);
        return false;
    }
    if (pimpl->m_cameras.count(camera_id) == 0)
    {
        ERR("Cannot reconnect unknown camera " << camera_id);
        return false;
    }
    pimpl->start_locked(camera_id, reason);
    return true;
}


void ReconnectionSupervisor::stop_reconnection(const std::string& camera_id)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    pimpl->dispose_locked(camera_id);
}


bool ReconnectionSupervisor::force_reconnection(const std::string& camera_id)
{
    uint64_t generation { 0 };
    {
        std::lock_guard<std::mutex> lock(pimpl->m_mutex);
        auto& m_log_callback = pimpl->m_log_callback;
        auto it = pimpl->m_sessions.find(camera_id);
        if (it == pimpl->m_sessions.end())
        {
            DBG("Forced reconnection of " << camera_id << " without a session", LOG_LVL_INFO);
            return false;
        }
        if (it->second.timer != Scheduler_T::INVALID_TIMER)
        {
            pimpl->m_scheduler.cancel(it->second.timer);
            it->second.timer = Scheduler_T::INVALID_TIMER;
        }
        generation = it->second.generation;
    }
    return pimpl->run_attempt(camera_id, generation);
}


void ReconnectionSupervisor::set_enabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto& m_log_callback = pimpl->m_log_callback;
    pimpl->m_enabled = enabled;
    if (!enabled)
    {
        std::vector<std::string> ids;
        for (const auto& entry : pimpl->m_sessions)
        {
            ids.push_back(entry.first);
        }
        for (const auto& id : ids)
        {
            pimpl->dispose_locked(id);
        }
    }
    DBG("Automatic reconnection " << (enabled ? "enabled" : "disabled"), LOG_LVL_INFO);
}


bool ReconnectionSupervisor::enabled() const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    return pimpl->m_enabled;
}


ReconnectionState ReconnectionSupervisor::state_of(const std::string& camera_id) const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto it = pimpl->m_sessions.find(camera_id);
    return it == pimpl->m_sessions.end() ? ReconnectionState::idle : it->second.session.state;
}


std::optional<ReconnectionSession> ReconnectionSupervisor::session(const std::string& camera_id) const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto it = pimpl->m_sessions.find(camera_id);
    if (it == pimpl->m_sessions.end())
    {
        return std::nullopt;
    }
    return it->second.session;
}


std::vector<ReconnectionSession> ReconnectionSupervisor::active_sessions() const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    std::vector<ReconnectionSession> result;
    for (const auto& entry : pimpl->m_sessions)
    {
        if (entry.second.session.is_active())
        {
            result.push_back(entry.second.session);
        }
    }
    return result;
}


SupervisorStatistics ReconnectionSupervisor::statistics() const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    SupervisorStatistics stats {};
    stats.global_enabled = pimpl->m_enabled;
    stats.total_sessions = pimpl->m_sessions.size();
    stats.watched_cameras = pimpl->m_cameras.size();
    stats.health_check_active = !pimpl->m_closed && pimpl->m_health_timer != Scheduler_T::INVALID_TIMER;
    for (auto s : { ReconnectionState::idle, ReconnectionState::attempting, ReconnectionState::backing_off,
                    ReconnectionState::failed, ReconnectionState::disabled })
    {
        stats.sessions_by_state[s] = 0;
    }
    for (const auto& entry : pimpl->m_sessions)
    {
        ++stats.sessions_by_state[entry.second.session.state];
        if (entry.second.session.is_active())
        {
            ++stats.active_sessions;
        }
    }
    return stats;
}


void ReconnectionSupervisor::check_health()
{
    pimpl->check_health();
}


void to_json(json& j, const ReconnectionSession& session)
{
    json attempts = json::array();
    for (const auto& a : session.attempts)
    {
        attempts.push_back({
            { "attemptNumber", a.attempt_number },
            { "timestamp", epoch_ms(a.timestamp) },
            { "backoffDelay", a.backoff_delay.count() },
            { "error", a.error },
            { "successful", a.successful } });
    }
    j = json {
        { "cameraId", session.camera_id },
        { "startTime", epoch_ms(session.start_time) },
        { "state", to_string(session.state) },
        { "currentAttempt", session.current_attempt },
        { "lastAttemptTime", session.last_attempt_time ? json(epoch_ms(*session.last_attempt_time)) : json(nullptr) },
        { "lastError", session.last_error },
        { "attempts", attempts },
        { "config", {
            { "initialDelay", session.config.initial_delay.count() },
            { "maxDelay", session.config.max_delay.count() },
            { "backoffMultiplier", session.config.backoff_multiplier },
            { "maxAttempts", session.config.max_attempts },
            { "connectionTimeout", session.config.connection_timeout.count() },
            { "enableJitter", session.config.jitter_enabled } } }
    };
}


json ReconnectionSupervisor::to_json() const
{
    const auto stats = statistics();
    json by_state = json::object();
    for (const auto& entry : stats.sessions_by_state)
    {
        by_state[to_string(entry.first)] = entry.second;
    }
    json sessions = json::object();
    {
        std::lock_guard<std::mutex> lock(pimpl->m_mutex);
        for (const auto& entry : pimpl->m_sessions)
        {
            sessions[entry.first] = entry.second.session;
        }
    }
    return json {
        { "globalEnabled", stats.global_enabled },
        { "totalSessions", stats.total_sessions },
        { "activeSessions", stats.active_sessions },
        { "sessionsByState", by_state },
        { "sessions", sessions },
        { "healthCheckActive", stats.health_check_active }
    };
}

} // namespace camscout
