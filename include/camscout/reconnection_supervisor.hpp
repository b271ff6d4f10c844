/**
 * @file reconnection_supervisor.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Automatic reconnection of watched cameras with exponential backoff.
 * @{
 */
#ifndef CAMSCOUT_RECONNECTION_SUPERVISOR_HPP
#define CAMSCOUT_RECONNECTION_SUPERVISOR_HPP

#include "CommonTypes.hpp"
#include "connection_manager.hpp"
#include "scheduler.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{

struct ReconnectionConfig
{
    std::chrono::milliseconds initial_delay { 1000 };
    std::chrono::milliseconds max_delay { 300000 };
    double backoff_multiplier { 2.0 };
    unsigned max_attempts { 10 };
    std::chrono::milliseconds connection_timeout { 30000 };
    std::chrono::milliseconds settle_delay { 1000 };    ///< passed to ConnectionManager::reconnect()
    bool jitter_enabled { true };
    std::vector<std::chrono::milliseconds> custom_delays;   ///< delays for attempts 1..N, overriding the exponential schedule
};

/**
 * @brief Delay that follows failed attempt number attempt (1 based).
 * @param jitter_sample Uniform sample in [0, 1); ignored unless jitter is enabled.
 *  It scales the exponential delay by a factor in [0.95, 1.05).
 */
std::chrono::milliseconds backoff_delay(const ReconnectionConfig& config, unsigned attempt, double jitter_sample = 0.5);

struct ReconnectionAttempt
{
    unsigned attempt_number { 0 };
    Clock::time_point timestamp;
    std::chrono::milliseconds backoff_delay { 0 };
    std::string error;
    bool successful { false };
};

/// Snapshot of one camera's reconnection progress.
struct ReconnectionSession
{
    std::string camera_id;
    Clock::time_point start_time;
    ReconnectionConfig config;
    ReconnectionState state { ReconnectionState::idle };
    unsigned current_attempt { 0 };
    std::optional<Clock::time_point> last_attempt_time;
    std::string last_error;
    std::vector<ReconnectionAttempt> attempts;

    bool is_active() const
    {
        return state != ReconnectionState::idle && state != ReconnectionState::failed &&
               state != ReconnectionState::disabled;
    }
};

struct SupervisorStatistics
{
    bool global_enabled { true };
    std::size_t total_sessions { 0 };
    std::size_t active_sessions { 0 };
    std::size_t watched_cameras { 0 };
    std::map<ReconnectionState, std::size_t> sessions_by_state;
    bool health_check_active { false };
};

/**
 * @brief Keeps watched cameras connected.
 *
 * A session starts when a watched ConnectionManager enters the error state,
 * when the periodic health check finds a connected camera unresponsive, or on
 * request. Each attempt runs on the scheduler: the first one immediately, the
 * following ones after backoff_delay() of the attempt that just failed. A
 * successful attempt removes the session; once max_attempts have failed the
 * session stays in the failed state until it is restarted.
 */
class ReconnectionSupervisor
{
public:
    static constexpr std::chrono::milliseconds HEALTH_CHECK_INTERVAL { 30000 };

    ReconnectionSupervisor(Scheduler_T& scheduler, log_callback_t log_callback = nullptr);
    ~ReconnectionSupervisor();

    ReconnectionSupervisor(const ReconnectionSupervisor&) = delete;
    ReconnectionSupervisor& operator=(const ReconnectionSupervisor&) = delete;

    /// Supervise manager under its camera id. Replaces an earlier manager with the same id.
    void watch(std::shared_ptr<ConnectionManager> manager);
    /// Stop supervising, disposing any session.
    void unwatch(const std::string& camera_id);

    void configure_camera(const std::string& camera_id, const ReconnectionConfig& config);

    /// @brief Start a fresh session, replacing an existing one.
    /// @return false if the supervisor is disabled or the camera is not watched.
    bool start_reconnection(const std::string& camera_id, const std::string& reason = {});
    void stop_reconnection(const std::string& camera_id);

    /// @brief Cancel the pending backoff and attempt now.
    /// @return The outcome of the attempt; false if there is no session.
    bool force_reconnection(const std::string& camera_id);

    /// Disabling disposes every session. Enabling resumes event driven and health check sessions.
    void set_enabled(bool enabled);
    bool enabled() const;

    ReconnectionState state_of(const std::string& camera_id) const;
    std::optional<ReconnectionSession> session(const std::string& camera_id) const;
    std::vector<ReconnectionSession> active_sessions() const;
    SupervisorStatistics statistics() const;

    /// Run the health check now instead of waiting for the timer.
    void check_health();

    /// Diagnostics export of the statistics and every session.
    nlohmann::json to_json() const;

private:
    struct Impl;
    std::shared_ptr<Impl> pimpl;
};

void to_json(nlohmann::json& j, const ReconnectionSession& session);

} // namespace camscout

#endif // CAMSCOUT_RECONNECTION_SUPERVISOR_HPP

/** @} */
