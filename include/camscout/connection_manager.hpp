/**
 * @file connection_manager.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Per-camera connection state machine with ONVIF / DVRIP negotiation.
 * @{
 */
#ifndef CAMSCOUT_CONNECTION_MANAGER_HPP
#define CAMSCOUT_CONNECTION_MANAGER_HPP

#include "CommonTypes.hpp"
#include "camera_protocol.hpp"
#include "operation_result.hpp"
#include <atomic>
#include <boost/signals2.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{

struct ConnectionConfig
{
    PreferredProtocol preferred { PreferredProtocol::automatic };
    std::optional<Credentials> credentials;
    std::chrono::milliseconds connect_timeout { 10000 };
    std::chrono::milliseconds reconnect_settle { 1000 };    ///< pause between disconnect and connect in reconnect()
};

/**
 * @brief Owns the control connection to one camera.
 *
 * State moves disconnected -> connecting -> connected [-> authenticating -> authenticated],
 * or to error from any in-flight state. disconnect() always returns to disconnected.
 *
 * Slots connected to the state and error signals run on the thread performing the
 * transition and must not call back into the ConnectionManager.
 */
class ConnectionManager
{
public:
    typedef boost::signals2::signal<void (ConnectionState)> state_signal_t;
    typedef boost::signals2::signal<void (const std::string&)> error_signal_t;

    /// Either protocol may be null, in which case negotiation never selects it.
    ConnectionManager(std::string camera_id,
                      std::shared_ptr<CameraProtocol_T> onvif,
                      std::shared_ptr<CameraProtocol_T> proprietary,
                      ConnectionConfig config,
                      log_callback_t log_callback = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Negotiate a protocol and log in when credentials are configured.
    ///  With the automatic policy ONVIF is tried first and the proprietary protocol second.
    ///  A login rejected over ONVIF still moves on to the proprietary protocol, which may
    ///  accept the same credentials.
    /// @return true once connected and, if credentials are configured, authenticated.
    ///  last_status() tells a rejected login apart from an unreachable camera, and stays
    ///  auth_failed when any protocol rejected the login and none succeeded.
    bool connect();
    bool connect(std::chrono::milliseconds timeout);

    void disconnect();

    /// disconnect(), wait for settle, connect() with the same policy.
    bool reconnect();
    bool reconnect(std::chrono::milliseconds settle, std::chrono::milliseconds timeout);

    /// A cheap round trip over the active protocol.
    bool test_connection();

    OperationResult<DeviceInformation> device_information();
    OperationResult<std::vector<RecordingFile>> recordings(const RecordingQuery& query);
    OperationResult<std::string> start_playback(const std::string& file_name);
    OperationResult<bool> ptz(const std::string& command, int speed = 4);

    ConnectionState state() const { return m_state.load(); }
    bool is_connected() const;
    bool is_authenticated() const;
    std::optional<ProtocolType> active_protocol() const;

    /// Outcome of the last connect(): ok, network_error, protocol_error or auth_failed.
    OperationStatus last_status() const;

    const std::string& camera_id() const { return m_camera_id; }
    const ConnectionConfig& config() const { return m_config; }

    boost::signals2::connection on_state_change(const state_signal_t::slot_type& slot);
    boost::signals2::connection on_error(const error_signal_t::slot_type& slot);

private:
    OperationStatus try_protocol(const std::shared_ptr<CameraProtocol_T>& protocol, std::chrono::milliseconds timeout);
    void close_active();
    void update_state(ConnectionState state);
    void report_error(const std::string& message);

    template <typename T, typename F>
    OperationResult<T> dispatch(bool needs_authentication, const char* what, F&& f);

    const std::string m_camera_id;
    std::shared_ptr<CameraProtocol_T> m_onvif;
    std::shared_ptr<CameraProtocol_T> m_proprietary;
    const ConnectionConfig m_config;
    log_callback_t m_log_callback;

    mutable std::recursive_mutex m_mutex;
    std::atomic<ConnectionState> m_state { ConnectionState::disconnected };
    std::shared_ptr<CameraProtocol_T> m_active;
    OperationStatus m_last_status { OperationStatus::not_connected };

    state_signal_t m_state_signal;
    error_signal_t m_error_signal;
};

} // namespace camscout

#endif // CAMSCOUT_CONNECTION_MANAGER_HPP

/** @} */
