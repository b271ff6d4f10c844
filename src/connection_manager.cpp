/**
 * @file connection_manager.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Protocol negotiation and connection state tracking for one camera
 */
#include "connection_manager.hpp"
#include "log_macros.hpp"

#include <thread>

namespace camscout
{

ConnectionManager::ConnectionManager(std::string camera_id,
                                     std::shared_ptr<CameraProtocol_T> onvif,
                                     std::shared_ptr<CameraProtocol_T> proprietary,
                                     ConnectionConfig config,
                                     log_callback_t log_callback) :
    m_camera_id(std::move(camera_id)),
    m_onvif(std::move(onvif)),
    m_proprietary(std::move(proprietary)),
    m_config(std::move(config)),
    m_log_callback(log_callback)
{
}


ConnectionManager::~ConnectionManager()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    close_active();
}


bool ConnectionManager::connect()
{
    return connect(m_config.connect_timeout);
}


bool ConnectionManager::connect(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (is_connected())
    {
        return true;
    }

    std::vector<std::shared_ptr<CameraProtocol_T>> candidates;
    switch (m_config.preferred)
    {
    case PreferredProtocol::onvif:
        candidates = { m_onvif };
        break;
    case PreferredProtocol::proprietary:
        candidates = { m_proprietary };
        break;
    case PreferredProtocol::automatic:
        candidates = { m_onvif, m_proprietary };
        break;
    }

    bool auth_rejected { false };
    OperationStatus status { OperationStatus::unsupported };
    for (const auto& protocol : candidates)
    {
        if (!protocol)
        {
            continue;
        }
        update_state(ConnectionState::connecting);
        status = try_protocol(protocol, timeout);
        if (status == OperationStatus::ok)
        {
            m_last_status = status;
            return true;
        }
        auth_rejected = auth_rejected || (status == OperationStatus::auth_failed);
    }

    m_last_status = auth_rejected ? OperationStatus::auth_failed : status;
    if (m_last_status == OperationStatus::unsupported)
    {
        report_error("no protocol available for " + std::string(to_string(m_config.preferred)) + " negotiation");
    }
    else
    {
        report_error("connection to " + m_camera_id + " failed: " + to_string(m_last_status));
    }
    return false;
}


OperationStatus ConnectionManager::try_protocol(const std::shared_ptr<CameraProtocol_T>& protocol,
                                                std::chrono::milliseconds timeout)
{
    const auto name = to_string(protocol->type());
    DBG(m_camera_id << ": trying " << name, LOG_LVL_DBG_HI);

    auto status = protocol->connect(timeout);
    if (status != OperationStatus::ok)
    {
        DBG(m_camera_id << ": " << name << " connect failed, " << to_string(status), LOG_LVL_DBG_HI);
        protocol->disconnect();
        return status;
    }

    m_active = protocol;
    update_state(ConnectionState::connected);
    if (!m_config.credentials)
    {
        DBG(m_camera_id << ": connected via " << name, LOG_LVL_INFO);
        return OperationStatus::ok;
    }

    update_state(ConnectionState::authenticating);
    status = protocol->authenticate(*m_config.credentials);
    if (status != OperationStatus::ok)
    {
        report_error(m_camera_id + ": " + name + " authentication failed");
        close_active();
        return status;
    }
    update_state(ConnectionState::authenticated);
    DBG(m_camera_id << ": authenticated via " << name, LOG_LVL_INFO);
    return OperationStatus::ok;
}


void ConnectionManager::disconnect()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    close_active();
    update_state(ConnectionState::disconnected);
}


bool ConnectionManager::reconnect()
{
    return reconnect(m_config.reconnect_settle, m_config.connect_timeout);
}


bool ConnectionManager::reconnect(std::chrono::milliseconds settle, std::chrono::milliseconds timeout)
{
    DBG(m_camera_id << ": reconnecting", LOG_LVL_INFO);
    disconnect();
    if (settle.count() > 0)
    {
        std::this_thread::sleep_for(settle);
    }
    return connect(timeout);
}


bool ConnectionManager::test_connection()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!is_connected())
    {
        return false;
    }
    auto result = device_information();
    if (!result.success)
    {
        report_error(m_camera_id + ": connection test failed, " + result.error);
        return false;
    }
    return true;
}


template <typename T, typename F>
OperationResult<T> ConnectionManager::dispatch(bool needs_authentication, const char* what, F&& f)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_active || !is_connected())
    {
        return OperationResult<T>::failure(OperationStatus::not_connected, "not connected to " + m_camera_id);
    }
    if (needs_authentication && m_config.credentials && !is_authenticated())
    {
        return OperationResult<T>::failure(OperationStatus::auth_failed, "not authenticated on " + m_camera_id,
                                           m_active->type());
    }
    try
    {
        auto result = f(*m_active);
        result.protocol_used = m_active->type();
        if (!result.success)
        {
            DBG(m_camera_id << ": " << what << " failed: " << result.error, LOG_LVL_DBG_HI);
        }
        return result;
    }
    catch (const std::exception& e)
    {
        ERR(m_camera_id << ": " << what << " raised " << e.what());
        return OperationResult<T>::failure(OperationStatus::protocol_error, e.what(), m_active->type());
    }
}


OperationResult<DeviceInformation> ConnectionManager::device_information()
{
    return dispatch<DeviceInformation>(false, "device information",
        [](CameraProtocol_T& p) { return p.device_information(); });
}


OperationResult<std::vector<RecordingFile>> ConnectionManager::recordings(const RecordingQuery& query)
{
    return dispatch<std::vector<RecordingFile>>(true, "recording listing",
        [&](CameraProtocol_T& p) { return p.recordings(query); });
}


OperationResult<std::string> ConnectionManager::start_playback(const std::string& file_name)
{
    return dispatch<std::string>(true, "playback",
        [&](CameraProtocol_T& p) { return p.start_playback(file_name); });
}


OperationResult<bool> ConnectionManager::ptz(const std::string& command, int speed)
{
    return dispatch<bool>(false, "ptz",
        [&](CameraProtocol_T& p) { return p.ptz(command, speed); });
}


bool ConnectionManager::is_connected() const
{
    const auto s = m_state.load();
    return s == ConnectionState::connected || s == ConnectionState::authenticated;
}


bool ConnectionManager::is_authenticated() const
{
    return m_state.load() == ConnectionState::authenticated;
}


std::optional<ProtocolType> ConnectionManager::active_protocol() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_active)
    {
        return std::nullopt;
    }
    return m_active->type();
}


OperationStatus ConnectionManager::last_status() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_last_status;
}


boost::signals2::connection ConnectionManager::on_state_change(const state_signal_t::slot_type& slot)
{
    return m_state_signal.connect(slot);
}


boost::signals2::connection ConnectionManager::on_error(const error_signal_t::slot_type& slot)
{
    return m_error_signal.connect(slot);
}


void ConnectionManager::close_active()
{
    if (m_active)
    {
        m_active->disconnect();
        m_active.reset();
    }
}


void ConnectionManager::update_state(ConnectionState state)
{
    if (m_state.exchange(state) == state)
    {
        return;
    }
    DBG(m_camera_id << ": state " << to_string(state), LOG_LVL_DBG_MID);
    m_state_signal(state);
}


void ConnectionManager::report_error(const std::string& message)
{
    ERR(message);
    update_state(ConnectionState::error);
    m_error_signal(message);
}

} // namespace camscout
