/**
 * @file dvrip_protocol.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * CameraProtocol_T adapter for the DVRIP client
 */
#include "camera_protocol.hpp"
#include "log_macros.hpp"

#include <algorithm>
#include <map>

namespace camscout
{

DvripProtocol::DvripProtocol(std::shared_ptr<DvripConnection_T> connection, DvripProtocolConfig config,
                             log_callback_t log_callback) :
    m_connection(std::move(connection)),
    m_client(m_connection, log_callback),
    m_config(std::move(config)),
    m_log_callback(log_callback)
{
}


OperationStatus DvripProtocol::connect(std::chrono::milliseconds timeout)
{
    if (!m_config.port)
    {
        // The first port that answers is kept for later reconnects.
        m_config.port = probe_dvrip_ports(*m_connection, m_config.host, DvripClient::default_ports(), timeout, timeout,
                                          m_log_callback);
        if (!m_config.port)
        {
            return OperationStatus::network_error;
        }
    }
    const auto port = *m_config.port;
    if (!m_client.connect(m_config.host, port, timeout))
    {
        return OperationStatus::network_error;
    }
    if (!m_client.probe())
    {
        DBG(m_config.host << ":" << port << " does not answer DVRIP", LOG_LVL_DBG_HI);
        m_client.logout();
        return OperationStatus::protocol_error;
    }
    return OperationStatus::ok;
}


OperationStatus DvripProtocol::authenticate(const Credentials& credentials)
{
    auto accepted = m_client.login(credentials.username, credentials.password);
    if (!accepted)
    {
        return m_client.is_connected() ? OperationStatus::protocol_error : OperationStatus::network_error;
    }
    return *accepted ? OperationStatus::ok : OperationStatus::auth_failed;
}


void DvripProtocol::disconnect()
{
    m_client.logout();
}


OperationResult<DeviceInformation> DvripProtocol::device_information()
{
    typedef OperationResult<DeviceInformation> result_t;
    DeviceInformation info {};
    info.extra["protocol"] = "DVRIP-Web";
    info.extra["port"] = std::to_string(m_client.port());
    if (!m_client.is_logged_in())
    {
        // Without a session only the transport details are known.
        return result_t::ok(std::move(info), ProtocolType::proprietary);
    }
    auto sysinfo = m_client.system_info();
    if (!sysinfo)
    {
        const auto status = m_client.is_connected() ? OperationStatus::protocol_error : OperationStatus::network_error;
        return result_t::failure(status, "SystemInfo request failed", ProtocolType::proprietary);
    }
    info.model = sysinfo->device_model;
    info.firmware_version = sysinfo->software_version;
    info.serial_number = sysinfo->serial_number;
    info.hardware_id = sysinfo->hardware;
    info.extra["build_time"] = sysinfo->build_time;
    info.extra["video_channels"] = std::to_string(sysinfo->video_channels);
    info.extra["session_id"] = format_session_id(*m_client.session_id());
    return result_t::ok(std::move(info), ProtocolType::proprietary);
}


OperationResult<std::vector<RecordingFile>> DvripProtocol::recordings(const RecordingQuery& query)
{
    typedef OperationResult<std::vector<RecordingFile>> result_t;
    auto files = m_client.find_recordings(query);
    if (!files)
    {
        const auto status = m_client.is_connected() ? OperationStatus::protocol_error : OperationStatus::network_error;
        return result_t::failure(status, "file query failed", ProtocolType::proprietary);
    }
    return result_t::ok(std::move(*files), ProtocolType::proprietary);
}


OperationResult<std::string> DvripProtocol::start_playback(const std::string& file_name)
{
    auto url = m_client.start_playback(file_name);
    if (!url)
    {
        return OperationResult<std::string>::failure(OperationStatus::protocol_error,
            "playback claim for " + file_name + " was refused", ProtocolType::proprietary);
    }
    return OperationResult<std::string>::ok(*url, ProtocolType::proprietary);
}


OperationResult<bool> DvripProtocol::ptz(const std::string& command, int speed)
{
    static const std::map<std::string, std::string> s_directions
    {
        { "up", "DirectionUp" },
        { "down", "DirectionDown" },
        { "left", "DirectionLeft" },
        { "right", "DirectionRight" },
        { "zoom_in", "ZoomTile" },
        { "zoom_out", "ZoomWide" },
        { "stop", "DirectionUp" },
    };
    auto it = s_directions.find(command);
    if (it == s_directions.end())
    {
        return OperationResult<bool>::failure(OperationStatus::unsupported,
            "unknown PTZ command " + command, ProtocolType::proprietary);
    }
    PtzCommand ptz {};
    ptz.direction = it->second;
    ptz.step = static_cast<uint32_t>(std::max(1, speed));
    ptz.stop = (command == "stop");
    if (!m_client.ptz(ptz))
    {
        return OperationResult<bool>::failure(OperationStatus::protocol_error,
            "PTZ " + command + " was refused", ProtocolType::proprietary);
    }
    return OperationResult<bool>::ok(true, ProtocolType::proprietary);
}

} // namespace camscout
