/**
 * @file camera_protocol.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Control protocols a ConnectionManager negotiates between.
 * @{
 */
#ifndef CAMSCOUT_CAMERA_PROTOCOL_HPP
#define CAMSCOUT_CAMERA_PROTOCOL_HPP

#include "CommonTypes.hpp"
#include "dvrip_client.hpp"
#include "http_client.hpp"
#include "operation_result.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace camscout
{

/// Directions accepted by CameraProtocol_T::ptz().
/// "up", "down", "left", "right", "zoom_in", "zoom_out" and "stop".
bool is_ptz_command(const std::string& command);

class CameraProtocol_T
{
public:
    virtual ~CameraProtocol_T() = default;

    virtual ProtocolType type() const = 0;

    /// @brief Open the control channel and confirm the camera speaks this protocol.
    /// @return ok, network_error, protocol_error or auth_failed.
    virtual OperationStatus connect(std::chrono::milliseconds timeout) = 0;

    /// @brief Log in on an open channel.
    /// @return ok or auth_failed; network_error when the camera stopped answering.
    virtual OperationStatus authenticate(const Credentials& credentials) = 0;

    virtual void disconnect() = 0;

    virtual OperationResult<DeviceInformation> device_information() = 0;
    virtual OperationResult<std::vector<RecordingFile>> recordings(const RecordingQuery& query) = 0;
    virtual OperationResult<std::string> start_playback(const std::string& file_name) = 0;
    virtual OperationResult<bool> ptz(const std::string& command, int speed) = 0;
};


struct OnvifConfig
{
    std::string host;
    uint16_t port { 80 };
    std::string device_service { "/onvif/device_service" };
    std::string ptz_service { "/onvif/ptz_service" };
    std::string profile_token { "Profile_1" };
    std::string stream_url;                 ///< returned by start_playback()
    std::optional<Credentials> credentials; ///< WS-Security header of every call after connect()
};

/// @brief ONVIF device management and PTZ over SOAP/HTTP.
class OnvifProtocol : public CameraProtocol_T
{
public:
    OnvifProtocol(std::shared_ptr<HttpClient_T> http, OnvifConfig config, log_callback_t log_callback = nullptr);

    ProtocolType type() const override { return ProtocolType::onvif; }
    OperationStatus connect(std::chrono::milliseconds timeout) override;
    OperationStatus authenticate(const Credentials& credentials) override;
    void disconnect() override;
    OperationResult<DeviceInformation> device_information() override;
    OperationResult<std::vector<RecordingFile>> recordings(const RecordingQuery& query) override;
    OperationResult<std::string> start_playback(const std::string& file_name) override;
    OperationResult<bool> ptz(const std::string& command, int speed) override;

private:
    /// POST a SOAP body to path, signed with credentials when present.
    /// @return status and, on ok, the parsed response body text.
    std::pair<OperationStatus, std::string> call(const std::string& path, const std::string& action,
                                                 const std::string& body,
                                                 const std::optional<Credentials>& credentials,
                                                 std::chrono::milliseconds timeout);

    std::shared_ptr<HttpClient_T> m_http;
    OnvifConfig m_config;
    log_callback_t m_log_callback;
    bool m_connected { false };
    std::chrono::milliseconds m_timeout { 10000 };
};


struct DvripProtocolConfig
{
    std::string host;
    std::optional<uint16_t> port; ///< probed over DvripClient::default_ports() when unset
};

/// @brief CameraProtocol_T on top of the DVRIP session client.
class DvripProtocol : public CameraProtocol_T
{
public:
    DvripProtocol(std::shared_ptr<DvripConnection_T> connection, DvripProtocolConfig config,
                  log_callback_t log_callback = nullptr);

    ProtocolType type() const override { return ProtocolType::proprietary; }
    OperationStatus connect(std::chrono::milliseconds timeout) override;
    OperationStatus authenticate(const Credentials& credentials) override;
    void disconnect() override;
    OperationResult<DeviceInformation> device_information() override;
    OperationResult<std::vector<RecordingFile>> recordings(const RecordingQuery& query) override;
    OperationResult<std::string> start_playback(const std::string& file_name) override;
    OperationResult<bool> ptz(const std::string& command, int speed) override;

private:
    std::shared_ptr<DvripConnection_T> m_connection;
    DvripClient m_client;
    DvripProtocolConfig m_config;
    log_callback_t m_log_callback;
};


/// @brief SOAP 1.2 envelope around body, with a WS-Security UsernameToken header when credentials are given.
std::string make_soap_envelope(const std::string& body, const std::optional<Credentials>& credentials);

/// @brief UsernameToken password digest: base64(sha1(nonce + created + password)).
std::string ws_password_digest(const std::string& nonce, const std::string& created, const std::string& password);

} // namespace camscout

#endif // CAMSCOUT_CAMERA_PROTOCOL_HPP

/** @} */
