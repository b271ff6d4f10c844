/**
 * @file onvif_protocol.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * ONVIF device management and PTZ calls
 */
#include "camera_protocol.hpp"
#include "digest_util.hpp"
#include "log_macros.hpp"
#include "xml_util.hpp"

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace camscout
{

namespace
{

constexpr auto DEVICE_WSDL { "http://www.onvif.org/ver10/device/wsdl" };
constexpr auto PTZ_WSDL { "http://www.onvif.org/ver20/ptz/wsdl" };

std::string utc_timestamp(Clock::time_point when)
{
    const std::time_t t = Clock::to_time_t(when);
    std::tm tm {};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string random_nonce()
{
    static boost::uuids::random_generator s_gen;
    static std::mutex s_mutex;
    std::lock_guard<std::mutex> lock(s_mutex);
    const boost::uuids::uuid u = s_gen();
    return std::string(u.begin(), u.end());
}

/// Map a 1..8 speed onto an ONVIF velocity in (0, 1].
std::string velocity(int speed)
{
    const double v = std::min(1.0, std::max(0.1, speed / 8.0));
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

bool is_auth_fault(const xml::ptree& doc)
{
    auto fault = xml::descendant(doc, "Fault");
    if (!fault)
    {
        return false;
    }
    for (auto value : xml::descendants(*fault, "Value"))
    {
        auto v = xml::text(value);
        if (v.find("NotAuthorized") != std::string::npos || v.find("FailedAuthentication") != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

} // namespace


bool is_ptz_command(const std::string& command)
{
    static const std::vector<std::string> s_commands
        { "up", "down", "left", "right", "zoom_in", "zoom_out", "stop" };
    return std::find(s_commands.begin(), s_commands.end(), command) != s_commands.end();
}


std::string ws_password_digest(const std::string& nonce, const std::string& created, const std::string& password)
{
    const auto digest = sha1_digest(nonce + created + password);
    return base64_encode(std::string(digest.begin(), digest.end()));
}


std::string make_soap_envelope(const std::string& body, const std::optional<Credentials>& credentials)
{
    std::ostringstream ss;
    ss << R"(<?xml version="1.0" encoding="UTF-8"?>)"
       << R"(<s:Envelope xmlns:s="http://www.w3.org/2003/05/soap-envelope">)";
    if (credentials)
    {
        const auto nonce = random_nonce();
        const auto created = utc_timestamp(Clock::now());
        ss << "<s:Header>"
           << R"(<wsse:Security s:mustUnderstand="1" )"
           << R"(xmlns:wsse="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd" )"
           << R"(xmlns:wsu="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd">)"
           << "<wsse:UsernameToken>"
           << "<wsse:Username>" << xml::escape(credentials->username) << "</wsse:Username>"
           << R"(<wsse:Password Type="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest">)"
           << ws_password_digest(nonce, created, credentials->password) << "</wsse:Password>"
           << R"(<wsse:Nonce EncodingType="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary">)"
           << base64_encode(nonce) << "</wsse:Nonce>"
           << "<wsu:Created>" << created << "</wsu:Created>"
           << "</wsse:UsernameToken>"
           << "</wsse:Security>"
           << "</s:Header>";
    }
    ss << "<s:Body>" << body << "</s:Body>"
       << "</s:Envelope>";
    return ss.str();
}


OnvifProtocol::OnvifProtocol(std::shared_ptr<HttpClient_T> http, OnvifConfig config, log_callback_t log_callback) :
    m_http(std::move(http)),
    m_config(std::move(config)),
    m_log_callback(log_callback)
{
}


std::pair<OperationStatus, std::string> OnvifProtocol::call(const std::string& path, const std::string& action,
                                                            const std::string& body,
                                                            const std::optional<Credentials>& credentials,
                                                            std::chrono::milliseconds timeout)
{
    HttpRequest request {};
    request.method = "POST";
    request.url = "http://" + m_config.host + ":" + std::to_string(m_config.port) + path;
    request.headers["Content-Type"] = "application/soap+xml; charset=utf-8; action=\"" + action + "\"";
    request.body = make_soap_envelope(body, credentials);
    request.timeout = timeout;

    auto response = m_http->request(request);
    if (!response)
    {
        DBG("ONVIF " << action << " to " << m_config.host << " got no response", LOG_LVL_DBG_HI);
        return { OperationStatus::network_error, {} };
    }
    if (response->status == 401)
    {
        return { OperationStatus::auth_failed, {} };
    }
    auto doc = xml::parse(response->body);
    if (!doc)
    {
        DBG("ONVIF " << action << " answer is not XML (HTTP " << response->status << ")", LOG_LVL_DBG_HI);
        return { OperationStatus::protocol_error, {} };
    }
    if (is_auth_fault(*doc))
    {
        return { OperationStatus::auth_failed, {} };
    }
    if (response->status != 200)
    {
        DBG("ONVIF " << action << " failed with HTTP " << response->status, LOG_LVL_DBG_HI);
        return { OperationStatus::protocol_error, {} };
    }
    return { OperationStatus::ok, response->body };
}


OperationStatus OnvifProtocol::connect(std::chrono::milliseconds timeout)
{
    m_timeout = timeout;
    m_connected = false;
    // GetSystemDateAndTime is callable before authentication, a NotAuthorized fault still proves an ONVIF endpoint.
    const auto action = std::string(DEVICE_WSDL) + "/GetSystemDateAndTime";
    const auto body = std::string(R"(<tds:GetSystemDateAndTime xmlns:tds=")") + DEVICE_WSDL + R"("/>)";
    const auto status = call(m_config.device_service, action, body, std::nullopt, m_timeout).first;
    if (status != OperationStatus::ok && status != OperationStatus::auth_failed)
    {
        return status;
    }
    m_connected = true;
    return OperationStatus::ok;
}


OperationStatus OnvifProtocol::authenticate(const Credentials& credentials)
{
    m_config.credentials = credentials;
    auto result = device_information();
    if (!result.success)
    {
        return result.status;
    }
    m_connected = true;
    return OperationStatus::ok;
}


void OnvifProtocol::disconnect()
{
    m_connected = false;
}


OperationResult<DeviceInformation> OnvifProtocol::device_information()
{
    typedef OperationResult<DeviceInformation> result_t;
    const auto action = std::string(DEVICE_WSDL) + "/GetDeviceInformation";
    const auto body = std::string(R"(<tds:GetDeviceInformation xmlns:tds=")") + DEVICE_WSDL + R"("/>)";
    auto [status, text] = call(m_config.device_service, action, body, m_config.credentials, m_timeout);
    if (status != OperationStatus::ok)
    {
        return result_t::failure(status, "GetDeviceInformation failed: " + std::string(to_string(status)), ProtocolType::onvif);
    }
    auto doc = xml::parse(text);
    const xml::ptree* rsp = doc ? xml::descendant(*doc, "GetDeviceInformationResponse") : nullptr;
    if (!rsp)
    {
        return result_t::failure(OperationStatus::protocol_error, "missing GetDeviceInformationResponse", ProtocolType::onvif);
    }
    DeviceInformation info {};
    info.manufacturer = xml::child_text(*rsp, "Manufacturer");
    info.model = xml::child_text(*rsp, "Model");
    info.firmware_version = xml::child_text(*rsp, "FirmwareVersion");
    info.serial_number = xml::child_text(*rsp, "SerialNumber");
    info.hardware_id = xml::child_text(*rsp, "HardwareId");
    return result_t::ok(std::move(info), ProtocolType::onvif);
}


OperationResult<std::vector<RecordingFile>> OnvifProtocol::recordings(const RecordingQuery&)
{
    return OperationResult<std::vector<RecordingFile>>::failure(OperationStatus::unsupported,
        "ONVIF has no standard recording listing", ProtocolType::onvif);
}


OperationResult<std::string> OnvifProtocol::start_playback(const std::string&)
{
    if (m_config.stream_url.empty())
    {
        return OperationResult<std::string>::failure(OperationStatus::unsupported,
            "no stream URL configured", ProtocolType::onvif);
    }
    return OperationResult<std::string>::ok(m_config.stream_url, ProtocolType::onvif);
}


OperationResult<bool> OnvifProtocol::ptz(const std::string& command, int speed)
{
    typedef OperationResult<bool> result_t;
    if (!is_ptz_command(command))
    {
        return result_t::failure(OperationStatus::unsupported, "unknown PTZ command " + command, ProtocolType::onvif);
    }

    const auto token = "<tptz:ProfileToken>" + xml::escape(m_config.profile_token) + "</tptz:ProfileToken>";
    std::string action;
    std::ostringstream body;
    if (command == "stop")
    {
        action = std::string(PTZ_WSDL) + "/Stop";
        body << R"(<tptz:Stop xmlns:tptz=")" << PTZ_WSDL << R"(">)" << token
             << "<tptz:PanTilt>true</tptz:PanTilt><tptz:Zoom>true</tptz:Zoom></tptz:Stop>";
    }
    else
    {
        const auto v = velocity(speed);
        std::string x { "0" }, y { "0" }, z { "0" };
        if (command == "up") y = v;
        else if (command == "down") y = "-" + v;
        else if (command == "left") x = "-" + v;
        else if (command == "right") x = v;
        else if (command == "zoom_in") z = v;
        else z = "-" + v;

        action = std::string(PTZ_WSDL) + "/ContinuousMove";
        body << R"(<tptz:ContinuousMove xmlns:tptz=")" << PTZ_WSDL
             << R"(" xmlns:tt="http://www.onvif.org/ver10/schema">)" << token
             << "<tptz:Velocity>"
             << R"(<tt:PanTilt x=")" << x << R"(" y=")" << y << R"("/>)"
             << R"(<tt:Zoom x=")" << z << R"("/>)"
             << "</tptz:Velocity></tptz:ContinuousMove>";
    }

    const auto status = call(m_config.ptz_service, action, body.str(), m_config.credentials, m_timeout).first;
    if (status != OperationStatus::ok)
    {
        return result_t::failure(status, "PTZ " + command + " failed", ProtocolType::onvif);
    }
    return result_t::ok(true, ProtocolType::onvif);
}

} // namespace camscout
