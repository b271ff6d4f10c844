/**
 * @file device_validator.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Multi-layer validation of discovered devices
 */
#include "device_validator.hpp"
#include "camera_ports.hpp"
#include "dvrip_client.hpp"
#include "DvripCommand_IF.hpp"
#include "log_macros.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>

namespace camscout
{
using boost::algorithm::contains;
using boost::algorithm::to_lower_copy;

namespace
{

const std::vector<std::string> s_routerIndicators
{
    "<title>router", "<title>wireless", "<title>tp-link", "<title>d-link",
    "<title>netgear", "<title>linksys", "<title>asus", "<title>tenda",
    "<title>mercusys", "<title>intelbras", "<title>multilaser",
    "wireless settings", "router configuration", "admin panel",
    "network settings", "wifi settings", "dhcp settings",
    "port forwarding", "firewall settings", "wan settings",
    "lan settings", "wireless security", "access control",
    "tp-link", "d-link", "netgear", "linksys", "asus router",
    "tenda router", "mercusys", "intelbras router",
    "/cgi-bin/luci", "/userrpm/", "/webpages/", "/goform/",
    "/boaform/", "/goahead/", "/cgi-bin/webproc",
};

// Embedded servers shared by routers and cameras, only conclusive with router-ish content.
const std::vector<std::string> s_routerServers
{
    "lighttpd", "boa", "goahead", "mini_httpd", "thttpd", "webserver", "router", "embedded"
};

const std::vector<std::string> s_cameraKeywords
{
    "camera", "ipcam", "webcam", "video", "stream", "onvif",
    "hikvision", "dahua", "axis", "foscam", "surveillance"
};

ValidationLayer layer(const char* name, bool valid, std::string message)
{
    return ValidationLayer { name, valid, std::move(message) };
}

} // namespace


DeviceValidator::DeviceValidator(std::shared_ptr<TcpProber_T> prober,
                                 std::shared_ptr<HttpClient_T> http,
                                 std::shared_ptr<TcpExchange_T> exchange,
                                 ValidatorConfig config,
                                 log_callback_t log_callback) :
    m_prober(std::move(prober)),
    m_http(std::move(http)),
    m_exchange(std::move(exchange)),
    m_blacklist(log_callback),
    m_config(config),
    m_log_callback(log_callback)
{
}


ValidationResult DeviceValidator::validate(const DiscoveredCandidate& device)
{
    ValidationResult result {};
    result.device = device;

    auto reason = m_blacklist.filter_reason(DeviceSignals::from_candidate(device));
    result.layers.push_back(layer("blacklist", !reason, reason.value_or("not blacklisted")));
    if (reason)
    {
        result.reason = "blacklisted: " + *reason;
        return result;
    }

    result.layers.push_back(check_connectivity(device));
    if (!result.layers.back().valid)
    {
        result.reason = "not reachable";
        return result;
    }

    result.layers.push_back(check_protocol(device));
    if (!result.layers.back().valid)
    {
        result.reason = "protocol check failed: " + result.layers.back().message;
        return result;
    }

    result.valid = true;
    result.reason = "validated";
    DBG(device.ip << ":" << device.port << " validated as " << device.protocol, LOG_LVL_DBG_HI);
    return result;
}


ValidationLayer DeviceValidator::check_connectivity(const DiscoveredCandidate& device)
{
    auto hits = m_prober->probe_batch({ ScanEndpoint { device.ip, device.port } }, m_config.quick_timeout);
    if (hits.empty())
    {
        return layer("connectivity", false, "no TCP connection");
    }
    return layer("connectivity", true, "connected in " + std::to_string(hits.front().response_time.count()) + "ms");
}


ValidationLayer DeviceValidator::check_protocol(const DiscoveredCandidate& device)
{
    if (device.protocol == "RTSP")
        return check_rtsp(device);
    if (device.protocol == "HTTP")
        return check_http(device);
    if (device.protocol == "ONVIF")
        return check_onvif(device);
    if (device.protocol == "UPNP")
        return layer("protocol", true, "UPnP descriptor already parsed");
    const auto& dvrip = DvripClient::default_ports();
    if (std::find(dvrip.begin(), dvrip.end(), device.port) != dvrip.end())
        return check_dvrip(device);
    return layer("protocol", false, "unknown protocol " + device.protocol);
}


ValidationLayer DeviceValidator::check_rtsp(const DiscoveredCandidate& device)
{
    TcpExchangeRequest request {};
    request.host = device.ip;
    request.port = device.port;
    request.timeout = m_config.validation_timeout;
    request.terminator = "\r\n\r\n";
    request.payload = "OPTIONS rtsp://" + device.ip + ":" + std::to_string(device.port) + "/ RTSP/1.0\r\n"
                      "CSeq: 1\r\n"
                      "User-Agent: camscout\r\n"
                      "\r\n";
    auto response = m_exchange->exchange(request);
    if (!response)
    {
        return layer("protocol", false, "no RTSP answer");
    }
    const bool ok = contains(*response, "RTSP/1.0") && contains(*response, "200 OK");
    return layer("protocol", ok, ok ? "RTSP OPTIONS accepted" : "invalid RTSP answer");
}


ValidationLayer DeviceValidator::check_http(const DiscoveredCandidate& device)
{
    HttpRequest request {};
    request.url = "http://" + device.ip + ":" + std::to_string(device.port) + "/";
    request.headers["User-Agent"] = "camscout";
    request.timeout = m_config.validation_timeout;
    auto response = m_http->request(request);
    if (!response)
    {
        return layer("protocol", false, "no HTTP answer");
    }
    if (is_router_response(*response))
    {
        return layer("protocol", false, "router or gateway web interface");
    }
    if (DeviceBlacklist::is_non_camera_http_response(response->body))
    {
        return layer("protocol", false, "non-camera web interface");
    }
    if (is_likely_camera_response(*response))
    {
        return layer("protocol", true, "camera keywords in HTTP answer");
    }
    if (ports::is_rtsp_port(device.port) || ports::is_onvif_port(device.port))
    {
        return layer("protocol", true, "HTTP on a camera port");
    }
    return layer("protocol", false, "no camera indicators");
}


ValidationLayer DeviceValidator::check_onvif(const DiscoveredCandidate& device)
{
    HttpRequest request {};
    request.method = "POST";
    request.url = "http://" + device.ip + ":" + std::to_string(device.port) + "/onvif/device_service";
    request.headers["Content-Type"] = "application/soap+xml; charset=utf-8";
    request.headers["SOAPAction"] = "http://www.onvif.org/ver10/device/wsdl/GetDeviceInformation";
    request.body =
        R"(<?xml version="1.0" encoding="UTF-8"?>)"
        R"(<soap:Envelope xmlns:soap="http://www.w3.org/2003/05/soap-envelope">)"
        R"(<soap:Body><tds:GetDeviceInformation xmlns:tds="http://www.onvif.org/ver10/device/wsdl"/></soap:Body>)"
        R"(</soap:Envelope>)";
    request.timeout = m_config.validation_timeout;
    auto response = m_http->request(request);
    if (!response)
    {
        return layer("protocol", false, "no ONVIF answer");
    }
    const bool ok = response->status == 200 && contains(response->body, "GetDeviceInformationResponse");
    return layer("protocol", ok, ok ? "ONVIF device service answered" : "invalid ONVIF answer");
}


ValidationLayer DeviceValidator::check_dvrip(const DiscoveredCandidate& device)
{
    LoginRequest login {};
    login.username = "admin";
    DvripHeader header {};
    header.command = DvripComm::LOGIN_REQ;
    const auto frame = encode_frame(header, encode_login(login));

    TcpExchangeRequest request {};
    request.host = device.ip;
    request.port = device.port;
    request.timeout = m_config.validation_timeout;
    request.payload.assign(frame.begin(), frame.end());
    request.min_bytes = DVRIP_HEADER_SIZE;
    auto response = m_exchange->exchange(request);
    if (!response)
    {
        return layer("protocol", false, "no DVRIP answer");
    }
    const bool ok = has_valid_magic(reinterpret_cast<const uint8_t*>(response->data()), response->size());
    return layer("protocol", ok, ok ? "DVRIP header confirmed" : "not a DVRIP answer");
}


bool DeviceValidator::is_router_response(const HttpResponse& response)
{
    const auto body = to_lower_copy(response.body);
    const auto server = to_lower_copy(response.header("server").value_or(""));
    for (const auto& indicator : s_routerIndicators)
    {
        if (contains(body, indicator))
        {
            return true;
        }
    }
    for (const auto& s : s_routerServers)
    {
        if (contains(server, s) &&
            (contains(body, "router") || contains(body, "wireless") ||
             contains(body, "admin") || contains(body, "configuration")))
        {
            return true;
        }
    }
    return false;
}


bool DeviceValidator::is_likely_camera_response(const HttpResponse& response)
{
    const auto body = to_lower_copy(response.body);
    const auto server = to_lower_copy(response.header("server").value_or(""));
    return std::any_of(s_cameraKeywords.begin(), s_cameraKeywords.end(), [&](const std::string& k)
        {
            return contains(body, k) || contains(server, k);
        });
}

} // namespace camscout
