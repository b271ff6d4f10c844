/**
 * @file ssdp_probe.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * SSDP search and UPnP device description parsing
 */
#include "ssdp_probe.hpp"
#include "log_macros.hpp"
#include "xml_util.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <array>
#include <functional>
#include <set>
#include <sstream>
#include <thread>

namespace camscout
{
using namespace boost::asio;
using boost::asio::ip::udp;
using namespace std::chrono;
using namespace std::chrono_literals;

constexpr auto POLL_INTERVAL { 100ms };
constexpr std::size_t MAX_DATAGRAM { 4096 };

std::string build_msearch(const std::string& search_target, unsigned mx)
{
    std::stringstream ss;
    ss << "M-SEARCH * HTTP/1.1\r\n"
       << "HOST: " << SSDP_ADDRESS << ":" << SSDP_PORT << "\r\n"
       << "MAN: \"ssdp:discover\"\r\n"
       << "ST: " << search_target << "\r\n"
       << "MX: " << mx << "\r\n"
       << "\r\n";
    return ss.str();
}

std::optional<SsdpResponse> parse_ssdp_response(const std::string& datagram)
{
    std::istringstream in { datagram };
    std::string line;
    if (!std::getline(in, line))
    {
        return std::nullopt;
    }
    boost::algorithm::trim(line);
    if (!boost::algorithm::starts_with(line, "HTTP/1.") || line.find(" 200") == std::string::npos)
    {
        return std::nullopt;
    }

    SsdpResponse response;
    while (std::getline(in, line))
    {
        auto colon = line.find(':');
        if (colon == std::string::npos)
        {
            continue;
        }
        auto name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line.substr(0, colon)));
        auto value = boost::algorithm::trim_copy(line.substr(colon + 1));
        if (name == "location")
        {
            response.location = value;
        }
        else if (name == "server")
        {
            response.server = value;
        }
        else if (name == "usn")
        {
            response.usn = value;
        }
        else if (name == "st")
        {
            response.st = value;
        }
        else if (name == "ext")
        {
            response.ext = value;
        }
        else if (name == "cache-control")
        {
            auto lower = boost::algorithm::to_lower_copy(value);
            auto pos = lower.find("max-age");
            if (pos != std::string::npos)
            {
                auto eq = lower.find('=', pos);
                if (eq != std::string::npos)
                {
                    try
                    {
                        response.max_age = static_cast<uint32_t>(std::stoul(lower.substr(eq + 1)));
                    }
                    catch (std::logic_error&)
                    {
                        // malformed max-age is ignored
                    }
                }
            }
        }
    }
    if (response.location.empty())
    {
        return std::nullopt;
    }
    return response;
}

static bool contains_any(const std::string& value, std::initializer_list<const char*> terms)
{
    auto lower = boost::algorithm::to_lower_copy(value);
    for (auto term : terms)
    {
        if (lower.find(term) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

bool UpnpDeviceDescription::is_media_device() const
{
    return contains_any(device_type, { "mediaserver", "mediarenderer", "camera", "video", "nvr", "dvr" });
}

bool UpnpDeviceDescription::has_camera_services() const
{
    for (const auto& service : services)
    {
        if (contains_any(service.service_type, { "camera", "video", "imaging", "media" }))
        {
            return true;
        }
    }
    return false;
}

std::optional<UpnpDeviceDescription> parse_device_description(const std::string& text)
{
    auto doc = xml::parse(text);
    if (!doc)
    {
        return std::nullopt;
    }
    const auto* root = xml::child(*doc, "root");
    const auto* device = root ? xml::child(*root, "device") : xml::descendant(*doc, "device");
    if (device == nullptr)
    {
        return std::nullopt;
    }

    UpnpDeviceDescription d;
    d.device_type = xml::child_text(*device, "deviceType");
    d.friendly_name = xml::child_text(*device, "friendlyName");
    d.manufacturer = xml::child_text(*device, "manufacturer");
    d.manufacturer_url = xml::child_text(*device, "manufacturerURL");
    d.model_description = xml::child_text(*device, "modelDescription");
    d.model_name = xml::child_text(*device, "modelName");
    d.model_number = xml::child_text(*device, "modelNumber");
    d.model_url = xml::child_text(*device, "modelURL");
    d.serial_number = xml::child_text(*device, "serialNumber");
    d.udn = xml::child_text(*device, "UDN");
    d.presentation_url = xml::child_text(*device, "presentationURL");
    if (const auto* list = xml::child(*device, "serviceList"))
    {
        for (const auto* s : xml::children(*list, "service"))
        {
            UpnpService service;
            service.service_type = xml::child_text(*s, "serviceType");
            service.service_id = xml::child_text(*s, "serviceId");
            service.control_url = xml::child_text(*s, "controlURL");
            service.event_sub_url = xml::child_text(*s, "eventSubURL");
            service.scpd_url = xml::child_text(*s, "SCPDURL");
            d.services.push_back(service);
        }
    }
    return d;
}


SsdpProbe::SsdpProbe(std::shared_ptr<HttpClient_T> http, SsdpConfig config, log_callback_t log_callback) :
    m_http(std::move(http)),
    m_config(std::move(config)),
    m_log_callback(log_callback)
{
}

std::vector<SsdpResponse> SsdpProbe::search(const std::string& search_target,
                                            milliseconds window,
                                            const CancellationToken& token)
{
    std::vector<SsdpResponse> responses;
    std::set<std::string> locations;
    try
    {
        io_service io;
        udp::socket socket(io);
        socket.open(udp::v4());
        socket.bind(udp::endpoint(ip::address_v4::any(), 0));

        const auto message = build_msearch(search_target, m_config.mx);
        const udp::endpoint destination { ip::make_address_v4(SSDP_ADDRESS), SSDP_PORT };
        for (int i = 0; i < 2; ++i)
        {
            boost::system::error_code ec;
            socket.send_to(buffer(message), destination, 0, ec);
            if (ec)
            {
                DBG("M-SEARCH send failed: " << ec.message(), LOG_LVL_DBG_MID);
            }
            if (i == 0)
            {
                std::this_thread::sleep_for(m_config.resend_interval);
            }
        }

        std::array<char, MAX_DATAGRAM> datagram {};
        udp::endpoint sender;
        bool receive_failed { false };
        std::function<void()> receive = [&]()
        {
            socket.async_receive_from(buffer(datagram), sender,
                [&](const boost::system::error_code& ec, std::size_t count)
                {
                    if (ec)
                    {
                        receive_failed = true;
                        return;
                    }
                    auto response = parse_ssdp_response(std::string(datagram.data(), count));
                    if (response && locations.insert(response->location).second)
                    {
                        response->sender = sender.address().to_string();
                        DBG("SSDP response from " << response->sender << " at " << response->location, LOG_LVL_DBG_HI);
                        responses.push_back(*response);
                    }
                    receive();
                });
        };
        receive();

        const auto deadline = steady_clock::now() + window;
        while (!token.is_cancelled() && !receive_failed && steady_clock::now() < deadline)
        {
            io.run_until(std::min(steady_clock::now() + POLL_INTERVAL, deadline));
        }
        boost::system::error_code ignored;
        socket.close(ignored);
    }
    catch (boost::system::system_error& e)
    {
        ERR("SSDP search failed: " << e.what());
    }
    return responses;
}

candidate_list_t SsdpProbe::describe(const std::vector<SsdpResponse>& responses, const CancellationToken& token)
{
    return describe(responses, token, m_config.cameras_only);
}

candidate_list_t SsdpProbe::describe(const std::vector<SsdpResponse>& responses,
                                     const CancellationToken& token,
                                     bool cameras_only)
{
    candidate_list_t candidates;
    for (const auto& response : responses)
    {
        if (token.is_cancelled())
        {
            break;
        }
        HttpRequest request;
        request.url = response.location;
        request.timeout = m_config.http_timeout;
        const auto started = steady_clock::now();
        auto reply = m_http ? m_http->request(request) : std::nullopt;
        if (!reply || reply->status != 200)
        {
            DBG("No device description at " << response.location, LOG_LVL_DBG_MID);
            continue;
        }
        auto description = parse_device_description(reply->body);
        if (!description)
        {
            DBG("Malformed device description at " << response.location, LOG_LVL_DBG_MID);
            continue;
        }
        if (cameras_only && !description->is_probable_camera())
        {
            DBG("Ignoring non-media UPnP device " << description->friendly_name, LOG_LVL_DBG_HI);
            continue;
        }

        DiscoveredCandidate candidate;
        try
        {
            auto target = parse_http_url(response.location);
            candidate.ip = target.host;
            candidate.port = target.port;
        }
        catch (std::invalid_argument&)
        {
            candidate.ip = response.sender;
        }
        candidate.protocol = "UPNP";
        candidate.method = DiscoveryMethod::ssdp;
        candidate.service_type = description->device_type;
        candidate.response_time = duration_cast<milliseconds>(steady_clock::now() - started);
        if (!description->friendly_name.empty())
        {
            candidate.name = description->friendly_name;
        }
        if (!description->manufacturer.empty())
        {
            candidate.manufacturer = description->manufacturer;
        }
        if (!description->model_name.empty())
        {
            candidate.model = description->model_name;
        }
        candidate.metadata["location"] = response.location;
        candidate.metadata["server"] = response.server;
        candidate.metadata["usn"] = response.usn;
        candidate.metadata["udn"] = description->udn;
        if (!description->serial_number.empty())
        {
            candidate.metadata["serial_number"] = description->serial_number;
        }
        candidates.push_back(candidate);
    }
    return candidates;
}

candidate_list_t SsdpProbe::discover(const CancellationToken& token)
{
    auto responses = search(m_config.search_target, m_config.timeout, token);
    return describe(responses, token);
}

candidate_list_t SsdpProbe::discover_media_devices(const CancellationToken& token)
{
    const auto half = m_config.timeout / 2;
    auto responses = search("urn:schemas-upnp-org:device:MediaServer:1", half, token);
    auto roots = search("upnp:rootdevice", half, token);

    std::set<std::string> locations;
    for (const auto& r : responses)
    {
        locations.insert(r.location);
    }
    for (const auto& r : roots)
    {
        if (locations.insert(r.location).second)
        {
            responses.push_back(r);
        }
    }
    return describe(responses, token, true);
}

} // namespace camscout
