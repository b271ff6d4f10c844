/**
 * @file ws_discovery_probe.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * WS-Discovery probe and response parsing
 */
#include "ws_discovery_probe.hpp"
#include "http_client.hpp"
#include "log_macros.hpp"
#include "xml_util.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <array>
#include <cctype>
#include <functional>
#include <set>
#include <sstream>

namespace camscout
{
using namespace boost::asio;
using boost::asio::ip::udp;
using namespace std::chrono;
using namespace std::chrono_literals;

constexpr auto POLL_INTERVAL { 100ms };
constexpr std::size_t MAX_DATAGRAM { 65000 };
constexpr uint16_t DEFAULT_HTTP_PORT { 80 };

std::string make_message_id()
{
    boost::uuids::random_generator generator;
    return "urn:uuid:" + boost::uuids::to_string(generator());
}

std::string build_probe(const std::string& message_id, const std::string& types)
{
    std::stringstream ss;
    ss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
       << "<soap:Envelope"
       << " xmlns:soap=\"http://www.w3.org/2003/05/soap-envelope\""
       << " xmlns:wsa=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\""
       << " xmlns:d=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\""
       << " xmlns:dn=\"http://www.onvif.org/ver10/network/wsdl\">"
       << "<soap:Header>"
       << "<wsa:Action>http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</wsa:Action>"
       << "<wsa:MessageID>" << xml::escape(message_id) << "</wsa:MessageID>"
       << "<wsa:To>urn:schemas-xmlsoap-org:ws:2005:04:discovery</wsa:To>"
       << "</soap:Header>"
       << "<soap:Body>"
       << "<d:Probe><d:Types>" << xml::escape(types) << "</d:Types></d:Probe>"
       << "</soap:Body>"
       << "</soap:Envelope>";
    return ss.str();
}

static std::vector<std::string> split_tokens(const std::string& text)
{
    std::vector<std::string> tokens;
    auto trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty())
    {
        return tokens;
    }
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return tokens;
}

static WsProbeMatch parse_match(const xml::ptree& node, bool is_hello)
{
    WsProbeMatch match;
    match.is_hello = is_hello;
    if (const auto* epr = xml::child(node, "EndpointReference"))
    {
        match.endpoint_reference = xml::child_text(*epr, "Address");
    }
    match.types = split_tokens(xml::child_text(node, "Types"));
    match.scopes = split_tokens(xml::child_text(node, "Scopes"));
    match.xaddrs = split_tokens(xml::child_text(node, "XAddrs"));
    auto version = xml::child_text(node, "MetadataVersion");
    if (!version.empty())
    {
        try
        {
            match.metadata_version = static_cast<uint32_t>(std::stoul(version));
        }
        catch (std::logic_error&)
        {
            // a non-numeric version is treated as absent
        }
    }
    return match;
}

std::vector<WsProbeMatch> parse_probe_matches(const std::string& text)
{
    std::vector<WsProbeMatch> matches;
    auto doc = xml::parse(text);
    if (!doc)
    {
        return matches;
    }
    const auto* body = xml::descendant(*doc, "Body");
    if (body == nullptr)
    {
        return matches;
    }
    for (const auto* node : xml::descendants(*body, "ProbeMatch"))
    {
        matches.push_back(parse_match(*node, false));
    }
    for (const auto* node : xml::children(*body, "Hello"))
    {
        matches.push_back(parse_match(*node, true));
    }
    return matches;
}

std::string url_decode(const std::string& value)
{
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2])))
        {
            result += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else if (value[i] == '+')
        {
            result += ' ';
        }
        else
        {
            result += value[i];
        }
    }
    return result;
}

std::optional<std::string> extract_scope_value(const std::vector<std::string>& scopes, const std::string& key)
{
    const auto lower_key = boost::algorithm::to_lower_copy(key);
    const auto onvif_marker = "/" + lower_key + "/";
    const auto pair_marker = lower_key + "=";
    for (const auto& scope : scopes)
    {
        const auto lower = boost::algorithm::to_lower_copy(scope);
        auto pos = lower.find(onvif_marker);
        if (boost::algorithm::starts_with(lower, "onvif://") && pos != std::string::npos)
        {
            auto value = scope.substr(pos + onvif_marker.size());
            auto end = value.find('/');
            return url_decode(value.substr(0, end));
        }
        pos = lower.find(pair_marker);
        if (pos != std::string::npos && (pos == 0 || !std::isalnum(static_cast<unsigned char>(lower[pos - 1]))))
        {
            auto value = scope.substr(pos + pair_marker.size());
            auto end = value.find_first_of("&;/ ");
            return url_decode(value.substr(0, end));
        }
    }
    return std::nullopt;
}

bool WsProbeMatch::is_onvif() const
{
    for (const auto& type : types)
    {
        const auto lower = boost::algorithm::to_lower_copy(type);
        if (lower.find("networkvideotransmitter") != std::string::npos ||
            lower.find("device") != std::string::npos ||
            lower.find("onvif") != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

std::optional<std::string> WsProbeMatch::name() const
{
    return extract_scope_value(scopes, "name");
}

std::optional<std::string> WsProbeMatch::manufacturer() const
{
    if (auto value = extract_scope_value(scopes, "mfr"))
    {
        return value;
    }
    return extract_scope_value(scopes, "manufacturer");
}

std::optional<std::string> WsProbeMatch::model() const
{
    if (auto value = extract_scope_value(scopes, "model"))
    {
        return value;
    }
    return extract_scope_value(scopes, "hardware");
}

candidate_list_t WsDiscoveryProbe::to_candidates(const std::vector<WsProbeMatch>& matches)
{
    candidate_list_t result;
    std::set<std::tuple<std::string, uint16_t>> seen;
    for (const auto& match : matches)
    {
        if (!match.is_onvif())
        {
            continue;
        }
        DiscoveredCandidate candidate;
        candidate.ip = match.sender;
        candidate.port = DEFAULT_HTTP_PORT;
        for (const auto& xaddr : match.xaddrs)
        {
            try
            {
                auto target = parse_http_url(xaddr);
                candidate.ip = target.host;
                candidate.port = target.port;
                candidate.metadata["device_service"] = xaddr;
                break;
            }
            catch (std::invalid_argument&)
            {
                // try the next transport address
            }
        }
        if (candidate.ip.empty() || !seen.insert(candidate.key()).second)
        {
            continue;
        }
        candidate.protocol = "ONVIF";
        candidate.method = DiscoveryMethod::ws_discovery;
        candidate.service_type = boost::algorithm::join(match.types, " ");
        candidate.name = match.name();
        candidate.manufacturer = match.manufacturer();
        candidate.model = match.model();
        candidate.metadata["endpoint_reference"] = match.endpoint_reference;
        candidate.metadata["scopes"] = boost::algorithm::join(match.scopes, " ");
        if (match.metadata_version)
        {
            candidate.metadata["metadata_version"] = std::to_string(*match.metadata_version);
        }
        result.push_back(candidate);
    }
    return result;
}


WsDiscoveryProbe::WsDiscoveryProbe(WsDiscoveryConfig config, log_callback_t log_callback) :
    m_config(std::move(config)),
    m_log_callback(log_callback)
{
}

std::vector<WsProbeMatch> WsDiscoveryProbe::probe(const std::string& destination,
                                                  milliseconds window,
                                                  const CancellationToken& token)
{
    std::vector<WsProbeMatch> matches;
    try
    {
        io_service io;
        udp::socket socket(io);
        socket.open(udp::v4());
        socket.bind(udp::endpoint(ip::address_v4::any(), 0));

        const auto message_id = make_message_id();
        const auto envelope = build_probe(message_id, m_config.types);
        socket.send_to(buffer(envelope), udp::endpoint(ip::make_address_v4(destination), WS_DISCOVERY_PORT));
        DBG("WS-Discovery probe " << message_id << " sent to " << destination, LOG_LVL_DBG_HI);

        std::vector<char> datagram(MAX_DATAGRAM);
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
                    auto parsed = parse_probe_matches(std::string(datagram.data(), count));
                    if (parsed.empty())
                    {
                        DBG("Ignoring WS-Discovery datagram from " << sender.address().to_string(), LOG_LVL_DBG_LOW);
                    }
                    for (auto& match : parsed)
                    {
                        match.sender = sender.address().to_string();
                        matches.push_back(std::move(match));
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
        ERR("WS-Discovery probe to " << destination << " failed: " << e.what());
    }
    return matches;
}

candidate_list_t WsDiscoveryProbe::discover(const CancellationToken& token)
{
    auto candidates = to_candidates(probe(WS_DISCOVERY_ADDRESS, m_config.timeout, token));
    DBG("WS-Discovery found " << candidates.size() << " ONVIF devices", LOG_LVL_INFO);
    return candidates;
}

candidate_list_t WsDiscoveryProbe::probe_specific_device(const std::string& ip, const CancellationToken& token)
{
    return to_candidates(probe(ip, m_config.unicast_timeout, token));
}

} // namespace camscout
