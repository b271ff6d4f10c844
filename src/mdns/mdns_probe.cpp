/**
 * @file mdns_probe.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Multicast DNS query and response collection
 */
#include "mdns_probe.hpp"
#include "comm_ip/network_interfaces.hpp"
#include "dns_message.hpp"
#include "log_macros.hpp"
#include "mdns_resolver.hpp"
#include <boost/asio.hpp>
#include <algorithm>
#include <array>
#include <functional>
#include <thread>

namespace camscout
{
using namespace boost::asio;
using boost::asio::ip::udp;
using namespace std::chrono;
using namespace std::chrono_literals;

constexpr auto POLL_INTERVAL { 100ms };
constexpr std::size_t MAX_DATAGRAM { 9000 };

namespace
{
    struct QueryOutcome
    {
        bool bind_conflict { false };
        bool received_any { false };
        std::vector<mdns::ReceivedRecord> records;
    };

    bool is_bind_conflict(const boost::system::error_code& ec)
    {
        return ec == error::address_in_use || ec == error::access_denied;
    }

    QueryOutcome run_query(bool reuse_address,
                           const std::vector<std::string>& service_types,
                           milliseconds fast_fail,
                           milliseconds window,
                           const CancellationToken& token,
                           const log_callback_t& m_log_callback)
    {
        QueryOutcome outcome;
        io_service io;
        udp::socket socket(io);
        const auto group = ip::make_address_v4(mdns::MDNS_ADDRESS);

        try
        {
            socket.open(udp::v4());
            socket.set_option(udp::socket::reuse_address(reuse_address));
            socket.bind(udp::endpoint(ip::address_v4::any(), mdns::MDNS_PORT));
        }
        catch (boost::system::system_error& e)
        {
            if (is_bind_conflict(e.code()))
            {
                DBG("mDNS bind conflict (reuse_address=" << reuse_address << "): " << e.what(), LOG_LVL_DBG_HI);
                outcome.bind_conflict = true;
            }
            else
            {
                ERR("mDNS socket setup failed: " << e.what());
            }
            return outcome;
        }

        const auto interfaces = find_interfaces(m_log_callback);
        for (const auto& ifAddr : interfaces)
        {
            boost::system::error_code ec;
            socket.set_option(ip::multicast::join_group(group, ip::make_address_v4(ifAddr)), ec);
            if (ec)
            {
                DBG("mDNS join on " << ifAddr << " failed: " << ec.message(), LOG_LVL_DBG_MID);
            }
        }

        const auto query = mdns::make_ptr_query(service_types).encode();
        const udp::endpoint destination { group, mdns::MDNS_PORT };
        auto send_query = [&]()
        {
            boost::system::error_code ec;
            socket.send_to(buffer(query), destination, 0, ec);
            if (ec)
            {
                DBG("mDNS query send failed: " << ec.message(), LOG_LVL_DBG_MID);
            }
        };
        if (interfaces.empty())
        {
            send_query();
        }
        for (const auto& ifAddr : interfaces)
        {
            boost::system::error_code ec;
            socket.set_option(ip::multicast::outbound_interface(ip::make_address_v4(ifAddr)), ec);
            if (!ec)
            {
                send_query();
            }
        }

        std::array<uint8_t, MAX_DATAGRAM> datagram {};
        udp::endpoint sender;
        bool receive_failed { false };
        std::function<void()> receive = [&]()
        {
            socket.async_receive_from(buffer(datagram), sender,
                [&](const boost::system::error_code& ec, std::size_t count)
                {
                    if (ec)
                    {
                        if (ec != error::operation_aborted)
                        {
                            DBG("mDNS receive failed: " << ec.message(), LOG_LVL_DBG_MID);
                        }
                        receive_failed = true;
                        return;
                    }
                    auto msg = mdns::DnsMessage::decode(datagram.data(), count);
                    if (msg && msg->is_response())
                    {
                        outcome.received_any = true;
                        const auto from = sender.address().to_string();
                        for (auto& record : msg->all_records())
                        {
                            outcome.records.push_back({ std::move(record), from });
                        }
                    }
                    receive();
                });
        };
        receive();

        const auto start = steady_clock::now();
        const auto fast_deadline = start + fast_fail;
        const auto deadline = start + window;
        while (!token.is_cancelled() && !receive_failed)
        {
            const auto now = steady_clock::now();
            if (now >= deadline)
            {
                break;
            }
            if (!outcome.received_any && now >= fast_deadline)
            {
                break;
            }
            const auto limit = outcome.received_any ? deadline : std::min(deadline, fast_deadline);
            io.run_until(std::min(now + POLL_INTERVAL, limit));
        }
        boost::system::error_code ignored;
        socket.close(ignored);
        return outcome;
    }
}


MdnsProbe::MdnsProbe(MdnsConfig config, log_callback_t log_callback) :
    m_config(std::move(config)),
    m_log_callback(log_callback)
{
}

candidate_list_t MdnsProbe::discover(const CancellationToken& token)
{
    m_degraded = false;
    try
    {
        auto outcome = run_query(false, m_config.service_types,
                                 m_config.fast_fail_timeout, m_config.discovery_timeout,
                                 token, m_log_callback);
        auto service_types = m_config.service_types;
        if (outcome.bind_conflict)
        {
            m_bindConflict = true;
            std::this_thread::sleep_for(m_config.fallback_delay);
            if (token.is_cancelled())
            {
                return {};
            }
            DBG("Retrying mDNS with shared address for " << m_config.fallback_service_type, LOG_LVL_DBG_HI);
            service_types = { m_config.fallback_service_type };
            const auto window = std::min(m_config.fallback_window, m_config.fallback_cap);
            outcome = run_query(true, service_types, window, window, token, m_log_callback);
            if (outcome.bind_conflict)
            {
                ERR("mDNS unavailable: port " << mdns::MDNS_PORT << " cannot be bound");
                m_degraded = true;
                return {};
            }
        }
        if (!outcome.received_any)
        {
            DBG("mDNS received no responses", LOG_LVL_DBG_MID);
            m_degraded = true;
            return {};
        }
        auto candidates = mdns::resolve_services(outcome.records, service_types);
        DBG("mDNS resolved " << candidates.size() << " services", LOG_LVL_INFO);
        return candidates;
    }
    catch (std::exception& e)
    {
        ERR("mDNS discovery failed: " << e.what());
        return {};
    }
}

} // namespace camscout
