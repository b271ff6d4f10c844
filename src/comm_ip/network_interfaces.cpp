/**
 * @file network_interfaces.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Enumerates local IPv4 interfaces
 */
#include "network_interfaces.hpp"
#include "log_macros.hpp"
#include <boost/asio.hpp>
#include <cerrno>
#include <cstring>

#if defined(__APPLE__) || defined(__linux__)
#   include <ifaddrs.h>
#   include <net/if.h>
#   include <netdb.h>
#endif

namespace camscout
{

#if defined(__APPLE__) || defined(__linux__)
std::set<std::string> find_interfaces(log_callback_t m_log_callback)
{
    struct ifaddrs *ifaddr;
    std::set<std::string> ethernet_interfaces;

    if (getifaddrs(&ifaddr) != 0)
    {
        ERR("getifaddrs() FAILED: " << strerror(errno));
        return ethernet_interfaces;
    }

    for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == nullptr)
        {
            continue;
        }
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0)
        {
            continue;
        }
        if (AF_INET == ifa->ifa_addr->sa_family)
        {
            char ifAddr[NI_MAXHOST];
            if (getnameinfo(
                ifa->ifa_addr,
                sizeof(struct sockaddr_in),
                ifAddr,
                NI_MAXHOST,
                NULL,
                0,
                NI_NUMERICHOST) != 0)
            {
                ERR("getnameinfo() FAILED: " << strerror(errno));
            }
            else
            {
                ethernet_interfaces.insert(ifAddr);
            }
        }
    }
    freeifaddrs(ifaddr);
    return ethernet_interfaces;
}
#else
std::set<std::string> find_interfaces(log_callback_t m_log_callback)
{
    ERR("Interface enumeration is not supported on this platform");
    return {};
}
#endif

std::string network_base_of(const std::string& ip)
{
    auto pos = ip.rfind('.');
    return (pos == std::string::npos) ? ip : ip.substr(0, pos);
}

std::optional<std::string> detect_network_base(log_callback_t m_log_callback)
{
    for (const auto& ifAddr : find_interfaces(m_log_callback))
    {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address_v4(ifAddr, ec);
        if (ec)
        {
            continue;
        }
        const auto bytes = address.to_bytes();
        const bool is_private = (bytes[0] == 10) ||
                                (bytes[0] == 172 && bytes[1] >= 16 && bytes[1] <= 31) ||
                                (bytes[0] == 192 && bytes[1] == 168);
        if (is_private)
        {
            DBG("Using network base of interface " << ifAddr, LOG_LVL_DBG_HI);
            return network_base_of(ifAddr);
        }
    }
    return std::nullopt;
}

} // namespace camscout
