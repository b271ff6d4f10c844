#ifndef CAMSCOUT_NETWORK_INTERFACES_HPP
#define CAMSCOUT_NETWORK_INTERFACES_HPP
/**
 * @file network_interfaces.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Host network interface helpers shared by the multicast probes and the
 * discovery orchestrator.
 */
#include "CommonTypes.hpp"
#include <optional>
#include <set>
#include <string>

namespace camscout
{

/// Return the IPv4 address of every interface that is up, loopback excluded.
std::set<std::string> find_interfaces(log_callback_t log_callback = nullptr);

/// @brief The first three octets ("192.168.1") of the first private IPv4 interface.
std::optional<std::string> detect_network_base(log_callback_t log_callback = nullptr);

/// "192.168.1.20" -> "192.168.1"
std::string network_base_of(const std::string& ip);

} // namespace camscout

#endif // CAMSCOUT_NETWORK_INTERFACES_HPP
