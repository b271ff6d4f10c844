#ifndef CAMSCOUT_MDNS_RESOLVER_HPP
#define CAMSCOUT_MDNS_RESOLVER_HPP
/**
 * @file mdns_resolver.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Turns the records collected during an mDNS query window into candidates
 * by following PTR -> SRV -> A.
 */
#include "discovery_types.hpp"
#include "dns_message.hpp"
#include <string>
#include <vector>

namespace camscout
{
namespace mdns
{

struct ReceivedRecord
{
    DnsRecord record;
    std::string sender;     ///< source address of the datagram that carried the record
};

/// @brief Resolve service instances of the requested types.
///  An instance without an SRV record is dropped. When no A record names the SRV
///  target the datagram's source address is used. Results are unique by (ip, port).
candidate_list_t resolve_services(const std::vector<ReceivedRecord>& records,
                                  const std::vector<std::string>& service_types);

} // namespace mdns
} // namespace camscout

#endif // CAMSCOUT_MDNS_RESOLVER_HPP
