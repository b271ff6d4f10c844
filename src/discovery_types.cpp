/**
 * @file discovery_types.cpp
 *
 * Copyright 2024 PreAct Technologies
 */
#include "discovery_types.hpp"

namespace camscout
{

const char* to_string(DiscoveryMethod method)
{
    switch (method)
    {
        case DiscoveryMethod::port_scan:    return "port_scan";
        case DiscoveryMethod::mdns:         return "mdns";
        case DiscoveryMethod::ssdp:         return "ssdp";
        case DiscoveryMethod::ws_discovery: return "ws_discovery";
        case DiscoveryMethod::manual:       return "manual";
        case DiscoveryMethod::cache:        return "cache";
    }
    return "unknown";
}

} // namespace camscout
