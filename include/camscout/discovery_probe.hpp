/**
 * @file discovery_probe.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Common shape of the multicast discovery probes.
 * @{
 */
#ifndef CAMSCOUT_DISCOVERY_PROBE_HPP
#define CAMSCOUT_DISCOVERY_PROBE_HPP

#include "cancellation.hpp"
#include "discovery_types.hpp"

namespace camscout
{

/// @brief A discovery protocol: open a socket, send a query, collect answers for
///  a bounded window, parse them into candidates and close the socket.
///  Implementations never throw; failures are logged and produce an empty list.
class DiscoveryProbe_T
{
public:
    virtual ~DiscoveryProbe_T() = default;

    virtual const char* name() const = 0;

    /// @brief Run one discovery round.
    ///  Returns early with what was collected so far once the token is cancelled.
    virtual candidate_list_t discover(const CancellationToken& token) = 0;

    /// True when the last discover() could not use the network the way it wanted,
    /// so an empty answer does not mean there is nothing to find.
    virtual bool degraded() const { return false; }
};

} // namespace camscout

#endif // CAMSCOUT_DISCOVERY_PROBE_HPP

/** @} */
