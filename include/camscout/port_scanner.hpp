/**
 * @file port_scanner.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Phased, concurrency bounded TCP probing of an address range.
 * @{
 */
#ifndef CAMSCOUT_PORT_SCANNER_HPP
#define CAMSCOUT_PORT_SCANNER_HPP

#include "CommonTypes.hpp"
#include "cancellation.hpp"
#include "discovery_types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{

struct ScanEndpoint
{
    std::string ip;
    uint16_t port { 0 };
};

struct ProbeHit
{
    std::string ip;
    uint16_t port { 0 };
    std::chrono::milliseconds response_time { 0 };
};

/// Performs the actual connection attempts for the scanner.
class TcpProber_T
{
public:
    virtual ~TcpProber_T() = default;

    /// @brief Attempt a TCP connection to every endpoint concurrently.
    ///  Connections that succeed are closed immediately.
    ///  Refusals and timeouts are misses, never errors.
    /// @return The endpoints that accepted a connection within timeout.
    virtual std::vector<ProbeHit> probe_batch(const std::vector<ScanEndpoint>& endpoints,
                                              std::chrono::milliseconds timeout) = 0;
};

/// @brief TcpProber_T using boost::asio non-blocking connects, one io_service per batch.
class AsioTcpProber : public TcpProber_T
{
public:
    explicit AsioTcpProber(log_callback_t log_callback = nullptr);

    std::vector<ProbeHit> probe_batch(const std::vector<ScanEndpoint>& endpoints,
                                      std::chrono::milliseconds timeout) override;

private:
    log_callback_t m_log_callback;
};


struct ScanConfig
{
    std::size_t max_concurrency { 50 };
    std::chrono::milliseconds priority_timeout { 2000 };   ///< phase 1, RTSP priority ports
    std::chrono::milliseconds common_timeout { 3000 };     ///< phase 2, common camera ports
    std::chrono::milliseconds full_timeout { 5000 };       ///< phase 3, every remaining port
    std::chrono::milliseconds specific_ip_timeout { 2000 };

    /// Stop after the first phase that finds anything. When false every phase runs,
    /// so a device reachable only on a later phase's ports is not hidden by an
    /// unrelated hit on an RTSP port.
    bool short_circuit { true };
};


class PortScanner
{
public:
    explicit PortScanner(std::shared_ptr<TcpProber_T> prober,
                         ScanConfig config = {},
                         log_callback_t log_callback = nullptr);

    /// @brief Scan a range in up to three escalating phases.
    /// @param network_base "a.b.c" scans a.b.c.1-254, "a.b" scans a.b.1-10.1-254,
    ///  "a.b.c.d" scans a single address.
    /// @throw std::invalid_argument if network_base is not one of those forms.
    candidate_list_t scan(const std::string& network_base, CancellationToken token = {});

    /// @brief Scan one address on the manufacturer's known ports, or the fast discovery
    ///  ports when the manufacturer is unknown or not given.
    candidate_list_t scan_specific_ip(const std::string& ip,
                                      const std::optional<std::string>& manufacturer = std::nullopt,
                                      CancellationToken token = {});

    /// Scan a range on the RTSP priority ports only.
    candidate_list_t scan_for_streaming(const std::string& network_base, CancellationToken token = {});

    bool is_port_open(const std::string& ip, uint16_t port,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @return The phase (1-3) that produced the last scan() result, 0 if nothing was found.
    uint32_t last_phase() const { return m_lastPhase; }

    /// @throw std::invalid_argument for a malformed base.
    static std::vector<std::string> expand_range(const std::string& network_base);

    const ScanConfig& config() const { return m_config; }

private:
    candidate_list_t scan_ports(const std::vector<std::string>& hosts,
                                const std::vector<uint16_t>& ports,
                                std::chrono::milliseconds timeout,
                                const CancellationToken& token);

    std::shared_ptr<TcpProber_T> m_prober;
    ScanConfig m_config;
    log_callback_t m_log_callback;
    uint32_t m_lastPhase { 0 };
};

} // namespace camscout

#endif // CAMSCOUT_PORT_SCANNER_HPP

/** @} */
