/**
 * @file tcp_exchange.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * One-shot request/response over a fresh TCP connection, used for RTSP and
 * DVRIP fingerprinting.
 * @{
 */
#ifndef CAMSCOUT_TCP_EXCHANGE_HPP
#define CAMSCOUT_TCP_EXCHANGE_HPP

#include "CommonTypes.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace camscout
{

struct TcpExchangeRequest
{
    std::string host;
    uint16_t port { 0 };
    std::string payload;
    std::chrono::milliseconds timeout { 5000 };
    std::string terminator;         ///< stop reading once this appears in the response
    std::size_t min_bytes { 0 };    ///< or once this many bytes arrived
    std::size_t max_bytes { 64 * 1024 };
};

class TcpExchange_T
{
public:
    virtual ~TcpExchange_T() = default;

    /// @brief Connect, send the payload, read until the terminator, min_bytes, end of stream or timeout.
    /// @return Whatever was received, std::nullopt if the connection or the write failed or nothing arrived.
    virtual std::optional<std::string> exchange(const TcpExchangeRequest& request) = 0;
};

class AsioTcpExchange : public TcpExchange_T
{
public:
    explicit AsioTcpExchange(log_callback_t log_callback = nullptr);

    std::optional<std::string> exchange(const TcpExchangeRequest& request) override;

private:
    log_callback_t m_log_callback;
};

} // namespace camscout

#endif // CAMSCOUT_TCP_EXCHANGE_HPP

/** @} */
