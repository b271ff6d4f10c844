/**
 * @file tcp_exchange.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Request/response over a short lived TCP connection
 */
#include "tcp_exchange.hpp"
#include "log_macros.hpp"

#include <array>
#include <boost/asio.hpp>

namespace camscout
{
using namespace boost::asio;
using boost::asio::ip::tcp;
using boost::system::error_code;

namespace
{

struct ExchangeState
{
    ExchangeState(io_service& io, const TcpExchangeRequest& request) :
        socket(io), timer(io), request(request)
    {
    }

    tcp::socket socket;
    steady_timer timer;
    const TcpExchangeRequest& request;
    std::array<char, 4096> chunk {};
    std::string received;
    bool written { false };

    bool complete() const
    {
        if (!request.terminator.empty() && received.find(request.terminator) != std::string::npos)
            return true;
        if (request.min_bytes > 0 && received.size() >= request.min_bytes)
            return true;
        return received.size() >= request.max_bytes;
    }

    void finish()
    {
        error_code ignored;
        timer.cancel(ignored);
        socket.close(ignored);
    }

    void read_more()
    {
        socket.async_read_some(buffer(chunk), [this](const error_code& ec, std::size_t n)
            {
                received.append(chunk.data(), n);
                if (ec || complete())
                {
                    finish();
                    return;
                }
                read_more();
            });
    }
};

} // namespace


AsioTcpExchange::AsioTcpExchange(log_callback_t log_callback) :
    m_log_callback(log_callback)
{
}


std::optional<std::string> AsioTcpExchange::exchange(const TcpExchangeRequest& request)
{
    io_service io;
    error_code ec;
    const auto address = ip::make_address(request.host, ec);
    if (ec)
    {
        DBG("Not an IP address: " << request.host, LOG_LVL_DBG_MID);
        return std::nullopt;
    }

    ExchangeState state(io, request);
    state.timer.expires_after(request.timeout);
    state.timer.async_wait([&state](const error_code& error)
        {
            if (!error)
            {
                error_code ignored;
                state.socket.close(ignored);
            }
        });

    state.socket.async_connect(tcp::endpoint(address, request.port), [&state](const error_code& error)
        {
            if (error)
            {
                state.finish();
                return;
            }
            async_write(state.socket, buffer(state.request.payload), [&state](const error_code& werr, std::size_t)
                {
                    if (werr)
                    {
                        state.finish();
                        return;
                    }
                    state.written = true;
                    state.read_more();
                });
        });

    try
    {
        io.run();
    }
    catch (const boost::system::system_error& e)
    {
        ERR("TCP exchange with " << request.host << ":" << request.port << " failed: " << e.what());
        return std::nullopt;
    }

    if (!state.written || state.received.empty())
    {
        DBG("No answer from " << request.host << ":" << request.port, LOG_LVL_DBG_MID);
        return std::nullopt;
    }
    return state.received;
}

} // namespace camscout
