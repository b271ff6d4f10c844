/**
 * @file tcp_prober.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Non-blocking TCP connect probing with per socket deadlines
 */
#include "port_scanner.hpp"
#include "log_macros.hpp"
#include <boost/asio.hpp>
#include <memory>

namespace camscout
{
using namespace boost::asio;
using boost::asio::ip::tcp;
using namespace std::chrono;

namespace
{
    struct ProbeState
    {
        ProbeState(io_service& io, ScanEndpoint ep) :
            socket(io),
            timer(io),
            endpoint(std::move(ep))
        {
        }

        tcp::socket socket;
        steady_timer timer;
        ScanEndpoint endpoint;
        steady_clock::time_point started {};
        bool done { false };
    };

    bool is_expected_miss(const boost::system::error_code& ec)
    {
        namespace err = boost::asio::error;
        return ec == err::connection_refused ||
               ec == err::timed_out ||
               ec == err::operation_aborted ||
               ec == err::host_unreachable ||
               ec == err::network_unreachable ||
               ec == err::connection_reset;
    }
}

AsioTcpProber::AsioTcpProber(log_callback_t log_callback) :
    m_log_callback(log_callback)
{
}

std::vector<ProbeHit> AsioTcpProber::probe_batch(const std::vector<ScanEndpoint>& endpoints,
                                                 std::chrono::milliseconds timeout)
{
    std::vector<ProbeHit> hits;
    io_service io;
    std::vector<std::shared_ptr<ProbeState>> probes;
    probes.reserve(endpoints.size());

    for (const auto& ep : endpoints)
    {
        boost::system::error_code ec;
        auto address = ip::make_address_v4(ep.ip, ec);
        if (ec)
        {
            ERR("Skipping invalid address " << ep.ip << ": " << ec.message());
            continue;
        }
        auto probe = std::make_shared<ProbeState>(io, ep);
        probes.push_back(probe);
        probe->started = steady_clock::now();

        probe->socket.async_connect(tcp::endpoint(address, ep.port),
            [this, probe, &hits](const boost::system::error_code& error)
            {
                if (probe->done)
                {
                    return;
                }
                probe->done = true;
                probe->timer.cancel();
                boost::system::error_code ignored;
                if (!error)
                {
                    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - probe->started);
                    hits.push_back({ probe->endpoint.ip, probe->endpoint.port, elapsed });
                    probe->socket.shutdown(tcp::socket::shutdown_both, ignored);
                }
                else if (!is_expected_miss(error))
                {
                    DBG("Probe of " << probe->endpoint.ip << ":" << probe->endpoint.port
                        << " failed: " << error.message(), LOG_LVL_DBG_MID);
                }
                probe->socket.close(ignored);
            });

        probe->timer.expires_after(timeout);
        probe->timer.async_wait([probe](const boost::system::error_code& error)
            {
                if (error || probe->done)
                {
                    return;
                }
                probe->done = true;
                boost::system::error_code ignored;
                probe->socket.close(ignored);
            });
    }

    try
    {
        io.run();
    }
    catch (boost::system::system_error& e)
    {
        ERR("Port probe batch aborted: " << e.what());
    }
    return hits;
}

} // namespace camscout
