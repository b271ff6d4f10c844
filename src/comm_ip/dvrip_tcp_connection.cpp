/**
 * @file dvrip_tcp_connection.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * TCP transport for DVRIP frames
 */
#include "dvrip_client.hpp"
#include "log_macros.hpp"

#include <array>
#include <boost/asio.hpp>

namespace camscout
{
using namespace boost;
using namespace boost::system;
using namespace boost::asio;
using boost::asio::ip::tcp;


struct DvripTcpConnection::Impl
{
    io_service m_io;
    tcp::socket m_socket;
    tcp::resolver m_resolver;
    steady_timer m_response_timer;
    log_callback_t m_log_callback;

    std::array<uint8_t, DVRIP_HEADER_SIZE> m_prolog_buf {};
    std::vector<uint8_t> m_response_buf;
    DvripHeader m_response_header {};

    typedef std::function<void(bool, const DvripFrame&)> on_response_callback_t;
    on_response_callback_t m_on_response;

    explicit Impl(log_callback_t log_callback) :
        m_socket(m_io),
        m_resolver(m_io),
        m_response_timer(m_io),
        m_log_callback(log_callback)
    {
    }

    void begin_response_timer(std::chrono::steady_clock::duration timeout);
    void on_response_timeout(const error_code& error);
    void begin_receive_prolog();
    void on_receive_prolog(const error_code& error);
    void on_receive_payload(const error_code& error);
    void complete(bool err);
    bool process_error(const error_code& error, const char* where);
    void disconnect();
};


void DvripTcpConnection::Impl::begin_response_timer(std::chrono::steady_clock::duration timeout)
{
    m_response_timer.expires_after(timeout);
    m_response_timer.async_wait([this](const error_code& error) { this->on_response_timeout(error); });
}


void DvripTcpConnection::Impl::on_response_timeout(const error_code& error)
{
    if (error == boost::asio::error::operation_aborted)
    {
        return;
    }
    DBG("DVRIP response timed out", LOG_LVL_DBG_MID);
    // A late response would be mistaken for the answer to the next request, so drop the socket.
    disconnect();
    complete(true);
}


void DvripTcpConnection::Impl::begin_receive_prolog()
{
    auto f = [this](const error_code& error, std::size_t)
    {
        this->on_receive_prolog(error);
    };
    boost::asio::async_read(m_socket, buffer(m_prolog_buf), f);
}


void DvripTcpConnection::Impl::on_receive_prolog(const error_code& error)
{
    if (error)
    {
        process_error(error, __FUNCTION__);
        m_response_timer.cancel();
        complete(true);
        return;
    }
    auto header = decode_header(m_prolog_buf.data(), m_prolog_buf.size());
    if (!header)
    {
        // Unlike a known peer there is no resynchronising here: a bad prolog means this is not DVRIP.
        DBG("Response prolog is not a DVRIP header", LOG_LVL_DBG_HI);
        m_response_timer.cancel();
        complete(true);
        return;
    }
    m_response_header = *header;
    m_response_buf.resize(header->payload_length);
    if (header->payload_length == 0)
    {
        m_response_timer.cancel();
        complete(false);
        return;
    }
    auto f = [this](const error_code& error, std::size_t)
    {
        this->on_receive_payload(error);
    };
    boost::asio::async_read(m_socket, buffer(m_response_buf), f);
}


void DvripTcpConnection::Impl::on_receive_payload(const error_code& error)
{
    m_response_timer.cancel();
    if (error)
    {
        process_error(error, __FUNCTION__);
        complete(true);
        return;
    }
    complete(false);
}


void DvripTcpConnection::Impl::complete(bool err)
{
    if (!m_on_response)
    {
        return;
    }
    auto on_response = m_on_response;
    m_on_response = nullptr;
    DvripFrame frame { m_response_header, std::string(m_response_buf.begin(), m_response_buf.end()) };
    on_response(err, frame);
}


bool DvripTcpConnection::Impl::process_error(const error_code& error, const char* where)
{
    if (!error)
    {
        DBG("NO ERROR in " << where, LOG_LVL_DBG_LOW);
        return true;
    }
    else if (error == boost::asio::error::operation_aborted)
    {
        DBG("OPERATION aborted in " << where, LOG_LVL_DBG_HI);
        return false;
    }
    else if (error == boost::asio::error::eof || error == boost::asio::error::connection_reset)
    {
        DBG("Peer closed the connection in " << where, LOG_LVL_DBG_MID);
        return false;
    }
    else
    {
        ERR("ERROR in " << where << ": " << error.message());
        return false;
    }
}


void DvripTcpConnection::Impl::disconnect()
{
    if (!m_socket.is_open())
    {
        return;
    }
    error_code ignored;
    m_socket.shutdown(tcp::socket::shutdown_both, ignored);
    m_socket.close(ignored);
}


DvripTcpConnection::DvripTcpConnection(log_callback_t log_callback) :
    pimpl { new Impl(log_callback) }
{
}


DvripTcpConnection::~DvripTcpConnection()
{
    pimpl->disconnect();
}


bool DvripTcpConnection::open(const std::string& host, uint16_t port, std::chrono::steady_clock::duration timeout)
{
    auto& m_log_callback = pimpl->m_log_callback;
    close();

    error_code error;
    auto endpoints = pimpl->m_resolver.resolve(host, std::to_string(port), error);
    if (error)
    {
        DBG("Unable to resolve " << host << ": " << error.message(), LOG_LVL_DBG_MID);
        return false;
    }

    bool connected { false };
    bool timed_out { false };
    pimpl->m_response_timer.expires_after(timeout);
    pimpl->m_response_timer.async_wait([&](const error_code& ec)
        {
            if (ec != boost::asio::error::operation_aborted)
            {
                timed_out = true;
                error_code ignored;
                pimpl->m_socket.close(ignored);
            }
        });
    boost::asio::async_connect(pimpl->m_socket, endpoints,
        [&](const error_code& ec, const tcp::endpoint&)
        {
            pimpl->m_response_timer.cancel();
            connected = !ec;
            if (ec && !timed_out)
            {
                DBG("Connect to " << host << ":" << port << " failed: " << ec.message(), LOG_LVL_DBG_MID);
            }
        });
    pimpl->m_io.restart();
    pimpl->m_io.run();

    if (!connected)
    {
        if (timed_out)
        {
            DBG("Connect to " << host << ":" << port << " timed out", LOG_LVL_DBG_MID);
        }
        pimpl->disconnect();
    }
    return connected;
}


void DvripTcpConnection::close()
{
    pimpl->disconnect();
}


bool DvripTcpConnection::is_open() const
{
    return pimpl->m_socket.is_open();
}


std::optional<DvripFrame> DvripTcpConnection::send_receive(const std::vector<uint8_t>& frame,
                                                           std::chrono::steady_clock::duration timeout)
{
    auto& m_log_callback = pimpl->m_log_callback;
    if (!is_open())
    {
        return std::nullopt;
    }

    error_code error;
    boost::asio::write(pimpl->m_socket, buffer(frame), error);
    if (error)
    {
        ERR("DVRIP send failed: " << error.message());
        pimpl->disconnect();
        return std::nullopt;
    }

    bool errOccurred { true };
    DvripFrame retval {};
    pimpl->m_on_response = [&](bool err, const DvripFrame& response)
    {
        errOccurred = err;
        retval = response;
    };
    pimpl->begin_receive_prolog();
    pimpl->begin_response_timer(timeout);
    pimpl->m_io.restart();
    pimpl->m_io.run();
    pimpl->m_on_response = nullptr;

    if (errOccurred)
    {
        return std::nullopt;
    }
    return retval;
}

} // namespace camscout
