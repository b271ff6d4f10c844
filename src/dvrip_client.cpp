/**
 * @file dvrip_client.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * DVRIP session handling on top of a DvripConnection_T
 */
#include "dvrip_client.hpp"
#include "DvripCommand_IF.hpp"
#include "log_macros.hpp"

namespace camscout
{
using namespace DvripComm;
using namespace std::chrono_literals;


const std::vector<uint16_t>& DvripClient::default_ports()
{
    static const std::vector<uint16_t> s_ports { 34567, 37777, 8000, 8080, 9000 };
    return s_ports;
}


struct DvripClient::Impl
{
    std::shared_ptr<DvripConnection_T> m_connection;
    log_callback_t m_log_callback;
    std::chrono::steady_clock::duration m_response_timeout;

    std::string m_host;
    uint16_t m_port { 0 };
    uint32_t m_sequence { 0 };
    std::optional<uint32_t> m_session_id;
    std::optional<uint32_t> m_alive_interval;

    Impl(std::shared_ptr<DvripConnection_T> connection, log_callback_t log_callback,
         std::chrono::steady_clock::duration response_timeout) :
        m_connection(std::move(connection)),
        m_log_callback(log_callback),
        m_response_timeout(response_timeout)
    {
    }

    /// Send one request and decode its answer.
    std::optional<dvrip_response_t> transact(uint32_t command, const std::string& payload);

    /// transact() for requests that only report a Ret code.
    bool transact_ok(uint32_t command, const std::string& payload);
};


std::optional<dvrip_response_t> DvripClient::Impl::transact(uint32_t command, const std::string& payload)
{
    if (!m_connection->is_open())
    {
        return std::nullopt;
    }
    DvripHeader header {};
    header.session_id = m_session_id.value_or(0);
    header.sequence = m_sequence++;
    header.command = command;

    const auto name = std::get<1>(dvrip_command_name(command));
    DBG("DVRIP request " << name, LOG_LVL_DBG_MID);

    auto response = m_connection->send_receive(encode_frame(header, payload), m_response_timeout);
    if (!response)
    {
        DBG("DVRIP request " << name << " got no response", LOG_LVL_DBG_HI);
        return std::nullopt;
    }
    auto decoded = decode_response(response->header, response->payload);
    if (!decoded)
    {
        ERR("Malformed DVRIP response to " << name);
    }
    return decoded;
}


bool DvripClient::Impl::transact_ok(uint32_t command, const std::string& payload)
{
    auto response = transact(command, payload);
    if (!response)
    {
        return false;
    }
    auto ret = response_ret(*response);
    return ret && *ret == RET_OK;
}


DvripClient::DvripClient(std::shared_ptr<DvripConnection_T> connection,
                         log_callback_t log_callback,
                         std::chrono::steady_clock::duration response_timeout) :
    pimpl { new Impl(std::move(connection), log_callback, response_timeout) }
{
}


DvripClient::~DvripClient()
{
    pimpl->m_connection->close();
}


bool DvripClient::connect(const std::string& host, uint16_t port, std::chrono::steady_clock::duration timeout)
{
    auto& m_log_callback = pimpl->m_log_callback;
    pimpl->m_session_id.reset();
    pimpl->m_alive_interval.reset();
    pimpl->m_sequence = 0;
    pimpl->m_host = host;
    pimpl->m_port = port;
    if (!pimpl->m_connection->open(host, port, timeout))
    {
        DBG("DVRIP connect to " << host << ":" << port << " failed", LOG_LVL_DBG_HI);
        return false;
    }
    DBG("DVRIP connected to " << host << ":" << port, LOG_LVL_INFO);
    return true;
}


bool DvripClient::probe()
{
    LoginRequest request {};
    request.username = "admin";
    // Any decodable or undecodable answer will do, the transport already checked the magic.
    DvripHeader header {};
    header.command = LOGIN_REQ;
    auto response = pimpl->m_connection->send_receive(encode_frame(header, encode_login(request)),
                                                      pimpl->m_response_timeout);
    return response.has_value();
}


std::optional<bool> DvripClient::login(const std::string& username, const std::string& password)
{
    auto& m_log_callback = pimpl->m_log_callback;
    pimpl->m_session_id.reset();

    LoginRequest request {};
    request.username = username;
    request.password = password;
    auto response = pimpl->transact(LOGIN_REQ, encode_login(request));
    if (!response)
    {
        return std::nullopt;
    }
    auto login = std::get_if<LoginResponse>(&*response);
    if (!login)
    {
        ERR("Unexpected answer to DVRIP login");
        return std::nullopt;
    }
    if (login->ret != RET_OK)
    {
        DBG("DVRIP login rejected, Ret=" << login->ret, LOG_LVL_INFO);
        return false;
    }
    if (!login->session_id)
    {
        ERR("DVRIP login accepted without a session id");
        return std::nullopt;
    }
    pimpl->m_session_id = login->session_id;
    pimpl->m_alive_interval = login->alive_interval;
    DBG("DVRIP login ok, session " << format_session_id(*login->session_id), LOG_LVL_INFO);
    return true;
}


bool DvripClient::keep_alive()
{
    if (!pimpl->m_session_id)
    {
        return false;
    }
    return pimpl->transact_ok(KEEPALIVE_REQ, encode_session_request("KeepAlive", *pimpl->m_session_id));
}


std::optional<SystemInfoResponse> DvripClient::system_info()
{
    if (!pimpl->m_session_id)
    {
        return std::nullopt;
    }
    auto response = pimpl->transact(SYSINFO_REQ, encode_session_request("SystemInfo", *pimpl->m_session_id));
    if (!response)
    {
        return std::nullopt;
    }
    auto info = std::get_if<SystemInfoResponse>(&*response);
    if (!info || info->ret != RET_OK)
    {
        return std::nullopt;
    }
    return *info;
}


std::optional<std::vector<RecordingFile>> DvripClient::find_recordings(const RecordingQuery& query)
{
    if (!pimpl->m_session_id)
    {
        return std::nullopt;
    }
    auto response = pimpl->transact(FILESEARCH_REQ, encode_file_search(query, *pimpl->m_session_id));
    if (!response)
    {
        return std::nullopt;
    }
    auto found = std::get_if<FileSearchResponse>(&*response);
    if (!found || found->ret != RET_OK)
    {
        return std::nullopt;
    }
    return found->files;
}


std::optional<std::string> DvripClient::start_playback(const std::string& file_name)
{
    if (!pimpl->m_session_id)
    {
        return std::nullopt;
    }
    if (!pimpl->transact_ok(PLAYBACK_REQ, encode_playback_claim(file_name, *pimpl->m_session_id)))
    {
        return std::nullopt;
    }
    return "rtsp://" + pimpl->m_host + "/playback/" + file_name;
}


bool DvripClient::ptz(const PtzCommand& command)
{
    if (!pimpl->m_session_id)
    {
        return false;
    }
    return pimpl->transact_ok(PTZ_REQ, encode_ptz(command, *pimpl->m_session_id));
}


void DvripClient::logout()
{
    auto& m_log_callback = pimpl->m_log_callback;
    if (pimpl->m_session_id && pimpl->m_connection->is_open())
    {
        if (!pimpl->transact_ok(LOGOUT_REQ, encode_session_request("", *pimpl->m_session_id)))
        {
            DBG("DVRIP logout was not acknowledged", LOG_LVL_DBG_HI);
        }
    }
    pimpl->m_session_id.reset();
    pimpl->m_alive_interval.reset();
    pimpl->m_connection->close();
}


bool DvripClient::is_connected() const
{
    return pimpl->m_connection->is_open();
}


bool DvripClient::is_logged_in() const
{
    return pimpl->m_session_id.has_value() && is_connected();
}


std::optional<uint32_t> DvripClient::session_id() const
{
    return pimpl->m_session_id;
}


std::optional<uint32_t> DvripClient::alive_interval() const
{
    return pimpl->m_alive_interval;
}


const std::string& DvripClient::host() const
{
    return pimpl->m_host;
}


uint16_t DvripClient::port() const
{
    return pimpl->m_port;
}


std::optional<uint16_t> probe_dvrip_ports(DvripConnection_T& connection,
                                          const std::string& host,
                                          const std::vector<uint16_t>& ports,
                                          std::chrono::steady_clock::duration connect_timeout,
                                          std::chrono::steady_clock::duration response_timeout,
                                          log_callback_t log_callback)
{
    auto& m_log_callback = log_callback;
    LoginRequest request {};
    request.username = "admin";
    DvripHeader header {};
    header.command = LOGIN_REQ;
    const auto frame = encode_frame(header, encode_login(request));

    for (auto port : ports)
    {
        if (!connection.open(host, port, connect_timeout))
        {
            continue;
        }
        auto response = connection.send_receive(frame, response_timeout);
        connection.close();
        if (response)
        {
            DBG("DVRIP confirmed on " << host << ":" << port, LOG_LVL_INFO);
            return port;
        }
    }
    DBG("No DVRIP port answered on " << host, LOG_LVL_DBG_HI);
    return std::nullopt;
}

} // namespace camscout
