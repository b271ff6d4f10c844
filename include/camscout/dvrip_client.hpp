/**
 * @file dvrip_client.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Session level client for the DVRIP camera protocol.
 * @{
 */
#ifndef CAMSCOUT_DVRIP_CLIENT_HPP
#define CAMSCOUT_DVRIP_CLIENT_HPP

#include "CommonTypes.hpp"
#include "dvrip_codec.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace camscout
{

struct DvripFrame
{
    DvripHeader header;
    std::string payload;
};

/// @brief Byte transport carrying DVRIP request/response frames.
///  Every request is answered by exactly one response frame.
class DvripConnection_T
{
public:
    virtual ~DvripConnection_T() = default;

    virtual bool open(const std::string& host, uint16_t port, std::chrono::steady_clock::duration timeout) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /// @brief Send a complete frame and wait for the response frame.
    /// @return std::nullopt on timeout, socket error or a response with a bad magic/version.
    virtual std::optional<DvripFrame> send_receive(const std::vector<uint8_t>& frame,
                                                   std::chrono::steady_clock::duration timeout) = 0;
};


/// @brief DvripConnection_T over a TCP socket.
///  Each call drives its own io_service on the calling thread until the
///  operation completes or its timer fires.
class DvripTcpConnection : public DvripConnection_T
{
public:
    explicit DvripTcpConnection(log_callback_t log_callback = nullptr);
    ~DvripTcpConnection() override;

    bool open(const std::string& host, uint16_t port, std::chrono::steady_clock::duration timeout) override;
    void close() override;
    bool is_open() const override;
    std::optional<DvripFrame> send_receive(const std::vector<uint8_t>& frame,
                                           std::chrono::steady_clock::duration timeout) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};


class DvripClient
{
public:
    /// Ports the protocol is commonly found on, in probing order.
    static const std::vector<uint16_t>& default_ports();

    DvripClient(std::shared_ptr<DvripConnection_T> connection,
                log_callback_t log_callback = nullptr,
                std::chrono::steady_clock::duration response_timeout = std::chrono::seconds(5));
    ~DvripClient();

    DvripClient(const DvripClient&) = delete;
    DvripClient& operator=(const DvripClient&) = delete;

    bool connect(const std::string& host, uint16_t port,
                 std::chrono::steady_clock::duration timeout = std::chrono::seconds(5));

    /// @brief Confirm the peer speaks DVRIP by sending an anonymous login and
    ///  checking the response header. The login result itself is ignored.
    bool probe();

    /// @brief Authenticate. A session id is assigned only when the camera answers Ret 100.
    /// @return std::nullopt when no usable answer came back, otherwise whether the login was accepted.
    std::optional<bool> login(const std::string& username, const std::string& password);

    bool keep_alive();
    std::optional<SystemInfoResponse> system_info();
    std::optional<std::vector<RecordingFile>> find_recordings(const RecordingQuery& query);

    /// @brief Claim a recording for playback.
    /// @return The URL the recording can be streamed from.
    std::optional<std::string> start_playback(const std::string& file_name);

    bool ptz(const PtzCommand& command);

    /// Ends the session (if any) and closes the connection.
    void logout();

    bool is_connected() const;
    bool is_logged_in() const;
    std::optional<uint32_t> session_id() const;
    std::optional<uint32_t> alive_interval() const;
    const std::string& host() const;
    uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};


/// @brief Try ports in order on host, returning the first whose answer to a login
///  carries the DVRIP magic and version bytes.
std::optional<uint16_t> probe_dvrip_ports(DvripConnection_T& connection,
                                          const std::string& host,
                                          const std::vector<uint16_t>& ports = DvripClient::default_ports(),
                                          std::chrono::steady_clock::duration connect_timeout = std::chrono::seconds(5),
                                          std::chrono::steady_clock::duration response_timeout = std::chrono::seconds(3),
                                          log_callback_t log_callback = nullptr);

} // namespace camscout

#endif // CAMSCOUT_DVRIP_CLIENT_HPP

/** @} */
