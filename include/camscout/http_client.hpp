/**
 * @file http_client.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Small synchronous HTTP/1.1 client used for UPnP descriptor fetches,
 * ONVIF SOAP calls and HTTP validation probes.
 * @{
 */
#ifndef CAMSCOUT_HTTP_CLIENT_HPP
#define CAMSCOUT_HTTP_CLIENT_HPP

#include "CommonTypes.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace camscout
{

struct HttpRequest
{
    std::string method { "GET" };
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout { 10000 };
};

struct HttpResponse
{
    unsigned status { 0 };
    std::map<std::string, std::string> headers;     ///< header names lower case
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
};

class HttpClient_T
{
public:
    virtual ~HttpClient_T() = default;

    /// @return The response, or std::nullopt on a network failure or timeout.
    virtual std::optional<HttpResponse> request(const HttpRequest& request) = 0;
};

/// @brief HttpClient_T implemented with Boost.Beast.
class BeastHttpClient : public HttpClient_T
{
public:
    explicit BeastHttpClient(log_callback_t log_callback = nullptr);

    std::optional<HttpResponse> request(const HttpRequest& request) override;

private:
    log_callback_t m_log_callback;
};

struct HttpTarget
{
    std::string host;
    uint16_t port { 80 };
    std::string target { "/" };
};

/// @brief Split an http URL into host, port and request target.
/// @throw std::invalid_argument if url is not an http URL.
HttpTarget parse_http_url(const std::string& url);

} // namespace camscout

#endif // CAMSCOUT_HTTP_CLIENT_HPP

/** @} */
