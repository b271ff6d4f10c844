/**
 * @file http_client.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Boost.Beast HTTP client with an overall deadline
 */
#include "http_client.hpp"
#include "log_macros.hpp"
#include "uri.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cctype>

namespace camscout
{
namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;
using namespace std::string_literals;

constexpr unsigned HTTP_VERSION_1_1 { 11 };

std::optional<std::string> HttpResponse::header(const std::string& name) const
{
    std::string key { name };
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    if (it == headers.end())
    {
        return std::nullopt;
    }
    return it->second;
}

HttpTarget parse_http_url(const std::string& url)
{
    const uri parsed(url);
    if (parsed.get_scheme() != "http")
    {
        throw std::invalid_argument("unsupported url scheme: "s + parsed.get_scheme());
    }
    HttpTarget result;
    result.host = parsed.get_host();
    if (result.host.empty())
    {
        throw std::invalid_argument("url has no host: "s + url);
    }
    if (parsed.get_port() != 0)
    {
        result.port = static_cast<uint16_t>(parsed.get_port());
    }
    const auto authority = url.find("://");
    const auto path_start = url.find('/', authority + 3);
    if (path_start != std::string::npos)
    {
        result.target = url.substr(path_start);
    }
    return result;
}


BeastHttpClient::BeastHttpClient(log_callback_t log_callback) :
    m_log_callback(log_callback)
{
}

std::optional<HttpResponse> BeastHttpClient::request(const HttpRequest& request)
{
    HttpTarget target;
    try
    {
        target = parse_http_url(request.url);
    }
    catch (std::invalid_argument& e)
    {
        ERR("Bad request url " << request.url << ": " << e.what());
        return std::nullopt;
    }

    boost::asio::io_service io;
    tcp::resolver resolver(io);
    beast::tcp_stream stream(io);
    beast::flat_buffer buffer;
    http::request<http::string_body> req { http::string_to_verb(request.method), target.target, HTTP_VERSION_1_1 };
    http::response<http::string_body> res;
    boost::system::error_code result_ec = boost::asio::error::timed_out;
    bool completed { false };

    req.set(http::field::host, target.host + ":" + std::to_string(target.port));
    req.set(http::field::user_agent, "camscout");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : request.headers)
    {
        req.set(name, value);
    }
    if (!request.body.empty())
    {
        req.body() = request.body;
        req.prepare_payload();
    }

    stream.expires_after(request.timeout);
    resolver.async_resolve(target.host, std::to_string(target.port),
        [&](const boost::system::error_code& ec, tcp::resolver::results_type results)
        {
            if (ec)
            {
                result_ec = ec;
                return;
            }
            stream.async_connect(results, [&](const boost::system::error_code& ec, const tcp::endpoint&)
            {
                if (ec)
                {
                    result_ec = ec;
                    return;
                }
                http::async_write(stream, req, [&](const boost::system::error_code& ec, std::size_t)
                {
                    if (ec)
                    {
                        result_ec = ec;
                        return;
                    }
                    http::async_read(stream, buffer, res, [&](const boost::system::error_code& ec, std::size_t)
                    {
                        result_ec = ec;
                        completed = !ec;
                    });
                });
            });
        });

    io.run_for(request.timeout);
    boost::system::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    stream.close();

    if (!completed)
    {
        DBG(request.method << " " << request.url << " failed: " << result_ec.message(), LOG_LVL_DBG_MID);
        return std::nullopt;
    }

    HttpResponse response;
    response.status = res.result_int();
    response.body = res.body();
    for (const auto& field : res)
    {
        std::string name { field.name_string() };
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        response.headers[name] = std::string { field.value() };
    }
    return response;
}

} // namespace camscout
