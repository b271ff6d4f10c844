#ifndef CAMSCOUT_COMMONTYPES_HPP
#define CAMSCOUT_COMMONTYPES_HPP
/**
 * @file CommonTypes.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Declares constants and types shared by the discovery and connection
 * components of libcamscout.
 */
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace camscout
{

typedef std::function<void (const std::string& msg, uint32_t level)> log_callback_t;

inline constexpr uint32_t LOG_LVL_ERROR     { 0 };
inline constexpr uint32_t LOG_LVL_INFO      { 1 };
inline constexpr uint32_t LOG_LVL_DBG_HI    { 2 };
inline constexpr uint32_t LOG_LVL_DBG_MID   { 3 };
inline constexpr uint32_t LOG_LVL_DBG_LOW   { 4 };

/// @brief Build the default log sink.
///  Errors are always written to std::cerr, other messages are written to std::cout
///  when their level is less than or equal to debug_level. Every line is prefixed
///  with the number of seconds since the logger was created.
log_callback_t make_console_logger(uint32_t debug_level);

/// Wall clock used for every timestamp the library records or persists.
typedef std::chrono::system_clock Clock;

/// Camera control protocol that is active on a connection.
enum class ProtocolType : uint8_t
{
    onvif,
    proprietary
};

/// Caller's hint for protocol negotiation.
enum class PreferredProtocol : uint8_t
{
    onvif,
    proprietary,
    automatic       ///< try ONVIF first, fall back to the proprietary protocol
};

enum class ConnectionState : uint8_t
{
    disconnected,
    connecting,
    connected,
    authenticating,
    authenticated,
    error
};

enum class ReconnectionState : uint8_t
{
    idle,
    attempting,
    backing_off,
    failed,
    disabled
};

/// Credentials passed through to the camera. Never stored by the library.
struct Credentials
{
    std::string username;
    std::string password;
};

const char* to_string(ProtocolType protocol);
const char* to_string(PreferredProtocol protocol);
const char* to_string(ConnectionState state);
const char* to_string(ReconnectionState state);

} // namespace camscout

#endif // CAMSCOUT_COMMONTYPES_HPP
