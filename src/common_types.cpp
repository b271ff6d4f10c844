/**
 * @file common_types.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Default logger and enum names
 */
#include "CommonTypes.hpp"
#include "operation_result.hpp"
#include <iomanip>
#include <iostream>

namespace camscout
{

using namespace std::chrono;

log_callback_t make_console_logger(uint32_t debug_level)
{
    const auto start_time = high_resolution_clock::now();
    return [start_time, debug_level](const std::string& msg, uint32_t level)
    {
        high_resolution_clock::time_point now { high_resolution_clock::now() };
        duration<double> elapsed { duration_cast<duration<double>>(now - start_time) };
        if (LOG_LVL_ERROR == level)
        {
            std::cerr << "[" << std::fixed << std::setprecision(6) << elapsed.count() << "] "
                      << " {ERR} " << msg.c_str() << std::endl;
        }
        else if (level <= debug_level)
        {
            std::cout << "[" << std::fixed << std::setprecision(6) << elapsed.count() << "] "
                      << msg.c_str() << std::endl;
        }
    };
}

const char* to_string(ProtocolType protocol)
{
    switch (protocol)
    {
        case ProtocolType::onvif:       return "onvif";
        case ProtocolType::proprietary: return "proprietary";
    }
    return "unknown";
}

const char* to_string(PreferredProtocol protocol)
{
    switch (protocol)
    {
        case PreferredProtocol::onvif:       return "onvif";
        case PreferredProtocol::proprietary: return "proprietary";
        case PreferredProtocol::automatic:   return "auto";
    }
    return "unknown";
}

const char* to_string(ConnectionState state)
{
    switch (state)
    {
        case ConnectionState::disconnected:   return "disconnected";
        case ConnectionState::connecting:     return "connecting";
        case ConnectionState::connected:      return "connected";
        case ConnectionState::authenticating: return "authenticating";
        case ConnectionState::authenticated:  return "authenticated";
        case ConnectionState::error:          return "error";
    }
    return "unknown";
}

const char* to_string(ReconnectionState state)
{
    switch (state)
    {
        case ReconnectionState::idle:        return "idle";
        case ReconnectionState::attempting:  return "attempting";
        case ReconnectionState::backing_off: return "backing_off";
        case ReconnectionState::failed:      return "failed";
        case ReconnectionState::disabled:    return "disabled";
    }
    return "unknown";
}


const char* to_string(OperationStatus status)
{
    switch (status)
    {
        case OperationStatus::ok:             return "ok";
        case OperationStatus::not_connected:  return "not_connected";
        case OperationStatus::unsupported:    return "unsupported";
        case OperationStatus::auth_failed:    return "auth_failed";
        case OperationStatus::network_error:  return "network_error";
        case OperationStatus::protocol_error: return "protocol_error";
    }
    return "unknown";
}

} // namespace camscout
