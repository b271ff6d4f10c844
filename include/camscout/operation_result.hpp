/**
 * @file operation_result.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Uniform outcome of a camera operation, independent of the protocol serving it.
 * @{
 */
#ifndef CAMSCOUT_OPERATION_RESULT_HPP
#define CAMSCOUT_OPERATION_RESULT_HPP

#include "CommonTypes.hpp"
#include <map>
#include <optional>
#include <string>

namespace camscout
{

enum class OperationStatus : uint8_t
{
    ok,
    not_connected,
    unsupported,        ///< the active protocol has no such capability
    auth_failed,        ///< the camera rejected the credentials
    network_error,
    protocol_error      ///< the camera answered with something that could not be understood
};

const char* to_string(OperationStatus status);

template <typename T>
struct OperationResult
{
    bool success { false };
    std::optional<T> data;
    std::string error;
    std::optional<ProtocolType> protocol_used;
    OperationStatus status { OperationStatus::ok };

    static OperationResult ok(T value, std::optional<ProtocolType> protocol = std::nullopt)
    {
        OperationResult r;
        r.success = true;
        r.data = std::move(value);
        r.protocol_used = protocol;
        return r;
    }

    static OperationResult failure(OperationStatus status, std::string error,
                                   std::optional<ProtocolType> protocol = std::nullopt)
    {
        OperationResult r;
        r.status = status;
        r.error = std::move(error);
        r.protocol_used = protocol;
        return r;
    }
};

/// Identity of a camera as reported by its control protocol.
struct DeviceInformation
{
    std::string manufacturer;
    std::string model;
    std::string firmware_version;
    std::string serial_number;
    std::string hardware_id;
    std::map<std::string, std::string> extra;
};

} // namespace camscout

#endif // CAMSCOUT_OPERATION_RESULT_HPP

/** @} */
