/**
 * @file dvrip_codec.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * DVRIP framing and JSON payload encoding
 */
#include "dvrip_codec.hpp"
#include "CamEndian.hpp"
#include "DvripCommand_IF.hpp"
#include "digest_util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <map>
#include <sstream>
#include <type_traits>

namespace camscout
{
using json = nlohmann::json;
using namespace DvripComm;

/*
 * Create a std::map where the key is the command value and the entry is name
 */
#undef DVRIP_CMD
#define DVRIP_CMD(name,value) {value,#name},

static std::map<uint32_t, const char*> s_dvripCommandNames
{
    DVRIP_CMDS
};


std::tuple<bool, std::string> dvrip_command_name(uint32_t command, bool verbose)
{
    auto nameIt = s_dvripCommandNames.find(command);
    std::string cmdName { };
    bool foundIt { false };
    if (nameIt != s_dvripCommandNames.end())
    {
        cmdName = nameIt->second;
        foundIt = true;
    }
    if (!foundIt || verbose)
    {
        std::stringstream ss {};
        ss << " (" << std::dec << command << ")";
        cmdName.append(ss.str());
    }
    return std::make_tuple(foundIt, cmdName);
}


std::vector<uint8_t> encode_frame(DvripHeader header, const std::string& payload)
{
    header.payload_length = static_cast<uint32_t>(payload.size());
    std::vector<uint8_t> frame(DVRIP_HEADER_SIZE + payload.size());
    auto dest = frame.data();
    dest[0] = header.magic;
    dest[1] = header.version;
    dest[2] = 0;
    dest[3] = 0;
    LE_Put(dest + 4, header.session_id);
    LE_Put(dest + 8, header.sequence);
    LE_Put(dest + 12, header.command);
    LE_Put(dest + 16, header.payload_length);
    std::copy(payload.begin(), payload.end(), dest + DVRIP_HEADER_SIZE);
    return frame;
}


bool has_valid_magic(const uint8_t* data, std::size_t size)
{
    return data != nullptr && size >= DVRIP_HEADER_SIZE && data[0] == DVRIP_MAGIC && data[1] == DVRIP_VERSION;
}


bool has_valid_magic(const std::vector<uint8_t>& frame)
{
    return has_valid_magic(frame.data(), frame.size());
}


std::optional<DvripHeader> decode_header(const uint8_t* data, std::size_t size)
{
    if (!has_valid_magic(data, size))
    {
        return std::nullopt;
    }
    DvripHeader header {};
    header.magic = data[0];
    header.version = data[1];
    LE_Get(header.session_id, data + 4);
    LE_Get(header.sequence, data + 8);
    LE_Get(header.command, data + 12);
    LE_Get(header.payload_length, data + 16);
    if (header.payload_length > DVRIP_MAX_PAYLOAD)
    {
        return std::nullopt;
    }
    return header;
}


std::string sofia_hash(const std::string& password)
{
    const auto digest = md5_digest(password);
    std::string result;
    result.reserve(8);
    for (std::size_t i = 0; i < 8; ++i)
    {
        const unsigned n = (digest[2 * i] + digest[2 * i + 1]) % 62;
        char c;
        if (n < 10)
            c = static_cast<char>('0' + n);
        else if (n < 36)
            c = static_cast<char>('A' + n - 10);
        else
            c = static_cast<char>('a' + n - 36);
        result.push_back(c);
    }
    return result;
}


std::string format_session_id(uint32_t session_id)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", session_id);
    return buf;
}


std::optional<uint32_t> parse_session_id(const std::string& text)
{
    if (text.empty())
        return std::nullopt;
    try
    {
        std::size_t used { 0 };
        const auto value = std::stoul(text, &used, 16);
        if (used != text.size() || value > 0xFFFFFFFFul)
            return std::nullopt;
        return static_cast<uint32_t>(value);
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}


std::string encode_login(const LoginRequest& request)
{
    const json j {
        { "EncryptType", request.encrypt_type },
        { "LoginType", request.login_type },
        { "PassWord", sofia_hash(request.password) },
        { "UserName", request.username }
    };
    return j.dump();
}


std::string encode_session_request(const std::string& name, uint32_t session_id)
{
    const json j {
        { "Name", name },
        { "SessionID", format_session_id(session_id) }
    };
    return j.dump();
}


std::string encode_file_search(const RecordingQuery& query, uint32_t session_id)
{
    const json j {
        { "Name", "OPFileQuery" },
        { "OPFileQuery", {
            { "BeginTime", query.begin_time },
            { "EndTime", query.end_time },
            { "Channel", query.channel },
            { "DriverTypeMask", "0x0000FFFF" },
            { "Event", "*" },
            { "Type", query.type } } },
        { "SessionID", format_session_id(session_id) }
    };
    return j.dump();
}


std::string encode_ptz(const PtzCommand& command, uint32_t session_id)
{
    const json j {
        { "Name", "OPPTZControl" },
        { "OPPTZControl", {
            { "Command", command.direction },
            { "Parameter", {
                { "Channel", command.channel },
                { "Preset", command.stop ? -1 : 65535 },
                { "Step", command.step },
                { "Tour", 0 } } } } },
        { "SessionID", format_session_id(session_id) }
    };
    return j.dump();
}


std::string encode_playback_claim(const std::string& file_name, uint32_t session_id)
{
    const json j {
        { "Name", "OPPlayBack" },
        { "OPPlayBack", {
            { "Action", "Claim" },
            { "Parameter", {
                { "PlayMode", "ByName" },
                { "FileName", file_name },
                { "TransMode", "TCP" },
                { "Value", 0 } } } } },
        { "SessionID", format_session_id(session_id) }
    };
    return j.dump();
}


namespace
{

/// Devices terminate payloads with "\n\0", strip that before parsing.
std::string trim_payload(const std::string& payload)
{
    auto end = payload.find_last_not_of(std::string("\0\n\r ", 4));
    return end == std::string::npos ? std::string() : payload.substr(0, end + 1);
}

std::string string_field(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

uint64_t number_field(const json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end())
        return 0;
    if (it->is_number_unsigned() || it->is_number_integer())
        return it->get<uint64_t>();
    if (it->is_string())
    {
        try
        {
            return std::stoull(it->get<std::string>(), nullptr, 0);
        }
        catch (const std::exception&)
        {
            return 0;
        }
    }
    return 0;
}

LoginResponse decode_login(const json& j)
{
    LoginResponse rsp {};
    rsp.ret = j.at("Ret").get<int>();
    const auto sid = string_field(j, "SessionID");
    if (!sid.empty())
        rsp.session_id = parse_session_id(sid);
    if (j.contains("AliveInterval"))
        rsp.alive_interval = static_cast<uint32_t>(number_field(j, "AliveInterval"));
    rsp.device_type = string_field(j, "DeviceType ");
    if (rsp.device_type.empty())
        rsp.device_type = string_field(j, "DeviceType");
    return rsp;
}

SystemInfoResponse decode_sysinfo(const json& j)
{
    SystemInfoResponse rsp {};
    rsp.ret = j.at("Ret").get<int>();
    auto it = j.find("SystemInfo");
    if (it != j.end() && it->is_object())
    {
        rsp.serial_number = string_field(*it, "SerialNo");
        rsp.hardware = string_field(*it, "HardWare");
        rsp.software_version = string_field(*it, "SoftWareVersion");
        rsp.build_time = string_field(*it, "BuildTime");
        rsp.device_model = string_field(*it, "DeviceModel");
        rsp.video_channels = static_cast<uint32_t>(number_field(*it, "VideoInChannel"));
    }
    return rsp;
}

FileSearchResponse decode_file_search(const json& j)
{
    FileSearchResponse rsp {};
    rsp.ret = j.at("Ret").get<int>();
    auto it = j.find("OPFileQuery");
    if (it != j.end() && it->is_array())
    {
        for (const auto& entry : *it)
        {
            if (!entry.is_object())
                throw std::invalid_argument("file entry is not an object");
            RecordingFile file {};
            file.file_name = string_field(entry, "FileName");
            file.begin_time = string_field(entry, "BeginTime");
            file.end_time = string_field(entry, "EndTime");
            file.file_length = number_field(entry, "FileLength");
            rsp.files.push_back(std::move(file));
        }
    }
    return rsp;
}

} // namespace


std::optional<dvrip_response_t> decode_response(const DvripHeader& header, const std::string& payload)
{
    const bool known = std::get<0>(dvrip_command_name(header.command));
    if (!known)
    {
        return dvrip_response_t { UnknownResponse { header.command, payload } };
    }
    try
    {
        const auto j = json::parse(trim_payload(payload));
        if (!j.is_object())
            return std::nullopt;
        switch (header.command)
        {
        case LOGIN_RSP:
            return dvrip_response_t { decode_login(j) };
        case SYSINFO_RSP:
            return dvrip_response_t { decode_sysinfo(j) };
        case FILESEARCH_RSP:
            return dvrip_response_t { decode_file_search(j) };
        default:
            return dvrip_response_t { StatusResponse { header.command, j.at("Ret").get<int>() } };
        }
    }
    catch (const std::exception&)
    {
        // json parse_error, out_of_range for a missing Ret, type_error for a mistyped one
        return std::nullopt;
    }
}


std::optional<int> response_ret(const dvrip_response_t& response)
{
    return std::visit([](const auto& rsp) -> std::optional<int>
        {
            using T = std::decay_t<decltype(rsp)>;
            if constexpr (std::is_same_v<T, UnknownResponse>)
                return std::nullopt;
            else
                return rsp.ret;
        }, response);
}

} // namespace camscout
