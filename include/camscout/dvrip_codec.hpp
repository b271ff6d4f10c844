/**
 * @file dvrip_codec.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Framing and typed payloads of the DVRIP ("Sofia") binary camera protocol.
 *
 * Every frame is a fixed 20-byte header followed by a UTF-8 JSON payload.
 * @verbatim
 *  ------ --------- ---------- ------------ ------------ ------------ ------------ -----------
 * | 0xFF | version | reserved | session id | sequence   | command    | length     | payload   |
 * |  1   |    1    |    2     | 4 (LE)     | 4 (LE)     | 4 (LE)     | 4 (LE)     | length    |
 *  ------ --------- ---------- ------------ ------------ ------------ ------------ -----------
 * @endverbatim
 * @{
 */
#ifndef CAMSCOUT_DVRIP_CODEC_HPP
#define CAMSCOUT_DVRIP_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace camscout
{

inline constexpr uint8_t DVRIP_MAGIC { 0xFF };
inline constexpr uint8_t DVRIP_VERSION { 0x01 };
inline constexpr std::size_t DVRIP_HEADER_SIZE { 20 };

/// Upper bound accepted for a payload length field.
inline constexpr uint32_t DVRIP_MAX_PAYLOAD { 1024 * 1024 };

struct DvripHeader
{
    uint8_t magic { DVRIP_MAGIC };
    uint8_t version { DVRIP_VERSION };
    uint32_t session_id { 0 };
    uint32_t sequence { 0 };
    uint32_t command { 0 };
    uint32_t payload_length { 0 };
};

/// Frame bytes for a header and payload. The payload length field is taken from payload.
std::vector<uint8_t> encode_frame(DvripHeader header, const std::string& payload);

/// @brief At least a full header and the magic and version bytes match.
///  This is the fingerprint used to confirm the protocol on a port.
bool has_valid_magic(const uint8_t* data, std::size_t size);
bool has_valid_magic(const std::vector<uint8_t>& frame);

/// @return The header, or std::nullopt if the data is short, has bad magic or an oversized length.
std::optional<DvripHeader> decode_header(const uint8_t* data, std::size_t size);

/// @brief Vendor password digest: MD5 of the password folded to 8 characters of [0-9A-Za-z].
std::string sofia_hash(const std::string& password);

/// Human readable command name.
/// @return A tuple with the bool indicating whether the code is known and the name.
std::tuple<bool, std::string> dvrip_command_name(uint32_t command, bool verbose = false);


struct LoginRequest
{
    std::string username;
    std::string password;           ///< plain text, hashed when encoded
    std::string encrypt_type { "MD5" };
    std::string login_type { "DVRIP-Web" };
};

struct RecordingQuery
{
    std::string begin_time;         ///< "YYYY-MM-DD hh:mm:ss"
    std::string end_time;
    uint32_t channel { 0 };
    std::string type { "h264" };
};

struct PtzCommand
{
    std::string direction;          ///< DirectionUp, DirectionDown, DirectionLeft, DirectionRight, ZoomTile, ZoomWide
    uint32_t channel { 0 };
    uint32_t step { 5 };
    bool stop { false };
};

/// Any response only the status code of which matters (logout, keep-alive, PTZ, playback).
struct StatusResponse
{
    uint32_t command { 0 };
    int ret { 0 };
};

struct LoginResponse
{
    int ret { 0 };
    std::optional<uint32_t> session_id;
    std::optional<uint32_t> alive_interval;
    std::string device_type;
};

struct SystemInfoResponse
{
    int ret { 0 };
    std::string serial_number;
    std::string hardware;
    std::string software_version;
    std::string build_time;
    std::string device_model;
    uint32_t video_channels { 0 };
};

struct RecordingFile
{
    std::string file_name;
    std::string begin_time;
    std::string end_time;
    uint64_t file_length { 0 };
};

struct FileSearchResponse
{
    int ret { 0 };
    std::vector<RecordingFile> files;
};

/// Response for a command code the codec does not know. Carried through untouched.
struct UnknownResponse
{
    uint32_t command { 0 };
    std::string payload;
};

typedef std::variant<LoginResponse, SystemInfoResponse, FileSearchResponse, StatusResponse, UnknownResponse> dvrip_response_t;

std::string encode_login(const LoginRequest& request);
std::string encode_session_request(const std::string& name, uint32_t session_id);
std::string encode_file_search(const RecordingQuery& query, uint32_t session_id);
std::string encode_ptz(const PtzCommand& command, uint32_t session_id);
std::string encode_playback_claim(const std::string& file_name, uint32_t session_id);

/// @brief Decode the payload of a response frame into its typed form.
/// @return std::nullopt if the payload of a known response command is malformed.
///  Unknown command codes decode to UnknownResponse.
std::optional<dvrip_response_t> decode_response(const DvripHeader& header, const std::string& payload);

/// The Ret field of a decoded response, std::nullopt for UnknownResponse.
std::optional<int> response_ret(const dvrip_response_t& response);

/// Session ids are sent as "0x%08X" strings inside JSON payloads.
std::string format_session_id(uint32_t session_id);
std::optional<uint32_t> parse_session_id(const std::string& text);

} // namespace camscout

#endif // CAMSCOUT_DVRIP_CODEC_HPP

/** @} */
