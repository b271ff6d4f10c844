/**
 * @file testDvripCodec.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 */
#include <gtest/gtest.h>
#include "dvrip_codec.hpp"
#include "DvripCommand_IF.hpp"
#include "digest_util.hpp"
#include <nlohmann/json.hpp>

using namespace camscout;
using namespace DvripComm;
using json = nlohmann::json;

TEST(testDvripCodec, headerLayout)
{
    DvripHeader header;
    header.session_id = 0x11223344;
    header.sequence = 7;
    header.command = LOGIN_REQ;
    auto frame = encode_frame(header, "{}");

    ASSERT_EQ(frame.size(), DVRIP_HEADER_SIZE + 2);
    EXPECT_EQ(frame[0], 0xFF);
    EXPECT_EQ(frame[1], 0x01);
    EXPECT_EQ(frame[2], 0x00);
    EXPECT_EQ(frame[3], 0x00);
    // Little endian session id
    EXPECT_EQ(frame[4], 0x44);
    EXPECT_EQ(frame[5], 0x33);
    EXPECT_EQ(frame[6], 0x22);
    EXPECT_EQ(frame[7], 0x11);
    EXPECT_EQ(frame[8], 7);
    // 1000 = 0x03E8
    EXPECT_EQ(frame[12], 0xE8);
    EXPECT_EQ(frame[13], 0x03);
    EXPECT_EQ(frame[16], 2) << "length comes from the payload";
    EXPECT_EQ(frame[20], '{');

    auto decoded = decode_header(frame.data(), frame.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->session_id, 0x11223344u);
    EXPECT_EQ(decoded->sequence, 7u);
    EXPECT_EQ(decoded->command, 1000u);
    EXPECT_EQ(decoded->payload_length, 2u);
}

TEST(testDvripCodec, magicFingerprint)
{
    auto frame = encode_frame(DvripHeader {}, "");
    EXPECT_TRUE(has_valid_magic(frame));

    auto bad_magic = frame;
    bad_magic[0] = 0xFE;
    EXPECT_FALSE(has_valid_magic(bad_magic));
    EXPECT_FALSE(decode_header(bad_magic.data(), bad_magic.size()).has_value());

    auto bad_version = frame;
    bad_version[1] = 0x02;
    EXPECT_FALSE(has_valid_magic(bad_version));

    EXPECT_FALSE(has_valid_magic(frame.data(), DVRIP_HEADER_SIZE - 1)) << "short header";
    EXPECT_FALSE(has_valid_magic(nullptr, 40));
}

TEST(testDvripCodec, oversizedLengthRejected)
{
    DvripHeader header;
    auto frame = encode_frame(header, "");
    frame[16] = 0x00;
    frame[17] = 0x00;
    frame[18] = 0x20;   // 2 MiB
    EXPECT_FALSE(decode_header(frame.data(), frame.size()).has_value());
}

TEST(testDvripCodec, sofiaHash)
{
    EXPECT_EQ(sofia_hash(""), "tlJwpbo6");
    EXPECT_EQ(sofia_hash("admin"), "6QNMIQGe");
    EXPECT_EQ(sofia_hash("123456"), "nTBCS19C");
}

TEST(testDvripCodec, digestByteOrder)
{
    const std::array<uint8_t, 16> md5_abc { 0x90, 0x01, 0x50, 0x98, 0x3c, 0xd2, 0x4f, 0xb0,
                                            0xd6, 0x96, 0x3f, 0x7d, 0x28, 0xe1, 0x7f, 0x72 };
    EXPECT_EQ(md5_digest("abc"), md5_abc);

    const std::array<uint8_t, 20> sha1_abc { 0xa9, 0x99, 0x3e, 0x36, 0x47, 0x06, 0x81, 0x6a, 0xba, 0x3e,
                                             0x25, 0x71, 0x78, 0x50, 0xc2, 0x6c, 0x9c, 0xd0, 0xd8, 0x9d };
    EXPECT_EQ(sha1_digest("abc"), sha1_abc);
}

TEST(testDvripCodec, loginPayload)
{
    LoginRequest req;
    req.username = "admin";
    req.password = "";
    auto j = json::parse(encode_login(req));
    EXPECT_EQ(j["UserName"], "admin");
    EXPECT_EQ(j["PassWord"], "tlJwpbo6") << "password is never sent in clear";
    EXPECT_EQ(j["EncryptType"], "MD5");
    EXPECT_EQ(j["LoginType"], "DVRIP-Web");
}

TEST(testDvripCodec, sessionRequests)
{
    auto j = json::parse(encode_session_request("KeepAlive", 0x1A));
    EXPECT_EQ(j["Name"], "KeepAlive");
    EXPECT_EQ(j["SessionID"], "0x0000001A");

    RecordingQuery q;
    q.begin_time = "2024-01-01 00:00:00";
    q.end_time = "2024-01-01 23:59:59";
    q.channel = 2;
    j = json::parse(encode_file_search(q, 5));
    EXPECT_EQ(j["Name"], "OPFileQuery");
    EXPECT_EQ(j["OPFileQuery"]["Channel"], 2);
    EXPECT_EQ(j["OPFileQuery"]["Type"], "h264");
    EXPECT_EQ(j["OPFileQuery"]["BeginTime"], "2024-01-01 00:00:00");

    PtzCommand ptz;
    ptz.direction = "DirectionLeft";
    ptz.stop = true;
    j = json::parse(encode_ptz(ptz, 5));
    EXPECT_EQ(j["OPPTZControl"]["Command"], "DirectionLeft");
    EXPECT_EQ(j["OPPTZControl"]["Parameter"]["Preset"], -1);
    EXPECT_EQ(j["OPPTZControl"]["Parameter"]["Step"], 5);

    j = json::parse(encode_playback_claim("/idea0/2024-01-01/001.h264", 5));
    EXPECT_EQ(j["OPPlayBack"]["Action"], "Claim");
    EXPECT_EQ(j["OPPlayBack"]["Parameter"]["FileName"], "/idea0/2024-01-01/001.h264");
}

TEST(testDvripCodec, sessionIdText)
{
    EXPECT_EQ(format_session_id(0xDEADBEEF), "0xDEADBEEF");
    EXPECT_EQ(parse_session_id("0x0000002A"), std::optional<uint32_t>(42));
    EXPECT_EQ(parse_session_id("2a"), std::optional<uint32_t>(42));
    EXPECT_FALSE(parse_session_id("").has_value());
    EXPECT_FALSE(parse_session_id("zz").has_value());
    EXPECT_FALSE(parse_session_id("0x1FFFFFFFF").has_value());
}

TEST(testDvripCodec, decodeLogin)
{
    DvripHeader header;
    header.command = LOGIN_RSP;
    const std::string payload =
        R"({"AliveInterval":21,"ChannelNum":4,"DeviceType ":"HVR","ExtraChannel":0,"Ret":100,"SessionID":"0x00000010"})"
        "\n";
    auto rsp = decode_response(header, payload + std::string(1, '\0'));
    ASSERT_TRUE(rsp.has_value());
    ASSERT_TRUE(std::holds_alternative<LoginResponse>(*rsp));
    const auto& login = std::get<LoginResponse>(*rsp);
    EXPECT_EQ(login.ret, RET_OK);
    EXPECT_EQ(login.session_id, std::optional<uint32_t>(16));
    EXPECT_EQ(login.alive_interval, std::optional<uint32_t>(21));
    EXPECT_EQ(login.device_type, "HVR");
    EXPECT_EQ(response_ret(*rsp), std::optional<int>(100));
}

TEST(testDvripCodec, decodeSystemInfo)
{
    DvripHeader header;
    header.command = SYSINFO_RSP;
    auto rsp = decode_response(header,
        R"({"Name":"SystemInfo","Ret":100,"SystemInfo":{"SerialNo":"abc123","HardWare":"HI3518E",)"
        R"("SoftWareVersion":"V4.02","BuildTime":"2019-01-01","DeviceModel":"IPC","VideoInChannel":1}})");
    ASSERT_TRUE(rsp.has_value());
    const auto& info = std::get<SystemInfoResponse>(*rsp);
    EXPECT_EQ(info.serial_number, "abc123");
    EXPECT_EQ(info.hardware, "HI3518E");
    EXPECT_EQ(info.software_version, "V4.02");
    EXPECT_EQ(info.video_channels, 1u);
}

TEST(testDvripCodec, decodeFileSearch)
{
    DvripHeader header;
    header.command = FILESEARCH_RSP;
    auto rsp = decode_response(header,
        R"({"Name":"OPFileQuery","Ret":100,"OPFileQuery":[)"
        R"({"FileName":"/a.h264","BeginTime":"2024-01-01 10:00:00","EndTime":"2024-01-01 10:10:00","FileLength":"0x00000400"},)"
        R"({"FileName":"/b.h264","BeginTime":"x","EndTime":"y","FileLength":2048}]})");
    ASSERT_TRUE(rsp.has_value());
    const auto& files = std::get<FileSearchResponse>(*rsp).files;
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].file_name, "/a.h264");
    EXPECT_EQ(files[0].file_length, 1024u);
    EXPECT_EQ(files[1].file_length, 2048u);
}

TEST(testDvripCodec, statusResponses)
{
    DvripHeader header;
    header.command = KEEPALIVE_RSP;
    auto rsp = decode_response(header, R"({"Name":"KeepAlive","Ret":100})");
    ASSERT_TRUE(rsp.has_value());
    ASSERT_TRUE(std::holds_alternative<StatusResponse>(*rsp));
    EXPECT_EQ(std::get<StatusResponse>(*rsp).command, static_cast<uint32_t>(KEEPALIVE_RSP));
    EXPECT_EQ(response_ret(*rsp), std::optional<int>(100));
}

TEST(testDvripCodec, unknownCommandsCarriedThrough)
{
    DvripHeader header;
    header.command = 1586;
    auto rsp = decode_response(header, "not even json");
    ASSERT_TRUE(rsp.has_value()) << "unknown codes are not rejected";
    ASSERT_TRUE(std::holds_alternative<UnknownResponse>(*rsp));
    EXPECT_EQ(std::get<UnknownResponse>(*rsp).payload, "not even json");
    EXPECT_FALSE(response_ret(*rsp).has_value());
}

TEST(testDvripCodec, malformedKnownPayloadsRejected)
{
    DvripHeader header;
    header.command = LOGIN_RSP;
    EXPECT_FALSE(decode_response(header, "{broken").has_value());
    EXPECT_FALSE(decode_response(header, R"({"SessionID":"0x1"})").has_value()) << "missing Ret";
    EXPECT_FALSE(decode_response(header, R"({"Ret":"ok"})").has_value()) << "mistyped Ret";
    EXPECT_FALSE(decode_response(header, "[100]").has_value());

    header.command = FILESEARCH_RSP;
    EXPECT_FALSE(decode_response(header, R"({"Ret":100,"OPFileQuery":[1,2]})").has_value());
}

TEST(testDvripCodec, commandNames)
{
    auto [known, name] = dvrip_command_name(LOGIN_REQ);
    EXPECT_TRUE(known);
    EXPECT_EQ(name, "LOGIN_REQ");

    auto verbose = dvrip_command_name(KEEPALIVE_REQ, true);
    EXPECT_EQ(std::get<1>(verbose), "KEEPALIVE_REQ (1006)");

    auto unknown = dvrip_command_name(4242);
    EXPECT_FALSE(std::get<0>(unknown));
    EXPECT_EQ(std::get<1>(unknown), " (4242)");
}
