/**
 * @file testDvripLogin.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 */
#include "mock_collaborators.hpp"
#include "camera_protocol.hpp"
#include "dvrip_client.hpp"
#include "DvripCommand_IF.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

using namespace camscout;
using namespace DvripComm;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace
{

/// Camera answering DVRIP requests with canned payloads, remembering what it was sent.
class FakeDvripCamera
{
public:
    explicit FakeDvripCamera(std::shared_ptr<NiceMock<MockDvripConnection>> conn) : m_conn(std::move(conn))
    {
        ON_CALL(*m_conn, open(_, _, _)).WillByDefault(Invoke([this](const std::string&, uint16_t, auto)
            {
                m_open = reachable;
                return m_open;
            }));
        ON_CALL(*m_conn, is_open()).WillByDefault(Invoke([this]() { return m_open; }));
        ON_CALL(*m_conn, close()).WillByDefault(Invoke([this]() { m_open = false; }));
        ON_CALL(*m_conn, send_receive(_, _)).WillByDefault(Invoke(this, &FakeDvripCamera::answer));
    }

    std::optional<DvripFrame> answer(const std::vector<uint8_t>& frame, std::chrono::steady_clock::duration)
    {
        auto header = decode_header(frame.data(), frame.size());
        if (!header)
        {
            return std::nullopt;
        }
        requests.push_back(*header);
        payloads.emplace_back(frame.begin() + DVRIP_HEADER_SIZE, frame.end());
        auto it = replies.find(header->command);
        if (it == replies.end())
        {
            return std::nullopt;
        }
        return make_dvrip_frame(header->command + 1, it->second, header->session_id);
    }

    bool reachable { true };
    std::map<uint32_t, std::string> replies;
    std::vector<DvripHeader> requests;
    std::vector<std::string> payloads;

private:
    std::shared_ptr<NiceMock<MockDvripConnection>> m_conn;
    bool m_open { false };
};

const std::string LOGIN_OK { R"({"AliveInterval":20,"Ret":100,"SessionID":"0x0000ABCD"})" };
const std::string LOGIN_BAD_PASSWORD { R"({"Ret":203,"SessionID":"0x00000000"})" };

} // namespace

TEST(testDvripLogin, successAssignsSession)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = LOGIN_OK;

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("192.168.1.10", 34567));
    auto result = uit.login("admin", "");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
    EXPECT_EQ(uit.session_id(), std::optional<uint32_t>(0xABCD));
    EXPECT_EQ(uit.alive_interval(), std::optional<uint32_t>(20));
    EXPECT_TRUE(uit.is_logged_in());

    auto sent = json::parse(camera.payloads.at(0));
    EXPECT_EQ(sent["UserName"], "admin");
    EXPECT_EQ(sent["PassWord"], "tlJwpbo6");
}

TEST(testDvripLogin, rejectedLoginAssignsNoSession)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = LOGIN_BAD_PASSWORD;

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("192.168.1.10", 34567));
    auto result = uit.login("admin", "wrong");
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(*result);
    EXPECT_FALSE(uit.session_id().has_value());
    EXPECT_FALSE(uit.is_logged_in());
}

TEST(testDvripLogin, noAnswerIsNotARejection)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("192.168.1.10", 34567));
    EXPECT_FALSE(uit.login("admin", "").has_value());
    EXPECT_FALSE(uit.session_id().has_value());
}

TEST(testDvripLogin, acceptedWithoutSessionIdIsMalformed)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = R"({"Ret":100})";

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("192.168.1.10", 34567));
    EXPECT_FALSE(uit.login("admin", "").has_value());
    EXPECT_FALSE(uit.is_logged_in());
}

TEST(testDvripLogin, sessionRequestsCarrySessionAndSequence)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = LOGIN_OK;
    camera.replies[KEEPALIVE_REQ] = R"({"Name":"KeepAlive","Ret":100})";
    camera.replies[PTZ_REQ] = R"({"Name":"OPPTZControl","Ret":100})";
    camera.replies[LOGOUT_REQ] = R"({"Ret":100})";

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("10.0.0.3", 34567));
    ASSERT_TRUE(uit.login("admin", "").value_or(false));
    EXPECT_TRUE(uit.keep_alive());

    PtzCommand ptz;
    ptz.direction = "DirectionUp";
    EXPECT_TRUE(uit.ptz(ptz));

    uit.logout();
    EXPECT_FALSE(uit.is_connected());
    EXPECT_FALSE(uit.session_id().has_value());

    ASSERT_EQ(camera.requests.size(), 4u);
    EXPECT_EQ(camera.requests[0].session_id, 0u);
    for (std::size_t i = 0; i < camera.requests.size(); ++i)
    {
        EXPECT_EQ(camera.requests[i].sequence, i);
    }
    EXPECT_EQ(camera.requests[1].command, static_cast<uint32_t>(KEEPALIVE_REQ));
    EXPECT_EQ(camera.requests[1].session_id, 0xABCDu);
    EXPECT_EQ(json::parse(camera.payloads[1])["SessionID"], "0x0000ABCD");
    EXPECT_EQ(camera.requests[3].command, static_cast<uint32_t>(LOGOUT_REQ));
}

TEST(testDvripLogin, sessionRequestsNeedLogin)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("10.0.0.3", 34567));
    EXPECT_FALSE(uit.keep_alive());
    EXPECT_FALSE(uit.system_info().has_value());
    EXPECT_FALSE(uit.find_recordings(RecordingQuery {}).has_value());
    EXPECT_FALSE(uit.start_playback("x").has_value());
    EXPECT_TRUE(camera.requests.empty());
}

TEST(testDvripLogin, recordingsAndPlayback)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = LOGIN_OK;
    camera.replies[FILESEARCH_REQ] =
        R"({"Ret":100,"OPFileQuery":[{"FileName":"/idea0/01.h264","BeginTime":"a","EndTime":"b","FileLength":"0x10"}]})";
    camera.replies[PLAYBACK_REQ] = R"({"Ret":100})";

    DvripClient uit(conn);
    ASSERT_TRUE(uit.connect("10.0.0.3", 34567));
    ASSERT_TRUE(uit.login("admin", "").value_or(false));

    auto files = uit.find_recordings(RecordingQuery {});
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 1u);
    EXPECT_EQ((*files)[0].file_length, 16u);

    auto url = uit.start_playback("/idea0/01.h264");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "rtsp://10.0.0.3/playback//idea0/01.h264");
}

TEST(testDvripLogin, probePortsReturnsFirstAnsweringPort)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    EXPECT_CALL(*conn, open("10.0.0.9", 34567, _)).WillOnce(Return(false));
    EXPECT_CALL(*conn, open("10.0.0.9", 37777, _)).WillOnce(Return(true));
    EXPECT_CALL(*conn, open("10.0.0.9", 8000, _)).WillOnce(Return(true));
    EXPECT_CALL(*conn, send_receive(_, _))
        .WillOnce(Return(std::nullopt))
        .WillOnce(Return(make_dvrip_frame(LOGIN_RSP, LOGIN_BAD_PASSWORD)));
    EXPECT_CALL(*conn, open("10.0.0.9", 8080, _)).Times(0);

    auto port = probe_dvrip_ports(*conn, "10.0.0.9");
    EXPECT_EQ(port, std::optional<uint16_t>(8000));
}

TEST(testDvripLogin, probePortsNothingAnswers)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    ON_CALL(*conn, open(_, _, _)).WillByDefault(Return(false));
    EXPECT_FALSE(probe_dvrip_ports(*conn, "10.0.0.9", { 1, 2, 3 }).has_value());
}

TEST(testDvripProtocol, connectAndAuthenticate)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = LOGIN_OK;
    camera.replies[SYSINFO_REQ] =
        R"({"Ret":100,"SystemInfo":{"SerialNo":"SN1","SoftWareVersion":"V1","DeviceModel":"XM530"}})";

    DvripProtocol uit(conn, DvripProtocolConfig { "10.0.0.4", 34567 });
    EXPECT_EQ(uit.type(), ProtocolType::proprietary);
    EXPECT_EQ(uit.connect(2000ms), OperationStatus::ok);

    auto basic = uit.device_information();
    ASSERT_TRUE(basic.success);
    EXPECT_EQ(basic.data->extra.at("port"), "34567");
    EXPECT_TRUE(basic.data->serial_number.empty()) << "no session yet";

    EXPECT_EQ(uit.authenticate({ "admin", "" }), OperationStatus::ok);
    auto info = uit.device_information();
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.data->serial_number, "SN1");
    EXPECT_EQ(info.data->model, "XM530");
    EXPECT_EQ(info.protocol_used, std::optional<ProtocolType>(ProtocolType::proprietary));
}

TEST(testDvripProtocol, failureClassification)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);

    DvripProtocol uit(conn, DvripProtocolConfig { "10.0.0.4", 34567 });
    EXPECT_EQ(uit.connect(2000ms), OperationStatus::protocol_error) << "open port that does not speak DVRIP";

    camera.reachable = false;
    EXPECT_EQ(uit.connect(2000ms), OperationStatus::network_error);

    camera.reachable = true;
    camera.replies[LOGIN_REQ] = LOGIN_BAD_PASSWORD;
    EXPECT_EQ(uit.connect(2000ms), OperationStatus::ok);
    EXPECT_EQ(uit.authenticate({ "admin", "nope" }), OperationStatus::auth_failed);
}

TEST(testDvripProtocol, ptzMapping)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    FakeDvripCamera camera(conn);
    camera.replies[LOGIN_REQ] = LOGIN_OK;
    camera.replies[PTZ_REQ] = R"({"Ret":100})";

    DvripProtocol uit(conn, DvripProtocolConfig { "10.0.0.4", 34567 });
    ASSERT_EQ(uit.connect(2000ms), OperationStatus::ok);
    ASSERT_EQ(uit.authenticate({ "admin", "" }), OperationStatus::ok);

    EXPECT_TRUE(uit.ptz("zoom_in", 3).success);
    auto sent = json::parse(camera.payloads.back());
    EXPECT_EQ(sent["OPPTZControl"]["Command"], "ZoomTile");
    EXPECT_EQ(sent["OPPTZControl"]["Parameter"]["Step"], 3);

    EXPECT_TRUE(uit.ptz("stop", 0).success);
    sent = json::parse(camera.payloads.back());
    EXPECT_EQ(sent["OPPTZControl"]["Parameter"]["Preset"], -1);
    EXPECT_EQ(sent["OPPTZControl"]["Parameter"]["Step"], 1);

    auto bad = uit.ptz("spin", 3);
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.status, OperationStatus::unsupported);
}
