/**
 * @file testConnectionManager.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 */
#include "mock_collaborators.hpp"
#include "connection_manager.hpp"
#include "DvripCommand_IF.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

using namespace camscout;
using namespace std::chrono_literals;

namespace
{

OperationResult<DeviceInformation> info_from(const std::string& manufacturer)
{
    DeviceInformation info {};
    info.manufacturer = manufacturer;
    return OperationResult<DeviceInformation>::ok(info);
}

const std::string ONVIF_NOT_AUTHORIZED {
    R"(<?xml version="1.0"?><env:Envelope xmlns:env="http://www.w3.org/2003/05/soap-envelope" xmlns:ter="http://www.onvif.org/ver10/error">)"
    R"(<env:Body><env:Fault><env:Code><env:Value>env:Sender</env:Value>)"
    R"(<env:Subcode><env:Value>ter:NotAuthorized</env:Value></env:Subcode></env:Code>)"
    R"(</env:Fault></env:Body></env:Envelope>)" };

const std::string ONVIF_DEVICE_INFO {
    R"(<?xml version="1.0"?><env:Envelope xmlns:env="http://www.w3.org/2003/05/soap-envelope" xmlns:tds="http://www.onvif.org/ver10/device/wsdl">)"
    R"(<env:Body><tds:GetDeviceInformationResponse><tds:Manufacturer>Dahua</tds:Manufacturer>)"
    R"(<tds:Model>IPC-HDW</tds:Model></tds:GetDeviceInformationResponse></env:Body></env:Envelope>)" };

class testConnectionManager : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ON_CALL(*onvif, type()).WillByDefault(Return(ProtocolType::onvif));
        ON_CALL(*dvrip, type()).WillByDefault(Return(ProtocolType::proprietary));
    }

    std::unique_ptr<ConnectionManager> make(ConnectionConfig cfg = {})
    {
        cfg.reconnect_settle = 0ms;
        auto uit = std::make_unique<ConnectionManager>("cam-1", onvif, dvrip, cfg);
        uit->on_state_change([this](ConnectionState s) { states.push_back(s); });
        uit->on_error([this](const std::string& m) { errors.push_back(m); });
        return uit;
    }

    std::shared_ptr<NiceMock<MockCameraProtocol>> onvif { std::make_shared<NiceMock<MockCameraProtocol>>() };
    std::shared_ptr<NiceMock<MockCameraProtocol>> dvrip { std::make_shared<NiceMock<MockCameraProtocol>>() };
    std::vector<ConnectionState> states;
    std::vector<std::string> errors;
};

} // namespace

TEST_F(testConnectionManager, automaticPrefersOnvif)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*dvrip, connect(_)).Times(0);

    auto uit = make();
    EXPECT_EQ(uit->state(), ConnectionState::disconnected);
    ASSERT_TRUE(uit->connect());
    EXPECT_EQ(uit->active_protocol(), std::optional<ProtocolType>(ProtocolType::onvif));
    EXPECT_EQ(uit->state(), ConnectionState::connected);
    EXPECT_EQ(uit->last_status(), OperationStatus::ok);
    EXPECT_EQ(states, (std::vector<ConnectionState> { ConnectionState::connecting, ConnectionState::connected }));
    EXPECT_TRUE(errors.empty());
}

TEST_F(testConnectionManager, automaticFallsBackToProprietary)
{
    {
        InSequence seq;
        EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::network_error));
        EXPECT_CALL(*onvif, disconnect());
        EXPECT_CALL(*dvrip, connect(_)).WillOnce(Return(OperationStatus::ok));
    }
    auto uit = make();
    ASSERT_TRUE(uit->connect());
    EXPECT_EQ(uit->active_protocol(), std::optional<ProtocolType>(ProtocolType::proprietary));
}

TEST_F(testConnectionManager, fixedPolicyNeverFallsBack)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::network_error));
    EXPECT_CALL(*dvrip, connect(_)).Times(0);

    ConnectionConfig cfg {};
    cfg.preferred = PreferredProtocol::onvif;
    auto uit = make(cfg);
    EXPECT_FALSE(uit->connect());
    EXPECT_EQ(uit->state(), ConnectionState::error);
    EXPECT_EQ(uit->last_status(), OperationStatus::network_error);
    EXPECT_FALSE(uit->active_protocol());
    EXPECT_EQ(errors.size(), 1u);
}

TEST_F(testConnectionManager, missingProtocolIsUnsupported)
{
    ConnectionConfig cfg {};
    cfg.preferred = PreferredProtocol::proprietary;
    ConnectionManager uit("cam-2", onvif, nullptr, cfg);
    EXPECT_FALSE(uit.connect());
    EXPECT_EQ(uit.last_status(), OperationStatus::unsupported);
    EXPECT_EQ(uit.state(), ConnectionState::error);
}

TEST_F(testConnectionManager, authenticatesWithCredentials)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, authenticate(_)).WillOnce(Return(OperationStatus::ok));

    ConnectionConfig cfg {};
    cfg.credentials = Credentials { "admin", "12345" };
    auto uit = make(cfg);
    ASSERT_TRUE(uit->connect());
    EXPECT_TRUE(uit->is_authenticated());
    EXPECT_EQ(states, (std::vector<ConnectionState> { ConnectionState::connecting, ConnectionState::connected,
                                                      ConnectionState::authenticating, ConnectionState::authenticated }));
}

TEST_F(testConnectionManager, rejectedLoginReportedAsAuthFailure)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, authenticate(_)).WillOnce(Return(OperationStatus::auth_failed));
    EXPECT_CALL(*dvrip, connect(_)).WillOnce(Return(OperationStatus::network_error));

    ConnectionConfig cfg {};
    cfg.credentials = Credentials { "admin", "wrong" };
    auto uit = make(cfg);
    EXPECT_FALSE(uit->connect());
    EXPECT_FALSE(uit->is_connected());
    EXPECT_EQ(uit->last_status(), OperationStatus::auth_failed) << "rejected login outranks the later network error";
    EXPECT_EQ(uit->state(), ConnectionState::error);
}

TEST_F(testConnectionManager, connectWhenConnectedIsNoop)
{
    EXPECT_CALL(*onvif, connect(_)).Times(1).WillOnce(Return(OperationStatus::ok));
    auto uit = make();
    ASSERT_TRUE(uit->connect());
    EXPECT_TRUE(uit->connect());
}

TEST_F(testConnectionManager, disconnectAndReconnect)
{
    EXPECT_CALL(*onvif, connect(_)).Times(2).WillRepeatedly(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, disconnect()).Times(::testing::AtLeast(1));

    auto uit = make();
    ASSERT_TRUE(uit->connect());
    uit->disconnect();
    EXPECT_EQ(uit->state(), ConnectionState::disconnected);
    EXPECT_FALSE(uit->active_protocol());
    EXPECT_TRUE(uit->reconnect());
    EXPECT_EQ(uit->state(), ConnectionState::connected);
}

TEST_F(testConnectionManager, operationsRequireConnection)
{
    auto uit = make();
    auto info = uit->device_information();
    EXPECT_FALSE(info.success);
    EXPECT_EQ(info.status, OperationStatus::not_connected);
    EXPECT_EQ(uit->ptz("up").status, OperationStatus::not_connected);
    EXPECT_FALSE(uit->test_connection());
}

TEST_F(testConnectionManager, operationsDispatchToActiveProtocol)
{
    EXPECT_CALL(*dvrip, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*dvrip, device_information()).WillRepeatedly(Return(info_from("Xiongmai")));
    EXPECT_CALL(*dvrip, start_playback("a.h264"))
        .WillOnce(Return(OperationResult<std::string>::ok("rtsp://x/playback/a.h264")));

    ConnectionConfig cfg {};
    cfg.preferred = PreferredProtocol::proprietary;
    auto uit = make(cfg);
    ASSERT_TRUE(uit->connect());

    auto info = uit->device_information();
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.data->manufacturer, "Xiongmai");
    EXPECT_EQ(info.protocol_used, std::optional<ProtocolType>(ProtocolType::proprietary));
    EXPECT_TRUE(uit->test_connection());

    auto url = uit->start_playback("a.h264");
    ASSERT_TRUE(url.success);
    EXPECT_EQ(*url.data, "rtsp://x/playback/a.h264");
}

TEST_F(testConnectionManager, recordingsNeedAuthenticationWhenConfigured)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, authenticate(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, recordings(_)).WillOnce(Return(
        OperationResult<std::vector<RecordingFile>>::failure(OperationStatus::unsupported, "none")));

    ConnectionConfig cfg {};
    cfg.credentials = Credentials { "admin", "12345" };
    auto uit = make(cfg);
    ASSERT_TRUE(uit->connect());
    auto recs = uit->recordings(RecordingQuery {});
    EXPECT_EQ(recs.status, OperationStatus::unsupported);
    EXPECT_EQ(recs.protocol_used, std::optional<ProtocolType>(ProtocolType::onvif));
}

TEST_F(testConnectionManager, protocolExceptionBecomesProtocolError)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, ptz(_, _)).WillOnce(Throw(std::runtime_error("socket closed")));

    auto uit = make();
    ASSERT_TRUE(uit->connect());
    auto r = uit->ptz("left", 2);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.status, OperationStatus::protocol_error);
    EXPECT_EQ(r.error, "socket closed");
}

TEST_F(testConnectionManager, failedConnectionTestRaisesError)
{
    EXPECT_CALL(*onvif, connect(_)).WillOnce(Return(OperationStatus::ok));
    EXPECT_CALL(*onvif, device_information()).WillOnce(Return(
        OperationResult<DeviceInformation>::failure(OperationStatus::network_error, "timeout")));

    auto uit = make();
    ASSERT_TRUE(uit->connect());
    EXPECT_FALSE(uit->test_connection());
    EXPECT_EQ(uit->state(), ConnectionState::error);
    ASSERT_EQ(errors.size(), 1u);
}

TEST_F(testConnectionManager, onvifCameraRequiringAuthentication)
{
    // Every unsigned request is refused, as on cameras with access control enabled.
    auto http = std::make_shared<NiceMock<MockHttpClient>>();
    std::vector<HttpRequest> sent;
    ON_CALL(*http, request(_)).WillByDefault(Invoke([&sent](const HttpRequest& r)
        {
            sent.push_back(r);
            HttpResponse rsp;
            const bool signed_request = r.body.find("UsernameToken") != std::string::npos;
            rsp.status = signed_request ? 200 : 400;
            rsp.body = signed_request ? ONVIF_DEVICE_INFO : ONVIF_NOT_AUTHORIZED;
            return std::optional<HttpResponse>(rsp);
        }));

    OnvifConfig onvifConfig {};
    onvifConfig.host = "192.168.1.108";
    ConnectionConfig cfg {};
    cfg.preferred = PreferredProtocol::onvif;
    cfg.credentials = Credentials { "admin", "correct" };
    cfg.reconnect_settle = 0ms;
    ConnectionManager uit("cam-3", std::make_shared<OnvifProtocol>(http, onvifConfig), nullptr, cfg);

    ASSERT_TRUE(uit.connect());
    EXPECT_EQ(uit.state(), ConnectionState::authenticated);
    EXPECT_EQ(uit.last_status(), OperationStatus::ok);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_THAT(sent[0].body, ::testing::Not(HasSubstr("UsernameToken")));
    EXPECT_THAT(sent[1].body, HasSubstr("<wsse:Username>admin</wsse:Username>"));

    auto info = uit.device_information();
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.data->manufacturer, "Dahua");
}

TEST_F(testConnectionManager, proprietaryPortDiscoveredOnConnect)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    std::vector<uint16_t> opened;
    bool session_open = false;
    ON_CALL(*conn, open(_, _, _)).WillByDefault(Invoke([&](const std::string&, uint16_t port, auto)
        {
            opened.push_back(port);
            session_open = port == 37777;
            return session_open;
        }));
    ON_CALL(*conn, is_open()).WillByDefault(Invoke([&session_open]() { return session_open; }));
    ON_CALL(*conn, close()).WillByDefault(Invoke([&session_open]() { session_open = false; }));
    ON_CALL(*conn, send_receive(_, _)).WillByDefault(Invoke([](const std::vector<uint8_t>&, auto)
        {
            return std::optional<DvripFrame>(make_dvrip_frame(DvripComm::LOGIN_RSP, R"({"Ret":203})"));
        }));

    DvripProtocolConfig dvripConfig {};
    dvripConfig.host = "192.168.1.20";
    auto protocol = std::make_shared<DvripProtocol>(conn, dvripConfig);
    ConnectionConfig cfg {};
    cfg.preferred = PreferredProtocol::proprietary;
    cfg.reconnect_settle = 0ms;
    ConnectionManager uit("cam-4", nullptr, protocol, cfg);

    ASSERT_TRUE(uit.connect());
    EXPECT_EQ(uit.state(), ConnectionState::connected);
    ASSERT_GE(opened.size(), 3u);
    EXPECT_EQ(opened[0], 34567);
    EXPECT_EQ(opened[1], 37777);
    EXPECT_EQ(opened.back(), 37777) << "session opened on the port that answered";

    auto info = uit.device_information();
    ASSERT_TRUE(info.success);
    EXPECT_EQ(info.data->extra.at("port"), "37777");

    uit.disconnect();
    opened.clear();
    ASSERT_TRUE(uit.connect());
    EXPECT_EQ(opened, (std::vector<uint16_t> { 37777 })) << "the answering port is remembered";
}

TEST_F(testConnectionManager, proprietaryWithoutAnsweringPort)
{
    auto conn = std::make_shared<NiceMock<MockDvripConnection>>();
    ON_CALL(*conn, open(_, _, _)).WillByDefault(Return(false));

    DvripProtocolConfig dvripConfig {};
    dvripConfig.host = "192.168.1.21";
    ConnectionConfig cfg {};
    cfg.preferred = PreferredProtocol::proprietary;
    cfg.reconnect_settle = 0ms;
    ConnectionManager uit("cam-5", nullptr, std::make_shared<DvripProtocol>(conn, dvripConfig), cfg);

    EXPECT_FALSE(uit.connect());
    EXPECT_EQ(uit.last_status(), OperationStatus::network_error);
}
