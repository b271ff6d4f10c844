/**
 * @file testSsdpParsing.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 */
#include "mock_collaborators.hpp"
#include "ssdp_probe.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;

using namespace camscout;

namespace
{

const std::string CAMERA_DESCRIPTION {
    R"(<?xml version="1.0"?>)"
    R"(<root xmlns="urn:schemas-upnp-org:device-1-0"><specVersion><major>1</major><minor>0</minor></specVersion>)"
    R"(<device><deviceType>urn:schemas-upnp-org:device:Basic:1</deviceType>)"
    R"(<friendlyName>Front Door</friendlyName><manufacturer>Amcrest</manufacturer>)"
    R"(<modelName>IP2M-841</modelName><serialNumber>AMC0001</serialNumber><UDN>uuid:1234</UDN>)"
    R"(<serviceList><service><serviceType>urn:schemas-upnp-org:service:VideoStream:1</serviceType>)"
    R"(<serviceId>urn:upnp-org:serviceId:video</serviceId><controlURL>/ctl</controlURL>)"
    R"(<eventSubURL>/evt</eventSubURL><SCPDURL>/scpd.xml</SCPDURL></service></serviceList>)"
    R"(</device></root>)" };

const std::string ROUTER_DESCRIPTION {
    R"(<root><device><deviceType>urn:schemas-upnp-org:device:InternetGatewayDevice:1</deviceType>)"
    R"(<friendlyName>Home Router</friendlyName><manufacturer>Netgear</manufacturer>)"
    R"(<serviceList><service><serviceType>urn:schemas-upnp-org:service:Layer3Forwarding:1</serviceType></service></serviceList>)"
    R"(</device></root>)" };

HttpResponse ok(const std::string& body)
{
    HttpResponse r;
    r.status = 200;
    r.body = body;
    return r;
}

SsdpResponse located(const std::string& location, const std::string& sender)
{
    SsdpResponse r;
    r.location = location;
    r.sender = sender;
    return r;
}

} // namespace

TEST(testSsdpParsing, msearch)
{
    const auto msg = build_msearch("upnp:rootdevice", 2);
    EXPECT_EQ(msg,
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "ST: upnp:rootdevice\r\n"
        "MX: 2\r\n"
        "\r\n");
}

TEST(testSsdpParsing, response)
{
    auto r = parse_ssdp_response(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age = 1800\r\n"
        "EXT:\r\n"
        "Location: http://192.168.1.108:49152/rootDesc.xml\r\n"
        "SERVER: Linux/3.10 UPnP/1.0 IpCam/1.0\r\n"
        "ST: upnp:rootdevice\r\n"
        "USN: uuid:1234::upnp:rootdevice\r\n"
        "\r\n");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->location, "http://192.168.1.108:49152/rootDesc.xml");
    EXPECT_EQ(r->server, "Linux/3.10 UPnP/1.0 IpCam/1.0");
    EXPECT_EQ(r->usn, "uuid:1234::upnp:rootdevice");
    EXPECT_EQ(r->st, "upnp:rootdevice");
    EXPECT_EQ(r->max_age, std::optional<uint32_t>(1800));
}

TEST(testSsdpParsing, rejectedResponses)
{
    EXPECT_FALSE(parse_ssdp_response(""));
    EXPECT_FALSE(parse_ssdp_response("M-SEARCH * HTTP/1.1\r\nST: ssdp:all\r\n\r\n")) << "other searches are not answers";
    EXPECT_FALSE(parse_ssdp_response("HTTP/1.1 404 Not Found\r\nLOCATION: http://x/\r\n\r\n"));
    EXPECT_FALSE(parse_ssdp_response("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n")) << "no location";

    auto r = parse_ssdp_response("HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=soon\r\nLOCATION: http://x/\r\n\r\n");
    ASSERT_TRUE(r);
    EXPECT_FALSE(r->max_age);
}

TEST(testSsdpParsing, deviceDescription)
{
    auto d = parse_device_description(CAMERA_DESCRIPTION);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->friendly_name, "Front Door");
    EXPECT_EQ(d->manufacturer, "Amcrest");
    EXPECT_EQ(d->model_name, "IP2M-841");
    EXPECT_EQ(d->udn, "uuid:1234");
    ASSERT_EQ(d->services.size(), 1u);
    EXPECT_EQ(d->services[0].control_url, "/ctl");
    EXPECT_EQ(d->services[0].scpd_url, "/scpd.xml");
    EXPECT_FALSE(d->is_media_device());
    EXPECT_TRUE(d->has_camera_services());
    EXPECT_TRUE(d->is_probable_camera());

    auto router = parse_device_description(ROUTER_DESCRIPTION);
    ASSERT_TRUE(router);
    EXPECT_FALSE(router->is_probable_camera());

    EXPECT_FALSE(parse_device_description("<root><specVersion/></root>"));
    EXPECT_FALSE(parse_device_description("not xml <"));
}

TEST(testSsdpParsing, mediaDeviceTypes)
{
    UpnpDeviceDescription d;
    for (auto type : { "urn:schemas-upnp-org:device:MediaServer:1", "urn:vendor:device:NVR:1", "urn:x:device:IPCamera:1" })
    {
        d.device_type = type;
        EXPECT_TRUE(d.is_media_device()) << type;
    }
    d.device_type = "urn:schemas-upnp-org:device:WANDevice:1";
    EXPECT_FALSE(d.is_media_device());
}

TEST(testSsdpParsing, describeKeepsCameras)
{
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, request(Field(&HttpRequest::url, "http://192.168.1.108:49152/rootDesc.xml")))
        .WillOnce(Return(ok(CAMERA_DESCRIPTION)));
    EXPECT_CALL(*http, request(Field(&HttpRequest::url, "http://192.168.1.1:5000/igd.xml")))
        .WillOnce(Return(ok(ROUTER_DESCRIPTION)));
    EXPECT_CALL(*http, request(Field(&HttpRequest::url, "http://192.168.1.50/gone.xml")))
        .WillOnce(Return(std::nullopt));

    SsdpProbe uit(http);
    auto candidates = uit.describe({ located("http://192.168.1.108:49152/rootDesc.xml", "192.168.1.108"),
                                     located("http://192.168.1.1:5000/igd.xml", "192.168.1.1"),
                                     located("http://192.168.1.50/gone.xml", "192.168.1.50") },
                                   CancellationToken {});
    ASSERT_EQ(candidates.size(), 1u);
    const auto& c = candidates[0];
    EXPECT_EQ(c.ip, "192.168.1.108");
    EXPECT_EQ(c.port, 49152);
    EXPECT_EQ(c.protocol, "UPNP");
    EXPECT_EQ(c.method, DiscoveryMethod::ssdp);
    EXPECT_EQ(c.name, std::optional<std::string>("Front Door"));
    EXPECT_EQ(c.manufacturer, std::optional<std::string>("Amcrest"));
    EXPECT_EQ(c.metadata.at("serial_number"), "AMC0001");
}

TEST(testSsdpParsing, describeEverythingWhenNotFiltering)
{
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, request(_)).WillOnce(Return(ok(ROUTER_DESCRIPTION)));

    SsdpConfig cfg {};
    cfg.cameras_only = false;
    SsdpProbe uit(http, cfg);
    auto candidates = uit.describe({ located("http://192.168.1.1/igd.xml", "192.168.1.1") }, CancellationToken {});
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].port, 80);
    EXPECT_FALSE(candidates[0].model);
}

TEST(testSsdpParsing, describeStopsWhenCancelled)
{
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, request(_)).Times(0);

    CancellationSource source;
    source.cancel();
    SsdpProbe uit(http);
    EXPECT_TRUE(uit.describe({ located("http://192.168.1.108/d.xml", "192.168.1.108") }, source.token()).empty());
}
