/**
 * @file testReconnectionSupervisor.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 */
#include "manual_scheduler.hpp"
#include "mock_collaborators.hpp"
#include "reconnection_supervisor.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

using namespace camscout;
using namespace std::chrono_literals;

namespace
{

ReconnectionConfig steady_config(unsigned max_attempts = 10)
{
    ReconnectionConfig cfg {};
    cfg.jitter_enabled = false;
    cfg.settle_delay = 0ms;
    cfg.max_attempts = max_attempts;
    return cfg;
}

class testReconnectionSupervisor : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ON_CALL(*protocol, type()).WillByDefault(Return(ProtocolType::onvif));
        ConnectionConfig cfg {};
        cfg.preferred = PreferredProtocol::onvif;
        cfg.reconnect_settle = 0ms;
        manager = std::make_shared<ConnectionManager>("cam-1", protocol, nullptr, cfg);
    }

    /// Fail one connect so the manager lands in the error state.
    void break_connection()
    {
        EXPECT_CALL(*protocol, connect(_)).WillRepeatedly(Return(OperationStatus::network_error));
        EXPECT_FALSE(manager->connect());
    }

    ManualScheduler scheduler;
    std::shared_ptr<NiceMock<MockCameraProtocol>> protocol { std::make_shared<NiceMock<MockCameraProtocol>>() };
    std::shared_ptr<ConnectionManager> manager;
};

} // namespace

TEST(testBackoffDelay, exponentialWithCap)
{
    auto cfg = steady_config();
    const std::vector<long> expected { 1000, 2000, 4000, 8000, 16000, 32000, 64000, 128000, 256000, 300000, 300000 };
    for (unsigned i = 0; i < expected.size(); ++i)
    {
        EXPECT_EQ(backoff_delay(cfg, i + 1).count(), expected[i]) << "attempt " << i + 1;
    }
    EXPECT_EQ(backoff_delay(cfg, 0).count(), 1000);
}

TEST(testBackoffDelay, jitterStaysWithinFivePercent)
{
    ReconnectionConfig cfg {};
    EXPECT_EQ(backoff_delay(cfg, 3, 0.0).count(), 3800);
    EXPECT_EQ(backoff_delay(cfg, 3, 0.5).count(), 4000);
    EXPECT_EQ(backoff_delay(cfg, 3, 0.999).count(), 4200);
    EXPECT_EQ(backoff_delay(cfg, 20, 0.999).count(), 300000) << "cap applies after jitter";
}

TEST(testBackoffDelay, customDelaysComeFirst)
{
    auto cfg = steady_config();
    cfg.custom_delays = { 500ms, 700ms };
    EXPECT_EQ(backoff_delay(cfg, 1).count(), 500);
    EXPECT_EQ(backoff_delay(cfg, 2).count(), 700);
    EXPECT_EQ(backoff_delay(cfg, 3).count(), 4000);
}

TEST_F(testReconnectionSupervisor, errorStartsSessionWithBackoff)
{
    ReconnectionSupervisor uit(scheduler);
    uit.configure_camera("cam-1", steady_config());
    uit.watch(manager);
    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::idle);

    break_connection();
    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::attempting);

    scheduler.run_due();
    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::backing_off);
    scheduler.advance(1000ms);
    scheduler.advance(2000ms);

    auto s = uit.session("cam-1");
    ASSERT_TRUE(s);
    EXPECT_EQ(s->current_attempt, 3u);
    ASSERT_EQ(s->attempts.size(), 3u);
    EXPECT_EQ(s->attempts[0].backoff_delay, 1000ms);
    EXPECT_EQ(s->attempts[2].backoff_delay, 4000ms);
    EXPECT_EQ(s->last_error, "network_error");
    EXPECT_FALSE(s->attempts[1].successful);

    const auto d = scheduler.delays();
    EXPECT_EQ(d, (std::vector<std::chrono::milliseconds> {
        ReconnectionSupervisor::HEALTH_CHECK_INTERVAL, 0ms, 1000ms, 2000ms, 4000ms }));
}

TEST_F(testReconnectionSupervisor, failsAfterMaxAttempts)
{
    ReconnectionSupervisor uit(scheduler);
    uit.configure_camera("cam-1", steady_config(3));
    uit.watch(manager);
    break_connection();

    scheduler.run_due();
    scheduler.advance(1000ms);
    scheduler.advance(2000ms);

    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::failed);
    EXPECT_EQ(scheduler.pending(), 1u) << "only the health check remains";
    EXPECT_TRUE(uit.active_sessions().empty());
    EXPECT_EQ(uit.statistics().sessions_by_state[ReconnectionState::failed], 1u);

    scheduler.advance(60000ms);
    EXPECT_EQ(uit.session("cam-1")->attempts.size(), 3u);
}

TEST_F(testReconnectionSupervisor, successEndsSession)
{
    ReconnectionSupervisor uit(scheduler);
    uit.configure_camera("cam-1", steady_config());
    uit.watch(manager);
    break_connection();

    scheduler.run_due();
    EXPECT_CALL(*protocol, connect(_)).WillRepeatedly(Return(OperationStatus::ok));
    scheduler.advance(1000ms);

    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::idle);
    EXPECT_FALSE(uit.session("cam-1"));
    EXPECT_TRUE(manager->is_connected());
}

TEST_F(testReconnectionSupervisor, forceReconnectionSkipsBackoff)
{
    ReconnectionSupervisor uit(scheduler);
    uit.configure_camera("cam-1", steady_config());
    uit.watch(manager);
    EXPECT_FALSE(uit.force_reconnection("cam-1"));

    break_connection();
    scheduler.run_due();
    ASSERT_EQ(uit.state_of("cam-1"), ReconnectionState::backing_off);

    EXPECT_CALL(*protocol, connect(_)).WillRepeatedly(Return(OperationStatus::ok));
    EXPECT_TRUE(uit.force_reconnection("cam-1"));
    EXPECT_FALSE(uit.session("cam-1"));
    EXPECT_EQ(scheduler.pending(), 1u);
}

TEST_F(testReconnectionSupervisor, disabledSupervisorIgnoresErrors)
{
    ReconnectionSupervisor uit(scheduler);
    uit.watch(manager);
    uit.set_enabled(false);
    EXPECT_FALSE(uit.enabled());

    break_connection();
    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::idle);
    EXPECT_FALSE(uit.start_reconnection("cam-1"));

    uit.set_enabled(true);
    EXPECT_TRUE(uit.start_reconnection("cam-1", "manual"));
    EXPECT_EQ(uit.state_of("cam-1"), ReconnectionState::attempting);

    uit.set_enabled(false);
    EXPECT_FALSE(uit.session("cam-1")) << "disabling disposes sessions";
}

TEST_F(testReconnectionSupervisor, unknownCameraAndStop)
{
    ReconnectionSupervisor uit(scheduler);
    EXPECT_FALSE(uit.start_reconnection("nope"));

    uit.configure_camera("cam-1", steady_config());
    uit.watch(manager);
    break_connection();
    uit.stop_reconnection("cam-1");
    EXPECT_FALSE(uit.session("cam-1"));
    EXPECT_EQ(scheduler.pending(), 1u);

    uit.unwatch("cam-1");
    EXPECT_EQ(uit.statistics().watched_cameras, 0u);
    EXPECT_FALSE(manager->connect());
    EXPECT_FALSE(uit.session("cam-1")) << "unwatched cameras are not supervised";
}

TEST_F(testReconnectionSupervisor, healthCheckDetectsDeadCamera)
{
    EXPECT_CALL(*protocol, connect(_)).WillRepeatedly(Return(OperationStatus::ok));
    EXPECT_CALL(*protocol, device_information()).WillRepeatedly(Return(
        OperationResult<DeviceInformation>::failure(OperationStatus::network_error, "timeout")));
    ASSERT_TRUE(manager->connect());

    ReconnectionSupervisor uit(scheduler);
    uit.configure_camera("cam-1", steady_config());
    uit.watch(manager);

    scheduler.advance(ReconnectionSupervisor::HEALTH_CHECK_INTERVAL);
    EXPECT_TRUE(uit.statistics().health_check_active);
    // The attempt was queued at the health check time and has run by now.
    auto s = uit.session("cam-1");
    EXPECT_FALSE(s) << "reconnect succeeded on the first attempt";
    EXPECT_TRUE(manager->is_connected());
}

TEST_F(testReconnectionSupervisor, jsonExport)
{
    ReconnectionSupervisor uit(scheduler);
    uit.configure_camera("cam-1", steady_config());
    uit.watch(manager);
    break_connection();
    scheduler.run_due();

    const auto j = uit.to_json();
    EXPECT_TRUE(j.at("globalEnabled").get<bool>());
    EXPECT_EQ(j.at("totalSessions").get<int>(), 1);
    EXPECT_EQ(j.at("sessionsByState").at("backing_off").get<int>(), 1);
    const auto& session = j.at("sessions").at("cam-1");
    EXPECT_EQ(session.at("state").get<std::string>(), "backing_off");
    EXPECT_EQ(session.at("attempts").size(), 1u);
    EXPECT_EQ(session.at("config").at("maxAttempts").get<int>(), 10);
}
