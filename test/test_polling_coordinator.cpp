#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include "../include/polling_coordinator.hpp"
#include "fakes.hpp"

namespace {

const std::time_t MORNING_UTC = 1792303200;  // 2026-10-18 06:00 UTC

PollingConfig pollingConfig(uint32_t device_timeout_ms = 2000) {
    PollingConfig p;
    p.cloud_interval_s = 30;
    p.local_interval_s = 5;
    p.min_interval_s = 5;
    p.max_interval_s = 300;
    p.device_timeout_ms = device_timeout_ms;
    return p;
}

DeviceConfig inverter(const std::string& serial) {
    DeviceConfig d;
    d.serial = serial;
    return d;
}

class PollingCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cloud = std::make_shared<FakeTransport>(TransportKind::CLOUD, "https://monitor.example.com");
        factory.cloud = cloud;
        now = MORNING_UTC;
    }

    std::unique_ptr<PollingCoordinator> make(const FleetEntry& entry, uint32_t device_timeout_ms = 2000) {
        std::unique_ptr<PollingCoordinator> c(new PollingCoordinator(
            entry, pollingConfig(device_timeout_ms), &factory, [this]() { return now.load(); }));
        c->begin();
        return c;
    }

    FakeTransportFactory factory;
    std::shared_ptr<FakeTransport> cloud;
    std::atomic<std::time_t> now{0};
};

}  // namespace

TEST_F(PollingCoordinatorTest, PollsEveryDevice) {
    FleetEntry entry = cloudEntry();
    entry.devices.push_back(inverter("2222222222"));
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::SUCCESS, r.status);
    EXPECT_EQ(2u, r.devices_ok);
    ASSERT_TRUE(r.snapshot);
    EXPECT_EQ(2u, r.snapshot->devices.size());
    EXPECT_FALSE(r.snapshot->stale);
    const DeviceRecord& rec = r.snapshot->devices.at("1234567890");
    EXPECT_FALSE(rec.hasError());
    EXPECT_DOUBLE_EQ(241.7, rec.sensors.at("ac_voltage").number);
    EXPECT_EQ("cloud", r.snapshot->device_info.at("1234567890").transport);
    EXPECT_EQ(CoordinatorState::IDLE, c->state());
}

TEST_F(PollingCoordinatorTest, FailingDeviceDoesNotAffectOthers) {
    FleetEntry entry = cloudEntry();
    entry.devices.push_back(inverter("BAD0000000"));
    cloud->runtime = [](const std::string& serial) {
        if (serial == "BAD0000000") throw ConnectionException("connection reset");
        RawPayload p(PayloadKind::RUNTIME);
        p.values["vacr"] = SensorValue(2400);
        return p;
    };
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::PARTIAL, r.status);
    EXPECT_EQ(1u, r.devices_ok);
    EXPECT_EQ(1u, r.devices_failed);
    EXPECT_EQ("connection: connection reset", r.snapshot->devices.at("BAD0000000").error);
    EXPECT_FALSE(r.snapshot->devices.at("1234567890").hasError());
    EXPECT_EQ(CoordinatorState::DEGRADED, c->state());
}

TEST_F(PollingCoordinatorTest, MalformedPayloadIsReportedPerDevice) {
    FleetEntry entry = cloudEntry();
    cloud->energy = [](const std::string&) -> RawPayload { throw DecodingException("not JSON"); };
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::FAILED, r.status);
    EXPECT_EQ("decoding: not JSON", r.snapshot->devices.at("1234567890").error);
}

TEST_F(PollingCoordinatorTest, RefreshWhileInFlightJoinsCycle) {
    cloud->delay_ms = 100;
    auto c = make(cloudEntry());

    PollFuture first = c->requestRefresh();
    PollFuture second = c->requestRefresh();
    EXPECT_TRUE(c->isPolling());
    EXPECT_EQ(first.get().cycle, second.get().cycle);
    EXPECT_EQ(3, cloud->calls.load());

    PollResult next = c->requestRefresh().get();
    EXPECT_EQ(first.get().cycle + 1, next.cycle);
}

TEST_F(PollingCoordinatorTest, SessionSafeTransportPollsConcurrently) {
    FleetEntry entry = cloudEntry();
    entry.devices.push_back(inverter("2222222222"));
    entry.devices.push_back(inverter("3333333333"));
    cloud->delay_ms = 150;
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::SUCCESS, r.status);
    EXPECT_GE(cloud->max_active.load(), 2);
}

TEST_F(PollingCoordinatorTest, SharedLocalTransportIsSerialized) {
    FleetEntry entry;
    entry.entry_id = "garage";
    entry.connection_type = ConnectionType::LOCAL;
    entry.local_transports.push_back(modbusTransport("1111111111"));
    entry.local_transports.push_back(modbusTransport("2222222222"));
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    local->session_safe = false;
    local->keeps_session = false;
    local->delay_ms = 30;
    factory.local["1111111111"] = local;
    factory.local["2222222222"] = local;
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::SUCCESS, r.status);
    EXPECT_EQ(2u, r.devices_ok);
    EXPECT_EQ(1, local->max_active.load());
    EXPECT_EQ(1, local->connect_calls.load());
    EXPECT_EQ(1, local->disconnect_calls.load());
    EXPECT_EQ("modbus_tcp", r.snapshot->device_info.at("2222222222").transport);
}

TEST_F(PollingCoordinatorTest, LocalEntryWithoutDeviceListPollsEachTransport) {
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    factory.local["1234567890"] = local;
    FleetEntry entry = modbusEntry();
    auto c = make(entry);

    ASSERT_EQ(1u, c->devices().size());
    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::SUCCESS, r.status);
    EXPECT_EQ(1u, r.snapshot->devices.count("1234567890"));
    EXPECT_EQ(0u, r.cloud_calls);
    EXPECT_FALSE(r.snapshot->has_station);
}

TEST_F(PollingCoordinatorTest, HybridRoutesLocalDevicesLocally) {
    FleetEntry entry = hybridEntry();
    entry.devices.push_back(inverter("9876543210"));
    entry.devices.back().type = DeviceType::GRIDBOSS;
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    factory.local["1234567890"] = local;
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::SUCCESS, r.status);
    EXPECT_EQ("modbus_tcp", r.snapshot->device_info.at("1234567890").transport);
    EXPECT_EQ("cloud", r.snapshot->device_info.at("9876543210").transport);
    std::vector<std::string> seen = cloud->seen();
    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ("9876543210", seen[0]);
}

TEST_F(PollingCoordinatorTest, MissingDriverIsReportedAsUnsupported) {
    FleetEntry entry = modbusEntry();
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::FAILED, r.status);
    EXPECT_EQ(0u, r.snapshot->devices.at("1234567890").error.find("unsupported:"));
}

TEST_F(PollingCoordinatorTest, ConnectFailureMarksDevicesOnThatTransport) {
    auto local = std::make_shared<FakeTransport>(TransportKind::WIFI_DONGLE, "192.168.1.51:8000");
    local->keeps_session = false;
    local->connect_error = []() { throw ConnectionException("no route", ERR_TIMEOUT); };
    factory.local["1234567890"] = local;
    FleetEntry entry = modbusEntry();
    entry.local_transports[0] = dongleTransport();
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ("timeout: no route", r.snapshot->devices.at("1234567890").error);
    EXPECT_EQ(0, local->calls.load());
}

TEST_F(PollingCoordinatorTest, RejectedSessionIsRenewedOnce) {
    FleetEntry entry = cloudEntry();
    entry.devices.push_back(inverter("2222222222"));
    std::atomic<bool> expired{true};
    cloud->runtime = [&expired](const std::string&) {
        if (expired.exchange(false)) throw AuthException("session expired");
        RawPayload p(PayloadKind::RUNTIME);
        p.values["vacr"] = SensorValue(2400);
        return p;
    };
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::SUCCESS, r.status);
    EXPECT_EQ(1, cloud->connect_calls.load());
    EXPECT_FALSE(c->needsReauth());
}

TEST_F(PollingCoordinatorTest, PersistentRejectionNeedsReauth) {
    cloud->runtime = [](const std::string&) -> RawPayload { throw AuthException("session expired"); };
    auto c = make(cloudEntry());

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::AUTH_FAILED, r.status);
    EXPECT_EQ(1, cloud->connect_calls.load());
    EXPECT_TRUE(c->needsReauth());
    EXPECT_EQ(0u, r.snapshot->devices.at("1234567890").error.find("auth:"));

    int calls = cloud->calls.load();
    PollResult again = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::AUTH_FAILED, again.status);
    EXPECT_EQ(calls, cloud->calls.load());
    EXPECT_EQ(1, cloud->connect_calls.load());
}

TEST_F(PollingCoordinatorTest, FailedLoginDuringRenewalNeedsReauth) {
    cloud->runtime = [](const std::string&) -> RawPayload { throw AuthException("session expired"); };
    cloud->connect_error = []() { throw AuthException("bad password"); };
    auto c = make(cloudEntry());

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::AUTH_FAILED, r.status);
    EXPECT_TRUE(c->needsReauth());
}

TEST_F(PollingCoordinatorTest, ReauthKeepsLocalDevicesPolling) {
    FleetEntry entry = hybridEntry();
    entry.devices.push_back(inverter("9876543210"));
    entry.devices.back().type = DeviceType::GRIDBOSS;
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    factory.local["1234567890"] = local;
    cloud->midbox = [](const std::string&) -> RawPayload { throw AuthException("session expired"); };
    auto c = make(entry);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::PARTIAL, r.status);
    EXPECT_TRUE(c->needsReauth());

    PollResult again = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::PARTIAL, again.status);
    EXPECT_FALSE(again.snapshot->devices.at("1234567890").hasError());
    EXPECT_EQ(0u, again.snapshot->devices.at("9876543210").error.find("auth:"));
}

TEST_F(PollingCoordinatorTest, FailedCycleKeepsLastSnapshotAsStale) {
    auto c = make(cloudEntry());
    PollResult good = c->requestRefresh().get();
    ASSERT_EQ(CycleStatus::SUCCESS, good.status);

    cloud->runtime = [](const std::string&) -> RawPayload { throw ConnectionException("HTTP 503"); };
    PollResult bad = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::FAILED, bad.status);
    ASSERT_TRUE(bad.snapshot);
    EXPECT_TRUE(bad.snapshot->stale);
    EXPECT_EQ(good.snapshot->cycle, bad.snapshot->cycle);
    EXPECT_FALSE(bad.snapshot->devices.at("1234567890").hasError());
    EXPECT_FALSE(good.snapshot->stale);
}

TEST_F(PollingCoordinatorTest, FirstFailedCyclePublishesErrors) {
    cloud->runtime = [](const std::string&) -> RawPayload { throw ConnectionException("HTTP 503"); };
    auto c = make(cloudEntry());

    PollResult r = c->requestRefresh().get();
    ASSERT_TRUE(r.snapshot);
    EXPECT_TRUE(r.snapshot->stale);
    EXPECT_TRUE(r.snapshot->devices.at("1234567890").hasError());
}

TEST_F(PollingCoordinatorTest, SlowDeviceTimesOut) {
    FleetEntry entry = hybridEntry();
    entry.devices.push_back(inverter("9876543210"));
    entry.devices.back().type = DeviceType::GRIDBOSS;
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    local->delay_ms = 600;
    factory.local["1234567890"] = local;
    auto c = make(entry, 100);

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::PARTIAL, r.status);
    EXPECT_EQ(0u, r.snapshot->devices.at("1234567890").error.find("timeout:"));
    EXPECT_FALSE(r.snapshot->devices.at("9876543210").hasError());
    EXPECT_LT(r.duration_ms, 600u);
}

TEST_F(PollingCoordinatorTest, StationCountsCloudRequestsPerDay) {
    auto c = make(cloudEntry());

    PollResult first = c->requestRefresh().get();
    EXPECT_EQ(3u, first.cloud_calls);
    ASSERT_TRUE(first.snapshot->has_station);
    EXPECT_EQ("Hillside Ranch", first.snapshot->station.name);
    EXPECT_EQ(3u, first.snapshot->station.api_requests_today);
    EXPECT_DOUBLE_EQ(6.0, first.snapshot->station.api_request_rate);

    PollResult second = c->requestRefresh().get();
    EXPECT_EQ(6u, second.snapshot->station.api_requests_today);

    now = MORNING_UTC + 24 * 3600;
    PollResult next_day = c->requestRefresh().get();
    EXPECT_EQ(3u, next_day.snapshot->station.api_requests_today);
}

TEST_F(PollingCoordinatorTest, TickerStartsCycleAndQueuesCompletion) {
    auto c = make(cloudEntry());
    c->loop();

    PollResult done;
    bool got = false;
    for (int i = 0; i < 200 && !got; ++i) {
        got = c->consumeCompletion(done);
        if (!got) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(got);
    EXPECT_EQ(1u, done.cycle);
    EXPECT_FALSE(c->consumeCompletion(done));
}

TEST_F(PollingCoordinatorTest, ShutdownReleasesTransportsAndCancelsRefresh) {
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    factory.local["1234567890"] = local;
    auto c = make(hybridEntry());
    c->requestRefresh().get();

    c->shutdown();
    EXPECT_EQ(1, cloud->disconnect_calls.load());
    EXPECT_EQ(1, local->disconnect_calls.load());

    PollResult r = c->requestRefresh().get();
    EXPECT_EQ(CycleStatus::CANCELLED, r.status);
    ASSERT_TRUE(r.snapshot);
}

TEST_F(PollingCoordinatorTest, RefreshBeforeBeginIsCancelled) {
    PollingCoordinator c(cloudEntry(), pollingConfig(), &factory);
    EXPECT_EQ(CycleStatus::CANCELLED, c.requestRefresh().get().status);
    EXPECT_FALSE(c.snapshot());
}

TEST_F(PollingCoordinatorTest, IntervalFollowsConnectionType) {
    PollingCoordinator cloud_only(cloudEntry(), pollingConfig(), &factory);
    PollingCoordinator hybrid(hybridEntry(), pollingConfig(), &factory);
    EXPECT_EQ(30u, cloud_only.intervalSeconds());
    EXPECT_EQ(5u, hybrid.intervalSeconds());

    char buf[256];
    hybrid.getStatistics(buf, sizeof(buf));
    EXPECT_NE(nullptr, strstr(buf, "interval=5"));
}
