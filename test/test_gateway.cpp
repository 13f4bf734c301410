#include <gtest/gtest.h>
#include <ArduinoJson.h>
#include <atomic>
#include <chrono>
#include <type_traits>
#include <cstring>
#include <thread>
#include "../include/gridlink_gateway.hpp"
#include "../include/transition_router.hpp"
#include "fakes.hpp"

namespace {

const std::time_t MORNING_UTC = 1792303200;  // 2026-10-18 06:00 UTC

const char* const CONFIG = R"({
  "logging": {"log_level": "WARN"},
  "polling": {"cloud_interval_s": 30, "local_interval_s": 5, "device_timeout_ms": 2000},
  "entries": [
    {
      "entry_id": "plant-4411",
      "title": "EG4 Electronics Web Monitor - Hillside Ranch",
      "connection_type": "http",
      "cloud": {"username": "installer@example.com", "password": "secret", "plant_id": "4411",
                "plant_name": "Hillside Ranch"},
      "devices": [{"serial": "1234567890", "type": "inverter", "model": "18kPV"}],
      "station": {"name": "Hillside Ranch", "timezone": "GMT -8"}
    }
  ]
})";

class GridLinkGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage.files["/config/gridlink.json"] = CONFIG;
        cloud = std::make_shared<FakeTransport>(TransportKind::CLOUD, "https://monitor.eg4electronics.com");
        factory.cloud = cloud;
        gateway.reset(new GridLinkGateway(&storage, &factory, [this]() { return now.load(); }));
        gateway->setPublishCallback([this](const std::string& id, const PollResult& result, const std::string& json) {
            published.push_back(id);
            statuses.push_back(result.status);
            last_json = json;
        });
    }

    void TearDown() override { gateway.reset(); }

    // The ticker starts the first cycle on the first loop() after begin().
    bool loopUntilPublished(size_t count) {
        for (int i = 0; i < 300 && published.size() < count; ++i) {
            gateway->loop();
            if (published.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return published.size() >= count;
    }

    MemoryConfigStorage storage;
    FakeTransportFactory factory;
    std::shared_ptr<FakeTransport> cloud;
    std::atomic<std::time_t> now{MORNING_UTC};
    std::unique_ptr<GridLinkGateway> gateway;
    std::vector<std::string> published;
    std::vector<CycleStatus> statuses;
    std::string last_json;
};

static_assert(!std::is_copy_constructible<GridLinkGateway>::value, "gateway owns its coordinators");
static_assert(!std::is_copy_assignable<GridLinkGateway>::value, "gateway owns its coordinators");

double yieldIn(const std::string& json) {
    DynamicJsonDocument doc(8192);
    if (deserializeJson(doc, json)) return -1;
    return doc["devices"]["1234567890"]["sensors"]["yield"] | -1.0;
}

}  // namespace

TEST_F(GridLinkGatewayTest, StartsOneCoordinatorPerEntry) {
    ASSERT_TRUE(gateway->begin());
    EXPECT_EQ(std::vector<std::string>{"plant-4411"}, gateway->entryIds());
    ASSERT_NE(nullptr, gateway->coordinator("plant-4411"));
    EXPECT_NE(nullptr, gateway->tracker("plant-4411"));
    EXPECT_EQ(nullptr, gateway->coordinator("other"));
    EXPECT_EQ(1, factory.cloud_creates);
    EXPECT_EQ("installer@example.com", factory.last_credentials.username);

    char stats[512];
    gateway->getStatistics(stats, sizeof(stats));
    EXPECT_NE(nullptr, strstr(stats, "entry=plant-4411"));
}

TEST_F(GridLinkGatewayTest, PublishesCompletedCycles) {
    ASSERT_TRUE(gateway->begin());
    std::string json;
    EXPECT_FALSE(gateway->snapshotJson("plant-4411", json));

    ASSERT_TRUE(loopUntilPublished(1));
    gateway->loop();
    ASSERT_EQ(std::vector<std::string>{"plant-4411"}, published);
    EXPECT_EQ(CycleStatus::SUCCESS, statuses[0]);

    DynamicJsonDocument doc(8192);
    ASSERT_EQ(DeserializationError::Ok, deserializeJson(doc, last_json).code());
    EXPECT_FALSE(doc["stale"].as<bool>());
    EXPECT_DOUBLE_EQ(241.7, doc["devices"]["1234567890"]["sensors"]["ac_voltage"].as<double>());
    EXPECT_STREQ("inverter", doc["devices"]["1234567890"]["type"].as<const char*>());
    EXPECT_EQ(3u, doc["station"]["api_requests_today"].as<unsigned>());
    EXPECT_STREQ("cloud", doc["device_info"]["1234567890"]["transport"].as<const char*>());

    ASSERT_TRUE(gateway->snapshotJson("plant-4411", json));
    EXPECT_EQ(last_json, json);
}

TEST_F(GridLinkGatewayTest, ErroredDevicesAreSerializedWithError) {
    cloud->runtime = [](const std::string&) -> RawPayload { throw ApiException("DEVICE_OFFLINE"); };
    ASSERT_TRUE(gateway->begin());
    ASSERT_TRUE(loopUntilPublished(1));
    EXPECT_EQ(CycleStatus::FAILED, statuses[0]);

    DynamicJsonDocument doc(8192);
    ASSERT_EQ(DeserializationError::Ok, deserializeJson(doc, last_json).code());
    EXPECT_TRUE(doc["stale"].as<bool>());
    EXPECT_STREQ("api: DEVICE_OFFLINE", doc["devices"]["1234567890"]["error"].as<const char*>());
}

TEST_F(GridLinkGatewayTest, RefreshOfUnknownEntryIsCancelled) {
    ASSERT_TRUE(gateway->begin());
    EXPECT_EQ(CycleStatus::CANCELLED, gateway->refresh("missing").get().status);
}

TEST_F(GridLinkGatewayTest, TransitionReloadsCoordinatorAndKeepsTracker) {
    auto local = std::make_shared<FakeTransport>(TransportKind::MODBUS_TCP, "192.168.1.50:502");
    factory.local["1234567890"] = local;
    ASSERT_TRUE(gateway->begin());
    gateway->refresh("plant-4411").get();

    PollingCoordinator* before = gateway->coordinator("plant-4411");
    MonotonicStateTracker* tracker = gateway->tracker("plant-4411");

    TransitionRouter* router = gateway->transitions();
    router->begin("plant-4411", TransitionType::HTTP_TO_HYBRID);
    FormInput local_type = {{"local_type", "modbus"}};
    router->step(STEP_SELECT_LOCAL_TYPE, &local_type);
    FormInput modbus = {{"host", "192.168.1.50"}};
    TransitionResult r = router->step(STEP_MODBUS, &modbus);
    ASSERT_EQ(STEP_CONFIRM, r.step_id);
    EXPECT_EQ("2092", router->builder()->context().test_results.at("device_type"));
    FormInput confirm;
    r = router->step(STEP_CONFIRM, &confirm);
    ASSERT_TRUE(r.isSuccess());

    PollingCoordinator* after = gateway->coordinator("plant-4411");
    ASSERT_NE(nullptr, after);
    EXPECT_NE(before, after);
    EXPECT_EQ(tracker, gateway->tracker("plant-4411"));
    EXPECT_EQ(ConnectionType::HYBRID, after->entry().connection_type);
    EXPECT_EQ(5u, after->intervalSeconds());
    EXPECT_EQ(1, cloud->disconnect_calls.load());

    PollResult next = gateway->refresh("plant-4411").get();
    EXPECT_EQ(CycleStatus::SUCCESS, next.status);
    EXPECT_EQ("modbus_tcp", next.snapshot->device_info.at("1234567890").transport);
    EXPECT_NE(std::string::npos, storage.files["/config/gridlink.json"].find("\"hybrid\""));
}

TEST_F(GridLinkGatewayTest, StartsWithDefaultsWhenNothingIsStored) {
    storage.files.clear();
    EXPECT_FALSE(gateway->begin());
    EXPECT_TRUE(gateway->entryIds().empty());
}

TEST_F(GridLinkGatewayTest, DailyCounterResetsOnFirstPollAfterMidnight) {
    std::atomic<int> today_yielding{200};
    cloud->energy = [&today_yielding](const std::string&) {
        RawPayload p(PayloadKind::ENERGY);
        p.values["todayYielding"] = SensorValue(today_yielding.load());
        return p;
    };
    ASSERT_TRUE(gateway->begin());
    ASSERT_TRUE(loopUntilPublished(1));
    EXPECT_DOUBLE_EQ(20.0, yieldIn(last_json));

    // 04:00 local on the next day at GMT -8.
    now = MORNING_UTC + 6 * 3600;
    std::string json;
    ASSERT_TRUE(gateway->snapshotJson("plant-4411", json));
    EXPECT_DOUBLE_EQ(20.0, yieldIn(json));
    ASSERT_TRUE(gateway->snapshotJson("plant-4411", json));
    EXPECT_DOUBLE_EQ(20.0, yieldIn(json));

    auto runtime = cloud->runtime;
    cloud->runtime = [](const std::string&) -> RawPayload { throw ConnectionException("HTTP 503"); };
    gateway->refresh("plant-4411").get();
    gateway->loop();
    ASSERT_EQ(2u, published.size());
    EXPECT_EQ(CycleStatus::FAILED, statuses[1]);
    EXPECT_NE(std::string::npos, last_json.find("\"stale\":true"));
    EXPECT_DOUBLE_EQ(20.0, yieldIn(last_json));

    // The cloud still reports yesterday's total on the first poll of the day.
    cloud->runtime = runtime;
    gateway->refresh("plant-4411").get();
    gateway->loop();
    ASSERT_EQ(3u, published.size());
    EXPECT_DOUBLE_EQ(0.0, yieldIn(last_json));

    today_yielding = 30;
    gateway->refresh("plant-4411").get();
    gateway->loop();
    ASSERT_EQ(4u, published.size());
    EXPECT_DOUBLE_EQ(3.0, yieldIn(last_json));
    ASSERT_TRUE(gateway->snapshotJson("plant-4411", json));
    EXPECT_EQ(last_json, json);
}

TEST_F(GridLinkGatewayTest, ReauthReplacesRejectedSession) {
    auto runtime = cloud->runtime;
    cloud->runtime = [](const std::string&) -> RawPayload { throw AuthException("please login again"); };
    ASSERT_TRUE(gateway->begin());
    PollResult failed = gateway->refresh("plant-4411").get();
    EXPECT_EQ(CycleStatus::AUTH_FAILED, failed.status);
    ASSERT_TRUE(gateway->coordinator("plant-4411")->needsReauth());

    TransitionRouter* router = gateway->transitions();
    TransitionResult r = router->begin("plant-4411");
    ASSERT_FALSE(r.options.empty());
    EXPECT_EQ("reauth", r.options.front());
    FormInput select = {{"transition", "reauth"}};
    r = router->step(STEP_SELECT, &select);
    ASSERT_EQ(STEP_REAUTH_CONFIRM, r.step_id);

    cloud->runtime = runtime;
    FormInput password = {{"password", "rotated2026"}};
    r = router->step(STEP_REAUTH_CONFIRM, &password);
    ASSERT_TRUE(r.isSuccess());
    EXPECT_EQ("reauth_successful", r.reason);
    EXPECT_EQ("rotated2026", factory.last_credentials.password);

    PollingCoordinator* after = gateway->coordinator("plant-4411");
    ASSERT_NE(nullptr, after);
    EXPECT_FALSE(after->needsReauth());
    EXPECT_EQ("rotated2026", after->entry().cloud.password);
    EXPECT_EQ(CycleStatus::SUCCESS, gateway->refresh("plant-4411").get().status);
    EXPECT_NE(std::string::npos, storage.files["/config/gridlink.json"].find("rotated2026"));

    EXPECT_EQ(std::vector<std::string>({"http_to_hybrid", "no_change"}), router->begin("plant-4411").options);
}
