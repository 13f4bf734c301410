#include <gtest/gtest.h>
#include "../include/local_time.hpp"
#include "../include/monotonic_state.hpp"

namespace {

// 2026-10-18 06:00:00 UTC
const std::time_t MORNING_UTC = 1792303200;

double num(const SensorValue& v) {
    EXPECT_TRUE(v.isNumber());
    return v.number;
}

}  // namespace

TEST(MonotonicStateTest, LifetimeNeverDecreases) {
    MonotonicStateTracker t;
    EXPECT_DOUBLE_EQ(100, num(t.applyOn("2026-10-18", "inv", "yield_lifetime", SensorValue(100.0))));
    EXPECT_DOUBLE_EQ(100, num(t.applyOn("2026-10-18", "inv", "yield_lifetime", SensorValue(99.9))));
    EXPECT_DOUBLE_EQ(105, num(t.applyOn("2026-10-18", "inv", "yield_lifetime", SensorValue(105.0))));
}

TEST(MonotonicStateTest, LifetimeSurvivesDateChange) {
    MonotonicStateTracker t;
    t.applyOn("2026-10-18", "inv", "total_energy", SensorValue(500.0));
    EXPECT_DOUBLE_EQ(500, num(t.applyOn("2026-10-19", "inv", "total_energy", SensorValue(10.0))));
}

TEST(MonotonicStateTest, DailyResetsAtDateBoundary) {
    MonotonicStateTracker t;
    EXPECT_DOUBLE_EQ(10, num(t.applyOn("2026-10-18", "inv", "yield", SensorValue(10.0))));
    EXPECT_DOUBLE_EQ(20, num(t.applyOn("2026-10-18", "inv", "yield", SensorValue(20.0))));
    // The transport still reports yesterday's total on the first read after midnight.
    EXPECT_DOUBLE_EQ(0, num(t.applyOn("2026-10-19", "inv", "yield", SensorValue(20.0))));
    EXPECT_DOUBLE_EQ(5, num(t.applyOn("2026-10-19", "inv", "yield", SensorValue(5.0))));
}

TEST(MonotonicStateTest, DailyAcceptsSameDayDropToZero) {
    MonotonicStateTracker t;
    EXPECT_DOUBLE_EQ(10, num(t.applyOn("2026-10-18", "inv", "grid_import", SensorValue(10.0))));
    EXPECT_DOUBLE_EQ(0, num(t.applyOn("2026-10-18", "inv", "grid_import", SensorValue(0.0))));
}

TEST(MonotonicStateTest, DailyRejectsSameDayDecrease) {
    MonotonicStateTracker t;
    t.applyOn("2026-10-18", "inv", "charging", SensorValue(8.0));
    EXPECT_DOUBLE_EQ(8, num(t.applyOn("2026-10-18", "inv", "charging", SensorValue(7.5))));
}

TEST(MonotonicStateTest, UntrackedPassesThrough) {
    MonotonicStateTracker t;
    t.applyOn("2026-10-18", "inv", "ac_power", SensorValue(1000.0));
    EXPECT_DOUBLE_EQ(10, num(t.applyOn("2026-10-18", "inv", "ac_power", SensorValue(10.0))));
    EXPECT_EQ(0u, t.trackedCount());
}

TEST(MonotonicStateTest, MissingValueKeepsLastValid) {
    MonotonicStateTracker t;
    EXPECT_TRUE(t.applyOn("2026-10-18", "inv", "yield_lifetime", SensorValue()).isNone());
    t.applyOn("2026-10-18", "inv", "yield_lifetime", SensorValue(42.0));
    EXPECT_DOUBLE_EQ(42, num(t.applyOn("2026-10-18", "inv", "yield_lifetime", SensorValue())));
}

TEST(MonotonicStateTest, StateIsPerDevice) {
    MonotonicStateTracker t;
    t.applyOn("2026-10-18", "a", "yield_lifetime", SensorValue(100.0));
    EXPECT_DOUBLE_EQ(50, num(t.applyOn("2026-10-18", "b", "yield_lifetime", SensorValue(50.0))));
}

TEST(MonotonicStateTest, ClassifiesSensorKeys) {
    EXPECT_EQ(CounterClass::LIFETIME, MonotonicStateTracker::classify("yield_lifetime"));
    EXPECT_EQ(CounterClass::LIFETIME, MonotonicStateTracker::classify("cycle_count"));
    EXPECT_EQ(CounterClass::LIFETIME, MonotonicStateTracker::classify("ups_lifetime_l1"));
    EXPECT_EQ(CounterClass::LIFETIME, MonotonicStateTracker::classify("load_total"));
    EXPECT_EQ(CounterClass::DAILY, MonotonicStateTracker::classify("yield"));
    EXPECT_EQ(CounterClass::DAILY, MonotonicStateTracker::classify("ups_today"));
    EXPECT_EQ(CounterClass::DAILY, MonotonicStateTracker::classify("smart_load2_l1"));
    EXPECT_EQ(CounterClass::UNTRACKED, MonotonicStateTracker::classify("grid_voltage_l1"));
    EXPECT_EQ(CounterClass::UNTRACKED, MonotonicStateTracker::classify("pv_total_power"));
}

TEST(MonotonicStateTest, DateFollowsStationTimezone) {
    std::time_t now = MORNING_UTC;
    MonotonicStateTracker t([&now]() { return now; });
    t.setTimezone("GMT -8");
    EXPECT_EQ("2026-10-17", t.today());
    t.setTimezone("GMT+8");
    EXPECT_EQ("2026-10-18", t.today());

    // 23:30 UTC is already the next day at GMT+8.
    now = MORNING_UTC + 17 * 3600 + 1800;
    EXPECT_EQ("2026-10-19", t.today());
}

TEST(MonotonicStateTest, ApplyUsesClockDate) {
    std::time_t now = MORNING_UTC;
    MonotonicStateTracker t([&now]() { return now; });
    t.setTimezone("GMT -8");
    EXPECT_DOUBLE_EQ(30, num(t.apply("inv", "yield", SensorValue(30.0))));
    // 18:00 on the next local day at GMT-8
    now += 20 * 3600;
    EXPECT_DOUBLE_EQ(0, num(t.apply("inv", "yield", SensorValue(30.0))));
    EXPECT_DOUBLE_EQ(1, num(t.apply("inv", "yield", SensorValue(1.0))));
}

TEST(MonotonicStateTest, UnknownTimezoneFallsBackToUtc) {
    std::time_t now = MORNING_UTC;
    MonotonicStateTracker t([&now]() { return now; });
    t.setTimezone("Mars/Olympus");
    EXPECT_EQ("2026-10-18", t.today());
}

TEST(MonotonicStateTest, ExposeDeviceGuardsBatteries) {
    std::time_t now = MORNING_UTC;
    MonotonicStateTracker t([&now]() { return now; });
    DeviceRecord rec;
    rec.serial = "1234567890";
    rec.sensors["yield_lifetime"] = SensorValue(100.0);
    rec.batteries["1234567890-01"]["cycle_count"] = SensorValue(50.0);
    t.exposeDevice(rec);

    rec.sensors["yield_lifetime"] = SensorValue(0.0);
    rec.batteries["1234567890-01"]["cycle_count"] = SensorValue(49.0);
    DeviceRecord out = t.exposeDevice(rec);
    EXPECT_DOUBLE_EQ(100, out.sensors["yield_lifetime"].number);
    EXPECT_DOUBLE_EQ(50, out.batteries["1234567890-01"]["cycle_count"].number);
    // Raw record untouched
    EXPECT_DOUBLE_EQ(0, rec.sensors["yield_lifetime"].number);
}

TEST(LocalTimeTest, ParsesGmtOffsets) {
    int offset = 0;
    EXPECT_TRUE(parseGmtOffset("GMT -8", offset));
    EXPECT_EQ(-480, offset);
    EXPECT_TRUE(parseGmtOffset("GMT+5:30", offset));
    EXPECT_EQ(330, offset);
    EXPECT_FALSE(parseGmtOffset("PST", offset));
}
