#include <gtest/gtest.h>
#include "../include/device_model.hpp"

static DeviceConfig inverter(const std::string& serial) {
    DeviceConfig c;
    c.serial = serial;
    c.type = DeviceType::INVERTER;
    c.model = "18kPV";
    return c;
}

TEST(DeviceModelTest, AssemblesInverterFromCloudPayloads) {
    DeviceReadings r;
    r.runtime.values["ppv"] = SensorValue(3200);
    r.runtime.values["pToUser"] = SensorValue(500);
    r.runtime.values["pToGrid"] = SensorValue(200);
    r.runtime.values["fwCode"] = SensorValue("FAAB-2525");
    r.energy.values["todayYielding"] = SensorValue(184);
    r.battery.bank.values["soc"] = SensorValue(76);

    BatteryPayload module;
    module.battery_key = "1234567890_Battery_ID_01";
    module.payload.values["batMaxCellVoltage"] = SensorValue(3350);
    module.payload.values["batMinCellVoltage"] = SensorValue(3300);
    r.battery.modules.push_back(module);

    DeviceRecord rec = DeviceModel::assemble(inverter("1234567890"), TransportKind::CLOUD, r);
    EXPECT_EQ("1234567890", rec.serial);
    EXPECT_EQ("18kPV", rec.model);
    EXPECT_EQ("FAAB-2525", rec.firmware_version);
    EXPECT_FALSE(rec.hasError());
    EXPECT_DOUBLE_EQ(3200, rec.sensors["pv_total_power"].number);
    EXPECT_DOUBLE_EQ(18.4, rec.sensors["yield"].number);
    EXPECT_DOUBLE_EQ(76, rec.sensors["battery_bank_soc"].number);
    EXPECT_DOUBLE_EQ(300, rec.sensors["grid_power"].number);

    ASSERT_EQ(1u, rec.batteries.count("1234567890-01"));
    SensorMap& bat = rec.batteries["1234567890-01"];
    EXPECT_NEAR(0.05, bat["battery_cell_voltage_delta"].number, 1e-9);
}

TEST(DeviceModelTest, FirmwareFallsBack) {
    DeviceRecord rec = DeviceModel::assemble(inverter("1234567890"), TransportKind::CLOUD, DeviceReadings());
    EXPECT_EQ(FIRMWARE_FALLBACK, rec.firmware_version);
}

TEST(DeviceModelTest, CleansBatteryKeys) {
    EXPECT_EQ("4512670118-01", DeviceModel::cleanBatteryKey("4512670118_Battery_ID_01", "1234567890"));
    EXPECT_EQ("1234567890-02", DeviceModel::cleanBatteryKey("Battery_ID_02", "1234567890"));
    EXPECT_EQ("1234567890-03", DeviceModel::cleanBatteryKey("3", "1234567890"));
    EXPECT_EQ("BAT-A", DeviceModel::cleanBatteryKey("BAT_A", "1234567890"));
    EXPECT_EQ("01", DeviceModel::cleanBatteryKey("", "1234567890"));
}

TEST(DeviceModelTest, FiltersPhaseSensorsByFeatureFlags) {
    DeviceConfig c = inverter("1234567890");
    c.supports_split_phase = Tristate::NO;
    EXPECT_FALSE(DeviceModel::includePhaseSensor(c, "eps_voltage_l1"));
    EXPECT_TRUE(DeviceModel::includePhaseSensor(c, "grid_voltage_r"));

    c.supports_split_phase = Tristate::UNSET;
    c.supports_three_phase = Tristate::NO;
    EXPECT_TRUE(DeviceModel::includePhaseSensor(c, "eps_voltage_l1"));
    EXPECT_FALSE(DeviceModel::includePhaseSensor(c, "grid_voltage_s"));

    DeviceReadings r;
    r.runtime.values["vacs"] = SensorValue(2400);
    r.runtime.values["vacr"] = SensorValue(2410);
    DeviceRecord rec = DeviceModel::assemble(c, TransportKind::CLOUD, r);
    EXPECT_EQ(0u, rec.sensors.count("grid_voltage_s"));
    EXPECT_EQ(1u, rec.sensors.count("ac_voltage"));
}

TEST(DeviceModelTest, GridBossAggregatesAndDropsUnusedPorts) {
    DeviceConfig c;
    c.serial = "9876543210";
    c.type = DeviceType::GRIDBOSS;

    DeviceReadings r;
    r.midbox.values["gridL1ActivePower"] = SensorValue(1000);
    r.midbox.values["gridL2ActivePower"] = SensorValue(1200);
    r.midbox.values["eUpsTodayL1"] = SensorValue(50);
    r.midbox.values["eUpsTodayL2"] = SensorValue(70);
    r.midbox.values["smartPort1Status"] = SensorValue(1);
    r.midbox.values["smartLoad1L1ActivePower"] = SensorValue(300);
    r.midbox.values["smartLoad1L2ActivePower"] = SensorValue(200);
    r.midbox.values["smartPort2Status"] = SensorValue(0);
    r.midbox.values["smartLoad2L1ActivePower"] = SensorValue(999);
    r.midbox.values["fwCode"] = SensorValue("IAAB-1300");

    DeviceRecord rec = DeviceModel::assemble(c, TransportKind::CLOUD, r);
    EXPECT_EQ("GridBOSS", rec.model);
    EXPECT_EQ("IAAB-1300", rec.firmware_version);
    EXPECT_DOUBLE_EQ(2200, rec.sensors["grid_power"].number);
    EXPECT_DOUBLE_EQ(12.0, rec.sensors["ups_today"].number);
    EXPECT_DOUBLE_EQ(500, rec.sensors["smart_load1_power"].number);
    EXPECT_DOUBLE_EQ(500, rec.sensors["smart_load_power"].number);
    EXPECT_EQ(0u, rec.sensors.count("smart_load2_power_l1"));
    EXPECT_EQ(0u, rec.sensors.count("smart_load2_power"));
}

TEST(DeviceModelTest, ParallelGroupModelName) {
    DeviceConfig c;
    c.serial = "parallel_group_b";
    c.type = DeviceType::PARALLEL_GROUP;
    c.master_serial = "1234567890";
    DeviceReadings r;
    r.parallel_energy.values["todayYielding"] = SensorValue(250);
    DeviceRecord rec = DeviceModel::assemble(c, TransportKind::CLOUD, r);
    EXPECT_EQ("Parallel Group B", rec.model);
    EXPECT_DOUBLE_EQ(25.0, rec.sensors["yield"].number);
}

TEST(DeviceModelTest, DecodesParallelConfigRegister) {
    SensorMap s;
    // Slave on phase 1, two units in the system.
    DeviceModel::decodeParallelConfig((2 << 8) | (1 << 2) | 2, s);
    EXPECT_EQ("Slave", s["parallel_role"].text);
    EXPECT_DOUBLE_EQ(1, s["parallel_phase"].number);
    EXPECT_DOUBLE_EQ(2, s["parallel_number"].number);
}

TEST(DeviceModelTest, ErroredRecordHasNoSensors) {
    DeviceRecord rec = DeviceModel::errored(inverter("1234567890"), "timeout: no reply");
    EXPECT_TRUE(rec.hasError());
    EXPECT_TRUE(rec.sensors.empty());
    EXPECT_EQ("timeout: no reply", rec.error);
    EXPECT_EQ("18kPV", rec.model);
}
