#include "../include/monotonic_state.hpp"
#include "../include/local_time.hpp"
#include "../include/logger.hpp"
#include <set>

static const std::set<std::string>& lifetimeSensors() {
    static const std::set<std::string> keys = {
        "total_energy", "yield_lifetime", "discharging_lifetime", "charging_lifetime",
        "consumption_lifetime", "grid_export_lifetime", "grid_import_lifetime", "cycle_count",
    };
    return keys;
}

static const std::set<std::string>& dailySensors() {
    static const std::set<std::string> keys = {
        "yield", "discharging", "charging", "consumption", "grid_export", "grid_import", "daily_energy",
    };
    return keys;
}

// GridBOSS per-phase daily channels: "<base>_l1" / "<base>_l2".
static const std::set<std::string>& dailyPhaseBases() {
    static const std::set<std::string> keys = {
        "ups", "grid_export", "grid_import", "load",
        "ac_couple1", "ac_couple2", "ac_couple3", "ac_couple4",
        "smart_load1", "smart_load2", "smart_load3", "smart_load4",
    };
    return keys;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

MonotonicStateTracker::MonotonicStateTracker(Clock clock) : clock_(clock) {
    if (!clock_) clock_ = []() { return std::time(nullptr); };
}

void MonotonicStateTracker::setTimezone(const std::string& timezone) {
    int offset = 0;
    if (!timezone.empty() && !parseGmtOffset(timezone, offset)) {
        Logger::warn("[Tracker] Unrecognised timezone '%s', using UTC", timezone.c_str());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    timezone_ = timezone;
}

std::string MonotonicStateTracker::timezone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timezone_;
}

CounterClass MonotonicStateTracker::classify(const std::string& sensor_key) {
    if (lifetimeSensors().count(sensor_key)) return CounterClass::LIFETIME;
    if (sensor_key.find("_lifetime") != std::string::npos || endsWith(sensor_key, "_total")) {
        return CounterClass::LIFETIME;
    }
    if (dailySensors().count(sensor_key) || endsWith(sensor_key, "_today")) return CounterClass::DAILY;
    if (endsWith(sensor_key, "_l1") || endsWith(sensor_key, "_l2")) {
        if (dailyPhaseBases().count(sensor_key.substr(0, sensor_key.size() - 3))) return CounterClass::DAILY;
    }
    return CounterClass::UNTRACKED;
}

std::string MonotonicStateTracker::today() const {
    return localDate(clock_(), timezone());
}

SensorValue MonotonicStateTracker::apply(const std::string& device_key, const std::string& sensor_key, const SensorValue& raw) {
    if (classify(sensor_key) == CounterClass::UNTRACKED) return raw;
    return applyOn(today(), device_key, sensor_key, raw);
}

SensorValue MonotonicStateTracker::applyOn(const std::string& date, const std::string& device_key,
                                           const std::string& sensor_key, const SensorValue& raw) {
    CounterClass cls = classify(sensor_key);
    if (cls == CounterClass::UNTRACKED) return raw;

    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(device_key, sensor_key);
    if (!raw.isNumber()) {
        auto it = states_.find(key);
        if (it == states_.end() || !it->second.has_value) return SensorValue();
        return SensorValue(it->second.last_valid_value);
    }

    SensorTrackingState& state = states_[key];
    double v = raw.number;

    if (cls == CounterClass::DAILY && !state.last_update_date.empty() && state.last_update_date != date) {
        Logger::info("[Tracker] %s/%s: date boundary %s -> %s, forcing 0 (transport reported %.2f)",
                     device_key.c_str(), sensor_key.c_str(), state.last_update_date.c_str(), date.c_str(), v);
        state.has_value = true;
        state.last_valid_value = 0.0;
        state.last_update_date = date;
        state.accept_next = true;
        return SensorValue(0.0);
    }

    if (state.accept_next) {
        state.accept_next = false;
    } else if (state.has_value && v < state.last_valid_value) {
        if (cls == CounterClass::DAILY && v == 0.0) {
            Logger::info("[Tracker] %s/%s: accepting same-day reset to 0", device_key.c_str(), sensor_key.c_str());
        } else {
            Logger::debug("[Tracker] %s/%s: rejecting decrease %.2f -> %.2f",
                          device_key.c_str(), sensor_key.c_str(), state.last_valid_value, v);
            return SensorValue(state.last_valid_value);
        }
    }

    state.has_value = true;
    state.last_valid_value = v;
    state.last_update_date = date;
    return SensorValue(v);
}

SensorMap MonotonicStateTracker::exposeSensors(const std::string& device_key, const SensorMap& sensors) {
    SensorMap out;
    std::string date = today();
    for (const auto& kv : sensors) {
        SensorValue v = applyOn(date, device_key, kv.first, kv.second);
        if (!v.isNone()) out[kv.first] = v;
    }
    return out;
}

DeviceRecord MonotonicStateTracker::exposeDevice(const DeviceRecord& record) {
    DeviceRecord out = record;
    if (record.hasError()) return out;
    out.sensors = exposeSensors(record.serial, record.sensors);
    for (auto& bat : out.batteries) {
        bat.second = exposeSensors(record.serial + "/" + bat.first, record.batteries.at(bat.first));
    }
    return out;
}

size_t MonotonicStateTracker::trackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}
