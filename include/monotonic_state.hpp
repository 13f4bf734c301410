#pragma once
#include <ctime>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include "types.hpp"

enum class CounterClass { UNTRACKED, DAILY, LIFETIME };

/**
 * @brief Guards cumulative counters against transport glitches.
 *
 * Lifetime counters never decrease. Daily counters never decrease within
 * a local date (except an explicit drop to 0) and are forced to 0 on the
 * first read after the station's local date changes.
 *
 * State is keyed by (device key, sensor key) and applied when a snapshot
 * is consumed, so raw snapshot values stay untouched. One tracker belongs
 * to exactly one fleet entry.
 */
class MonotonicStateTracker {
public:
    using Clock = std::function<std::time_t()>;

    explicit MonotonicStateTracker(Clock clock = Clock());

    /**
     * @brief Station timezone used for the date boundary ("GMT -8" style).
     * Unknown or empty timezones fall back to UTC.
     */
    void setTimezone(const std::string& timezone);
    std::string timezone() const;

    static CounterClass classify(const std::string& sensor_key);

    /**
     * @brief Exposed value for one sensor read at the current local date.
     */
    SensorValue apply(const std::string& device_key, const std::string& sensor_key, const SensorValue& raw);

    /**
     * @brief Same as apply() with an explicit local date (YYYY-MM-DD).
     */
    SensorValue applyOn(const std::string& date, const std::string& device_key,
                        const std::string& sensor_key, const SensorValue& raw);

    // Applies the tracker to every sensor of a device and its batteries.
    // Battery state is keyed "<serial>/<battery key>".
    SensorMap exposeSensors(const std::string& device_key, const SensorMap& sensors);
    DeviceRecord exposeDevice(const DeviceRecord& record);

    std::string today() const;
    size_t trackedCount() const;

private:
    struct SensorTrackingState {
        bool has_value = false;
        double last_valid_value = 0.0;
        std::string last_update_date;
        bool accept_next = false;
    };

    Clock clock_;
    std::string timezone_;
    std::map<std::pair<std::string, std::string>, SensorTrackingState> states_;
    mutable std::mutex mutex_;
};
