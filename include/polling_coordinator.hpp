#pragma once
#include <stdint.h>
#include <atomic>
#include <ctime>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config_manager.hpp"
#include "device_transport.hpp"
#include "ticker_fallback.hpp"
#include "types.hpp"

class TransportFactory;

enum class CoordinatorState { IDLE, POLLING, DEGRADED };
enum class CycleStatus { SUCCESS, PARTIAL, FAILED, AUTH_FAILED, CANCELLED };

const char* coordinatorStateName(CoordinatorState state);
const char* cycleStatusName(CycleStatus status);

struct PollResult {
    uint32_t cycle = 0;
    CycleStatus status = CycleStatus::SUCCESS;
    uint32_t devices_ok = 0;
    uint32_t devices_failed = 0;
    uint32_t cloud_calls = 0;
    uint32_t duration_ms = 0;
    SnapshotPtr snapshot;
};

using PollFuture = std::shared_future<PollResult>;

/**
 * @brief Polls every device of one fleet entry and publishes snapshots.
 *
 * At most one cycle runs at a time; refresh requests made while a cycle is
 * in flight receive that cycle's future. Devices are polled concurrently,
 * except that devices sharing a transport that is not session-safe are
 * polled one after the other. A device whose poll fails or exceeds
 * device_timeout_ms is published with an error; other devices are not
 * affected.
 */
class PollingCoordinator {
public:
    using Clock = std::function<std::time_t()>;

    PollingCoordinator(const FleetEntry& entry, const PollingConfig& polling, TransportFactory* factory,
                       Clock clock = Clock());
    ~PollingCoordinator();

    // Creates the transports and starts the interval ticker.
    void begin();
    // Drives the ticker; call from the main loop.
    void loop();
    PollFuture requestRefresh();
    // Pops the oldest finished cycle that has not been consumed yet.
    bool consumeCompletion(PollResult& out);
    // Cancels the in-flight cycle, waits for it and releases all transports.
    void shutdown();

    SnapshotPtr snapshot() const;
    CoordinatorState state() const;
    bool needsReauth() const;
    bool isPolling() const;
    uint32_t intervalSeconds() const { return interval_s_; }
    const FleetEntry& entry() const { return entry_; }
    std::vector<DeviceConfig> devices() const;
    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    struct Route {
        DeviceConfig device;
        std::shared_ptr<DeviceTransport> transport;
        std::string unavailable;
    };

    std::vector<Route> routeDevices() const;
    void runCycle(std::shared_ptr<std::promise<PollResult>> promise, uint32_t cycle);
    void updateStation(Snapshot& snap, uint32_t cloud_calls);

    FleetEntry entry_;
    PollingConfig polling_;
    TransportFactory* factory_;
    Clock clock_;
    uint32_t interval_s_;

    std::shared_ptr<DeviceTransport> cloud_;
    std::map<std::string, std::shared_ptr<DeviceTransport>> local_;
    Ticker ticker_;

    mutable std::mutex mutex_;
    SnapshotPtr snapshot_;
    CoordinatorState state_ = CoordinatorState::IDLE;
    bool in_flight_ = false;
    PollFuture in_flight_future_;
    std::thread cycle_thread_;
    std::deque<PollResult> completions_;
    std::shared_ptr<std::atomic<bool>> cancel_;
    bool needs_reauth_ = false;
    bool started_ = false;

    uint32_t cycles_ = 0;
    uint32_t failed_cycles_ = 0;
    uint32_t last_duration_ms_ = 0;
    std::string api_day_;
    uint32_t api_requests_today_ = 0;
};
