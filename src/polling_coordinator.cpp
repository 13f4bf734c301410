#include "../include/polling_coordinator.hpp"
#include "../include/device_model.hpp"
#include "../include/exceptions.hpp"
#include "../include/local_time.hpp"
#include "../include/logger.hpp"
#include "../include/transport_factory.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <set>
#include <system_error>

const char* coordinatorStateName(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::IDLE: return "idle";
        case CoordinatorState::POLLING: return "polling";
        case CoordinatorState::DEGRADED: return "degraded";
    }
    return "idle";
}

const char* cycleStatusName(CycleStatus status) {
    switch (status) {
        case CycleStatus::SUCCESS: return "success";
        case CycleStatus::PARTIAL: return "partial";
        case CycleStatus::FAILED: return "failed";
        case CycleStatus::AUTH_FAILED: return "auth_failed";
        case CycleStatus::CANCELLED: return "cancelled";
    }
    return "failed";
}

namespace {

const size_t MAX_PENDING_COMPLETIONS = 8;
const uint32_t CANCEL_CHECK_MS = 50;
const char* const REAUTH_REQUIRED = "auth: cloud session needs reauthentication";

// Shared by the cycle thread and its workers. A worker the cycle gave up on
// keeps running detached, so everything it touches is shared-owned.
struct CycleShared {
    std::mutex mutex;
    std::condition_variable cv;
    std::shared_ptr<std::atomic<bool>> cancel;
    std::atomic<bool> auth_failed{false};
    std::atomic<uint32_t> cloud_calls{0};
    std::atomic<uint32_t> login_generation{0};
    std::mutex reauth_mutex;
};

// Devices polled one after the other on the same transport.
struct Slot {
    std::shared_ptr<DeviceTransport> transport;
    std::vector<DeviceConfig> devices;
    std::vector<DeviceRecord> records;  // guarded by CycleShared::mutex
    bool done = false;                  // guarded by CycleShared::mutex
};

std::string describe(const TransportException& e) {
    return std::string(errorCodeName(e.code())) + ": " + e.what();
}

// Runs one transport call. A rejected cloud session is renewed once (shared
// by all workers of the cycle) and the call retried; a second rejection marks
// the whole cycle as needing reauthentication.
template <typename T>
T guarded(CycleShared& ctx, DeviceTransport& transport, const std::function<T()>& call) {
    bool cloud = transport.kind() == TransportKind::CLOUD;
    if (cloud && ctx.auth_failed) throw AuthException("Cloud session needs reauthentication");
    uint32_t generation = ctx.login_generation;
    try {
        if (cloud) ++ctx.cloud_calls;
        return call();
    } catch (const AuthException& e) {
        if (!cloud) throw;
        {
            std::lock_guard<std::mutex> lock(ctx.reauth_mutex);
            if (ctx.auth_failed) throw;
            if (ctx.login_generation == generation) {
                Logger::warn("[Coordinator] Cloud session rejected (%s), re-authenticating", e.what());
                try {
                    transport.connect();
                } catch (const AuthException& login_error) {
                    ctx.auth_failed = true;
                    Logger::error("[Coordinator] Re-authentication failed: %s", login_error.what());
                    throw;
                }
                ++ctx.login_generation;
            }
        }
        try {
            ++ctx.cloud_calls;
            return call();
        } catch (const AuthException& retry_error) {
            ctx.auth_failed = true;
            Logger::error("[Coordinator] Cloud call rejected after re-authentication: %s", retry_error.what());
            throw;
        }
    }
}

DeviceRecord pollDevice(CycleShared& ctx, DeviceTransport& t, const DeviceConfig& dev) {
    DeviceReadings readings;
    const std::string& serial = dev.serial;
    switch (dev.type) {
        case DeviceType::INVERTER:
            readings.runtime = guarded<RawPayload>(ctx, t, [&]() { return t.readRuntime(serial); });
            readings.energy = guarded<RawPayload>(ctx, t, [&]() { return t.readEnergy(serial); });
            try {
                readings.battery = guarded<BatteryReading>(ctx, t, [&]() { return t.readBattery(serial); });
            } catch (const ApiException& e) {
                Logger::warn("[Coordinator] %s: no battery data (%s)", serial.c_str(), e.what());
            } catch (const UnsupportedException& e) {
                Logger::debug("[Coordinator] %s: battery read unsupported (%s)", serial.c_str(), e.what());
            }
            if (t.kind() != TransportKind::CLOUD) {
                try {
                    readings.parallel_config = guarded<uint16_t>(ctx, t, [&]() { return t.readParallelConfig(serial); });
                    readings.has_parallel_config = true;
                } catch (const TransportException& e) {
                    Logger::warn("[Coordinator] %s: parallel config unavailable (%s)", serial.c_str(), e.what());
                }
            }
            break;
        case DeviceType::GRIDBOSS:
            readings.midbox = guarded<RawPayload>(ctx, t, [&]() { return t.readMidbox(serial); });
            break;
        case DeviceType::PARALLEL_GROUP: {
            std::string master = dev.master_serial.empty() ? serial : dev.master_serial;
            readings.parallel_energy = guarded<RawPayload>(ctx, t, [&]() { return t.readParallelEnergy(master); });
            break;
        }
    }
    return DeviceModel::assemble(dev, t.kind(), readings);
}

void runSlot(std::shared_ptr<CycleShared> ctx, std::shared_ptr<Slot> slot) {
    DeviceTransport& t = *slot->transport;
    std::vector<DeviceRecord> records;
    std::string connect_error;

    if (!t.keepsSession()) {
        try {
            t.connect();
        } catch (const TransportException& e) {
            connect_error = describe(e);
            Logger::warn("[Coordinator] Connect to %s failed: %s", t.endpoint().c_str(), e.what());
        }
    }

    for (const auto& dev : slot->devices) {
        if (!connect_error.empty()) {
            records.push_back(DeviceModel::errored(dev, connect_error));
            continue;
        }
        if (*ctx->cancel) {
            records.push_back(DeviceModel::errored(dev, "cancelled"));
            continue;
        }
        try {
            records.push_back(pollDevice(*ctx, t, dev));
        } catch (const DecodingException& e) {
            Logger::warn("[Coordinator] %s: malformed %s payload (%s): %s", dev.serial.c_str(),
                         transportKindName(t.kind()), errorCodeName(e.code()), e.what());
            records.push_back(DeviceModel::errored(dev, describe(e)));
        } catch (const TransportException& e) {
            Logger::warn("[Coordinator] %s: poll via %s failed: %s", dev.serial.c_str(),
                         transportKindName(t.kind()), e.what());
            records.push_back(DeviceModel::errored(dev, describe(e)));
        } catch (const std::exception& e) {
            Logger::warn("[Coordinator] %s: unexpected failure: %s", dev.serial.c_str(), e.what());
            records.push_back(DeviceModel::errored(dev, std::string("decoding: ") + e.what()));
        }
    }

    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        slot->records = records;
        slot->done = true;
    }
    ctx->cv.notify_all();
}

}  // namespace

PollingCoordinator::PollingCoordinator(const FleetEntry& entry, const PollingConfig& polling,
                                       TransportFactory* factory, Clock clock)
    : entry_(entry), polling_(polling), factory_(factory), clock_(clock),
      cancel_(std::make_shared<std::atomic<bool>>(false)) {
    interval_s_ = entry_.hasLocalTransports() ? polling_.local_interval_s : polling_.cloud_interval_s;
    ticker_.attach([this]() { requestRefresh(); });
    ticker_.interval(interval_s_ * 1000);
}

PollingCoordinator::~PollingCoordinator() {
    shutdown();
}

void PollingCoordinator::begin() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return;
    }
    if (entry_.usesCloud() && factory_) {
        cloud_ = factory_->createCloud(entry_.cloud);
        if (!cloud_) Logger::error("[Coordinator] %s: cloud transport not available", entry_.entry_id.c_str());
    }
    for (const auto& lt : entry_.local_transports) {
        std::shared_ptr<DeviceTransport> t = factory_ ? factory_->createLocal(lt) : nullptr;
        if (!t) {
            Logger::error("[Coordinator] %s: %s transport for %s not available", entry_.entry_id.c_str(),
                          localTransportTypeName(lt.type), lt.serial.c_str());
        }
        local_[lt.serial] = t;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        *cancel_ = false;
        started_ = true;
    }
    ticker_.start();
    Logger::info("[Coordinator] %s: polling %u device(s) every %u s", entry_.entry_id.c_str(),
                 (unsigned)devices().size(), (unsigned)interval_s_);
}

void PollingCoordinator::loop() {
    ticker_.update();
}

std::vector<DeviceConfig> PollingCoordinator::devices() const {
    if (!entry_.devices.empty()) return entry_.devices;
    // Local entries without a device list poll one inverter per transport.
    std::vector<DeviceConfig> out;
    for (const auto& lt : entry_.local_transports) {
        DeviceConfig dev;
        dev.serial = lt.serial;
        dev.type = DeviceType::INVERTER;
        out.push_back(dev);
    }
    return out;
}

std::vector<PollingCoordinator::Route> PollingCoordinator::routeDevices() const {
    std::vector<Route> routes;
    for (const auto& dev : devices()) {
        Route route;
        route.device = dev;
        auto it = local_.find(dev.serial);
        if (it != local_.end()) {
            route.transport = it->second;
            if (!route.transport) route.unavailable = "unsupported: local transport driver not available";
        } else if (entry_.usesCloud()) {
            route.transport = cloud_;
            if (!route.transport) route.unavailable = "unsupported: cloud transport not available";
        } else {
            route.unavailable = "unsupported: no transport configured for device";
        }
        routes.push_back(route);
    }
    return routes;
}

PollFuture PollingCoordinator::requestRefresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_) {
        Logger::debug("[Coordinator] %s: refresh coalesced into cycle in flight", entry_.entry_id.c_str());
        return in_flight_future_;
    }
    auto promise = std::make_shared<std::promise<PollResult>>();
    PollFuture future = promise->get_future().share();
    if (!started_ || *cancel_) {
        PollResult result;
        result.status = CycleStatus::CANCELLED;
        result.snapshot = snapshot_;
        promise->set_value(result);
        return future;
    }
    if (cycle_thread_.joinable()) cycle_thread_.join();

    uint32_t cycle = ++cycles_;
    in_flight_ = true;
    in_flight_future_ = future;
    state_ = CoordinatorState::POLLING;
    cycle_thread_ = std::thread(&PollingCoordinator::runCycle, this, promise, cycle);
    return future;
}

void PollingCoordinator::runCycle(std::shared_ptr<std::promise<PollResult>> promise, uint32_t cycle) {
    using namespace std::chrono;
    auto started = steady_clock::now();
    auto ctx = std::make_shared<CycleShared>();
    ctx->cancel = cancel_;

    bool skip_cloud = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        skip_cloud = needs_reauth_;
    }

    std::vector<Route> routes = routeDevices();
    std::map<std::string, DeviceRecord> records;
    std::vector<std::shared_ptr<Slot>> slots;
    std::map<DeviceTransport*, std::shared_ptr<Slot>> serialized;
    bool auth_blocked = false;

    for (const auto& route : routes) {
        if (!route.transport) {
            records[route.device.serial] = DeviceModel::errored(route.device, route.unavailable);
            continue;
        }
        if (skip_cloud && route.transport->kind() == TransportKind::CLOUD) {
            records[route.device.serial] = DeviceModel::errored(route.device, REAUTH_REQUIRED);
            auth_blocked = true;
            continue;
        }
        if (route.transport->isSessionSafe()) {
            auto slot = std::make_shared<Slot>();
            slot->transport = route.transport;
            slot->devices.push_back(route.device);
            slots.push_back(slot);
        } else {
            auto& slot = serialized[route.transport.get()];
            if (!slot) {
                slot = std::make_shared<Slot>();
                slot->transport = route.transport;
                slots.push_back(slot);
            }
            slot->devices.push_back(route.device);
        }
    }

    for (auto& slot : slots) {
        try {
            std::thread(runSlot, ctx, slot).detach();
        } catch (const std::system_error& e) {
            Logger::error("[Coordinator] Could not start device worker: %s", e.what());
            std::lock_guard<std::mutex> lock(ctx->mutex);
            for (const auto& dev : slot->devices) {
                slot->records.push_back(DeviceModel::errored(dev, std::string("unknown: ") + e.what()));
            }
            slot->done = true;
        }
    }

    std::set<DeviceTransport*> hung;
    bool cancelled = false;
    {
        std::unique_lock<std::mutex> lock(ctx->mutex);
        for (auto& slot : slots) {
            auto deadline = started + milliseconds((uint64_t)polling_.device_timeout_ms * slot->devices.size());
            while (!slot->done && !*cancel_ && steady_clock::now() < deadline) {
                auto step = std::min(deadline, steady_clock::now() + milliseconds(CANCEL_CHECK_MS));
                ctx->cv.wait_until(lock, step);
            }
            if (slot->done) {
                for (const auto& rec : slot->records) records[rec.serial] = rec;
                continue;
            }
            hung.insert(slot->transport.get());
            if (*cancel_) {
                cancelled = true;
                continue;
            }
            Logger::warn("[Coordinator] %s: %s did not answer within %u ms", entry_.entry_id.c_str(),
                         slot->transport->endpoint().c_str(),
                         (unsigned)(polling_.device_timeout_ms * slot->devices.size()));
            for (const auto& dev : slot->devices) {
                records[dev.serial] = DeviceModel::errored(dev, "timeout: device poll exceeded " +
                                                                    std::to_string(polling_.device_timeout_ms) + " ms");
            }
        }
    }
    cancelled = cancelled || *cancel_;

    // Sockets are released after every cycle unless the transport keeps its session.
    std::set<DeviceTransport*> released;
    for (auto& slot : slots) {
        DeviceTransport* t = slot->transport.get();
        if (t->keepsSession() || hung.count(t) || released.count(t)) continue;
        released.insert(t);
        try {
            t->disconnect();
        } catch (const TransportException& e) {
            Logger::debug("[Coordinator] Disconnect from %s failed: %s", t->endpoint().c_str(), e.what());
        }
    }

    PollResult result;
    result.cycle = cycle;
    result.cloud_calls = ctx->cloud_calls;
    result.duration_ms = (uint32_t)duration_cast<milliseconds>(steady_clock::now() - started).count();

    Snapshot snap;
    snap.cycle = cycle;
    for (const auto& route : routes) {
        auto it = records.find(route.device.serial);
        if (it == records.end()) continue;
        RawInfo info;
        info.model = it->second.model;
        info.transport = route.transport ? transportKindName(route.transport->kind()) : "none";
        info.endpoint = route.transport ? route.transport->endpoint() : "";
        snap.device_info[route.device.serial] = info;
        if (it->second.hasError()) {
            ++result.devices_failed;
        } else {
            ++result.devices_ok;
        }
    }
    snap.devices = records;

    bool auth_failed = ctx->auth_failed || auth_blocked;
    if (cancelled) {
        result.status = CycleStatus::CANCELLED;
    } else if (result.devices_failed == 0) {
        result.status = CycleStatus::SUCCESS;
    } else if (result.devices_ok > 0) {
        result.status = CycleStatus::PARTIAL;
    } else {
        result.status = auth_failed ? CycleStatus::AUTH_FAILED : CycleStatus::FAILED;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.status != CycleStatus::CANCELLED) {
            updateStation(snap, result.cloud_calls);
            if (result.status == CycleStatus::FAILED || result.status == CycleStatus::AUTH_FAILED) {
                ++failed_cycles_;
                // Keep the last good data visible, flagged as stale.
                auto stale = snapshot_ ? std::make_shared<Snapshot>(*snapshot_) : std::make_shared<Snapshot>(snap);
                stale->stale = true;
                snapshot_ = stale;
            } else {
                snapshot_ = std::make_shared<const Snapshot>(snap);
            }
        }
        if (ctx->auth_failed && !needs_reauth_) {
            needs_reauth_ = true;
            Logger::error("[Coordinator] %s: cloud credentials rejected, reauthentication required",
                          entry_.entry_id.c_str());
        }
        state_ = result.status == CycleStatus::SUCCESS ? CoordinatorState::IDLE : CoordinatorState::DEGRADED;
        last_duration_ms_ = result.duration_ms;
        result.snapshot = snapshot_;
        completions_.push_back(result);
        while (completions_.size() > MAX_PENDING_COMPLETIONS) completions_.pop_front();
        in_flight_ = false;
    }

    Logger::info("[Coordinator] %s: cycle %u %s (%u ok, %u failed, %u cloud calls, %u ms)",
                 entry_.entry_id.c_str(), (unsigned)cycle, cycleStatusName(result.status),
                 (unsigned)result.devices_ok, (unsigned)result.devices_failed, (unsigned)result.cloud_calls,
                 (unsigned)result.duration_ms);
    promise->set_value(result);
}

void PollingCoordinator::updateStation(Snapshot& snap, uint32_t cloud_calls) {
    if (!entry_.usesCloud() && entry_.station.name.empty()) return;
    snap.has_station = true;
    StationRecord& st = snap.station;
    st.name = entry_.station.name.empty() ? entry_.cloud.plant_name : entry_.station.name;
    st.country = entry_.station.country;
    st.timezone = entry_.station.timezone;
    st.address = entry_.station.address;

    std::time_t now = clock_ ? clock_() : std::time(nullptr);
    std::string today = localDate(now, entry_.station.timezone);
    if (today != api_day_) {
        api_day_ = today;
        api_requests_today_ = 0;
    }
    api_requests_today_ += cloud_calls;
    st.api_request_rate = interval_s_ ? cloud_calls * 60.0 / interval_s_ : 0.0;
    st.api_requests_today = api_requests_today_;
}

bool PollingCoordinator::consumeCompletion(PollResult& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completions_.empty()) return false;
    out = completions_.front();
    completions_.pop_front();
    return true;
}

void PollingCoordinator::shutdown() {
    ticker_.stop();
    *cancel_ = true;
    std::thread cycle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cycle.swap(cycle_thread_);
    }
    if (cycle.joinable()) cycle.join();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        started_ = false;
    }

    std::set<DeviceTransport*> released;
    std::vector<std::shared_ptr<DeviceTransport>> all;
    if (cloud_) all.push_back(cloud_);
    for (auto& kv : local_) {
        if (kv.second) all.push_back(kv.second);
    }
    for (auto& t : all) {
        if (!released.insert(t.get()).second) continue;
        try {
            t->disconnect();
        } catch (const TransportException& e) {
            Logger::debug("[Coordinator] Disconnect from %s failed: %s", t->endpoint().c_str(), e.what());
        }
    }
    Logger::info("[Coordinator] %s: stopped", entry_.entry_id.c_str());
}

SnapshotPtr PollingCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

CoordinatorState PollingCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool PollingCoordinator::needsReauth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return needs_reauth_;
}

bool PollingCoordinator::isPolling() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void PollingCoordinator::getStatistics(char* outBuf, size_t outBufSize) const {
    std::lock_guard<std::mutex> lock(mutex_);
    snprintf(outBuf, outBufSize, "entry=%s, cycles=%u, failed=%u, state=%s, interval=%lu, last_ms=%u, reauth=%d",
             entry_.entry_id.c_str(), (unsigned)cycles_, (unsigned)failed_cycles_, coordinatorStateName(state_),
             (unsigned long)interval_s_, (unsigned)last_duration_ms_, needs_reauth_ ? 1 : 0);
}
