#include "../include/gridlink_gateway.hpp"
#include "../include/connection_prober.hpp"
#include "../include/logger.hpp"
#include "../include/snapshot_json.hpp"
#include "../include/transition_router.hpp"
#include "../include/transport_factory.hpp"
#include <cstdio>

GridLinkGateway::GridLinkGateway(ConfigStorage* storage, TransportFactory* factory, MonotonicStateTracker::Clock clock)
    : factory_(factory), clock_(clock) {
    config_ = new ConfigManager(storage);
    prober_ = new ConnectionProber(factory);
    router_ = new TransitionRouter(config_, prober_);
    router_->setReauthCheck([this](const std::string& entry_id) {
        PollingCoordinator* c = coordinator(entry_id);
        return c != nullptr && c->needsReauth();
    });
}

GridLinkGateway::~GridLinkGateway() {
    end();
    for (auto& kv : entries_) delete kv.second.tracker;
    entries_.clear();
    delete router_;
    delete prober_;
    delete config_;
}

bool GridLinkGateway::begin() {
    bool loaded = config_->begin();
    Logger::begin(config_->getLoggingConfig());
    config_->setEntryChangedCallback([this](const FleetEntry& entry) { onEntryChanged(entry); });
    for (const auto& entry : config_->getEntries()) startEntry(entry);
    started_ = true;
    Logger::info("[Gateway] Started with %u fleet entr%s", (unsigned)entries_.size(),
                 entries_.size() == 1 ? "y" : "ies");
    return loaded;
}

void GridLinkGateway::end() {
    if (!started_) return;
    router_->abandon();
    for (auto& kv : entries_) stopEntry(kv.second);
    started_ = false;
}

void GridLinkGateway::startEntry(const FleetEntry& entry) {
    EntryRuntime& rt = entries_[entry.entry_id];
    rt.entry = entry;
    if (!rt.tracker) rt.tracker = new MonotonicStateTracker(clock_);
    rt.tracker->setTimezone(entry.station.timezone);
    rt.coordinator = new PollingCoordinator(entry, config_->getPollingConfig(), factory_, clock_);
    rt.coordinator->begin();
}

void GridLinkGateway::stopEntry(EntryRuntime& rt) {
    if (!rt.coordinator) return;
    rt.coordinator->shutdown();
    delete rt.coordinator;
    rt.coordinator = nullptr;
}

void GridLinkGateway::onEntryChanged(const FleetEntry& entry) {
    Logger::info("[Gateway] Reloading entry %s (%s)", entry.entry_id.c_str(), connectionTypeName(entry.connection_type));
    auto it = entries_.find(entry.entry_id);
    if (it != entries_.end()) stopEntry(it->second);
    if (started_) startEntry(entry);
}

void GridLinkGateway::loop() {
    for (auto& kv : entries_) {
        EntryRuntime& rt = kv.second;
        if (!rt.coordinator) continue;
        rt.coordinator->loop();
        PollResult result;
        while (rt.coordinator->consumeCompletion(result)) {
            if (result.status == CycleStatus::FAILED || result.status == CycleStatus::AUTH_FAILED) {
                Logger::warn("[Gateway] %s: last update failed (%s)", kv.first.c_str(), cycleStatusName(result.status));
            }
            if (result.status == CycleStatus::CANCELLED || !result.snapshot) continue;
            publish(kv.first, rt, result);
        }
    }
}

// The tracker sees each polled snapshot exactly once, here. A stale snapshot
// repeats data whose counters were already consumed, so it reuses the last
// guarded snapshot instead.
void GridLinkGateway::publish(const std::string& entry_id, EntryRuntime& rt, const PollResult& result) {
    if (result.snapshot->stale) {
        Snapshot stale = rt.published ? *rt.published : *result.snapshot;
        stale.stale = true;
        rt.published_json = snapshotToJson(stale);
    } else {
        rt.published = std::make_shared<const Snapshot>(exposeSnapshot(*result.snapshot, *rt.tracker));
        rt.published_json = snapshotToJson(*rt.published);
    }
    if (publish_cb_) publish_cb_(entry_id, result, rt.published_json);
}

PollFuture GridLinkGateway::refresh(const std::string& entry_id) {
    PollingCoordinator* c = coordinator(entry_id);
    if (!c) {
        std::promise<PollResult> none;
        PollResult result;
        result.status = CycleStatus::CANCELLED;
        none.set_value(result);
        return none.get_future().share();
    }
    return c->requestRefresh();
}

bool GridLinkGateway::snapshotJson(const std::string& entry_id, std::string& out) {
    auto it = entries_.find(entry_id);
    if (it == entries_.end() || it->second.published_json.empty()) return false;
    out = it->second.published_json;
    return true;
}

std::vector<std::string> GridLinkGateway::entryIds() const {
    std::vector<std::string> ids;
    for (const auto& kv : entries_) ids.push_back(kv.first);
    return ids;
}

PollingCoordinator* GridLinkGateway::coordinator(const std::string& entry_id) {
    auto it = entries_.find(entry_id);
    return it == entries_.end() ? nullptr : it->second.coordinator;
}

MonotonicStateTracker* GridLinkGateway::tracker(const std::string& entry_id) {
    auto it = entries_.find(entry_id);
    return it == entries_.end() ? nullptr : it->second.tracker;
}

void GridLinkGateway::getStatistics(char* outBuf, size_t outBufSize) const {
    size_t used = 0;
    if (outBufSize == 0) return;
    outBuf[0] = '\0';
    for (const auto& kv : entries_) {
        if (!kv.second.coordinator || used >= outBufSize) continue;
        char line[192];
        kv.second.coordinator->getStatistics(line, sizeof(line));
        int n = snprintf(outBuf + used, outBufSize - used, "%s%s", used ? "\n" : "", line);
        if (n < 0) break;
        used += (size_t)n;
    }
}
