#pragma once
#include <stdint.h>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "monotonic_state.hpp"
#include "polling_coordinator.hpp"

class ConfigStorage;
class ConnectionProber;
class TransitionRouter;
class TransportFactory;

/**
 * @brief Owns the configuration, one coordinator and tracker per fleet entry,
 * and the transition router.
 *
 * A committed transition replaces the entry in ConfigManager, which calls
 * back here to stop the old coordinator and start one for the new
 * configuration. The entry's tracker survives the reload.
 */
class GridLinkGateway {
public:
    using PublishCallback = std::function<void(const std::string& entry_id, const PollResult& result,
                                               const std::string& snapshot_json)>;

    GridLinkGateway(ConfigStorage* storage, TransportFactory* factory,
                    MonotonicStateTracker::Clock clock = MonotonicStateTracker::Clock());
    ~GridLinkGateway();

    GridLinkGateway(const GridLinkGateway&) = delete;
    GridLinkGateway& operator=(const GridLinkGateway&) = delete;

    bool begin();
    void loop();
    void end();

    PollFuture refresh(const std::string& entry_id);
    // Last published JSON for the entry; never touches the tracker.
    bool snapshotJson(const std::string& entry_id, std::string& out);
    std::vector<std::string> entryIds() const;
    void setPublishCallback(PublishCallback cb) { publish_cb_ = cb; }
    void getStatistics(char* outBuf, size_t outBufSize) const;

    ConfigManager* config() { return config_; }
    TransitionRouter* transitions() { return router_; }
    PollingCoordinator* coordinator(const std::string& entry_id);
    MonotonicStateTracker* tracker(const std::string& entry_id);

    // Callback for committed entry changes
    void onEntryChanged(const FleetEntry& entry);

private:
    struct EntryRuntime {
        FleetEntry entry;
        PollingCoordinator* coordinator = nullptr;
        MonotonicStateTracker* tracker = nullptr;
        // Last fresh snapshot after the tracker, and what was last published.
        SnapshotPtr published;
        std::string published_json;
    };

    void startEntry(const FleetEntry& entry);
    void stopEntry(EntryRuntime& rt);
    void publish(const std::string& entry_id, EntryRuntime& rt, const PollResult& result);

    ConfigManager* config_ = nullptr;
    ConnectionProber* prober_ = nullptr;
    TransitionRouter* router_ = nullptr;
    TransportFactory* factory_ = nullptr;
    MonotonicStateTracker::Clock clock_;
    std::map<std::string, EntryRuntime> entries_;
    PublishCallback publish_cb_;
    bool started_ = false;
};
