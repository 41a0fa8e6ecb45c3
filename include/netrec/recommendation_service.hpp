#ifndef NETREC_RECOMMENDATION_SERVICE_HPP
#define NETREC_RECOMMENDATION_SERVICE_HPP

#include "netrec/collaborators.hpp"
#include "netrec/event_loop.hpp"
#include "netrec/network_selector.hpp"
#include "netrec/notification_state_machine.hpp"
#include "netrec/recommendation_engine.hpp"
#include "netrec/score_store.hpp"
#include "netrec/wakeup_state_machine.hpp"

#include <future>
#include <ostream>
#include <string>
#include <vector>

namespace netrec {

struct Config {
    SelectorConfig selector;
    WakeupConfig wakeup;
    NotificationConfig notification;
};

struct Settings {
    bool wakeup_enabled = false;
    bool airplane_mode = false;
    bool notification_enabled = false;
};

class RecommendationService {
public:
    RecommendationService(RadioController& radio, Notifier& notifier, ScoreSink& sink,
                          const Config& config = Config(),
                          EventLoop::NowFunction now = &EventLoop::Clock::now);
    ~RecommendationService();

    // Runs the event loop on a worker thread. Without start(), callers drive
    // the loop with runPending().
    void start();
    void stop();
    std::size_t runPending();

    void onScanResults(const std::vector<ScanObservation>& scans);
    void onWifiStateChanged(WifiState state);
    void onNetworkStateChanged(NetworkState state);
    void onWifiApStateChanged(ApState state);
    void onConfiguredNetworksChanged(const std::vector<SavedNetwork>& networks);
    void onSettingsChanged(const Settings& settings);
    void onConnectToRecommendedNetwork();
    void onNotificationDeleted();

    std::future<Recommendation> requestRecommendation(const RecommendationRequest& request);
    std::future<void> requestScores(const std::vector<NetworkKey>& keys);

    // `addScore <line>` runs on the calling thread; `dump` reads component
    // state on the worker when it is running.
    bool runDiagnosticCommand(const std::vector<std::string>& args, std::ostream& out);

    void dump(std::ostream& out);

    ScoreStore& scoreStore() { return store_; }
    EventLoop& eventLoop() { return loop_; }
    const WakeupStateMachine& wakeup() const { return wakeup_; }
    const NotificationStateMachine& notification() const { return notification_; }

private:
    EventLoop loop_;
    ScoreStore store_;
    NetworkSelector selector_;
    RecommendationEngine engine_;
    WakeupStateMachine wakeup_;
    NotificationStateMachine notification_;
};

} // namespace netrec

#endif
