#ifndef NETREC_NOTIFICATION_STATE_MACHINE_HPP
#define NETREC_NOTIFICATION_STATE_MACHINE_HPP

#include "netrec/collaborators.hpp"
#include "netrec/event_loop.hpp"
#include "netrec/recommendation_engine.hpp"
#include "netrec/wifi_types.hpp"

#include <chrono>
#include <optional>
#include <ostream>
#include <vector>

namespace netrec {

struct NotificationConfig {
    // Consecutive qualifying scans before the notification is shown. Lets the
    // platform join a remembered network first.
    int scans_before_notify = 3;
    std::chrono::milliseconds repeat_delay = std::chrono::seconds(900);
    std::chrono::milliseconds connecting_timeout = std::chrono::seconds(10);
    std::chrono::milliseconds connected_display = std::chrono::seconds(5);
    std::chrono::milliseconds failed_display = std::chrono::seconds(5);
};

class NotificationStateMachine {
public:
    enum class State {
        Idle,
        CandidatePending,
        Shown,
        Connecting,
        Connected,
        Failed
    };

    static const char* const kFailedToConnectTimer;
    static const char* const kDismissTimer;

    NotificationStateMachine(const RecommendationEngine& engine, RadioController& radio,
                             Notifier& notifier, EventLoop& loop,
                             const NotificationConfig& config = NotificationConfig());

    void onSettingsChanged(bool notificationEnabled);
    void onWifiStateChanged(WifiState state);
    void onNetworkStateChanged(NetworkState state);
    void onScanResults(const std::vector<ScanObservation>& scans);
    void onConnectToRecommendedNetwork();
    void onNotificationDeleted();

    State state() const { return state_; }
    int scansSinceNetworkStateChange() const { return numScansSinceNetworkStateChange_; }
    const std::optional<SavedNetwork>& recommendedNetwork() const { return recommendedNetwork_; }
    const std::optional<Badge>& badge() const { return badge_; }

    void dump(std::ostream& out) const;

private:
    bool isQualifyingScan(const std::vector<ScanObservation>& scans);
    void displayNotification();
    void showFailedToConnect();
    void dismiss();
    void reset();
    void clearRecommendation();
    void post(NotificationContent::Kind kind);
    bool isNotificationVisible() const;
    void setState(State state);

    const RecommendationEngine& engine_;
    RadioController& radio_;
    Notifier& notifier_;
    EventLoop& loop_;
    NotificationConfig config_;

    State state_ = State::Idle;
    bool notificationEnabled_ = false;
    WifiState wifiState_ = WifiState::Unknown;
    NetworkState detailedState_ = NetworkState::Unknown;
    int numScansSinceNetworkStateChange_ = 0;
    EventLoop::TimePoint notificationRepeatTime_;
    std::optional<SavedNetwork> recommendedNetwork_;
    std::optional<Badge> badge_;
    int signalLevel_ = 0;
};

const char* notificationStateName(NotificationStateMachine::State state);

} // namespace netrec

#endif
