#include "netrec/notification_state_machine.hpp"

#include <spdlog/spdlog.h>

namespace netrec {

const char* const NotificationStateMachine::kFailedToConnectTimer = "notification.failed_to_connect";
const char* const NotificationStateMachine::kDismissTimer = "notification.dismiss";

static const int kSignalLevels = 5;

const char* notificationKindName(NotificationContent::Kind kind) {
    switch (kind) {
        case NotificationContent::Kind::NetworkAvailable: return "network_available";
        case NotificationContent::Kind::Connecting: return "connecting";
        case NotificationContent::Kind::Connected: return "connected";
        case NotificationContent::Kind::FailedToConnect: return "failed_to_connect";
    }
    return "network_available";
}

const char* notificationStateName(NotificationStateMachine::State state) {
    switch (state) {
        case NotificationStateMachine::State::Idle: return "idle";
        case NotificationStateMachine::State::CandidatePending: return "candidate_pending";
        case NotificationStateMachine::State::Shown: return "shown";
        case NotificationStateMachine::State::Connecting: return "connecting";
        case NotificationStateMachine::State::Connected: return "connected";
        case NotificationStateMachine::State::Failed: return "failed";
    }
    return "idle";
}

NotificationStateMachine::NotificationStateMachine(const RecommendationEngine& engine,
                                                   RadioController& radio, Notifier& notifier,
                                                   EventLoop& loop,
                                                   const NotificationConfig& config)
    : engine_(engine), radio_(radio), notifier_(notifier), loop_(loop), config_(config) {}

void NotificationStateMachine::setState(State state) {
    if (state == state_) {
        return;
    }
    spdlog::debug("[NotificationStateMachine] {} -> {}",
                  notificationStateName(state_), notificationStateName(state));
    state_ = state;
}

bool NotificationStateMachine::isNotificationVisible() const {
    return state_ == State::Shown || state_ == State::Connecting
        || state_ == State::Connected || state_ == State::Failed;
}

void NotificationStateMachine::onSettingsChanged(bool notificationEnabled) {
    notificationEnabled_ = notificationEnabled;
    reset();
}

void NotificationStateMachine::onWifiStateChanged(WifiState state) {
    wifiState_ = state;
    if (state != WifiState::Enabled) {
        reset();
    }
}

void NotificationStateMachine::onNetworkStateChanged(NetworkState state) {
    // Scan cycles pass through Scanning constantly; they are not a change.
    if (state == NetworkState::Scanning || state == detailedState_) {
        return;
    }
    detailedState_ = state;
    numScansSinceNetworkStateChange_ = 0;

    switch (state) {
        case NetworkState::Connected:
            if (state_ != State::Connecting) {
                break;
            }
            loop_.cancel(kFailedToConnectTimer);
            post(NotificationContent::Kind::Connected);
            loop_.postDelayed(kDismissTimer, config_.connected_display, [this] { dismiss(); });
            setState(State::Connected);
            break;
        case NetworkState::Disconnected:
        case NetworkState::CaptivePortalCheck:
            reset();
            break;
        default:
            break;
    }
}

void NotificationStateMachine::onScanResults(const std::vector<ScanObservation>& scans) {
    if (state_ == State::Connecting || state_ == State::Connected || state_ == State::Failed) {
        return;
    }

    if (isQualifyingScan(scans)) {
        if (state_ == State::Idle) {
            setState(State::CandidatePending);
        }
        // Enough scans without the platform joining anything means no
        // remembered network is in range.
        if (++numScansSinceNetworkStateChange_ >= config_.scans_before_notify) {
            displayNotification();
        }
        return;
    }

    numScansSinceNetworkStateChange_ = 0;
    if (isNotificationVisible()) {
        notifier_.retract();
    }
    clearRecommendation();
    setState(State::Idle);
}

bool NotificationStateMachine::isQualifyingScan(const std::vector<ScanObservation>& scans) {
    if (!notificationEnabled_ || wifiState_ != WifiState::Enabled || scans.empty()) {
        return false;
    }
    CoarseNetworkState coarse = coarseState(detailedState_);
    if (coarse != CoarseNetworkState::Disconnected && coarse != CoarseNetworkState::Unknown) {
        return false;
    }

    RecommendationRequest request;
    for (const auto& scan : scans) {
        if (scan.isOpen()) {
            request.scans.push_back(scan);
        }
    }
    if (request.scans.empty()) {
        return false;
    }

    Recommendation recommendation = engine_.recommend(request);
    if (!recommendation.connect || !recommendation.scan) {
        return false;
    }
    const ScanObservation& chosen = *recommendation.scan;
    std::optional<ScoredNetwork> score =
        engine_.scoreFor(NetworkKey(quoteSsid(chosen.ssid), chosen.bssid));
    if (!score) {
        return false;
    }
    recommendedNetwork_ = recommendation.connect;
    badge_ = score->calculateBadge(chosen.rssi);
    signalLevel_ = calculateSignalLevel(chosen.rssi, kSignalLevels);
    return true;
}

void NotificationStateMachine::displayNotification() {
    EventLoop::TimePoint now = loop_.now();
    if (now < notificationRepeatTime_) {
        spdlog::debug("[NotificationStateMachine] Repeat delay not elapsed, not showing");
        return;
    }
    post(NotificationContent::Kind::NetworkAvailable);
    notificationRepeatTime_ = now + config_.repeat_delay;
    spdlog::info("[NotificationStateMachine] Showing open network {}", recommendedNetwork_->ssid);
    setState(State::Shown);
}

void NotificationStateMachine::onConnectToRecommendedNetwork() {
    if (state_ != State::Shown || !recommendedNetwork_) {
        spdlog::debug("[NotificationStateMachine] Ignoring connect request in state {}",
                      notificationStateName(state_));
        return;
    }
    spdlog::info("[NotificationStateMachine] Connecting to {}", recommendedNetwork_->ssid);
    radio_.connect(*recommendedNetwork_);
    post(NotificationContent::Kind::Connecting);
    loop_.postDelayed(kFailedToConnectTimer, config_.connecting_timeout,
                      [this] { showFailedToConnect(); });
    setState(State::Connecting);
}

void NotificationStateMachine::showFailedToConnect() {
    if (state_ != State::Connecting) {
        return;
    }
    spdlog::info("[NotificationStateMachine] Failed to connect to {}", recommendedNetwork_->ssid);
    post(NotificationContent::Kind::FailedToConnect);
    loop_.postDelayed(kDismissTimer, config_.failed_display, [this] { dismiss(); });
    setState(State::Failed);
}

void NotificationStateMachine::dismiss() {
    if (state_ == State::Idle) {
        return;
    }
    if (isNotificationVisible()) {
        notifier_.retract();
    }
    clearRecommendation();
    setState(State::Idle);
}

void NotificationStateMachine::onNotificationDeleted() {
    loop_.cancel(kFailedToConnectTimer);
    loop_.cancel(kDismissTimer);
    clearRecommendation();
    setState(State::Idle);
}

void NotificationStateMachine::reset() {
    notificationRepeatTime_ = EventLoop::TimePoint();
    numScansSinceNetworkStateChange_ = 0;
    loop_.cancel(kFailedToConnectTimer);
    loop_.cancel(kDismissTimer);
    if (isNotificationVisible()) {
        notifier_.retract();
    }
    clearRecommendation();
    setState(State::Idle);
}

void NotificationStateMachine::clearRecommendation() {
    recommendedNetwork_.reset();
    badge_.reset();
    signalLevel_ = 0;
}

void NotificationStateMachine::post(NotificationContent::Kind kind) {
    NotificationContent content;
    content.kind = kind;
    content.ssid = recommendedNetwork_ ? recommendedNetwork_->printableSsid() : std::string();
    content.badge = badge_.value_or(Badge::None);
    content.signal_level = signalLevel_;
    notifier_.show(content);
}

void NotificationStateMachine::dump(std::ostream& out) const {
    out << "NotificationStateMachine: state=" << notificationStateName(state_)
        << " enabled=" << notificationEnabled_
        << " wifi=" << wifiStateName(wifiState_)
        << " network=" << networkStateName(detailedState_)
        << " scans=" << numScansSinceNetworkStateChange_ << "\n";
    if (recommendedNetwork_) {
        out << "  recommended: " << recommendedNetwork_->ssid
            << " badge=" << badgeName(badge_.value_or(Badge::None)) << "\n";
    }
}

} // namespace netrec
