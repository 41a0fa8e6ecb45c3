#include "netrec/recommendation_service.hpp"

#include <exception>
#include <memory>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace netrec {

RecommendationService::RecommendationService(RadioController& radio, Notifier& notifier,
                                             ScoreSink& sink, const Config& config,
                                             EventLoop::NowFunction now)
    : loop_(std::move(now)),
      selector_(config.selector),
      engine_(store_, sink),
      wakeup_(selector_, radio, config.wakeup),
      notification_(engine_, radio, notifier, loop_, config.notification) {}

RecommendationService::~RecommendationService() {
    stop();
}

void RecommendationService::start() {
    loop_.start();
    spdlog::info("[RecommendationService] Started");
}

void RecommendationService::stop() {
    if (!loop_.isRunning()) {
        return;
    }
    loop_.stop();
    spdlog::info("[RecommendationService] Stopped");
}

std::size_t RecommendationService::runPending() {
    return loop_.runReady();
}

void RecommendationService::onScanResults(const std::vector<ScanObservation>& scans) {
    loop_.post([this, scans] {
        spdlog::debug("[RecommendationService] Scan results: {} networks", scans.size());
        wakeup_.onScanResults(scans);
        notification_.onScanResults(scans);
    });
}

void RecommendationService::onWifiStateChanged(WifiState state) {
    loop_.post([this, state] {
        spdlog::debug("[RecommendationService] Wi-Fi state: {}", wifiStateName(state));
        wakeup_.onWifiStateChanged(state);
        notification_.onWifiStateChanged(state);
    });
}

void RecommendationService::onNetworkStateChanged(NetworkState state) {
    loop_.post([this, state] {
        notification_.onNetworkStateChanged(state);
    });
}

void RecommendationService::onWifiApStateChanged(ApState state) {
    loop_.post([this, state] {
        wakeup_.onWifiApStateChanged(state);
    });
}

void RecommendationService::onConfiguredNetworksChanged(const std::vector<SavedNetwork>& networks) {
    loop_.post([this, networks] {
        engine_.setSavedNetworks(networks);
        wakeup_.onConfiguredNetworksChanged(networks);
    });
}

void RecommendationService::onSettingsChanged(const Settings& settings) {
    loop_.post([this, settings] {
        wakeup_.onSettingsChanged(settings.wakeup_enabled, settings.airplane_mode);
        notification_.onSettingsChanged(settings.notification_enabled);
    });
}

void RecommendationService::onConnectToRecommendedNetwork() {
    loop_.post([this] { notification_.onConnectToRecommendedNetwork(); });
}

void RecommendationService::onNotificationDeleted() {
    loop_.post([this] { notification_.onNotificationDeleted(); });
}

std::future<Recommendation> RecommendationService::requestRecommendation(
    const RecommendationRequest& request) {
    auto promise = std::make_shared<std::promise<Recommendation>>();
    std::future<Recommendation> result = promise->get_future();
    loop_.post([this, request, promise] {
        try {
            promise->set_value(engine_.recommend(request));
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });
    return result;
}

std::future<void> RecommendationService::requestScores(const std::vector<NetworkKey>& keys) {
    auto promise = std::make_shared<std::promise<void>>();
    std::future<void> result = promise->get_future();
    loop_.post([this, keys, promise] {
        try {
            engine_.onRequestScores(keys);
            promise->set_value();
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });
    return result;
}

bool RecommendationService::runDiagnosticCommand(const std::vector<std::string>& args,
                                                 std::ostream& out) {
    if (!args.empty() && args[0] == "dump") {
        dump(out);
        return true;
    }
    return engine_.handleCommand(args, out);
}

void RecommendationService::dump(std::ostream& out) {
    auto write = [this](std::ostream& stream) {
        engine_.dump(stream);
        wakeup_.dump(stream);
        notification_.dump(stream);
    };
    if (!loop_.isRunning()) {
        write(out);
        return;
    }
    // The state machines belong to the worker; read them from there.
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> text = promise->get_future();
    loop_.post([write, promise] {
        std::ostringstream stream;
        write(stream);
        promise->set_value(stream.str());
    });
    out << text.get();
}

} // namespace netrec
