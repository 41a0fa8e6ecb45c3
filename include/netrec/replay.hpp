#ifndef NETREC_REPLAY_HPP
#define NETREC_REPLAY_HPP

#include "netrec/collaborators.hpp"
#include "netrec/recommendation_service.hpp"
#include "netrec/wifi_types.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace netrec {

// Parsers for the replay script vocabulary. All throw std::invalid_argument.
SecurityType parseSecurity(const std::string& text);
WifiState parseWifiState(const std::string& text);
ApState parseApState(const std::string& text);
NetworkState parseNetworkState(const std::string& text);

// `<ssid>,<bssid>,<rssi>,<freq>,<caps>[;...]`. The SSID may contain commas.
std::vector<ScanObservation> parseScanList(const std::string& text);

// `wakeup=<0|1> airplane=<0|1> notify=<0|1>`; omitted keys stay false.
Settings parseSettings(const std::vector<std::string>& tokens);

// Runs an event script against a RecommendationService on a manual clock.
// Every action the service takes on its collaborators is written to `out`.
class ReplayRunner {
public:
    explicit ReplayRunner(std::ostream& out, const Config& config = Config());

    ReplayRunner(const ReplayRunner&) = delete;
    ReplayRunner& operator=(const ReplayRunner&) = delete;

    void execute(const std::string& line);

    void run(std::istream& in);

    RecommendationService& service() { return service_; }

private:
    class Radio : public RadioController {
    public:
        explicit Radio(std::ostream& out) : out_(out) {}
        void setWifiEnabled(bool enabled) override;
        void connect(const SavedNetwork& network) override;

    private:
        std::ostream& out_;
    };

    class Notification : public Notifier {
    public:
        explicit Notification(std::ostream& out) : out_(out) {}
        void show(const NotificationContent& content) override;
        void retract() override;

    private:
        std::ostream& out_;
    };

    class Sink : public ScoreSink {
    public:
        explicit Sink(std::ostream& out) : out_(out) {}
        void updateScores(const std::vector<ScoredNetwork>& networks) override;

    private:
        std::ostream& out_;
    };

    void recommend();

    std::ostream& out_;
    EventLoop::TimePoint now_;
    Radio radio_;
    Notification notifier_;
    Sink sink_;
    RecommendationService service_;
    std::vector<SavedNetwork> saved_;
    std::vector<ScanObservation> lastScan_;
};

} // namespace netrec

#endif
