#ifndef NETREC_COLLABORATORS_HPP
#define NETREC_COLLABORATORS_HPP

#include "netrec/scored_network.hpp"
#include "netrec/wifi_types.hpp"

#include <string>
#include <vector>

namespace netrec {

// Radio capabilities of the platform. Calls are fire-and-forget; their
// outcome arrives later as wifi-state or network-state events.
class RadioController {
public:
    virtual ~RadioController() = default;
    virtual void setWifiEnabled(bool enabled) = 0;
    virtual void connect(const SavedNetwork& network) = 0;
};

struct NotificationContent {
    enum class Kind {
        NetworkAvailable,
        Connecting,
        Connected,
        FailedToConnect
    };

    Kind kind = Kind::NetworkAvailable;
    std::string ssid;             // printable, unquoted
    Badge badge = Badge::None;
    int signal_level = 0;         // 0..4 bars
};

const char* notificationKindName(NotificationContent::Kind kind);

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void show(const NotificationContent& content) = 0;
    virtual void retract() = 0;
};

// Receives scores published for concrete BSSIDs. May be called from the
// event worker and from diagnostic callers concurrently.
class ScoreSink {
public:
    virtual ~ScoreSink() = default;
    virtual void updateScores(const std::vector<ScoredNetwork>& networks) = 0;
};

} // namespace netrec

#endif
