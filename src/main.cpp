#include "netrec/nl80211_scan_source.hpp"
#include "netrec/recommendation_engine.hpp"
#include "netrec/replay.hpp"
#include "netrec/score_store.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace netrec;

namespace {

struct Options {
    std::string command;
    std::vector<std::string> operands;
    bool useTable = false;
    std::string iface;
    std::string scoresFile;
    Config config;
};

class LoggingScoreSink : public ScoreSink {
public:
    void updateScores(const std::vector<ScoredNetwork>& networks) override {
        for (const auto& network : networks) {
            spdlog::debug("[netrec] Published score {}", network.toString());
        }
    }
};

} // namespace

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <command> [args]\n";
    std::cout << "Commands:\n";
    std::cout << "  scan             Show cached scan results and the recommended network\n";
    std::cout << "  replay [FILE]    Run an event script (stdin when FILE is omitted)\n";
    std::cout << "  addScore LINE    Validate a score line and print the parsed network\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -j, --json             Output scan as JSON (default)\n";
    std::cout << "  -t, --table            Output scan as formatted table\n";
    std::cout << "  --iface IF             Wireless interface (default: first wlan*)\n";
    std::cout << "  --scores FILE          Score lines used by scan, one per line\n";
    std::cout << "  --repeat-delay SEC     Notification repeat delay (default: 900)\n";
    std::cout << "  --rssi-24 DBM          Qualified 2.4 GHz RSSI (default: -80)\n";
    std::cout << "  --rssi-5 DBM           Qualified 5 GHz RSSI (default: -77)\n";
    std::cout << "  -v, --verbose          Debug logging\n";
    std::cout << "  -q, --quiet            Only log errors\n";
}

static int parse_number(const std::string& option, const std::string& value) {
    size_t used = 0;
    int number = 0;
    try {
        number = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (used != value.size()) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return number;
}

void printAsTable(const std::vector<ScanObservation>& networks, const Recommendation& recommendation) {
    if (networks.empty()) {
        std::cout << "No networks found.\n";
        return;
    }

    std::cout << std::left
              << std::setw(32) << "SSID"
              << std::setw(20) << "BSSID"
              << std::setw(10) << "Signal"
              << std::setw(10) << "Strength"
              << std::setw(10) << "Freq(MHz)"
              << std::setw(12) << "Security"
              << "Capabilities"
              << "\n";

    std::cout << std::string(110, '-') << "\n";

    for (const auto& net : networks) {
        std::cout << std::left
                  << std::setw(32) << net.ssid
                  << std::setw(20) << net.bssid
                  << std::setw(10) << (std::to_string(net.rssi) + " dBm")
                  << std::setw(10) << (std::to_string(net.getSignalPercent()) + "%")
                  << std::setw(10) << net.frequency
                  << std::setw(12) << securityName(securityFromCapabilities(net.capabilities))
                  << net.capabilities
                  << "\n";
    }

    std::cout << "\nTotal networks found: " << networks.size() << "\n";
    if (recommendation.shouldConnect()) {
        std::cout << "Recommended: " << recommendation.connect->printableSsid() << "\n";
    } else {
        std::cout << "Recommended: none\n";
    }
}

void printAsJson(const std::vector<ScanObservation>& networks, const Recommendation& recommendation) {
    std::cout << "{\"networks\":[";
    for (size_t i = 0; i < networks.size(); ++i) {
        std::cout << networks[i].toJson();
        if (i < networks.size() - 1) {
            std::cout << ",";
        }
    }
    std::cout << "],\"recommendation\":";
    if (recommendation.shouldConnect()) {
        std::cout << "\"" << jsonEscape(recommendation.connect->printableSsid()) << "\"";
    } else {
        std::cout << "null";
    }
    std::cout << "}\n";
}

int runScan(const Options& options) {
    ScoreStore store;
    LoggingScoreSink sink;
    RecommendationEngine engine(store, sink);

    if (!options.scoresFile.empty()) {
        std::ifstream scores(options.scoresFile);
        if (!scores) {
            throw std::runtime_error("Cannot open scores file " + options.scoresFile);
        }
        std::string line;
        while (std::getline(scores, line)) {
            if (line.empty() || line[0] == '#') continue;
            engine.addScore(line);
        }
    }

    Nl80211ScanSource source(options.iface);
    auto networks = source.cachedScanResults();

    RecommendationRequest request;
    request.scans = networks;
    Recommendation recommendation = engine.recommend(request);

    if (options.useTable) {
        std::cout << "Cached scan results on " << source.interfaceName() << ":\n\n";
        printAsTable(networks, recommendation);
    } else {
        printAsJson(networks, recommendation);
    }
    return 0;
}

int runReplay(const Options& options) {
    ReplayRunner runner(std::cout, options.config);
    if (options.operands.empty()) {
        runner.run(std::cin);
        return 0;
    }
    std::ifstream script(options.operands[0]);
    if (!script) {
        throw std::runtime_error("Cannot open script " + options.operands[0]);
    }
    runner.run(script);
    return 0;
}

int runAddScore(const Options& options) {
    if (options.operands.size() != 1) {
        throw std::invalid_argument("addScore takes exactly one score line");
    }
    ScoredNetwork network = parseScoredNetwork(options.operands[0]);
    std::cout << network.toString() << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    Options options;
    // Keep stdout for scan and replay output.
    spdlog::set_default_logger(spdlog::stderr_color_mt("netrec"));
    spdlog::set_level(spdlog::level::info);

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };
            if (arg == "-h" || arg == "--help") {
                printHelp(argv[0]);
                return 0;
            } else if (arg == "-t" || arg == "--table") {
                options.useTable = true;
            } else if (arg == "-j" || arg == "--json") {
                options.useTable = false;
            } else if (arg == "-v" || arg == "--verbose") {
                spdlog::set_level(spdlog::level::debug);
            } else if (arg == "-q" || arg == "--quiet") {
                spdlog::set_level(spdlog::level::err);
            } else if (arg == "--iface") {
                options.iface = value();
            } else if (arg == "--scores") {
                options.scoresFile = value();
            } else if (arg == "--repeat-delay") {
                options.config.notification.repeat_delay =
                    std::chrono::seconds(parse_number(arg, value()));
            } else if (arg == "--rssi-24") {
                options.config.selector.threshold_qualified_rssi_24 = parse_number(arg, value());
            } else if (arg == "--rssi-5") {
                options.config.selector.threshold_qualified_rssi_5 = parse_number(arg, value());
            } else if (options.command.empty() && arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                printHelp(argv[0]);
                return 1;
            } else if (options.command.empty()) {
                options.command = arg;
            } else {
                options.operands.push_back(arg);
            }
        }

        if (options.command == "scan") {
            return runScan(options);
        } else if (options.command == "replay") {
            return runReplay(options);
        } else if (options.command == "addScore") {
            return runAddScore(options);
        }

        if (options.command.empty()) {
            std::cerr << "Missing command\n";
        } else {
            std::cerr << "Unknown command: " << options.command << "\n";
        }
        printHelp(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
