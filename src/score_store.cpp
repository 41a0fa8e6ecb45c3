#include "netrec/score_store.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace netrec {

void ScoreStore::put(const ScoredNetwork& network) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = scores_.find(network.key);
    if (it != scores_.end()) {
        it->second = network;
    } else {
        scores_.emplace(network.key, network);
    }
    spdlog::debug("[ScoreStore] Stored score for {}", network.key.toString());
}

std::optional<ScoredNetwork> ScoreStore::get(const NetworkKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = scores_.find(key);
    if (it != scores_.end()) {
        return it->second;
    }
    if (key.isWildcard()) {
        return std::nullopt;
    }
    it = scores_.find(key.toWildcard());
    if (it == scores_.end()) {
        return std::nullopt;
    }
    ScoredNetwork fallback = it->second;
    fallback.key = key;
    return fallback;
}

std::optional<ScoredNetwork> ScoreStore::getExact(const NetworkKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = scores_.find(key);
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ScoreStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return scores_.size();
}

std::vector<ScoredNetwork> ScoreStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ScoredNetwork> networks;
    networks.reserve(scores_.size());
    for (const auto& entry : scores_) {
        networks.push_back(entry.second);
    }
    return networks;
}

} // namespace netrec
