#ifndef NETREC_SCORE_STORE_HPP
#define NETREC_SCORE_STORE_HPP

#include "netrec/network_key.hpp"
#include "netrec/scored_network.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace netrec {

class ScoreStore {
public:
    void put(const ScoredNetwork& network);

    std::optional<ScoredNetwork> get(const NetworkKey& key) const;

    std::optional<ScoredNetwork> getExact(const NetworkKey& key) const;

    std::size_t size() const;
    std::vector<ScoredNetwork> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<NetworkKey, ScoredNetwork> scores_;
};

} // namespace netrec

#endif
