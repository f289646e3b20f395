#include "feedrank/candidate_pool.hpp"

#include "feedrank/errors.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace feedrank {

std::vector<Candidate> build_candidate_pool(std::vector<Candidate> in_network,
                                            std::vector<Candidate> discovery) {
    if (in_network.empty() && discovery.empty()) {
        throw EmptyPoolError("candidate pool requires at least one in-network or discovery candidate");
    }

    std::vector<Candidate> pool;
    pool.reserve(in_network.size() + discovery.size());
    std::unordered_set<std::string> ids;
    ids.reserve(in_network.size() + discovery.size());

    auto append = [&](std::vector<Candidate>& source, Origin origin) {
        for (auto& candidate : source) {
            if (candidate.id.empty()) {
                throw std::invalid_argument("candidate id must be non-empty");
            }
            if (candidate.author_id.empty()) {
                throw std::invalid_argument("candidate author id must be non-empty: " + candidate.id);
            }
            if (!ids.insert(candidate.id).second) {
                throw std::invalid_argument("duplicate candidate id: " + candidate.id);
            }
            candidate.origin = origin;
            pool.push_back(std::move(candidate));
        }
    };

    append(in_network, Origin::InNetwork);
    append(discovery, Origin::Discovery);
    return pool;
}

void apply_pool_cap(std::vector<Candidate>& pool, std::size_t cap) {
    if (cap != 0 && pool.size() > cap) {
        pool.resize(cap);
    }
}

}  // namespace feedrank
