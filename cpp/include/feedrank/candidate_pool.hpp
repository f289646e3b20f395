#pragma once

#include "feedrank/candidate.hpp"

#include <cstddef>
#include <vector>

namespace feedrank {

// Concatenates in-network candidates followed by discovery candidates.
// Each candidate is tagged with the origin of the list it came from.
// Throws EmptyPoolError when both lists are empty and std::invalid_argument
// for empty or repeated candidate ids.
[[nodiscard]] std::vector<Candidate> build_candidate_pool(std::vector<Candidate> in_network,
                                                          std::vector<Candidate> discovery);

// Keeps the first `cap` candidates; a cap of zero keeps everything.
void apply_pool_cap(std::vector<Candidate>& pool, std::size_t cap);

}  // namespace feedrank
