#pragma once

#include "feedrank/candidate.hpp"

#include <cstdint>
#include <random>

namespace feedrank {

// Supplies per-action probabilities for a candidate. Implementations must
// return values in [0, 1].
class EngagementPredictor {
public:
    virtual ~EngagementPredictor() = default;

    [[nodiscard]] virtual ActionProbabilities predict(const Candidate& candidate) = 0;
};

// Seeded pseudo-random predictor used for demonstrations. In-network posts get
// a 1.5x engagement boost and video posts a 1.3x watch boost; positive
// probabilities are capped at 0.95 and negative signals stay small.
class SimulatedEngagementPredictor final : public EngagementPredictor {
public:
    explicit SimulatedEngagementPredictor(std::uint32_t seed = 42);

    [[nodiscard]] ActionProbabilities predict(const Candidate& candidate) override;

private:
    [[nodiscard]] double uniform(double lo, double hi);

    std::mt19937 rng_;
};

}  // namespace feedrank
