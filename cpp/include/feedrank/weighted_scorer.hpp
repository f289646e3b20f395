#pragma once

#include "feedrank/candidate.hpp"
#include "feedrank/ranking_config.hpp"

#include <Eigen/Dense>

#include <vector>

namespace feedrank {

struct ScoreContribution {
    ActionKind action;
    double probability{0.0};
    double weight{0.0};        // signed
    double contribution{0.0};  // probability * weight
};

/**
 * Linear engagement scorer.
 *
 *   score = sum_{a positive} w_a * p_a - sum_{a negative} w_a * p_a
 *
 * Missing probabilities count as zero. The score depends only on the
 * candidate's probability map and the weight table, so scoring never reads or
 * writes shared state beyond the immutable weights.
 */
class WeightedScorer {
public:
    explicit WeightedScorer(ActionWeights weights);

    // Throws InvalidProbabilityError if any probability lies outside [0, 1].
    [[nodiscard]] double score(const Candidate& candidate) const;

    /**
     * Scores a whole pool at once. Probabilities are laid out as an
     * (n_candidates x n_actions) matrix and multiplied by the signed weight
     * vector. Writes base_score and score on every candidate.
     */
    void score_all(std::vector<Candidate>& candidates) const;

    // Per-action contributions in declaration order of ActionKind, zero-probability rows included.
    [[nodiscard]] std::vector<ScoreContribution> breakdown(const Candidate& candidate) const;

    [[nodiscard]] const Eigen::VectorXd& signed_weights() const noexcept;

    [[nodiscard]] const ActionWeights& weights() const noexcept;

private:
    ActionWeights weights_;
    Eigen::VectorXd signed_weights_;
};

// Validates a probability map; throws InvalidProbabilityError naming the candidate and action.
void validate_probabilities(const Candidate& candidate);

}  // namespace feedrank
