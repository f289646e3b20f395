#include "feedrank/weighted_scorer.hpp"

#include "feedrank/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace feedrank {

namespace {

[[nodiscard]] Eigen::VectorXd probability_row(const Candidate& candidate) {
    Eigen::VectorXd row = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(kActionKindCount));
    for (const auto& [kind, p] : candidate.predictions) {
        row(static_cast<Eigen::Index>(action_index(kind))) = p;
    }
    return row;
}

}  // namespace

void validate_probabilities(const Candidate& candidate) {
    for (const auto& [kind, p] : candidate.predictions) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw InvalidProbabilityError("probability for action '" + std::string(action_kind_name(kind)) +
                                          "' on candidate " + candidate.id + " is outside [0, 1]: " +
                                          std::to_string(p));
        }
    }
}

WeightedScorer::WeightedScorer(ActionWeights weights)
    : weights_(std::move(weights)),
      signed_weights_(static_cast<Eigen::Index>(kActionKindCount)) {
    for (ActionKind kind : kAllActionKinds) {
        const double magnitude = weights_.magnitude(kind);
        if (!std::isfinite(magnitude) || magnitude < 0.0) {
            throw ConfigurationError(std::string("weight for action '") + action_kind_name(kind) +
                                     "' must be a finite non-negative magnitude");
        }
        signed_weights_(static_cast<Eigen::Index>(action_index(kind))) = weights_.signed_weight(kind);
    }
}

double WeightedScorer::score(const Candidate& candidate) const {
    validate_probabilities(candidate);
    return probability_row(candidate).dot(signed_weights_);
}

void WeightedScorer::score_all(std::vector<Candidate>& candidates) const {
    if (candidates.empty()) {
        return;
    }
    const auto n = static_cast<Eigen::Index>(candidates.size());
    Eigen::MatrixXd probabilities = Eigen::MatrixXd::Zero(n, static_cast<Eigen::Index>(kActionKindCount));
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& candidate = candidates[static_cast<std::size_t>(i)];
        validate_probabilities(candidate);
        for (const auto& [kind, p] : candidate.predictions) {
            probabilities(i, static_cast<Eigen::Index>(action_index(kind))) = p;
        }
    }

    const Eigen::VectorXd scores = probabilities * signed_weights_;
    for (Eigen::Index i = 0; i < n; ++i) {
        auto& candidate = candidates[static_cast<std::size_t>(i)];
        candidate.base_score = scores(i);
        candidate.score = scores(i);
    }
}

std::vector<ScoreContribution> WeightedScorer::breakdown(const Candidate& candidate) const {
    validate_probabilities(candidate);
    std::vector<ScoreContribution> rows;
    rows.reserve(kActionKindCount);
    for (ActionKind kind : kAllActionKinds) {
        const double p = candidate.probability(kind);
        const double w = signed_weights_(static_cast<Eigen::Index>(action_index(kind)));
        rows.push_back(ScoreContribution{kind, p, w, p * w});
    }
    return rows;
}

const Eigen::VectorXd& WeightedScorer::signed_weights() const noexcept {
    return signed_weights_;
}

const ActionWeights& WeightedScorer::weights() const noexcept {
    return weights_;
}

}  // namespace feedrank
