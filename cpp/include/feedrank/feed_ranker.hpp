#pragma once

#include "feedrank/candidate.hpp"
#include "feedrank/candidate_filter.hpp"
#include "feedrank/diversity_adjuster.hpp"
#include "feedrank/engagement_predictor.hpp"
#include "feedrank/ranking_config.hpp"
#include "feedrank/weighted_scorer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace feedrank {

struct FeedRequest {
    std::vector<Candidate> in_network;
    std::vector<Candidate> discovery;
    ViewerContext viewer;
    std::int64_t now{0};  // seconds since epoch, reference point for staleness
};

struct RankedPost {
    std::string id;
    std::string author_id;
    Origin origin{Origin::InNetwork};
    std::size_t rank{0};
    double score{0.0};       // after video bonus and diversity demotion
    double base_score{0.0};  // weighted engagement score
    double video_bonus{0.0};
    double diversity_multiplier{1.0};
};

struct FeedResult {
    std::vector<RankedPost> posts;
    FilterReport filter_report;
    std::size_t pool_size{0};
};

// Runs pool building, filtering, scoring and diversity adjustment for one
// feed-generation call. Holds no state between calls.
class FeedRanker {
public:
    // Throws ConfigurationError if the configuration is invalid.
    explicit FeedRanker(RankingConfig config);

    [[nodiscard]] FeedResult rank(const FeedRequest& request) const;

    // Candidates surviving the filter with an empty probability map are
    // filled from the predictor before scoring.
    [[nodiscard]] FeedResult rank(const FeedRequest& request, EngagementPredictor& predictor) const;

    [[nodiscard]] const RankingConfig& config() const noexcept;

private:
    [[nodiscard]] FeedResult run(const FeedRequest& request, EngagementPredictor* predictor) const;

    RankingConfig config_;
    CandidateFilter filter_;
    WeightedScorer scorer_;
    DiversityAdjuster adjuster_;
};

}  // namespace feedrank
