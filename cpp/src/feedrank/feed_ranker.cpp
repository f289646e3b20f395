#include "feedrank/feed_ranker.hpp"

#include "feedrank/candidate_pool.hpp"

#include <iostream>
#include <utility>

namespace feedrank {

namespace {

[[nodiscard]] const RankingConfig& validated(const RankingConfig& config) {
    config.validate();
    return config;
}

void print_filter_report(const FilterReport& report) {
    std::cout << "feedrank: filter kept " << report.kept << ", dropped " << report.total_dropped();
    for (std::size_t i = 0; i < kDropReasonCount; ++i) {
        if (report.dropped[i] > 0) {
            std::cout << " " << drop_reason_name(static_cast<DropReason>(i)) << "=" << report.dropped[i];
        }
    }
    std::cout << std::endl;
}

}  // namespace

FeedRanker::FeedRanker(RankingConfig config)
    : config_(validated(config)),
      filter_(config_.filter),
      scorer_(config_.weights),
      adjuster_(config_.diversity, config_.video) {}

const RankingConfig& FeedRanker::config() const noexcept {
    return config_;
}

FeedResult FeedRanker::rank(const FeedRequest& request) const {
    return run(request, nullptr);
}

FeedResult FeedRanker::rank(const FeedRequest& request, EngagementPredictor& predictor) const {
    return run(request, &predictor);
}

FeedResult FeedRanker::run(const FeedRequest& request, EngagementPredictor* predictor) const {
    FeedResult result;

    auto pool = build_candidate_pool(request.in_network, request.discovery);
    apply_pool_cap(pool, config_.pool_size_cap);
    result.pool_size = pool.size();
    if (config_.verbose) {
        std::cout << "feedrank: pool of " << pool.size() << " candidates (" << request.in_network.size()
                  << " in-network, " << request.discovery.size() << " discovery)" << std::endl;
    }

    auto survivors = filter_.apply(pool, request.viewer, request.now, &result.filter_report);
    if (config_.verbose) {
        print_filter_report(result.filter_report);
    }

    if (predictor != nullptr) {
        for (auto& candidate : survivors) {
            if (candidate.predictions.empty()) {
                candidate.predictions = predictor->predict(candidate);
            }
        }
    }

    scorer_.score_all(survivors);
    auto ranked = adjuster_.apply(std::move(survivors));

    result.posts.reserve(ranked.size());
    for (const auto& candidate : ranked) {
        result.posts.push_back(RankedPost{candidate.id,
                                          candidate.author_id,
                                          candidate.origin,
                                          candidate.rank.value_or(0),
                                          candidate.score.value_or(0.0),
                                          candidate.base_score,
                                          candidate.video_bonus,
                                          candidate.diversity_multiplier});
    }

    if (config_.verbose) {
        std::cout << "feedrank: ranked " << result.posts.size() << " posts";
        if (!result.posts.empty()) {
            std::cout << ", top " << result.posts.front().id << " (score " << result.posts.front().score << ")";
        }
        std::cout << std::endl;
    }
    return result;
}

}  // namespace feedrank
