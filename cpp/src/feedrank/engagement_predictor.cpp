#include "feedrank/engagement_predictor.hpp"

#include <algorithm>

namespace feedrank {

namespace {
constexpr double kPositiveCap = 0.95;
constexpr double kNegativeFloor = 0.001;
constexpr double kNetworkBoost = 1.5;
constexpr double kVideoBoost = 1.3;

[[nodiscard]] double cap(double p) {
    return std::min(kPositiveCap, p);
}
}  // namespace

SimulatedEngagementPredictor::SimulatedEngagementPredictor(std::uint32_t seed) : rng_(seed) {}

double SimulatedEngagementPredictor::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

ActionProbabilities SimulatedEngagementPredictor::predict(const Candidate& candidate) {
    const bool in_network = candidate.origin == Origin::InNetwork;
    const bool has_video = candidate.media_duration.has_value();

    const double base = uniform(0.01, 0.05);
    const double network = in_network ? kNetworkBoost : 1.0;

    ActionProbabilities p;
    p[ActionKind::Like] = cap(base * 3.0 * network + uniform(0.0, 0.1));
    p[ActionKind::Reply] = cap(base * 0.5 * network + uniform(0.0, 0.03));
    p[ActionKind::Repost] = cap(base * 0.8 * network + uniform(0.0, 0.05));
    p[ActionKind::Quote] = cap(base * 0.3 * network + uniform(0.0, 0.02));
    p[ActionKind::Click] = cap(base * 2.0 + uniform(0.0, 0.15));
    p[ActionKind::ProfileClick] = cap(base * 0.4 + uniform(0.0, 0.05));
    p[ActionKind::VideoWatch] = has_video ? cap(base * 4.0 * kVideoBoost) : 0.01;
    p[ActionKind::PhotoExpand] = cap(base * 0.6 + uniform(0.0, 0.05));
    p[ActionKind::Share] = cap(base * 0.4 * network + uniform(0.0, 0.03));
    p[ActionKind::Dwell] = cap(base * 5.0 + uniform(0.0, 0.2));
    p[ActionKind::Follow] = in_network ? 0.001 : cap(base * 0.1);

    p[ActionKind::NotInterested] = std::max(kNegativeFloor, uniform(0.0, 0.02));
    p[ActionKind::Block] = std::max(kNegativeFloor, uniform(0.0, 0.005));
    p[ActionKind::Mute] = std::max(kNegativeFloor, uniform(0.0, 0.008));
    p[ActionKind::Report] = std::max(kNegativeFloor, uniform(0.0, 0.002));
    return p;
}

}  // namespace feedrank
