#include "feedrank/diversity_adjuster.hpp"

#include "feedrank/errors.hpp"
#include "feedrank/video_bonus.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <numeric>
#include <queue>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace feedrank {

namespace {

struct AuthorState {
    std::size_t emitted{0};
    std::deque<std::size_t> pending;  // indices into the candidate vector, best first
};

struct QueueEntry {
    double effective_score;
    double factor;
    std::size_t index;
};

[[nodiscard]] bool ranks_before(double lhs_score, const Candidate& lhs, double rhs_score, const Candidate& rhs) {
    if (lhs_score != rhs_score) {
        return lhs_score > rhs_score;
    }
    if (lhs.created_at != rhs.created_at) {
        return lhs.created_at > rhs.created_at;
    }
    return lhs.id < rhs.id;
}

[[nodiscard]] double demote(double score, double factor) {
    if (score >= 0.0) {
        return score * factor;
    }
    return std::max(score / factor, std::numeric_limits<double>::lowest());
}

}  // namespace

DiversityAdjuster::DiversityAdjuster(DiversityOptions diversity, VideoBonusOptions video)
    : diversity_(diversity), video_(video) {
    if (!(diversity_.decay_rate > 0.0 && diversity_.decay_rate < 1.0)) {
        throw ConfigurationError("diversity decay rate must lie strictly between 0 and 1");
    }
    if (video_.window_lower > video_.window_upper) {
        throw ConfigurationError("video bonus window lower bound exceeds upper bound");
    }
    if (!(video_.short_falloff > 0.0) || !(video_.long_falloff > 0.0)) {
        throw ConfigurationError("video falloff distances must be positive");
    }
}

double DiversityAdjuster::demotion_factor(std::size_t k) const {
    // Clamped at the smallest normal double so the factor never reaches zero.
    return std::max(std::pow(diversity_.decay_rate, static_cast<double>(k)), std::numeric_limits<double>::min());
}

const DiversityOptions& DiversityAdjuster::diversity_options() const noexcept {
    return diversity_;
}

const VideoBonusOptions& DiversityAdjuster::video_options() const noexcept {
    return video_;
}

std::vector<Candidate> DiversityAdjuster::apply(std::vector<Candidate> candidates) const {
    const std::size_t n = candidates.size();
    if (n == 0) {
        return candidates;
    }

    std::vector<double> adjusted(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto& candidate = candidates[i];
        if (!candidate.score) {
            throw std::invalid_argument("candidate must be scored before diversity adjustment: " + candidate.id);
        }
        candidate.video_bonus = video_duration_bonus(candidate.media_duration, video_);
        adjusted[i] = *candidate.score + candidate.video_bonus;
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return ranks_before(adjusted[a], candidates[a], adjusted[b], candidates[b]);
    });

    std::unordered_map<std::string, AuthorState> authors;
    for (std::size_t idx : order) {
        authors[candidates[idx].author_id].pending.push_back(idx);
    }

    auto lower_priority = [&](const QueueEntry& lhs, const QueueEntry& rhs) {
        return ranks_before(rhs.effective_score, candidates[rhs.index], lhs.effective_score, candidates[lhs.index]);
    };
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, decltype(lower_priority)> queue(lower_priority);

    auto enqueue_next = [&](AuthorState& state) {
        if (state.pending.empty()) {
            return;
        }
        const std::size_t idx = state.pending.front();
        state.pending.pop_front();
        const double factor = demotion_factor(state.emitted);
        queue.push(QueueEntry{demote(adjusted[idx], factor), factor, idx});
    };

    for (auto& [author, state] : authors) {
        enqueue_next(state);
    }

    std::vector<Candidate> ranked;
    ranked.reserve(n);
    while (!queue.empty()) {
        const QueueEntry top = queue.top();
        queue.pop();

        Candidate& candidate = candidates[top.index];
        AuthorState& state = authors.at(candidate.author_id);
        ++state.emitted;

        candidate.diversity_multiplier = top.factor;
        candidate.score = top.effective_score;
        candidate.rank = ranked.size() + 1;
        ranked.push_back(std::move(candidate));

        enqueue_next(state);
    }
    return ranked;
}

}  // namespace feedrank
