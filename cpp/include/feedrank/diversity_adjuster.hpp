#pragma once

#include "feedrank/candidate.hpp"
#include "feedrank/ranking_config.hpp"

#include <cstddef>
#include <vector>

namespace feedrank {

/**
 * Produces the final feed order from scored candidates.
 *
 * Algorithm:
 *   1. Add the video duration bonus to every candidate's score.
 *   2. Order by adjusted score (desc), creation time (newest first), id (asc).
 *   3. Walk that order with a per-author emission count k. Each author
 *      contributes its best remaining candidate to a priority queue keyed by
 *      adjusted * decay^k; popping emits the candidate and re-enqueues the
 *      author's next one with k + 1. Repeat authors therefore sink below
 *      fresher authors but are never removed.
 *   4. Assign 1-based ranks.
 *
 * A negative adjusted score is divided by the factor instead of multiplied so
 * that demotion always lowers the effective score.
 */
class DiversityAdjuster {
public:
    DiversityAdjuster(DiversityOptions diversity, VideoBonusOptions video);

    // Every candidate must already carry a score. Returns candidates in final
    // order with score set to the effective score and rank assigned.
    [[nodiscard]] std::vector<Candidate> apply(std::vector<Candidate> candidates) const;

    // 1.0 at k = 0, strictly decreasing in k until it bottoms out at the
    // smallest normal double.
    [[nodiscard]] double demotion_factor(std::size_t k) const;

    [[nodiscard]] const DiversityOptions& diversity_options() const noexcept;

    [[nodiscard]] const VideoBonusOptions& video_options() const noexcept;

private:
    DiversityOptions diversity_;
    VideoBonusOptions video_;
};

}  // namespace feedrank
