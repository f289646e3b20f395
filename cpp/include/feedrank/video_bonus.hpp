#pragma once

#include "feedrank/ranking_config.hpp"

#include <optional>

namespace feedrank {

// Peak bonus inside [window_lower, window_upper], decaying as
// peak * exp(-distance / falloff) on either side of the window.
// Throws std::invalid_argument for negative or non-finite durations.
[[nodiscard]] double video_duration_bonus(double duration_seconds, const VideoBonusOptions& options);

// Zero when the candidate carries no video.
[[nodiscard]] double video_duration_bonus(const std::optional<double>& duration_seconds,
                                          const VideoBonusOptions& options);

}  // namespace feedrank
