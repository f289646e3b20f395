#include "feedrank/video_bonus.hpp"

#include <cmath>
#include <stdexcept>

namespace feedrank {

double video_duration_bonus(double duration_seconds, const VideoBonusOptions& options) {
    if (!std::isfinite(duration_seconds) || duration_seconds < 0.0) {
        throw std::invalid_argument("media duration must be a finite non-negative number of seconds");
    }
    if (duration_seconds < options.window_lower) {
        const double distance = options.window_lower - duration_seconds;
        return options.peak_bonus * std::exp(-distance / options.short_falloff);
    }
    if (duration_seconds > options.window_upper) {
        const double distance = duration_seconds - options.window_upper;
        return options.peak_bonus * std::exp(-distance / options.long_falloff);
    }
    return options.peak_bonus;
}

double video_duration_bonus(const std::optional<double>& duration_seconds, const VideoBonusOptions& options) {
    if (!duration_seconds) {
        return 0.0;
    }
    return video_duration_bonus(*duration_seconds, options);
}

}  // namespace feedrank
