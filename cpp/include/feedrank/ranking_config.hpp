#pragma once

#include "feedrank/candidate.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace feedrank {

// Magnitudes only. Penalties are subtracted by the scorer.
struct ActionWeights {
    double like{1.0};
    double reply{2.0};
    double repost{1.5};
    double quote{2.5};
    double share{1.5};
    double video_watch{0.8};
    double click{0.5};
    double profile_click{0.3};
    double photo_expand{0.3};
    double dwell{0.2};
    double follow{3.0};

    double not_interested_penalty{5.0};
    double block_penalty{10.0};
    double mute_penalty{8.0};
    double report_penalty{15.0};

    [[nodiscard]] double magnitude(ActionKind kind) const noexcept;

    // Positive for engagement actions, negated for penalties.
    [[nodiscard]] double signed_weight(ActionKind kind) const noexcept;
};

struct VideoBonusOptions {
    double window_lower{15.0};    // seconds, inclusive
    double window_upper{60.0};    // seconds, inclusive
    double peak_bonus{0.5};
    double short_falloff{10.0};   // e-folding distance below the window
    double long_falloff{120.0};   // e-folding distance above the window
};

struct DiversityOptions {
    double decay_rate{0.7};  // factor(k) = decay_rate^k
};

struct FilterOptions {
    std::int64_t staleness_window{172800};  // seconds
    std::vector<std::string> muted_keywords;
};

struct RankingConfig {
    ActionWeights weights;
    VideoBonusOptions video;
    DiversityOptions diversity;
    FilterOptions filter;
    std::size_t pool_size_cap{0};  // 0 disables the cap
    bool verbose{false};           // print stage summaries

    // Throws ConfigurationError on the first out-of-range setting.
    void validate() const;

    // Sets one numeric option by its dashed name, e.g. "reply-weight" or "staleness-window".
    void apply_option(const std::string& name, double value);

    [[nodiscard]] static RankingConfig from_options(const std::unordered_map<std::string, double>& options);

    [[nodiscard]] static const std::vector<std::string>& option_names();
};

}  // namespace feedrank
