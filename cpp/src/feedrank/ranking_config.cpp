#include "feedrank/ranking_config.hpp"

#include "feedrank/errors.hpp"

#include <cmath>
#include <limits>

namespace feedrank {

namespace {

void require_non_negative(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigurationError(std::string(name) + " must be a finite non-negative value");
    }
}

[[nodiscard]] std::size_t to_count(double value, const std::string& name) {
    if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value) {
        throw ConfigurationError(name + " must be a non-negative integer");
    }
    if (value > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        throw ConfigurationError(name + " is too large");
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

double ActionWeights::magnitude(ActionKind kind) const noexcept {
    switch (kind) {
        case ActionKind::Like:
            return like;
        case ActionKind::Reply:
            return reply;
        case ActionKind::Repost:
            return repost;
        case ActionKind::Quote:
            return quote;
        case ActionKind::Share:
            return share;
        case ActionKind::VideoWatch:
            return video_watch;
        case ActionKind::Click:
            return click;
        case ActionKind::ProfileClick:
            return profile_click;
        case ActionKind::PhotoExpand:
            return photo_expand;
        case ActionKind::Dwell:
            return dwell;
        case ActionKind::Follow:
            return follow;
        case ActionKind::NotInterested:
            return not_interested_penalty;
        case ActionKind::Block:
            return block_penalty;
        case ActionKind::Mute:
            return mute_penalty;
        case ActionKind::Report:
            return report_penalty;
    }
    return 0.0;
}

double ActionWeights::signed_weight(ActionKind kind) const noexcept {
    const double value = magnitude(kind);
    return is_negative_action(kind) ? -value : value;
}

void RankingConfig::validate() const {
    for (ActionKind kind : kAllActionKinds) {
        const double value = weights.magnitude(kind);
        if (!std::isfinite(value) || value < 0.0) {
            throw ConfigurationError(std::string("weight for action '") + action_kind_name(kind) +
                                     "' must be a finite non-negative magnitude");
        }
    }

    if (filter.staleness_window < 0) {
        throw ConfigurationError("staleness window must be non-negative");
    }

    require_non_negative(video.window_lower, "video bonus window lower bound");
    require_non_negative(video.window_upper, "video bonus window upper bound");
    if (video.window_lower > video.window_upper) {
        throw ConfigurationError("video bonus window lower bound exceeds upper bound");
    }
    require_non_negative(video.peak_bonus, "video peak bonus");
    if (!(video.short_falloff > 0.0) || !std::isfinite(video.short_falloff)) {
        throw ConfigurationError("video short falloff must be positive");
    }
    if (!(video.long_falloff > 0.0) || !std::isfinite(video.long_falloff)) {
        throw ConfigurationError("video long falloff must be positive");
    }

    if (!(diversity.decay_rate > 0.0 && diversity.decay_rate < 1.0)) {
        throw ConfigurationError("diversity decay rate must lie strictly between 0 and 1");
    }
}

void RankingConfig::apply_option(const std::string& name, double value) {
    if (name == "like-weight") {
        weights.like = value;
    } else if (name == "reply-weight") {
        weights.reply = value;
    } else if (name == "repost-weight") {
        weights.repost = value;
    } else if (name == "quote-weight") {
        weights.quote = value;
    } else if (name == "share-weight") {
        weights.share = value;
    } else if (name == "video-watch-weight") {
        weights.video_watch = value;
    } else if (name == "click-weight") {
        weights.click = value;
    } else if (name == "profile-click-weight") {
        weights.profile_click = value;
    } else if (name == "photo-expand-weight") {
        weights.photo_expand = value;
    } else if (name == "dwell-weight") {
        weights.dwell = value;
    } else if (name == "follow-weight") {
        weights.follow = value;
    } else if (name == "not-interested-penalty") {
        weights.not_interested_penalty = value;
    } else if (name == "block-penalty") {
        weights.block_penalty = value;
    } else if (name == "mute-penalty") {
        weights.mute_penalty = value;
    } else if (name == "report-penalty") {
        weights.report_penalty = value;
    } else if (name == "staleness-window") {
        filter.staleness_window = static_cast<std::int64_t>(to_count(value, name));
    } else if (name == "video-window-lower") {
        video.window_lower = value;
    } else if (name == "video-window-upper") {
        video.window_upper = value;
    } else if (name == "video-peak-bonus") {
        video.peak_bonus = value;
    } else if (name == "video-short-falloff") {
        video.short_falloff = value;
    } else if (name == "video-long-falloff") {
        video.long_falloff = value;
    } else if (name == "diversity-decay-rate") {
        diversity.decay_rate = value;
    } else if (name == "pool-size-cap") {
        pool_size_cap = to_count(value, name);
    } else {
        throw ConfigurationError("Unknown ranking option: " + name);
    }
}

RankingConfig RankingConfig::from_options(const std::unordered_map<std::string, double>& options) {
    RankingConfig config;
    for (const auto& [name, value] : options) {
        config.apply_option(name, value);
    }
    config.validate();
    return config;
}

const std::vector<std::string>& RankingConfig::option_names() {
    static const std::vector<std::string> names = {
        "like-weight",          "reply-weight",          "repost-weight",        "quote-weight",
        "share-weight",         "video-watch-weight",    "click-weight",         "profile-click-weight",
        "photo-expand-weight",  "dwell-weight",          "follow-weight",        "not-interested-penalty",
        "block-penalty",        "mute-penalty",          "report-penalty",       "staleness-window",
        "video-window-lower",   "video-window-upper",    "video-peak-bonus",     "video-short-falloff",
        "video-long-falloff",   "diversity-decay-rate",  "pool-size-cap"};
    return names;
}

}  // namespace feedrank
