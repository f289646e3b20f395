#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace feedrank {

enum class ActionKind {
    Like,
    Reply,
    Repost,
    Quote,
    Share,
    VideoWatch,
    Click,
    ProfileClick,
    PhotoExpand,
    Dwell,
    Follow,
    NotInterested,
    Block,
    Mute,
    Report
};

inline constexpr std::size_t kActionKindCount = 15;

inline constexpr std::array<ActionKind, kActionKindCount> kAllActionKinds = {
    ActionKind::Like,         ActionKind::Reply,       ActionKind::Repost,        ActionKind::Quote,
    ActionKind::Share,        ActionKind::VideoWatch,  ActionKind::Click,         ActionKind::ProfileClick,
    ActionKind::PhotoExpand,  ActionKind::Dwell,       ActionKind::Follow,        ActionKind::NotInterested,
    ActionKind::Block,        ActionKind::Mute,        ActionKind::Report};

enum class Origin {
    InNetwork,
    Discovery
};

[[nodiscard]] bool is_negative_action(ActionKind kind) noexcept;

[[nodiscard]] std::size_t action_index(ActionKind kind) noexcept;

[[nodiscard]] const char* action_kind_name(ActionKind kind) noexcept;

// Accepts the canonical snake_case name, throws std::invalid_argument otherwise.
[[nodiscard]] ActionKind parse_action_kind(const std::string& name);

[[nodiscard]] const char* origin_name(Origin origin) noexcept;

using ActionProbabilities = std::unordered_map<ActionKind, double>;

struct Candidate {
    std::string id;
    std::string author_id;
    Origin origin{Origin::InNetwork};
    std::int64_t created_at{0};  // seconds since epoch
    std::string text;
    std::optional<double> media_duration;   // seconds, absent when the post carries no video
    std::optional<std::string> reposted_from;  // id of the original post for reposts
    bool flagged{false};
    ActionProbabilities predictions;

    std::optional<double> score;
    std::optional<std::size_t> rank;

    double base_score{0.0};
    double video_bonus{0.0};
    double diversity_multiplier{1.0};

    [[nodiscard]] double probability(ActionKind kind) const noexcept;
};

struct ViewerContext {
    std::string viewer_id;
    std::unordered_set<std::string> seen_post_ids;
    std::unordered_set<std::string> blocked_author_ids;
    std::unordered_set<std::string> muted_author_ids;
    std::vector<std::string> muted_keywords;
};

}  // namespace feedrank
