#include "feedrank/candidate_filter.hpp"

#include "feedrank/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <utility>

namespace feedrank {

namespace {

[[nodiscard]] std::string to_lower(const std::string& value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

[[nodiscard]] const std::string& dedup_key(const Candidate& candidate) {
    return candidate.reposted_from ? *candidate.reposted_from : candidate.id;
}

// Unsigned difference so that timestamps far in the past cannot overflow.
[[nodiscard]] bool is_stale(std::int64_t created_at, std::int64_t now, std::int64_t window) {
    if (created_at >= now) {
        return false;
    }
    const std::uint64_t age = static_cast<std::uint64_t>(now) - static_cast<std::uint64_t>(created_at);
    return age > static_cast<std::uint64_t>(window);
}

}  // namespace

const char* drop_reason_name(DropReason reason) noexcept {
    switch (reason) {
        case DropReason::Seen:
            return "seen";
        case DropReason::OwnPost:
            return "own_post";
        case DropReason::BlockedAuthor:
            return "blocked_author";
        case DropReason::MutedKeyword:
            return "muted_keyword";
        case DropReason::DuplicateRepost:
            return "duplicate_repost";
        case DropReason::Stale:
            return "stale";
        case DropReason::Flagged:
            return "flagged";
    }
    return "unknown";
}

std::size_t FilterReport::count(DropReason reason) const noexcept {
    return dropped[static_cast<std::size_t>(reason)];
}

std::size_t FilterReport::total_dropped() const noexcept {
    std::size_t total = 0;
    for (std::size_t n : dropped) {
        total += n;
    }
    return total;
}

bool contains_keyword(const std::string& text, const std::string& keyword) {
    if (keyword.empty()) {
        return false;
    }
    return to_lower(text).find(to_lower(keyword)) != std::string::npos;
}

CandidateFilter::CandidateFilter(FilterOptions options) : options_(std::move(options)) {
    if (options_.staleness_window < 0) {
        throw ConfigurationError("staleness window must be non-negative");
    }
}

const FilterOptions& CandidateFilter::options() const noexcept {
    return options_;
}

std::vector<Candidate> CandidateFilter::apply(const std::vector<Candidate>& candidates,
                                              const ViewerContext& viewer,
                                              std::int64_t now,
                                              FilterReport* report) const {
    std::vector<std::string> keywords;
    keywords.reserve(viewer.muted_keywords.size() + options_.muted_keywords.size());
    for (const auto& source : {&viewer.muted_keywords, &options_.muted_keywords}) {
        for (const auto& keyword : *source) {
            if (!keyword.empty()) {
                keywords.push_back(to_lower(keyword));
            }
        }
    }

    FilterReport local;
    std::unordered_set<std::string> kept_keys;
    std::vector<Candidate> kept;
    kept.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        std::optional<DropReason> reason;

        if (viewer.seen_post_ids.contains(candidate.id)) {
            reason = DropReason::Seen;
        } else if (!viewer.viewer_id.empty() && candidate.author_id == viewer.viewer_id) {
            reason = DropReason::OwnPost;
        } else if (viewer.blocked_author_ids.contains(candidate.author_id) ||
                   viewer.muted_author_ids.contains(candidate.author_id)) {
            reason = DropReason::BlockedAuthor;
        } else if (candidate.flagged) {
            reason = DropReason::Flagged;
        } else if (is_stale(candidate.created_at, now, options_.staleness_window)) {
            reason = DropReason::Stale;
        } else {
            const std::string text = to_lower(candidate.text);
            for (const auto& keyword : keywords) {
                if (text.find(keyword) != std::string::npos) {
                    reason = DropReason::MutedKeyword;
                    break;
                }
            }
        }

        // Dedup runs last so that only candidates which would otherwise be kept claim a key.
        if (!reason && kept_keys.contains(dedup_key(candidate))) {
            reason = DropReason::DuplicateRepost;
        }

        if (reason) {
            ++local.dropped[static_cast<std::size_t>(*reason)];
            continue;
        }
        kept_keys.insert(dedup_key(candidate));
        kept.push_back(candidate);
    }

    local.kept = kept.size();
    if (report != nullptr) {
        *report = local;
    }
    return kept;
}

}  // namespace feedrank
