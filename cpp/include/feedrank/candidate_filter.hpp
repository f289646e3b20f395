#pragma once

#include "feedrank/candidate.hpp"
#include "feedrank/ranking_config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace feedrank {

enum class DropReason {
    Seen,
    OwnPost,
    BlockedAuthor,
    MutedKeyword,
    DuplicateRepost,
    Stale,
    Flagged
};

inline constexpr std::size_t kDropReasonCount = 7;

[[nodiscard]] const char* drop_reason_name(DropReason reason) noexcept;

struct FilterReport {
    std::array<std::size_t, kDropReasonCount> dropped{};
    std::size_t kept{0};

    [[nodiscard]] std::size_t count(DropReason reason) const noexcept;

    [[nodiscard]] std::size_t total_dropped() const noexcept;
};

class CandidateFilter {
public:
    explicit CandidateFilter(FilterOptions options);

    // Returns the order-preserving subsequence of candidates that pass every
    // exclusion rule. Candidates are copied, never modified.
    [[nodiscard]] std::vector<Candidate> apply(const std::vector<Candidate>& candidates,
                                               const ViewerContext& viewer,
                                               std::int64_t now,
                                               FilterReport* report = nullptr) const;

    [[nodiscard]] const FilterOptions& options() const noexcept;

private:
    FilterOptions options_;
};

// Case-insensitive (ASCII) substring test; an empty keyword never matches.
[[nodiscard]] bool contains_keyword(const std::string& text, const std::string& keyword);

}  // namespace feedrank
