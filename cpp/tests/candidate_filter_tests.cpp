#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "feedrank/candidate_filter.hpp"
#include "feedrank/errors.hpp"

namespace {

constexpr std::int64_t kNow = 1'700'000'000;

feedrank::Candidate make_post(const std::string& id, const std::string& author, const std::string& text = "hello",
                              std::int64_t age = 60) {
    feedrank::Candidate c;
    c.id = id;
    c.author_id = author;
    c.text = text;
    c.created_at = kNow - age;
    return c;
}

std::vector<std::string> ids(const std::vector<feedrank::Candidate>& candidates) {
    std::vector<std::string> out;
    for (const auto& c : candidates) {
        out.push_back(c.id);
    }
    return out;
}

}  // namespace

TEST_CASE("Filter applies every exclusion rule", "[candidate_filter]") {
    feedrank::ViewerContext viewer;
    viewer.viewer_id = "me";
    viewer.seen_post_ids = {"seen"};
    viewer.blocked_author_ids = {"troll"};
    viewer.muted_author_ids = {"loud"};
    viewer.muted_keywords = {"spam"};

    auto flagged = make_post("flagged", "carol");
    flagged.flagged = true;

    std::vector<feedrank::Candidate> pool = {
        make_post("keep1", "alice"),
        make_post("seen", "alice"),
        make_post("mine", "me"),
        make_post("blocked", "troll"),
        make_post("muted", "loud"),
        make_post("keyword", "bob", "Buy cheap SPAM today"),
        make_post("stale", "bob", "old news", 172800 + 1),
        flagged,
        make_post("keep2", "dave"),
    };

    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    feedrank::FilterReport report;
    auto kept = filter.apply(pool, viewer, kNow, &report);

    REQUIRE(ids(kept) == std::vector<std::string>{"keep1", "keep2"});
    REQUIRE(report.kept == 2);
    REQUIRE(report.count(feedrank::DropReason::Seen) == 1);
    REQUIRE(report.count(feedrank::DropReason::OwnPost) == 1);
    REQUIRE(report.count(feedrank::DropReason::BlockedAuthor) == 2);
    REQUIRE(report.count(feedrank::DropReason::MutedKeyword) == 1);
    REQUIRE(report.count(feedrank::DropReason::Stale) == 1);
    REQUIRE(report.count(feedrank::DropReason::Flagged) == 1);
    REQUIRE(report.total_dropped() == 7);
}

TEST_CASE("Muted keyword excludes a candidate regardless of score", "[candidate_filter]") {
    auto post = make_post("p", "alice", "this is spam");
    post.predictions[feedrank::ActionKind::Like] = 0.95;
    post.predictions[feedrank::ActionKind::Follow] = 0.95;

    feedrank::ViewerContext viewer;
    viewer.muted_keywords = {"spam"};
    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    REQUIRE(filter.apply({post}, viewer, kNow).empty());

    feedrank::FilterOptions options;
    options.muted_keywords = {"SpAm"};
    feedrank::CandidateFilter configured(options);
    REQUIRE(configured.apply({post}, feedrank::ViewerContext{}, kNow).empty());
}

TEST_CASE("Keyword matching is case-insensitive and ignores empty keywords", "[candidate_filter]") {
    REQUIRE(feedrank::contains_keyword("Hot TAKE incoming", "take"));
    REQUIRE(feedrank::contains_keyword("hot take", "HOT"));
    REQUIRE_FALSE(feedrank::contains_keyword("hot take", "cold"));
    REQUIRE_FALSE(feedrank::contains_keyword("hot take", ""));
}

TEST_CASE("Duplicate reposts keep only the first occurrence", "[candidate_filter]") {
    auto original = make_post("orig", "alice");
    auto repost_a = make_post("r1", "bob");
    repost_a.reposted_from = "orig";
    auto repost_b = make_post("r2", "carol");
    repost_b.reposted_from = "orig";
    auto other_a = make_post("r3", "dave");
    other_a.reposted_from = "elsewhere";
    auto other_b = make_post("r4", "erin");
    other_b.reposted_from = "elsewhere";

    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    feedrank::FilterReport report;
    auto kept = filter.apply({original, repost_a, other_a, repost_b, other_b}, feedrank::ViewerContext{}, kNow, &report);

    REQUIRE(ids(kept) == std::vector<std::string>{"orig", "r3"});
    REQUIRE(report.count(feedrank::DropReason::DuplicateRepost) == 3);
}

TEST_CASE("A dropped original does not claim its dedup key", "[candidate_filter]") {
    auto original = make_post("orig", "alice");
    original.flagged = true;
    auto repost = make_post("r1", "bob");
    repost.reposted_from = "orig";

    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    auto kept = filter.apply({original, repost}, feedrank::ViewerContext{}, kNow);
    REQUIRE(ids(kept) == std::vector<std::string>{"r1"});
}

TEST_CASE("Staleness window is inclusive and tolerates future timestamps", "[candidate_filter]") {
    feedrank::FilterOptions options;
    options.staleness_window = 3600;
    feedrank::CandidateFilter filter(options);

    auto edge = make_post("edge", "alice", "x", 3600);
    auto old = make_post("old", "alice", "x", 3601);
    auto future = make_post("future", "bob", "x", -120);

    auto kept = filter.apply({edge, old, future}, feedrank::ViewerContext{}, kNow);
    REQUIRE(ids(kept) == std::vector<std::string>{"edge", "future"});

    options.staleness_window = -1;
    REQUIRE_THROWS_AS(feedrank::CandidateFilter(options), feedrank::ConfigurationError);
}

TEST_CASE("Timestamps at the bottom of the range are stale", "[candidate_filter]") {
    auto ancient = make_post("ancient", "alice");
    ancient.created_at = std::numeric_limits<std::int64_t>::min() + 5;
    auto recent = make_post("recent", "bob");

    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    feedrank::FilterReport report;
    auto kept = filter.apply({ancient, recent}, feedrank::ViewerContext{}, kNow, &report);

    REQUIRE(ids(kept) == std::vector<std::string>{"recent"});
    REQUIRE(report.count(feedrank::DropReason::Stale) == 1);

    feedrank::FilterOptions wide;
    wide.staleness_window = std::numeric_limits<std::int64_t>::max();
    feedrank::CandidateFilter lenient(wide);
    REQUIRE(lenient.apply({ancient}, feedrank::ViewerContext{}, kNow).empty());
    REQUIRE(lenient.apply({ancient}, feedrank::ViewerContext{}, -10).size() == 1);
}

TEST_CASE("Filter output is an ordered subset and the filter is idempotent", "[candidate_filter]") {
    feedrank::ViewerContext viewer;
    viewer.viewer_id = "me";
    viewer.seen_post_ids = {"p3"};
    viewer.muted_keywords = {"crypto"};

    std::vector<feedrank::Candidate> pool;
    for (int i = 0; i < 12; ++i) {
        auto post = make_post("p" + std::to_string(i), i % 4 == 0 ? "me" : "author" + std::to_string(i % 3),
                              i % 5 == 0 ? "crypto moon" : "weather report", 60 * i);
        if (i % 6 == 1) {
            post.reposted_from = "shared";
        }
        pool.push_back(post);
    }

    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    auto once = filter.apply(pool, viewer, kNow);
    auto twice = filter.apply(once, viewer, kNow);

    REQUIRE_FALSE(once.empty());
    REQUIRE(ids(once) == ids(twice));

    // Every survivor appears in the input, in the same relative order.
    std::size_t cursor = 0;
    for (const auto& kept : once) {
        while (cursor < pool.size() && pool[cursor].id != kept.id) {
            ++cursor;
        }
        REQUIRE(cursor < pool.size());
        ++cursor;
    }
}

TEST_CASE("Filtering everything yields an empty feed", "[candidate_filter]") {
    feedrank::ViewerContext viewer;
    viewer.viewer_id = "me";
    feedrank::CandidateFilter filter(feedrank::FilterOptions{});
    auto kept = filter.apply({make_post("a", "me"), make_post("b", "me")}, viewer, kNow);
    REQUIRE(kept.empty());
}
