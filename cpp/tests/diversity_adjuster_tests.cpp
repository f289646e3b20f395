#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "feedrank/diversity_adjuster.hpp"
#include "feedrank/errors.hpp"

namespace {

feedrank::Candidate scored(const std::string& id, const std::string& author, double score,
                           std::int64_t created_at = 1000) {
    feedrank::Candidate c;
    c.id = id;
    c.author_id = author;
    c.score = score;
    c.base_score = score;
    c.created_at = created_at;
    return c;
}

std::vector<std::string> ids(const std::vector<feedrank::Candidate>& candidates) {
    std::vector<std::string> out;
    for (const auto& c : candidates) {
        out.push_back(c.id);
    }
    return out;
}

feedrank::DiversityAdjuster make_adjuster(double decay) {
    feedrank::DiversityOptions diversity;
    diversity.decay_rate = decay;
    return feedrank::DiversityAdjuster(diversity, feedrank::VideoBonusOptions{});
}

}  // namespace

TEST_CASE("Repeat authors sink below other authors", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.5);
    auto ranked = adjuster.apply({scored("A", "1", 10.0), scored("B", "1", 8.0), scored("C", "2", 9.0)});

    REQUIRE(ids(ranked) == std::vector<std::string>{"A", "C", "B"});
    REQUIRE(*ranked[0].score == Catch::Approx(10.0));
    REQUIRE(*ranked[1].score == Catch::Approx(9.0));
    REQUIRE(*ranked[2].score == Catch::Approx(4.0));
    REQUIRE(ranked[2].diversity_multiplier == Catch::Approx(0.5));
    REQUIRE(*ranked[0].rank == 1);
    REQUIRE(*ranked[1].rank == 2);
    REQUIRE(*ranked[2].rank == 3);
}

TEST_CASE("Demotion factor starts at one and strictly decreases", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.7);
    REQUIRE(adjuster.demotion_factor(0) == Catch::Approx(1.0));
    double previous = adjuster.demotion_factor(0);
    for (std::size_t k = 1; k < 10; ++k) {
        const double current = adjuster.demotion_factor(k);
        REQUIRE(current < previous);
        previous = current;
    }
    REQUIRE(adjuster.demotion_factor(2) == Catch::Approx(0.49));
}

TEST_CASE("Demotion factor stays positive for long author runs", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.01);
    REQUIRE(adjuster.demotion_factor(500) > 0.0);
    REQUIRE(adjuster.demotion_factor(500) == std::numeric_limits<double>::min());

    std::vector<feedrank::Candidate> pool;
    for (int i = 0; i < 400; ++i) {
        pool.push_back(scored("n" + std::to_string(i), "solo", -1.0 - i));
    }
    auto ranked = adjuster.apply(pool);
    REQUIRE(ranked.size() == pool.size());
    for (const auto& c : ranked) {
        REQUIRE(std::isfinite(*c.score));
    }
}

TEST_CASE("Single-author pools are demoted but never truncated", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.5);
    auto ranked = adjuster.apply({scored("low", "solo", 1.0), scored("high", "solo", 3.0), scored("mid", "solo", 2.0)});

    REQUIRE(ids(ranked) == std::vector<std::string>{"high", "mid", "low"});
    REQUIRE(*ranked[1].score == Catch::Approx(1.0));
    REQUIRE(*ranked[2].score == Catch::Approx(0.25));
}

TEST_CASE("Empty input yields empty output", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.7);
    REQUIRE(adjuster.apply({}).empty());
}

TEST_CASE("Ties break by recency then identifier", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.7);
    auto ranked = adjuster.apply({scored("b", "x", 1.0, 100),
                                  scored("c", "y", 1.0, 200),
                                  scored("a", "z", 1.0, 100)});
    REQUIRE(ids(ranked) == std::vector<std::string>{"c", "a", "b"});
}

TEST_CASE("Negative scores rank normally and demotion still lowers them", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.5);
    auto ranked = adjuster.apply({scored("x1", "X", -1.0), scored("x2", "X", -2.0), scored("y", "Y", -1.5)});

    REQUIRE(ids(ranked) == std::vector<std::string>{"x1", "y", "x2"});
    REQUIRE(*ranked[2].score == Catch::Approx(-4.0));
}

TEST_CASE("Video bonus is applied before ordering", "[diversity_adjuster]") {
    auto adjuster = make_adjuster(0.7);
    auto video = scored("video", "v", 0.1);
    video.media_duration = 30.0;
    auto plain = scored("plain", "p", 0.4);

    auto ranked = adjuster.apply({plain, video});
    REQUIRE(ids(ranked) == std::vector<std::string>{"video", "plain"});
    REQUIRE(ranked[0].video_bonus == Catch::Approx(0.5));
    REQUIRE(*ranked[0].score == Catch::Approx(0.6));
    REQUIRE(ranked[1].video_bonus == 0.0);
}

// Only "rep" repeats here. With several repeating authors, demoting one author can let
// another author's later candidate move up.
TEST_CASE("Demotion never moves a repeat occurrence earlier", "[diversity_adjuster]") {
    std::vector<feedrank::Candidate> pool = {
        scored("r1", "rep", 9.0),  scored("r2", "rep", 8.5), scored("r3", "rep", 7.0), scored("o1", "a", 10.0),
        scored("o2", "b", 8.8),    scored("o3", "c", 8.0),   scored("o4", "d", 6.0),   scored("o5", "e", 5.0),
        scored("o6", "f", 1.0),
    };

    auto baseline = pool;
    std::sort(baseline.begin(), baseline.end(),
              [](const feedrank::Candidate& a, const feedrank::Candidate& b) { return *a.score > *b.score; });
    auto position = [](const std::vector<feedrank::Candidate>& order, const std::string& id) {
        auto it = std::find_if(order.begin(), order.end(), [&](const feedrank::Candidate& c) { return c.id == id; });
        return static_cast<std::size_t>(it - order.begin());
    };

    auto ranked = make_adjuster(0.7).apply(pool);
    REQUIRE(ranked.size() == pool.size());
    for (const std::string id : {"r2", "r3"}) {
        REQUIRE(position(ranked, id) >= position(baseline, id));
    }
    REQUIRE(position(ranked, "r1") == position(baseline, "r1"));
}

TEST_CASE("Every author's candidates are emitted in score order", "[diversity_adjuster]") {
    std::vector<feedrank::Candidate> pool;
    for (int i = 0; i < 20; ++i) {
        pool.push_back(scored("p" + std::to_string(i), "author" + std::to_string(i % 3), static_cast<double>((i * 7) % 11),
                              1000 + i));
    }
    auto ranked = make_adjuster(0.6).apply(pool);
    REQUIRE(ranked.size() == pool.size());

    std::unordered_map<std::string, double> last_base;
    std::unordered_map<std::string, std::size_t> counts;
    for (const auto& c : ranked) {
        auto it = last_base.find(c.author_id);
        if (it != last_base.end()) {
            REQUIRE(c.base_score <= it->second);
        }
        last_base[c.author_id] = c.base_score;
        ++counts[c.author_id];
    }
    REQUIRE(counts["author0"] == 7);
    REQUIRE(counts["author1"] == 7);
    REQUIRE(counts["author2"] == 6);
}

TEST_CASE("Adjuster validates its inputs", "[diversity_adjuster]") {
    REQUIRE_THROWS_AS(make_adjuster(1.0), feedrank::ConfigurationError);
    REQUIRE_THROWS_AS(make_adjuster(0.0), feedrank::ConfigurationError);

    feedrank::Candidate unscored;
    unscored.id = "u";
    unscored.author_id = "a";
    REQUIRE_THROWS_AS(make_adjuster(0.7).apply({unscored}), std::invalid_argument);
}
