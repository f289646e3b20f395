#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "feedrank/candidate.hpp"
#include "feedrank/candidate_filter.hpp"
#include "feedrank/errors.hpp"
#include "feedrank/feed_ranker.hpp"
#include "feedrank/ranking_config.hpp"
#include "feedrank/video_bonus.hpp"
#include "feedrank/weighted_scorer.hpp"

namespace py = pybind11;
using namespace feedrank;

PYBIND11_MODULE(_feedrank, m) {
    m.doc() = "feedrank python bindings";

    py::register_exception<EmptyPoolError>(m, "EmptyPoolError", PyExc_ValueError);
    py::register_exception<InvalidProbabilityError>(m, "InvalidProbabilityError", PyExc_ValueError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    py::enum_<ActionKind>(m, "ActionKind")
        .value("Like", ActionKind::Like)
        .value("Reply", ActionKind::Reply)
        .value("Repost", ActionKind::Repost)
        .value("Quote", ActionKind::Quote)
        .value("Share", ActionKind::Share)
        .value("VideoWatch", ActionKind::VideoWatch)
        .value("Click", ActionKind::Click)
        .value("ProfileClick", ActionKind::ProfileClick)
        .value("PhotoExpand", ActionKind::PhotoExpand)
        .value("Dwell", ActionKind::Dwell)
        .value("Follow", ActionKind::Follow)
        .value("NotInterested", ActionKind::NotInterested)
        .value("Block", ActionKind::Block)
        .value("Mute", ActionKind::Mute)
        .value("Report", ActionKind::Report)
        .export_values();

    py::enum_<Origin>(m, "Origin")
        .value("InNetwork", Origin::InNetwork)
        .value("Discovery", Origin::Discovery)
        .export_values();

    m.def("parse_action_kind", &parse_action_kind, py::arg("name"));

    py::class_<Candidate>(m, "Candidate")
        .def(py::init<>())
        .def_readwrite("id", &Candidate::id)
        .def_readwrite("author_id", &Candidate::author_id)
        .def_readwrite("origin", &Candidate::origin)
        .def_readwrite("created_at", &Candidate::created_at)
        .def_readwrite("text", &Candidate::text)
        .def_readwrite("media_duration", &Candidate::media_duration)
        .def_readwrite("reposted_from", &Candidate::reposted_from)
        .def_readwrite("flagged", &Candidate::flagged)
        .def_readwrite("predictions", &Candidate::predictions)
        .def_readwrite("score", &Candidate::score)
        .def_readwrite("rank", &Candidate::rank);

    py::class_<ViewerContext>(m, "ViewerContext")
        .def(py::init<>())
        .def_readwrite("viewer_id", &ViewerContext::viewer_id)
        .def_readwrite("seen_post_ids", &ViewerContext::seen_post_ids)
        .def_readwrite("blocked_author_ids", &ViewerContext::blocked_author_ids)
        .def_readwrite("muted_author_ids", &ViewerContext::muted_author_ids)
        .def_readwrite("muted_keywords", &ViewerContext::muted_keywords);

    py::class_<VideoBonusOptions>(m, "VideoBonusOptions")
        .def(py::init<>())
        .def_readwrite("window_lower", &VideoBonusOptions::window_lower)
        .def_readwrite("window_upper", &VideoBonusOptions::window_upper)
        .def_readwrite("peak_bonus", &VideoBonusOptions::peak_bonus)
        .def_readwrite("short_falloff", &VideoBonusOptions::short_falloff)
        .def_readwrite("long_falloff", &VideoBonusOptions::long_falloff);

    py::class_<ActionWeights>(m, "ActionWeights")
        .def(py::init<>())
        .def_readwrite("like", &ActionWeights::like)
        .def_readwrite("reply", &ActionWeights::reply)
        .def_readwrite("repost", &ActionWeights::repost)
        .def_readwrite("quote", &ActionWeights::quote)
        .def_readwrite("share", &ActionWeights::share)
        .def_readwrite("video_watch", &ActionWeights::video_watch)
        .def_readwrite("click", &ActionWeights::click)
        .def_readwrite("profile_click", &ActionWeights::profile_click)
        .def_readwrite("photo_expand", &ActionWeights::photo_expand)
        .def_readwrite("dwell", &ActionWeights::dwell)
        .def_readwrite("follow", &ActionWeights::follow)
        .def_readwrite("not_interested_penalty", &ActionWeights::not_interested_penalty)
        .def_readwrite("block_penalty", &ActionWeights::block_penalty)
        .def_readwrite("mute_penalty", &ActionWeights::mute_penalty)
        .def_readwrite("report_penalty", &ActionWeights::report_penalty)
        .def("signed_weight", &ActionWeights::signed_weight, py::arg("kind"));

    py::class_<DiversityOptions>(m, "DiversityOptions")
        .def(py::init<>())
        .def_readwrite("decay_rate", &DiversityOptions::decay_rate);

    py::class_<FilterOptions>(m, "FilterOptions")
        .def(py::init<>())
        .def_readwrite("staleness_window", &FilterOptions::staleness_window)
        .def_readwrite("muted_keywords", &FilterOptions::muted_keywords);

    py::class_<RankingConfig>(m, "RankingConfig")
        .def(py::init<>())
        .def_readwrite("weights", &RankingConfig::weights)
        .def_readwrite("diversity", &RankingConfig::diversity)
        .def_readwrite("filter", &RankingConfig::filter)
        .def_readwrite("pool_size_cap", &RankingConfig::pool_size_cap)
        .def_readwrite("verbose", &RankingConfig::verbose)
        .def_readwrite("video", &RankingConfig::video)
        .def("apply_option", &RankingConfig::apply_option, py::arg("name"), py::arg("value"))
        .def("validate", &RankingConfig::validate)
        .def_static("from_options", &RankingConfig::from_options, py::arg("options"))
        .def_static("option_names", &RankingConfig::option_names);

    py::class_<FilterReport>(m, "FilterReport")
        .def_readonly("kept", &FilterReport::kept)
        .def("dropped", [](const FilterReport& report) {
            py::dict out;
            for (std::size_t i = 0; i < kDropReasonCount; ++i) {
                out[drop_reason_name(static_cast<DropReason>(i))] = report.dropped[i];
            }
            return out;
        });

    py::class_<RankedPost>(m, "RankedPost")
        .def_readonly("id", &RankedPost::id)
        .def_readonly("author_id", &RankedPost::author_id)
        .def_readonly("origin", &RankedPost::origin)
        .def_readonly("rank", &RankedPost::rank)
        .def_readonly("score", &RankedPost::score)
        .def_readonly("base_score", &RankedPost::base_score)
        .def_readonly("video_bonus", &RankedPost::video_bonus)
        .def_readonly("diversity_multiplier", &RankedPost::diversity_multiplier);

    py::class_<FeedResult>(m, "FeedResult")
        .def_readonly("posts", &FeedResult::posts)
        .def_readonly("filter_report", &FeedResult::filter_report)
        .def_readonly("pool_size", &FeedResult::pool_size);

    py::class_<FeedRequest>(m, "FeedRequest")
        .def(py::init<>())
        .def_readwrite("in_network", &FeedRequest::in_network)
        .def_readwrite("discovery", &FeedRequest::discovery)
        .def_readwrite("viewer", &FeedRequest::viewer)
        .def_readwrite("now", &FeedRequest::now);

    py::class_<SimulatedEngagementPredictor>(m, "SimulatedEngagementPredictor")
        .def(py::init<std::uint32_t>(), py::arg("seed") = 42)
        .def("predict", &SimulatedEngagementPredictor::predict, py::arg("candidate"));

    py::class_<FeedRanker>(m, "FeedRanker")
        .def(py::init<RankingConfig>(), py::arg("config") = RankingConfig{})
        .def("rank", py::overload_cast<const FeedRequest&>(&FeedRanker::rank, py::const_), py::arg("request"))
        .def("rank_with_predictor",
             [](const FeedRanker& ranker, const FeedRequest& request, SimulatedEngagementPredictor& predictor) {
                 return ranker.rank(request, predictor);
             },
             py::arg("request"), py::arg("predictor"));

    py::class_<ScoreContribution>(m, "ScoreContribution")
        .def_readonly("action", &ScoreContribution::action)
        .def_readonly("probability", &ScoreContribution::probability)
        .def_readonly("weight", &ScoreContribution::weight)
        .def_readonly("contribution", &ScoreContribution::contribution);

    m.def("score_breakdown",
          [](const Candidate& candidate, const RankingConfig& config) {
              return WeightedScorer(config.weights).breakdown(candidate);
          },
          py::arg("candidate"), py::arg("config") = RankingConfig{});

    m.def("video_duration_bonus",
          py::overload_cast<double, const VideoBonusOptions&>(&video_duration_bonus),
          py::arg("duration_seconds"), py::arg("options") = VideoBonusOptions{});
}
