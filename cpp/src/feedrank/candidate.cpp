#include "feedrank/candidate.hpp"

#include <stdexcept>

namespace feedrank {

bool is_negative_action(ActionKind kind) noexcept {
    switch (kind) {
        case ActionKind::NotInterested:
        case ActionKind::Block:
        case ActionKind::Mute:
        case ActionKind::Report:
            return true;
        default:
            return false;
    }
}

std::size_t action_index(ActionKind kind) noexcept {
    return static_cast<std::size_t>(kind);
}

const char* action_kind_name(ActionKind kind) noexcept {
    switch (kind) {
        case ActionKind::Like:
            return "like";
        case ActionKind::Reply:
            return "reply";
        case ActionKind::Repost:
            return "repost";
        case ActionKind::Quote:
            return "quote";
        case ActionKind::Share:
            return "share";
        case ActionKind::VideoWatch:
            return "video_watch";
        case ActionKind::Click:
            return "click";
        case ActionKind::ProfileClick:
            return "profile_click";
        case ActionKind::PhotoExpand:
            return "photo_expand";
        case ActionKind::Dwell:
            return "dwell";
        case ActionKind::Follow:
            return "follow";
        case ActionKind::NotInterested:
            return "not_interested";
        case ActionKind::Block:
            return "block";
        case ActionKind::Mute:
            return "mute";
        case ActionKind::Report:
            return "report";
    }
    return "unknown";
}

ActionKind parse_action_kind(const std::string& name) {
    for (ActionKind kind : kAllActionKinds) {
        if (name == action_kind_name(kind)) {
            return kind;
        }
    }
    if (name == "favorite") {
        return ActionKind::Like;
    }
    throw std::invalid_argument("Unknown action kind: " + name);
}

const char* origin_name(Origin origin) noexcept {
    return origin == Origin::InNetwork ? "in_network" : "discovery";
}

double Candidate::probability(ActionKind kind) const noexcept {
    auto it = predictions.find(kind);
    if (it == predictions.end()) {
        return 0.0;
    }
    return it->second;
}

}  // namespace feedrank
