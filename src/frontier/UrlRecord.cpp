#include "../../include/frontier_crawler/frontier/UrlRecord.h"

namespace frontier_crawler::frontier {

std::string urlStatusToString(UrlStatus status) {
    switch (status) {
        case UrlStatus::PENDING: return "pending";
        case UrlStatus::IN_PROGRESS: return "in_progress";
        case UrlStatus::VISITED: return "visited";
        case UrlStatus::PAUSED: return "paused";
        case UrlStatus::ERROR: return "error";
    }
    return "unknown";
}

std::optional<UrlStatus> urlStatusFromString(const std::string& value) {
    if (value == "pending") return UrlStatus::PENDING;
    if (value == "in_progress") return UrlStatus::IN_PROGRESS;
    if (value == "visited") return UrlStatus::VISITED;
    if (value == "paused") return UrlStatus::PAUSED;
    if (value == "error") return UrlStatus::ERROR;
    return std::nullopt;
}

std::string transitionOutcomeToString(TransitionOutcome outcome) {
    switch (outcome) {
        case TransitionOutcome::APPLIED: return "applied";
        case TransitionOutcome::NOT_FOUND: return "not found";
        case TransitionOutcome::REJECTED: return "rejected";
    }
    return "unknown";
}

bool isTransitionAllowed(UrlStatus from, UrlStatus to) {
    switch (from) {
        case UrlStatus::PENDING:
            return to == UrlStatus::VISITED || to == UrlStatus::ERROR ||
                   to == UrlStatus::PAUSED || to == UrlStatus::IN_PROGRESS;
        case UrlStatus::IN_PROGRESS:
            return to == UrlStatus::VISITED || to == UrlStatus::PENDING || to == UrlStatus::ERROR;
        case UrlStatus::PAUSED:
            return to == UrlStatus::PENDING;
        case UrlStatus::ERROR:
            return to == UrlStatus::PENDING;
        case UrlStatus::VISITED:
            return false;
    }
    return false;
}

} // namespace frontier_crawler::frontier
