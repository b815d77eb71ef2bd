#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace frontier_crawler::frontier {

enum class UrlStatus {
    PENDING,
    IN_PROGRESS,   // reserved for lease-based claiming; the default engine never writes it
    VISITED,
    PAUSED,
    ERROR
};

// Result of a direct status change requested by an operator command.
enum class TransitionOutcome {
    APPLIED,
    NOT_FOUND,
    REJECTED
};

struct UrlRecord {
    std::string url;
    UrlStatus status = UrlStatus::PENDING;
    int retryCount = 0;
    bool isSitemap = false;
    std::chrono::system_clock::time_point lastUpdated;
    std::chrono::system_clock::time_point createdAt;

    std::string domain;
    std::optional<std::string> lastError;
    std::optional<std::string> pauseReason;
};

std::string urlStatusToString(UrlStatus status);

// Parses the stored lowercase form. Unknown strings yield std::nullopt.
std::optional<UrlStatus> urlStatusFromString(const std::string& value);

std::string transitionOutcomeToString(TransitionOutcome outcome);

/**
 * Whether a row in state `from` may move to `to`.
 *
 * pending  -> visited | error | paused | in_progress
 * paused   -> pending
 * error    -> pending          (operator resume only)
 * in_progress -> visited | pending | error
 * visited is terminal.
 */
bool isTransitionAllowed(UrlStatus from, UrlStatus to);

} // namespace frontier_crawler::frontier
