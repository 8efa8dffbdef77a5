/**
 * @file SelectionOutcome.hpp
 * @brief Result of a selectImage call.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include "Verification.hpp"

namespace chronolens::domain {

struct AcceptedSelection {
    ImageBytes bytes;
    std::string source;
    int confidence = 0;
    Verdict verdict = Verdict::Approved;
    StyleProfile styleInfo;
    ImageMetadata metadata;
    std::string selectionId;
    double combinedScore = 0.0;
    bool fromCache = false;
};

struct RejectedSelection {
    std::optional<ScoredCandidate> bestAttempt;
    std::string reason;
};

/** @brief Either an accepted image or the "no image" outcome. */
using SelectionOutcome = std::variant<AcceptedSelection, RejectedSelection>;

inline bool IsAccepted(const SelectionOutcome& outcome) {
    return std::holds_alternative<AcceptedSelection>(outcome);
}

} // namespace chronolens::domain
