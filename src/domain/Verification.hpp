/**
 * @file Verification.hpp
 * @brief Oracle verdicts, style classification and the combined ranking record.
 */

#pragma once
#include <string>
#include "Candidate.hpp"

namespace chronolens::domain {

/**
 * @enum Verdict
 * @brief Categorical judgment of how well an image matches an event.
 */
enum class Verdict {
    Approved,
    Questionable,
    Wrong,
    Error
};

inline std::string VerdictToString(Verdict v) {
    switch (v) {
        case Verdict::Approved: return "APPROVED";
        case Verdict::Questionable: return "QUESTIONABLE";
        case Verdict::Wrong: return "WRONG";
        case Verdict::Error: return "ERROR";
    }
    return "QUESTIONABLE";
}

/** @brief Parses a verdict token. Unrecognised tokens map to Questionable. */
inline Verdict VerdictFromString(const std::string& value) {
    if (value == "APPROVED") return Verdict::Approved;
    if (value == "WRONG") return Verdict::Wrong;
    if (value == "ERROR") return Verdict::Error;
    return Verdict::Questionable;
}

/**
 * @struct VerificationResult
 * @brief Outcome of one match verification. Immutable once produced.
 */
struct VerificationResult {
    Verdict verdict = Verdict::Questionable;
    int confidence = 0; ///< 0-100.
    std::string reasoning;
    std::string visualDescription;
};

/**
 * @struct StyleProfile
 * @brief Visual style tags of an image plus the learned preference for them.
 */
struct StyleProfile {
    std::string type = "unknown";        ///< photograph, illustration, painting...
    std::string era = "unknown";         ///< modern, vintage, historical, ancient.
    std::string colorScheme = "unknown"; ///< color, black-and-white, sepia.
    std::string composition = "unknown";
    std::string subject = "unknown";
    double preferenceScore = 50.0;       ///< 0-100.
};

/**
 * @struct ScoredCandidate
 * @brief Candidate enriched with verification and style; ranked by combinedScore.
 */
struct ScoredCandidate {
    Candidate candidate;
    VerificationResult verification;
    StyleProfile style;
    double combinedScore = 0.0;
};

} // namespace chronolens::domain
