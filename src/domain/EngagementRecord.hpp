/**
 * @file EngagementRecord.hpp
 * @brief Downstream engagement of a past selection.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "Verification.hpp"

namespace chronolens::domain {

struct EngagementMetrics {
    int likes = 0;
    int retweets = 0;
    int replies = 0;
    int impressions = 0;
};

/**
 * @struct EngagementRecord
 * @brief Created at selection time with empty metrics; metrics are filled exactly once.
 */
struct EngagementRecord {
    std::string selectionId;
    std::int64_t timestamp = 0;
    std::string sourceName;
    int confidence = 0;
    Verdict verdict = Verdict::Approved;
    StyleProfile style;
    std::optional<int> likes;
    std::optional<int> retweets;
    std::optional<int> replies;
    std::optional<int> impressions;
    std::optional<std::int64_t> updatedAt;

    bool hasMetrics() const { return likes.has_value(); }

    /** @brief likes + 2*retweets + 1.5*replies; 0 when metrics are missing. */
    double engagementScore() const {
        return likes.value_or(0) + retweets.value_or(0) * 2.0 + replies.value_or(0) * 1.5;
    }
};

} // namespace chronolens::domain
