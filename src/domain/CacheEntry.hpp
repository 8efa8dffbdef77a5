/**
 * @file CacheEntry.hpp
 * @brief Metadata of a previously accepted image selection.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "Verification.hpp"

namespace chronolens::domain {

/**
 * @struct CacheEntry
 * @brief Records which source won for an event; the image bytes are not cached.
 *
 * Timestamps are milliseconds since the Unix epoch.
 */
struct CacheEntry {
    std::string key;
    std::string source;
    int confidence = 0;
    Verdict verdict = Verdict::Approved;
    StyleProfile styleInfo;
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::int64_t cachedAt = 0;
    std::int64_t lastUsed = 0;
    int useCount = 0;
    int eventYear = 0;
    std::string eventDescriptionPrefix;
};

/**
 * @struct SelectionInfo
 * @brief What the engine hands to the cache when a selection is accepted.
 */
struct SelectionInfo {
    std::string source;
    int confidence = 0;
    Verdict verdict = Verdict::Approved;
    StyleProfile styleInfo;
    std::optional<std::string> url;
    std::optional<std::string> title;
};

} // namespace chronolens::domain
