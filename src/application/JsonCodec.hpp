/**
 * @file JsonCodec.hpp
 * @brief JSON mapping of persisted documents (cache entries, engagement records).
 *
 * Readers never trust the stored shape: missing or mistyped fields fall back
 * to defaults instead of throwing.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/CacheEntry.hpp"
#include "domain/EngagementRecord.hpp"

namespace chronolens::application {

class JsonCodec {
public:
    static nlohmann::json StyleToJson(const domain::StyleProfile& style);
    static domain::StyleProfile StyleFromJson(const nlohmann::json& j);

    static nlohmann::json CacheEntryToJson(const domain::CacheEntry& entry);
    static domain::CacheEntry CacheEntryFromJson(const std::string& key, const nlohmann::json& j);

    static nlohmann::json EngagementRecordToJson(const domain::EngagementRecord& record);
    static domain::EngagementRecord EngagementRecordFromJson(const nlohmann::json& j);

    /** @brief Reads a string field; empty when absent or not a string. */
    static std::string StringOr(const nlohmann::json& j, const char* field, const std::string& fallback = "");

    /** @brief Reads an integer field, accepting floats and numeric strings. */
    static std::optional<long long> IntegerField(const nlohmann::json& j, const char* field);

    /** @brief At most maxBytes of text, never splitting a UTF-8 sequence. */
    static std::string Utf8Prefix(const std::string& text, std::size_t maxBytes);
};

} // namespace chronolens::application
