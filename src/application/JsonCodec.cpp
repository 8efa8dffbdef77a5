#include "application/JsonCodec.hpp"
#include <cmath>

namespace chronolens::application {

using json = nlohmann::json;

std::string JsonCodec::StringOr(const json& j, const char* field, const std::string& fallback) {
    if (j.is_object() && j.contains(field) && j[field].is_string()) {
        return j[field].get<std::string>();
    }
    return fallback;
}

std::optional<long long> JsonCodec::IntegerField(const json& j, const char* field) {
    if (!j.is_object() || !j.contains(field)) return std::nullopt;
    const auto& v = j[field];
    if (v.is_number_integer()) return v.get<long long>();
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d)) return static_cast<long long>(std::llround(d));
        return std::nullopt;
    }
    if (v.is_string()) {
        try {
            std::size_t used = 0;
            double d = std::stod(v.get<std::string>(), &used);
            if (used > 0 && std::isfinite(d)) return static_cast<long long>(std::llround(d));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string JsonCodec::Utf8Prefix(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    std::size_t end = maxBytes;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

json JsonCodec::StyleToJson(const domain::StyleProfile& style) {
    return {
        {"type", style.type},
        {"era", style.era},
        {"colorScheme", style.colorScheme},
        {"composition", style.composition},
        {"subject", style.subject},
        {"preferenceScore", style.preferenceScore}
    };
}

domain::StyleProfile JsonCodec::StyleFromJson(const json& j) {
    domain::StyleProfile style;
    if (!j.is_object()) return style;
    style.type = StringOr(j, "type", style.type);
    style.era = StringOr(j, "era", style.era);
    style.colorScheme = StringOr(j, "colorScheme", style.colorScheme);
    style.composition = StringOr(j, "composition", style.composition);
    style.subject = StringOr(j, "subject", style.subject);
    if (j.contains("preferenceScore") && j["preferenceScore"].is_number()) {
        style.preferenceScore = j["preferenceScore"].get<double>();
    }
    return style;
}

json JsonCodec::CacheEntryToJson(const domain::CacheEntry& entry) {
    json j = {
        {"source", entry.source},
        {"confidence", entry.confidence},
        {"verdict", domain::VerdictToString(entry.verdict)},
        {"styleInfo", StyleToJson(entry.styleInfo)},
        {"cachedAt", entry.cachedAt},
        {"lastUsed", entry.lastUsed},
        {"useCount", entry.useCount},
        {"eventYear", entry.eventYear},
        {"eventDescription", entry.eventDescriptionPrefix}
    };
    if (entry.url) j["url"] = *entry.url;
    if (entry.title) j["title"] = *entry.title;
    return j;
}

domain::CacheEntry JsonCodec::CacheEntryFromJson(const std::string& key, const json& j) {
    domain::CacheEntry entry;
    entry.key = key;
    entry.source = StringOr(j, "source");
    entry.confidence = static_cast<int>(IntegerField(j, "confidence").value_or(0));
    entry.verdict = domain::VerdictFromString(StringOr(j, "verdict", "APPROVED"));
    if (j.contains("styleInfo")) {
        entry.styleInfo = StyleFromJson(j["styleInfo"]);
    }
    entry.cachedAt = IntegerField(j, "cachedAt").value_or(0);
    entry.lastUsed = IntegerField(j, "lastUsed").value_or(entry.cachedAt);
    entry.useCount = static_cast<int>(IntegerField(j, "useCount").value_or(0));
    entry.eventYear = static_cast<int>(IntegerField(j, "eventYear").value_or(0));
    entry.eventDescriptionPrefix = StringOr(j, "eventDescription");
    if (j.contains("url") && j["url"].is_string()) entry.url = j["url"].get<std::string>();
    if (j.contains("title") && j["title"].is_string()) entry.title = j["title"].get<std::string>();
    return entry;
}

json JsonCodec::EngagementRecordToJson(const domain::EngagementRecord& record) {
    auto nullable = [](const std::optional<int>& v) -> json {
        return v ? json(*v) : json(nullptr);
    };
    json j = {
        {"selectionId", record.selectionId},
        {"timestamp", record.timestamp},
        {"imageSource", record.sourceName},
        {"imageConfidence", record.confidence},
        {"imageVerdict", domain::VerdictToString(record.verdict)},
        {"style", StyleToJson(record.style)},
        {"likes", nullable(record.likes)},
        {"retweets", nullable(record.retweets)},
        {"replies", nullable(record.replies)},
        {"impressions", nullable(record.impressions)}
    };
    if (record.updatedAt) j["updatedAt"] = *record.updatedAt;
    return j;
}

domain::EngagementRecord JsonCodec::EngagementRecordFromJson(const json& j) {
    auto optionalInt = [&j](const char* field) -> std::optional<int> {
        auto v = IntegerField(j, field);
        if (!v) return std::nullopt;
        return static_cast<int>(*v);
    };

    domain::EngagementRecord record;
    record.selectionId = StringOr(j, "selectionId");
    record.timestamp = IntegerField(j, "timestamp").value_or(0);
    record.sourceName = StringOr(j, "imageSource", "unknown");
    record.confidence = static_cast<int>(IntegerField(j, "imageConfidence").value_or(0));
    record.verdict = domain::VerdictFromString(StringOr(j, "imageVerdict"));
    if (j.is_object() && j.contains("style")) {
        record.style = StyleFromJson(j["style"]);
    }
    record.likes = optionalInt("likes");
    record.retweets = optionalInt("retweets");
    record.replies = optionalInt("replies");
    record.impressions = optionalInt("impressions");
    if (auto updated = IntegerField(j, "updatedAt")) {
        record.updatedAt = *updated;
    }
    return record;
}

} // namespace chronolens::application
