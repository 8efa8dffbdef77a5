/**
 * @file EngagementStore.cpp
 * @brief Implementation of EngagementStore.
 */

#include "application/EngagementStore.hpp"
#include "application/JsonCodec.hpp"
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chronolens::application {

using json = nlohmann::json;

EngagementStore::EngagementStore(std::shared_ptr<domain::KeyValueStore> store, Clock clock, std::string documentKey)
    : m_store(std::move(store)), m_clock(std::move(clock)), m_documentKey(std::move(documentKey)) {}

std::vector<domain::EngagementRecord> EngagementStore::loadDocument() {
    std::vector<domain::EngagementRecord> records;
    std::optional<std::string> raw;
    try {
        raw = m_store->get(m_documentKey);
    } catch (const std::exception& e) {
        std::cerr << "[Engagement] Error reading log: " << e.what() << std::endl;
        return records;
    }
    if (!raw || raw->empty()) {
        return records;
    }

    try {
        json j = json::parse(*raw);
        if (!j.is_object() || !j.contains("posts") || !j["posts"].is_array()) {
            std::cerr << "[Engagement] Log has no 'posts' array, starting empty" << std::endl;
            return records;
        }
        for (const auto& item : j["posts"]) {
            if (item.is_object()) {
                records.push_back(JsonCodec::EngagementRecordFromJson(item));
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[Engagement] Log unreadable, starting empty: " << e.what() << std::endl;
        records.clear();
    }
    return records;
}

bool EngagementStore::saveDocument(const std::vector<domain::EngagementRecord>& records) {
    json posts = json::array();
    for (const auto& record : records) {
        posts.push_back(JsonCodec::EngagementRecordToJson(record));
    }
    json j = {{"posts", posts}};

    try {
        std::string text = j.dump(2, ' ', false, json::error_handler_t::replace);
        if (!m_store->set(m_documentKey, text)) {
            std::cerr << "[Engagement] Error writing log" << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Engagement] Error writing log: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void EngagementStore::trackSelection(const std::string& selectionId,
                                     const std::string& sourceName,
                                     int confidence,
                                     domain::Verdict verdict,
                                     const domain::StyleProfile& style) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = loadDocument();

    domain::EngagementRecord record;
    record.selectionId = selectionId;
    record.timestamp = m_clock();
    record.sourceName = sourceName.empty() ? "unknown" : sourceName;
    record.confidence = confidence;
    record.verdict = verdict;
    record.style = style;
    records.push_back(record);

    if (records.size() > kMaxRecords) {
        records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(kMaxRecords));
    }

    if (saveDocument(records)) {
        std::cout << "[Engagement] Tracked selection " << selectionId << " (" << record.sourceName
                  << ", " << confidence << "%)" << std::endl;
    }
}

bool EngagementStore::recordEngagement(const std::string& selectionId, const domain::EngagementMetrics& metrics) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = loadDocument();

    auto it = std::find_if(records.begin(), records.end(),
                           [&](const domain::EngagementRecord& r) { return r.selectionId == selectionId; });
    if (it == records.end()) {
        std::cerr << "[Engagement] Unknown selection " << selectionId << std::endl;
        return false;
    }
    if (it->hasMetrics()) {
        std::cerr << "[Engagement] Metrics for " << selectionId << " already recorded, ignoring update" << std::endl;
        return false;
    }

    it->likes = std::max(0, metrics.likes);
    it->retweets = std::max(0, metrics.retweets);
    it->replies = std::max(0, metrics.replies);
    it->impressions = std::max(0, metrics.impressions);
    it->updatedAt = m_clock();

    if (!saveDocument(records)) {
        return false;
    }
    std::cout << "[Engagement] Updated metrics for " << selectionId << std::endl;
    return true;
}

std::vector<domain::EngagementRecord> EngagementStore::records() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadDocument();
}

std::vector<std::string> EngagementStore::recentSources(std::size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = loadDocument();

    std::size_t start = records.size() > limit ? records.size() - limit : 0;
    std::vector<std::string> sources;
    for (std::size_t i = start; i < records.size(); ++i) {
        if (!records[i].sourceName.empty()) {
            sources.push_back(records[i].sourceName);
        }
    }
    return sources;
}

std::vector<domain::StyleProfile> EngagementStore::recentStyles(std::size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = loadDocument();

    std::size_t start = records.size() > limit ? records.size() - limit : 0;
    std::vector<domain::StyleProfile> styles;
    for (std::size_t i = start; i < records.size(); ++i) {
        styles.push_back(records[i].style);
    }
    return styles;
}

EngagementStats EngagementStore::stats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = loadDocument();

    EngagementStats stats;
    stats.totalRecords = records.size();
    double likes = 0.0, retweets = 0.0, replies = 0.0;
    for (const auto& r : records) {
        if (!r.hasMetrics()) continue;
        ++stats.recordsWithMetrics;
        likes += r.likes.value_or(0);
        retweets += r.retweets.value_or(0);
        replies += r.replies.value_or(0);
    }
    if (stats.recordsWithMetrics > 0) {
        double n = static_cast<double>(stats.recordsWithMetrics);
        stats.avgLikes = likes / n;
        stats.avgRetweets = retweets / n;
        stats.avgReplies = replies / n;
        stats.avgEngagement = stats.avgLikes + stats.avgRetweets + stats.avgReplies;
    }
    return stats;
}

} // namespace chronolens::application
