/**
 * @file ResultCache.cpp
 * @brief Implementation of ResultCache.
 */

#include "application/ResultCache.hpp"
#include "application/JsonCodec.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace chronolens::application {

using json = nlohmann::json;

ResultCache::ResultCache(std::shared_ptr<domain::KeyValueStore> store, Clock clock, std::string documentKey)
    : m_store(std::move(store)), m_clock(std::move(clock)), m_documentKey(std::move(documentKey)) {}

std::string ResultCache::DeriveKey(const domain::Event& event) {
    std::string normalized;
    normalized.reserve(event.description.size());
    for (char ch : event.description) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80 && (std::isalnum(c) || c == '_')) {
            normalized.push_back(static_cast<char>(std::tolower(c)));
        } else if (c < 0x80 && std::isspace(c)) {
            normalized.push_back(' ');
        }
    }

    std::istringstream words(normalized);
    std::string word;
    std::string key = std::to_string(event.year) + "_";
    std::size_t taken = 0;
    while (taken < kKeyWords && words >> word) {
        if (word.size() < kMinWordLength) continue;
        if (taken > 0) key += "_";
        key += word;
        ++taken;
    }
    return key;
}

ResultCache::Document ResultCache::loadDocument() {
    Document document;
    std::optional<std::string> raw;
    try {
        raw = m_store->get(m_documentKey);
    } catch (const std::exception& e) {
        std::cerr << "[ResultCache] Error reading cache: " << e.what() << std::endl;
        return document;
    }
    if (!raw || raw->empty()) {
        return document;
    }

    try {
        json j = json::parse(*raw);
        if (!j.is_object()) {
            std::cerr << "[ResultCache] Cache document is not an object, starting empty" << std::endl;
            return document;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_object()) continue;
            document[it.key()] = JsonCodec::CacheEntryFromJson(it.key(), it.value());
        }
    } catch (const json::exception& e) {
        std::cerr << "[ResultCache] Cache document unreadable, starting empty: " << e.what() << std::endl;
        document.clear();
    }
    return document;
}

bool ResultCache::saveDocument(const Document& document) {
    json j = json::object();
    for (const auto& [key, entry] : document) {
        j[key] = JsonCodec::CacheEntryToJson(entry);
    }

    try {
        std::string text = j.dump(2, ' ', false, json::error_handler_t::replace);
        if (!m_store->set(m_documentKey, text)) {
            std::cerr << "[ResultCache] Error saving cache" << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ResultCache] Error saving cache: " << e.what() << std::endl;
        return false;
    }
    return true;
}

std::optional<domain::CacheEntry> ResultCache::peek(const domain::Event& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = loadDocument();
    auto it = document.find(DeriveKey(event));
    if (it == document.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<domain::CacheEntry> ResultCache::touchLocked(Document& document, const std::string& key) {
    auto it = document.find(key);
    if (it == document.end()) {
        return std::nullopt;
    }
    it->second.lastUsed = m_clock();
    it->second.useCount += 1;
    saveDocument(document);
    return it->second;
}

std::optional<domain::CacheEntry> ResultCache::touch(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = loadDocument();
    return touchLocked(document, key);
}

std::optional<domain::CacheEntry> ResultCache::lookup(const domain::Event& event) {
    std::string key = DeriveKey(event);

    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = loadDocument();
    auto entry = touchLocked(document, key);
    if (entry) {
        std::cout << "[ResultCache] Cache hit for \"" << key << "\" (used " << entry->useCount
                  << " times, confidence: " << entry->confidence << "%)" << std::endl;
    }
    return entry;
}

void ResultCache::store(const domain::Event& event, const domain::SelectionInfo& info) {
    std::string key = DeriveKey(event);

    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = loadDocument();

    // Amortized: only evict once the store has grown well past capacity.
    if (document.size() * 10 > kMaxEntries * 11) {
        evictDocument(document);
    }

    std::int64_t now = m_clock();
    domain::CacheEntry entry;
    entry.key = key;
    entry.source = info.source;
    entry.confidence = info.confidence;
    entry.verdict = info.verdict;
    entry.styleInfo = info.styleInfo;
    entry.url = info.url;
    entry.title = info.title;
    entry.cachedAt = now;
    entry.lastUsed = now;
    entry.useCount = 1;
    entry.eventYear = event.year;
    entry.eventDescriptionPrefix = JsonCodec::Utf8Prefix(event.description, kDescriptionPrefix);
    document[key] = entry;

    if (saveDocument(document)) {
        std::cout << "[ResultCache] Cached image for \"" << key << "\" (confidence: "
                  << info.confidence << "%)" << std::endl;
    }
}

void ResultCache::evictDocument(Document& document) const {
    const std::int64_t now = m_clock();
    const std::int64_t maxAge = static_cast<std::int64_t>(kMaxAgeDays) * kMillisPerDay;

    std::vector<domain::CacheEntry> valid;
    valid.reserve(document.size());
    for (const auto& [key, entry] : document) {
        if (now - entry.cachedAt < maxAge) {
            valid.push_back(entry);
        }
    }

    if (valid.size() > kMaxEntries) {
        std::stable_sort(valid.begin(), valid.end(),
                         [](const domain::CacheEntry& a, const domain::CacheEntry& b) {
                             return a.lastUsed > b.lastUsed;
                         });
        valid.resize(kMaxEntries);
    }

    std::size_t before = document.size();
    document.clear();
    for (auto& entry : valid) {
        document[entry.key] = std::move(entry);
    }
    std::cout << "[ResultCache] Evicted " << (before - document.size()) << " entries, "
              << document.size() << " remain" << std::endl;
}

void ResultCache::evict() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = loadDocument();
    evictDocument(document);
    saveDocument(document);
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (saveDocument(Document{})) {
        std::cout << "[ResultCache] Cache cleared" << std::endl;
    }
}

CacheStats ResultCache::stats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    Document document = loadDocument();

    CacheStats stats;
    stats.totalEntries = document.size();
    long long confidenceSum = 0;
    for (const auto& [key, entry] : document) {
        stats.totalUses += entry.useCount;
        confidenceSum += entry.confidence;
        if (!stats.oldestEntry || entry.cachedAt < *stats.oldestEntry) {
            stats.oldestEntry = entry.cachedAt;
        }
    }
    if (!document.empty()) {
        stats.avgConfidence = static_cast<double>(confidenceSum) / static_cast<double>(document.size());
    }
    return stats;
}

std::size_t ResultCache::size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadDocument().size();
}

} // namespace chronolens::application
