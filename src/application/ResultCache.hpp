/**
 * @file ResultCache.hpp
 * @brief Content-addressed cache of accepted image selections.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/Clock.hpp"
#include "domain/CacheEntry.hpp"
#include "domain/Event.hpp"
#include "domain/KeyValueStore.hpp"

namespace chronolens::application {

/**
 * @struct CacheStats
 * @brief Summary of the cache document.
 */
struct CacheStats {
    std::size_t totalEntries = 0;
    long long totalUses = 0;
    double avgConfidence = 0.0;
    std::optional<std::int64_t> oldestEntry;
};

/**
 * @class ResultCache
 * @brief Remembers which source produced an accepted image for an event.
 *
 * The whole store is one document in the KeyValueStore. Any failure to read or
 * parse it is treated as an empty cache, and write failures are logged only:
 * the pipeline must work without the cache.
 */
class ResultCache {
public:
    static constexpr std::size_t kMaxEntries = 500;
    static constexpr int kMaxAgeDays = 90;
    static constexpr std::size_t kDescriptionPrefix = 100;
    static constexpr std::size_t kKeyWords = 8;
    static constexpr std::size_t kMinWordLength = 4;

    explicit ResultCache(std::shared_ptr<domain::KeyValueStore> store,
                         Clock clock = SystemNowMillis,
                         std::string documentKey = "image-cache");

    /**
     * @brief Derives the cache key: "<year>_<word>_<word>...".
     *
     * Lower-cases the description, strips punctuation, keeps words of at least
     * four characters in their original order and joins the first eight.
     */
    static std::string DeriveKey(const domain::Event& event);

    /**
     * @brief Finds the entry for an event and records the hit.
     *
     * Not a pure read: lastUsed and useCount are updated and persisted before
     * the (updated) entry is returned.
     */
    std::optional<domain::CacheEntry> lookup(const domain::Event& event);

    /** @brief Pure read, no bookkeeping. */
    std::optional<domain::CacheEntry> peek(const domain::Event& event);

    /** @brief Records a use of the entry under key. Returns the updated entry. */
    std::optional<domain::CacheEntry> touch(const std::string& key);

    /** @brief Upserts the entry for an event; useCount restarts at 1. */
    void store(const domain::Event& event, const domain::SelectionInfo& info);

    /** @brief Drops expired entries, then keeps only the most recently used kMaxEntries. */
    void evict();

    void clear();

    CacheStats stats();

    std::size_t size();

private:
    using Document = std::map<std::string, domain::CacheEntry>;

    Document loadDocument();
    bool saveDocument(const Document& document);
    void evictDocument(Document& document) const;
    std::optional<domain::CacheEntry> touchLocked(Document& document, const std::string& key);

    std::shared_ptr<domain::KeyValueStore> m_store;
    Clock m_clock;
    std::string m_documentKey;
    std::mutex m_mutex; ///< Whole-store lock around read-modify-write.
};

} // namespace chronolens::application
