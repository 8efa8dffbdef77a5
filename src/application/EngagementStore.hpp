/**
 * @file EngagementStore.hpp
 * @brief Bounded log of past selections and their engagement metrics.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/Clock.hpp"
#include "domain/EngagementRecord.hpp"
#include "domain/KeyValueStore.hpp"

namespace chronolens::application {

struct EngagementStats {
    std::size_t totalRecords = 0;
    std::size_t recordsWithMetrics = 0;
    double avgLikes = 0.0;
    double avgRetweets = 0.0;
    double avgReplies = 0.0;
    double avgEngagement = 0.0; ///< Mean of likes + retweets + replies.
};

/**
 * @class EngagementStore
 * @brief Source of truth for source and style learning.
 *
 * Records are appended at selection time and receive metrics once, later.
 * Only the newest kMaxRecords are retained (oldest dropped first).
 */
class EngagementStore {
public:
    static constexpr std::size_t kMaxRecords = 100;

    explicit EngagementStore(std::shared_ptr<domain::KeyValueStore> store,
                             Clock clock = SystemNowMillis,
                             std::string documentKey = "image-engagement");

    /** @brief Appends a record with empty metrics for a new selection. */
    void trackSelection(const std::string& selectionId,
                        const std::string& sourceName,
                        int confidence,
                        domain::Verdict verdict,
                        const domain::StyleProfile& style);

    /**
     * @brief Attaches metrics to a selection.
     * @return False when the id is unknown, already has metrics, or the write failed.
     */
    bool recordEngagement(const std::string& selectionId, const domain::EngagementMetrics& metrics);

    /** @brief All retained records, oldest first. */
    std::vector<domain::EngagementRecord> records();

    /** @brief Sources of the newest `limit` records, oldest first. */
    std::vector<std::string> recentSources(std::size_t limit = 5);

    /** @brief Styles of the newest `limit` records, oldest first. */
    std::vector<domain::StyleProfile> recentStyles(std::size_t limit);

    EngagementStats stats();

private:
    std::vector<domain::EngagementRecord> loadDocument();
    bool saveDocument(const std::vector<domain::EngagementRecord>& records);

    std::shared_ptr<domain::KeyValueStore> m_store;
    Clock m_clock;
    std::string m_documentKey;
    std::mutex m_mutex;
};

} // namespace chronolens::application
