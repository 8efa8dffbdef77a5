/**
 * @file SourceOptimizer.hpp
 * @brief Ranks image sources by historical engagement with an exploration penalty.
 */

#pragma once
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "application/EngagementStore.hpp"
#include "domain/EngineConfig.hpp"

namespace chronolens::application {

enum class SampleConfidence {
    Low,
    Medium,
    High
};

std::string SampleConfidenceToString(SampleConfidence c);

/**
 * @struct SourcePerformance
 * @brief Aggregate derived from the engagement log; never stored.
 */
struct SourcePerformance {
    double avgEngagement = 0.0;
    int count = 0;
    SampleConfidence confidence = SampleConfidence::Low;
};

using PerformanceTable = std::map<std::string, SourcePerformance>;

/**
 * @class SourceOptimizer
 * @brief Orders sources for fetching. Deterministic for a given log and recent-source window.
 */
class SourceOptimizer {
public:
    SourceOptimizer(std::shared_ptr<EngagementStore> engagement,
                    std::vector<domain::SourceConfig> registry,
                    domain::OptimizerSettings settings = {});

    /** @brief Groups records with metrics by source and averages likes + 2*retweets + 1.5*replies. */
    PerformanceTable performance() const;

    /**
     * @brief Priority score in [0, 100] for one source.
     * @param recentSources Trailing window of selected sources; each occurrence costs a 20% penalty.
     */
    double priority(const std::string& sourceName, const std::vector<std::string>& recentSources) const;

    /** @brief Enabled sources sorted by priority, ties kept in registry order. */
    std::vector<std::string> order(const std::vector<std::string>& recentSources) const;

    /** @brief Sources with data, best average engagement first. */
    std::vector<std::pair<std::string, SourcePerformance>> rankedSources() const;

    void logStats() const;

    /** @brief Scoring rule applied to an already computed performance table. */
    double priorityFrom(const PerformanceTable& table,
                        const std::string& sourceName,
                        const std::vector<std::string>& recentSources) const;

private:
    std::shared_ptr<EngagementStore> m_engagement;
    std::vector<domain::SourceConfig> m_registry;
    domain::OptimizerSettings m_settings;
};

} // namespace chronolens::application
