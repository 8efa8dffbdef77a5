/**
 * @file StylePreferences.hpp
 * @brief Learned preference for visual styles, with a diversity guard.
 */

#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "application/EngagementStore.hpp"

namespace chronolens::application {

struct StylePerformance {
    double avgEngagement = 0.0;
    int count = 0;
};

/** @brief dimension -> value -> performance, e.g. "type" -> "photograph" -> {...}. */
using StylePerformanceTable = std::map<std::string, std::map<std::string, StylePerformance>>;

/**
 * @class StylePreferences
 * @brief Turns a StyleProfile into a 0-100 preference score from past engagement.
 */
class StylePreferences {
public:
    static constexpr int kMinSamples = 2;
    static constexpr double kEngagementScale = 5.0;
    static constexpr double kOverusePenalty = 0.7;
    static constexpr std::size_t kDiversityWindow = 5;
    static constexpr std::size_t kOveruseWindow = 3;

    explicit StylePreferences(std::shared_ptr<EngagementStore> engagement);

    StylePerformanceTable performance() const;

    /** @brief Diversity of the last five selected styles, 0-100 (100 when there is too little data). */
    double diversityScore() const;

    /** @brief Preference score in [0, 100]; 50 without enough data. */
    double preferenceScore(const domain::StyleProfile& profile) const;

    /** @brief Pure scoring rule over explicit inputs. */
    static double ScoreFrom(const StylePerformanceTable& table,
                            const std::vector<domain::StyleProfile>& recentStyles,
                            const domain::StyleProfile& profile);

    static double DiversityFrom(const std::vector<domain::StyleProfile>& recentStyles);

    void logStats() const;

private:
    std::shared_ptr<EngagementStore> m_engagement;
};

} // namespace chronolens::application
