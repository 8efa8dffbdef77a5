/**
 * @file StylePreferences.cpp
 * @brief Implementation of StylePreferences.
 */

#include "application/StylePreferences.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace chronolens::application {

namespace {

constexpr const char* kUnknown = "unknown";

std::vector<std::pair<std::string, std::string>> Dimensions(const domain::StyleProfile& p) {
    return {
        {"type", p.type},
        {"era", p.era},
        {"colorScheme", p.colorScheme},
        {"composition", p.composition},
        {"subject", p.subject},
    };
}

} // namespace

StylePreferences::StylePreferences(std::shared_ptr<EngagementStore> engagement)
    : m_engagement(std::move(engagement)) {}

StylePerformanceTable StylePreferences::performance() const {
    struct Accumulator {
        double total = 0.0;
        int count = 0;
    };
    std::map<std::string, std::map<std::string, Accumulator>> byStyle;

    for (const auto& record : m_engagement->records()) {
        if (!record.hasMetrics()) continue;
        double score = record.engagementScore();
        for (const auto& [dimension, value] : Dimensions(record.style)) {
            if (value.empty() || value == kUnknown) continue;
            auto& acc = byStyle[dimension][value];
            acc.total += score;
            acc.count++;
        }
    }

    StylePerformanceTable table;
    for (const auto& [dimension, values] : byStyle) {
        for (const auto& [value, acc] : values) {
            table[dimension][value] = {acc.total / acc.count, acc.count};
        }
    }
    return table;
}

double StylePreferences::DiversityFrom(const std::vector<domain::StyleProfile>& recentStyles) {
    std::size_t start = recentStyles.size() > kDiversityWindow ? recentStyles.size() - kDiversityWindow : 0;
    std::vector<domain::StyleProfile> recent(recentStyles.begin() + static_cast<std::ptrdiff_t>(start), recentStyles.end());
    if (recent.size() < 2) {
        return 100.0;
    }

    std::set<std::string> types, eras, colors, compositions;
    for (const auto& s : recent) {
        types.insert(s.type);
        eras.insert(s.era);
        colors.insert(s.colorScheme);
        compositions.insert(s.composition);
    }
    double avgUnique = (types.size() + eras.size() + colors.size() + compositions.size()) / 4.0;
    return std::min(100.0, avgUnique / static_cast<double>(recent.size()) * 100.0);
}

double StylePreferences::ScoreFrom(const StylePerformanceTable& table,
                                   const std::vector<domain::StyleProfile>& recentStyles,
                                   const domain::StyleProfile& profile) {
    double score = 50.0;

    double boost = 0.0;
    int dataPoints = 0;
    for (const auto& [dimension, value] : Dimensions(profile)) {
        auto dim = table.find(dimension);
        if (dim == table.end()) continue;
        auto perf = dim->second.find(value);
        if (perf == dim->second.end() || perf->second.count < kMinSamples) continue;
        boost += perf->second.avgEngagement * kEngagementScale;
        ++dataPoints;
    }
    if (dataPoints > 0) {
        score = boost / dataPoints;
    }

    // Low diversity: push back on a type that dominated the last few picks.
    if (DiversityFrom(recentStyles) < 50.0) {
        std::size_t start = recentStyles.size() > kOveruseWindow ? recentStyles.size() - kOveruseWindow : 0;
        auto sameType = std::count_if(recentStyles.begin() + static_cast<std::ptrdiff_t>(start), recentStyles.end(),
                                      [&](const domain::StyleProfile& s) { return s.type == profile.type; });
        if (sameType >= 2) {
            score *= kOverusePenalty;
            std::cout << "[StylePreferences] Penalizing " << profile.type << " - used too recently" << std::endl;
        }
    }

    return std::clamp(score, 0.0, 100.0);
}

double StylePreferences::diversityScore() const {
    return DiversityFrom(m_engagement->recentStyles(kDiversityWindow));
}

double StylePreferences::preferenceScore(const domain::StyleProfile& profile) const {
    return ScoreFrom(performance(), m_engagement->recentStyles(kDiversityWindow), profile);
}

void StylePreferences::logStats() const {
    std::ostringstream diversity;
    diversity << std::fixed << std::setprecision(1) << diversityScore();
    std::cout << "[StylePreferences] Style Performance:" << std::endl;
    std::cout << "  Diversity Score: " << diversity.str() << "/100" << std::endl;

    for (const auto& [dimension, values] : performance()) {
        std::vector<std::pair<std::string, StylePerformance>> sorted(values.begin(), values.end());
        std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second.avgEngagement > b.second.avgEngagement;
        });
        std::cout << "  " << dimension << ":" << std::endl;
        for (std::size_t i = 0; i < sorted.size() && i < 3; ++i) {
            std::ostringstream avg;
            avg << std::fixed << std::setprecision(1) << sorted[i].second.avgEngagement;
            std::cout << "    " << sorted[i].first << ": " << avg.str() << " (" << sorted[i].second.count
                      << " posts)" << std::endl;
        }
    }
}

} // namespace chronolens::application
