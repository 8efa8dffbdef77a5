/**
 * @file SourceOptimizer.cpp
 * @brief Implementation of SourceOptimizer.
 */

#include "application/SourceOptimizer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chronolens::application {

std::string SampleConfidenceToString(SampleConfidence c) {
    switch (c) {
        case SampleConfidence::High: return "high";
        case SampleConfidence::Medium: return "medium";
        case SampleConfidence::Low: return "low";
    }
    return "low";
}

SourceOptimizer::SourceOptimizer(std::shared_ptr<EngagementStore> engagement,
                                 std::vector<domain::SourceConfig> registry,
                                 domain::OptimizerSettings settings)
    : m_engagement(std::move(engagement)), m_registry(std::move(registry)), m_settings(settings) {}

PerformanceTable SourceOptimizer::performance() const {
    struct Accumulator {
        double total = 0.0;
        int count = 0;
    };
    std::map<std::string, Accumulator> bySource;

    for (const auto& record : m_engagement->records()) {
        if (!record.hasMetrics()) continue;
        auto& acc = bySource[record.sourceName.empty() ? "unknown" : record.sourceName];
        acc.total += record.engagementScore();
        acc.count++;
    }

    PerformanceTable table;
    for (const auto& [source, acc] : bySource) {
        SourcePerformance perf;
        perf.avgEngagement = acc.total / acc.count;
        perf.count = acc.count;
        if (acc.count >= m_settings.highConfidenceSamples) {
            perf.confidence = SampleConfidence::High;
        } else if (acc.count >= m_settings.mediumConfidenceSamples) {
            perf.confidence = SampleConfidence::Medium;
        }
        table[source] = perf;
    }
    return table;
}

double SourceOptimizer::priorityFrom(const PerformanceTable& table,
                                     const std::string& sourceName,
                                     const std::vector<std::string>& recentSources) const {
    double score = m_settings.baseScore;

    auto it = table.find(sourceName);
    if (it != table.end()) {
        const auto& stats = it->second;
        if (stats.confidence == SampleConfidence::High) {
            score = stats.avgEngagement * m_settings.engagementScale;
        } else if (stats.confidence == SampleConfidence::Medium) {
            score = stats.avgEngagement * m_settings.engagementScale * m_settings.mediumConfidenceDiscount;
        }
        // Low confidence keeps the base score: no learning signal yet.
    }

    auto recentUses = std::count(recentSources.begin(), recentSources.end(), sourceName);
    if (recentUses > 0) {
        score *= std::pow(m_settings.recencyPenalty, static_cast<double>(recentUses));
    }

    return std::clamp(score, 0.0, 100.0);
}

double SourceOptimizer::priority(const std::string& sourceName, const std::vector<std::string>& recentSources) const {
    return priorityFrom(performance(), sourceName, recentSources);
}

std::vector<std::string> SourceOptimizer::order(const std::vector<std::string>& recentSources) const {
    // One snapshot of the log for every source, so scores are mutually consistent.
    PerformanceTable table = performance();

    std::vector<std::pair<std::string, double>> scored;
    for (const auto& source : m_registry) {
        if (!source.enabled) continue;
        scored.emplace_back(source.name, priorityFrom(table, source.name, recentSources));
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::ostringstream line;
    line << std::fixed << std::setprecision(1);
    std::vector<std::string> ordered;
    for (const auto& [name, score] : scored) {
        if (!ordered.empty()) line << ", ";
        line << name << " (" << score << ")";
        ordered.push_back(name);
    }
    std::cout << "[SourceOptimizer] Optimal source order: " << line.str() << std::endl;
    return ordered;
}

std::vector<std::pair<std::string, SourcePerformance>> SourceOptimizer::rankedSources() const {
    PerformanceTable table = performance();
    std::vector<std::pair<std::string, SourcePerformance>> ranked(table.begin(), table.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second.avgEngagement > b.second.avgEngagement;
    });
    return ranked;
}

void SourceOptimizer::logStats() const {
    std::cout << "[SourceOptimizer] Source Performance:" << std::endl;
    auto ranked = rankedSources();
    if (ranked.empty()) {
        std::cout << "  (no engagement data yet)" << std::endl;
        return;
    }
    for (const auto& [source, perf] : ranked) {
        std::ostringstream line;
        line << std::fixed << std::setprecision(1) << perf.avgEngagement;
        std::cout << "  " << source << ": " << line.str() << " avg engagement (" << perf.count << " posts, "
                  << SampleConfidenceToString(perf.confidence) << " confidence)" << std::endl;
    }
}

} // namespace chronolens::application
