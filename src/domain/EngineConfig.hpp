/**
 * @file EngineConfig.hpp
 * @brief Configuration values consumed by the selection engine and its collaborators.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace chronolens::domain {

/**
 * @struct SourceConfig
 * @brief One entry of the ordered source registry.
 */
struct SourceConfig {
    std::string name;
    bool enabled = true;
    int priorityRank = 0;       ///< Lower rank = preferred on ties.
    int reliabilityScore = 50;  ///< 0-100.
    int timeoutMs = 10000;
    std::string host;           ///< Fetcher endpoint (HttpImageSource only).
    int port = 80;
    std::string path;
};

/**
 * @struct QualityThresholds
 * @brief Limits applied by the quality filter before any oracle call.
 */
struct QualityThresholds {
    int minWidth = 600;
    int minHeight = 600;
    std::size_t minBytes = 30 * 1024;
    std::size_t maxBytes = 5 * 1024 * 1024;
    double minAspectRatio = 0.33;
    double maxAspectRatio = 3.0;
};

struct SelectionSettings {
    int topSourcesCount = 3;
    int parallelTimeoutMs = 20000;
    int acceptConfidence = 70;
    double verificationWeight = 0.7;
    double styleWeight = 0.3;
    int recentWindow = 5;
    int searchTermWords = 8;
};

struct OptimizerSettings {
    double baseScore = 50.0;
    double engagementScale = 10.0;
    double mediumConfidenceDiscount = 0.7;
    double recencyPenalty = 0.8;
    int highConfidenceSamples = 5;
    int mediumConfidenceSamples = 2;
};

struct OracleSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "llava:13b";
    int timeoutSeconds = 120;
};

struct StorageSettings {
    std::string dataDir = "data";
};

/**
 * @struct EngineConfig
 * @brief Full configuration document (see ConfigLoader).
 */
struct EngineConfig {
    std::vector<SourceConfig> sources;
    QualityThresholds quality;
    SelectionSettings selection;
    OptimizerSettings optimizer;
    OracleSettings oracle;
    StorageSettings storage;
};

} // namespace chronolens::domain
