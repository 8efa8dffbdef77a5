/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace chronolens::infrastructure {

using json = nlohmann::json;

namespace {

// The effective quality minimums may be raised by configuration, never lowered below this.
constexpr int kFloorMinWidth = 600;
constexpr int kFloorMinHeight = 400;

domain::SourceConfig MakeSource(const std::string& name, bool enabled, int rank, int reliability, int timeoutMs) {
    domain::SourceConfig s;
    s.name = name;
    s.enabled = enabled;
    s.priorityRank = rank;
    s.reliabilityScore = reliability;
    s.timeoutMs = timeoutMs;
    return s;
}

domain::SourceConfig ParseSource(const json& j, std::size_t index) {
    domain::SourceConfig s;
    if (!j.contains("name") || !j["name"].is_string()) {
        throw std::runtime_error("sources[" + std::to_string(index) + "] is missing a name");
    }
    s.name = j["name"].get<std::string>();
    s.enabled = j.value("enabled", true);
    s.priorityRank = j.value("priorityRank", static_cast<int>(index) + 1);
    s.reliabilityScore = j.value("reliabilityScore", 50);
    s.timeoutMs = j.value("timeoutMs", 10000);
    s.host = j.value("host", std::string());
    s.port = j.value("port", 80);
    s.path = j.value("path", std::string("/"));
    return s;
}

} // namespace

domain::EngineConfig ConfigLoader::Defaults() {
    domain::EngineConfig config;
    config.sources = {
        MakeSource("Library of Congress", true, 1, 95, 15000),
        MakeSource("Smithsonian", true, 2, 93, 15000),
        MakeSource("Wikimedia Commons", true, 3, 85, 12000),
        MakeSource("Wikipedia", true, 4, 75, 10000),
        MakeSource("Unsplash", false, 5, 60, 10000),
    };
    return config;
}

domain::EngineConfig ConfigLoader::Load(const std::string& configPath) {
    std::filesystem::path path(configPath);
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << configPath << " not found, using built-in defaults" << std::endl;
        return Defaults();
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open configuration file " + configPath);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

domain::EngineConfig ConfigLoader::Parse(const std::string& jsonText) {
    domain::EngineConfig config = Defaults();

    try {
        json j = json::parse(jsonText);
        if (!j.is_object()) {
            throw std::runtime_error("configuration root must be an object");
        }

        if (j.contains("sources")) {
            const auto& arr = j["sources"];
            if (!arr.is_array()) {
                throw std::runtime_error("'sources' must be an array");
            }
            config.sources.clear();
            for (std::size_t i = 0; i < arr.size(); ++i) {
                config.sources.push_back(ParseSource(arr[i], i));
            }
        }

        if (j.contains("quality")) {
            const auto& q = j["quality"];
            auto& t = config.quality;
            t.minWidth = q.value("minWidth", t.minWidth);
            t.minHeight = q.value("minHeight", t.minHeight);
            t.minBytes = q.value("minBytes", t.minBytes);
            t.maxBytes = q.value("maxBytes", t.maxBytes);
            t.minAspectRatio = q.value("minAspectRatio", t.minAspectRatio);
            t.maxAspectRatio = q.value("maxAspectRatio", t.maxAspectRatio);
        }

        if (j.contains("selection")) {
            const auto& s = j["selection"];
            auto& sel = config.selection;
            sel.topSourcesCount = s.value("topSourcesCount", sel.topSourcesCount);
            sel.parallelTimeoutMs = s.value("parallelTimeoutMs", sel.parallelTimeoutMs);
            sel.acceptConfidence = s.value("acceptConfidence", sel.acceptConfidence);
            sel.verificationWeight = s.value("verificationWeight", sel.verificationWeight);
            sel.styleWeight = s.value("styleWeight", sel.styleWeight);
            sel.recentWindow = s.value("recentWindow", sel.recentWindow);
            sel.searchTermWords = s.value("searchTermWords", sel.searchTermWords);
        }

        if (j.contains("optimizer")) {
            const auto& o = j["optimizer"];
            auto& opt = config.optimizer;
            opt.baseScore = o.value("baseScore", opt.baseScore);
            opt.engagementScale = o.value("engagementScale", opt.engagementScale);
            opt.mediumConfidenceDiscount = o.value("mediumConfidenceDiscount", opt.mediumConfidenceDiscount);
            opt.recencyPenalty = o.value("recencyPenalty", opt.recencyPenalty);
            opt.highConfidenceSamples = o.value("highConfidenceSamples", opt.highConfidenceSamples);
            opt.mediumConfidenceSamples = o.value("mediumConfidenceSamples", opt.mediumConfidenceSamples);
        }

        if (j.contains("oracle")) {
            const auto& o = j["oracle"];
            auto& orc = config.oracle;
            orc.host = o.value("host", orc.host);
            orc.port = o.value("port", orc.port);
            orc.model = o.value("model", orc.model);
            orc.timeoutSeconds = o.value("timeoutSeconds", orc.timeoutSeconds);
        }

        if (j.contains("storage")) {
            config.storage.dataDir = j["storage"].value("dataDir", config.storage.dataDir);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid configuration: ") + e.what());
    }

    Validate(config);
    return config;
}

void ConfigLoader::Validate(const domain::EngineConfig& config) {
    if (config.sources.empty()) {
        throw std::runtime_error("source registry is empty");
    }
    bool anyEnabled = std::any_of(config.sources.begin(), config.sources.end(),
                                  [](const domain::SourceConfig& s) { return s.enabled; });
    if (!anyEnabled) {
        throw std::runtime_error("source registry has no enabled source");
    }
    for (std::size_t i = 0; i < config.sources.size(); ++i) {
        const auto& s = config.sources[i];
        if (s.timeoutMs <= 0) {
            throw std::runtime_error("source '" + s.name + "' has a non-positive timeout");
        }
        if (s.reliabilityScore < 0 || s.reliabilityScore > 100) {
            throw std::runtime_error("source '" + s.name + "' reliabilityScore must be within 0-100");
        }
        for (std::size_t k = i + 1; k < config.sources.size(); ++k) {
            if (config.sources[k].name == s.name) {
                throw std::runtime_error("source '" + s.name + "' is declared twice");
            }
        }
    }

    const auto& q = config.quality;
    if (q.minWidth < kFloorMinWidth || q.minHeight < kFloorMinHeight) {
        throw std::runtime_error("quality minimums cannot be below 600x400");
    }
    if (q.minBytes >= q.maxBytes) {
        throw std::runtime_error("quality.minBytes must be smaller than quality.maxBytes");
    }
    if (q.minAspectRatio <= 0.0 || q.minAspectRatio >= q.maxAspectRatio) {
        throw std::runtime_error("quality aspect ratio bounds are inconsistent");
    }

    const auto& sel = config.selection;
    if (sel.topSourcesCount <= 0 || sel.parallelTimeoutMs <= 0) {
        throw std::runtime_error("selection.topSourcesCount and parallelTimeoutMs must be positive");
    }
    if (sel.acceptConfidence < 0 || sel.acceptConfidence > 100) {
        throw std::runtime_error("selection.acceptConfidence must be within 0-100");
    }
    if (sel.recentWindow < 0 || sel.searchTermWords <= 0) {
        throw std::runtime_error("selection.recentWindow/searchTermWords are invalid");
    }

    const auto& opt = config.optimizer;
    if (opt.recencyPenalty <= 0.0 || opt.recencyPenalty > 1.0) {
        throw std::runtime_error("optimizer.recencyPenalty must be within (0, 1]");
    }
    if (opt.mediumConfidenceSamples > opt.highConfidenceSamples) {
        throw std::runtime_error("optimizer sample thresholds are inverted");
    }
}

} // namespace chronolens::infrastructure
