/**
 * @file ChronoLensApp.cpp
 * @brief Implementation of the ChronoLensApp class.
 */
#include "app/ChronoLensApp.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileKeyValueStore.hpp"
#include "infrastructure/HttpImageSource.hpp"
#include "infrastructure/OllamaVisionClient.hpp"
#include "infrastructure/PathUtils.hpp"

namespace chronolens::app {

namespace {

bool ParseInt(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::filesystem::path ResolveDataDir(const std::string& dataDir) {
    std::filesystem::path dir(dataDir);
    if (dir.is_absolute()) return dir;
    return infrastructure::PathUtils::GetStateDir() / dir;
}

} // namespace

ChronoLensApp::ChronoLensApp(std::vector<std::string> args) : m_args(std::move(args)) {}

void ChronoLensApp::PrintUsage() {
    std::cerr << "Usage: chronolens [--config <file>] <command>\n"
              << "Commands:\n"
              << "  select <year> <description> [<generatedText>] [--out <file>]\n"
              << "  engagement <selectionId> <likes> <retweets> <replies> <impressions>\n"
              << "  stats\n"
              << "  evict\n"
              << "  clear-cache" << std::endl;
}

bool ChronoLensApp::Init() {
    m_configPath = infrastructure::PathUtils::GetDefaultConfigPath().string();
    for (std::size_t i = 0; i < m_args.size(); ++i) {
        if (m_args[i] == "--config") {
            if (i + 1 >= m_args.size()) {
                std::cerr << "--config requires a file path" << std::endl;
                return false;
            }
            m_configPath = m_args[++i];
        } else if (m_command.empty()) {
            m_command = m_args[i];
        } else {
            m_params.push_back(m_args[i]);
        }
    }
    if (m_command.empty()) {
        PrintUsage();
        return false;
    }

    try {
        auto config = infrastructure::ConfigLoader::Load(m_configPath);

        auto dataDir = ResolveDataDir(config.storage.dataDir);
        std::cout << "[ChronoLens] Data directory: " << dataDir.string() << std::endl;
        auto store = std::make_shared<infrastructure::FileKeyValueStore>(dataDir.string());

        std::map<std::string, std::shared_ptr<domain::ImageSource>> sources;
        for (const auto& source : config.sources) {
            sources[source.name] = std::make_shared<infrastructure::HttpImageSource>(source);
        }
        auto oracle = std::make_shared<infrastructure::OllamaVisionClient>(config.oracle);

        m_engine = std::make_unique<application::SelectionEngine>(config, std::move(sources), oracle, store);
    } catch (const std::exception& e) {
        std::cerr << "[ChronoLens] Configuration error: " << e.what() << std::endl;
        return false;
    }
    return true;
}

int ChronoLensApp::Run() {
    if (!Init()) {
        return 1;
    }

    if (m_command == "select") return RunSelect(m_params);
    if (m_command == "engagement") return RunEngagement(m_params);
    if (m_command == "stats") return RunStats();
    if (m_command == "evict") return RunEvict();
    if (m_command == "clear-cache") return RunClearCache();

    std::cerr << "Unknown command: " << m_command << std::endl;
    PrintUsage();
    return 1;
}

int ChronoLensApp::RunSelect(const std::vector<std::string>& params) {
    std::vector<std::string> positional;
    std::string outPath;
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (params[i] == "--out" && i + 1 < params.size()) {
            outPath = params[++i];
        } else {
            positional.push_back(params[i]);
        }
    }

    domain::Event event;
    if (positional.size() < 2 || !ParseInt(positional[0], event.year)) {
        PrintUsage();
        return 1;
    }
    event.description = positional[1];
    const std::string generatedText = positional.size() > 2 ? positional[2] : event.description;

    auto outcome = m_engine->selectImage(event, generatedText);
    if (const auto* rejected = std::get_if<domain::RejectedSelection>(&outcome)) {
        std::cout << "No image selected: " << rejected->reason << std::endl;
        return 2;
    }

    const auto& accepted = std::get<domain::AcceptedSelection>(outcome);
    std::cout << "Selection:  " << accepted.selectionId << "\n"
              << "Source:     " << accepted.source << (accepted.fromCache ? " (cached)" : "") << "\n"
              << "Verdict:    " << domain::VerdictToString(accepted.verdict) << " (" << accepted.confidence << "%)\n"
              << "Style:      " << accepted.styleInfo.type << ", " << accepted.styleInfo.era << ", "
              << accepted.styleInfo.colorScheme << "\n"
              << "Score:      " << std::fixed << std::setprecision(1) << accepted.combinedScore << std::endl;
    if (accepted.metadata.title) std::cout << "Title:      " << *accepted.metadata.title << std::endl;
    if (accepted.metadata.url) std::cout << "URL:        " << *accepted.metadata.url << std::endl;

    if (!outPath.empty()) {
        std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[ChronoLens] Cannot write image to " << outPath << std::endl;
            return 1;
        }
        const std::string data(accepted.bytes.begin(), accepted.bytes.end());
        out << data;
        if (!out) {
            std::cerr << "[ChronoLens] Error writing image to " << outPath << std::endl;
            return 1;
        }
        std::cout << "Image written to " << outPath << " (" << accepted.bytes.size() << " bytes)" << std::endl;
    }
    return 0;
}

int ChronoLensApp::RunEngagement(const std::vector<std::string>& params) {
    domain::EngagementMetrics metrics;
    if (params.size() != 5 ||
        !ParseInt(params[1], metrics.likes) ||
        !ParseInt(params[2], metrics.retweets) ||
        !ParseInt(params[3], metrics.replies) ||
        !ParseInt(params[4], metrics.impressions)) {
        PrintUsage();
        return 1;
    }
    if (!m_engine->recordEngagement(params[0], metrics)) {
        std::cerr << "Engagement not recorded for " << params[0] << std::endl;
        return 1;
    }
    std::cout << "Engagement recorded for " << params[0] << std::endl;
    return 0;
}

int ChronoLensApp::RunStats() {
    auto cache = m_engine->cache().stats();
    std::cout << "Cache: " << cache.totalEntries << " entries, " << cache.totalUses << " uses, avg confidence "
              << std::fixed << std::setprecision(1) << cache.avgConfidence << "%" << std::endl;

    auto engagement = m_engine->engagement().stats();
    std::cout << "Engagement: " << engagement.totalRecords << " selections, " << engagement.recordsWithMetrics
              << " with metrics, avg likes " << engagement.avgLikes << ", avg retweets " << engagement.avgRetweets
              << ", avg replies " << engagement.avgReplies << std::endl;

    auto diversity = m_engine->diversity().stats();
    std::cout << "Image history: " << diversity.total << " images, " << diversity.withinCooldown
              << " within the reuse cooldown" << std::endl;

    m_engine->optimizer().logStats();
    m_engine->stylePreferences().logStats();
    return 0;
}

int ChronoLensApp::RunEvict() {
    m_engine->cache().evict();
    std::cout << "Cache now holds " << m_engine->cache().size() << " entries" << std::endl;
    return 0;
}

int ChronoLensApp::RunClearCache() {
    m_engine->cache().clear();
    return 0;
}

} // namespace chronolens::app
