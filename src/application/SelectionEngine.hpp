/**
 * @file SelectionEngine.hpp
 * @brief Orchestrates cache, source ordering, fetch, filter, scoring and decision.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/CandidateCollector.hpp"
#include "application/Clock.hpp"
#include "application/EngagementStore.hpp"
#include "application/ImageDiversity.hpp"
#include "application/MediaScorer.hpp"
#include "application/QualityFilter.hpp"
#include "application/ResultCache.hpp"
#include "application/SourceOptimizer.hpp"
#include "application/StylePreferences.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/ImageSource.hpp"
#include "domain/KeyValueStore.hpp"
#include "domain/SelectionOutcome.hpp"
#include "domain/VisionOracle.hpp"

namespace chronolens::application {

/**
 * @enum Stage
 * @brief Steps of one selection run.
 */
enum class Stage {
    CacheCheck,
    Fetching,
    Filtering,
    Scoring,
    Deciding,
    Accepted,
    Rejected
};

std::string StageToString(Stage stage);

/**
 * @class SelectionEngine
 * @brief Entry point: picks the best verified image for an event, or none.
 *
 * selectImage never throws. Construction throws std::runtime_error when the
 * configuration is invalid or an enabled source has no adapter.
 */
class SelectionEngine {
public:
    SelectionEngine(domain::EngineConfig config,
                    std::map<std::string, std::shared_ptr<domain::ImageSource>> sources,
                    std::shared_ptr<domain::VisionOracle> oracle,
                    std::shared_ptr<domain::KeyValueStore> store,
                    Clock clock = SystemNowMillis);

    /**
     * @brief Runs the full pipeline for one event.
     * @param recentSources Sources used by recent selections; defaults to the engagement log.
     */
    domain::SelectionOutcome selectImage(const domain::Event& event,
                                         const std::string& generatedText,
                                         std::optional<std::vector<std::string>> recentSources = std::nullopt);

    /** @brief Attaches engagement metrics to a previous selection. */
    bool recordEngagement(const std::string& selectionId, const domain::EngagementMetrics& metrics);

    /** @brief Accept iff the verdict is APPROVED with confidence at or above the threshold. */
    static bool IsAcceptable(const domain::VerificationResult& verification, int acceptConfidence);

    /** @brief First searchTermWords whitespace-separated words of the description. */
    static std::string SearchTerm(const std::string& description, int maxWords);

    /** @brief Highest combined score first; ties go to the lower priorityRank, then registry order. */
    void rank(std::vector<domain::ScoredCandidate>& scored) const;

    ResultCache& cache() { return *m_cache; }
    EngagementStore& engagement() { return *m_engagement; }
    SourceOptimizer& optimizer() { return *m_optimizer; }
    StylePreferences& stylePreferences() { return *m_stylePreferences; }
    ImageDiversity& diversity() { return *m_diversity; }
    const domain::EngineConfig& config() const { return m_config; }

private:
    std::optional<domain::AcceptedSelection> tryCached(const domain::Event& event, const std::string& searchTerm);
    domain::SelectionOutcome runPipeline(const domain::Event& event,
                                         const std::string& generatedText,
                                         const std::string& searchTerm,
                                         const std::vector<std::string>& recentSources);
    std::vector<domain::Candidate> filter(std::vector<domain::Candidate> candidates) const;
    std::vector<domain::ScoredCandidate> scoreAll(const std::vector<domain::Candidate>& candidates,
                                                  const domain::Event& event,
                                                  const std::string& generatedText) const;
    const domain::SourceConfig* findSource(const std::string& name) const;
    std::string nextSelectionId();
    void enter(Stage stage) const;

    domain::EngineConfig m_config;
    Clock m_clock;
    std::shared_ptr<ResultCache> m_cache;
    std::shared_ptr<EngagementStore> m_engagement;
    std::shared_ptr<SourceOptimizer> m_optimizer;
    std::shared_ptr<StylePreferences> m_stylePreferences;
    std::shared_ptr<ImageDiversity> m_diversity;
    QualityFilter m_qualityFilter;
    MediaScorer m_scorer;
    CandidateCollector m_collector;
};

} // namespace chronolens::application
