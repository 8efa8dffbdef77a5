/**
 * @file SelectionEngine.cpp
 * @brief Implementation of SelectionEngine.
 */

#include "application/SelectionEngine.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace chronolens::application {

std::string StageToString(Stage stage) {
    switch (stage) {
        case Stage::CacheCheck: return "CACHE_CHECK";
        case Stage::Fetching: return "FETCHING";
        case Stage::Filtering: return "FILTERING";
        case Stage::Scoring: return "SCORING";
        case Stage::Deciding: return "DECIDING";
        case Stage::Accepted: return "ACCEPTED";
        case Stage::Rejected: return "REJECTED";
    }
    return "UNKNOWN";
}

namespace {

domain::RejectedSelection Reject(std::string reason, std::optional<domain::ScoredCandidate> best = std::nullopt) {
    std::cout << "[SelectionEngine] No image selected: " << reason << std::endl;
    domain::RejectedSelection rejected;
    rejected.reason = std::move(reason);
    rejected.bestAttempt = std::move(best);
    return rejected;
}

} // namespace

SelectionEngine::SelectionEngine(domain::EngineConfig config,
                                 std::map<std::string, std::shared_ptr<domain::ImageSource>> sources,
                                 std::shared_ptr<domain::VisionOracle> oracle,
                                 std::shared_ptr<domain::KeyValueStore> store,
                                 Clock clock)
    : m_config(std::move(config)),
      m_clock(std::move(clock)),
      m_cache(std::make_shared<ResultCache>(store, m_clock)),
      m_engagement(std::make_shared<EngagementStore>(store, m_clock)),
      m_optimizer(std::make_shared<SourceOptimizer>(m_engagement, m_config.sources, m_config.optimizer)),
      m_stylePreferences(std::make_shared<StylePreferences>(m_engagement)),
      m_diversity(std::make_shared<ImageDiversity>(store, m_clock)),
      m_qualityFilter(m_config.quality),
      m_scorer(oracle, m_stylePreferences, m_config.selection),
      m_collector(m_config.sources, sources) {
    infrastructure::ConfigLoader::Validate(m_config);
    if (!oracle) {
        throw std::runtime_error("SelectionEngine requires a vision oracle");
    }
    if (!store) {
        throw std::runtime_error("SelectionEngine requires a key-value store");
    }
    for (const auto& source : m_config.sources) {
        if (source.enabled && !m_collector.hasSource(source.name)) {
            throw std::runtime_error("No image source adapter for enabled source: " + source.name);
        }
    }
}

bool SelectionEngine::IsAcceptable(const domain::VerificationResult& verification, int acceptConfidence) {
    return verification.verdict == domain::Verdict::Approved && verification.confidence >= acceptConfidence;
}

std::string SelectionEngine::SearchTerm(const std::string& description, int maxWords) {
    std::istringstream words(description);
    std::string word;
    std::string term;
    int count = 0;
    while (count < maxWords && words >> word) {
        if (!term.empty()) term += ' ';
        term += word;
        ++count;
    }
    return term;
}

void SelectionEngine::enter(Stage stage) const {
    std::cout << "[SelectionEngine] Stage: " << StageToString(stage) << std::endl;
}

const domain::SourceConfig* SelectionEngine::findSource(const std::string& name) const {
    for (const auto& source : m_config.sources) {
        if (source.name == name) return &source;
    }
    return nullptr;
}

std::string SelectionEngine::nextSelectionId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    std::ostringstream id;
    id << "sel-" << m_clock() << "-" << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return id.str();
}

domain::SelectionOutcome SelectionEngine::selectImage(const domain::Event& event,
                                                      const std::string& generatedText,
                                                      std::optional<std::vector<std::string>> recentSources) {
    try {
        std::cout << "[SelectionEngine] Selecting image for " << event.year << ": " << event.description << std::endl;
        const std::string searchTerm = SearchTerm(event.description, m_config.selection.searchTermWords);

        enter(Stage::CacheCheck);
        if (auto cached = tryCached(event, searchTerm)) {
            enter(Stage::Accepted);
            return *cached;
        }

        std::vector<std::string> recent = recentSources
            ? *recentSources
            : m_engagement->recentSources(static_cast<std::size_t>(m_config.selection.recentWindow));
        return runPipeline(event, generatedText, searchTerm, recent);
    } catch (const std::exception& e) {
        std::cerr << "[SelectionEngine] Selection failed: " << e.what() << std::endl;
        enter(Stage::Rejected);
        return Reject(std::string("selection failed: ") + e.what());
    } catch (...) {
        std::cerr << "[SelectionEngine] Selection failed: unknown error" << std::endl;
        enter(Stage::Rejected);
        return Reject("selection failed: unknown error");
    }
}

std::optional<domain::AcceptedSelection> SelectionEngine::tryCached(const domain::Event& event,
                                                                    const std::string& searchTerm) {
    auto entry = m_cache->peek(event);
    if (!entry) return std::nullopt;

    const auto* source = findSource(entry->source);
    if (!source || !source->enabled) {
        std::cout << "[SelectionEngine] Cached source " << entry->source << " is no longer available" << std::endl;
        return std::nullopt;
    }

    auto candidate = m_collector.fetchOne(entry->source, searchTerm, event.year);
    if (!candidate) {
        std::cout << "[SelectionEngine] Re-fetch from cached source " << entry->source << " failed" << std::endl;
        return std::nullopt;
    }
    auto report = m_qualityFilter.check(candidate->imageBytes);
    if (!report.passed) {
        std::cout << "[SelectionEngine] Cached source image rejected: " << report.reason << std::endl;
        return std::nullopt;
    }

    auto touched = m_cache->touch(entry->key);
    const auto& hit = touched ? *touched : *entry;
    std::cout << "[SelectionEngine] Cache hit for \"" << hit.key << "\" served from " << hit.source
              << " (used " << hit.useCount << " times)" << std::endl;

    domain::AcceptedSelection accepted;
    accepted.bytes = std::move(candidate->imageBytes);
    accepted.source = hit.source;
    accepted.confidence = hit.confidence;
    accepted.verdict = hit.verdict;
    accepted.styleInfo = hit.styleInfo;
    accepted.metadata = std::move(candidate->metadata);
    accepted.combinedScore = m_scorer.combine(domain::VerificationResult{hit.verdict, hit.confidence, "", ""}, hit.styleInfo);
    accepted.selectionId = nextSelectionId();
    accepted.fromCache = true;
    m_engagement->trackSelection(accepted.selectionId, accepted.source, accepted.confidence,
                                 accepted.verdict, accepted.styleInfo);
    return accepted;
}

std::vector<domain::Candidate> SelectionEngine::filter(std::vector<domain::Candidate> candidates) const {
    std::vector<domain::Candidate> survivors;
    for (auto& candidate : candidates) {
        auto report = m_qualityFilter.check(candidate.imageBytes);
        std::cout << "[QualityFilter] " << candidate.sourceName << ": " << report.reason << std::endl;
        if (!report.passed) continue;
        if (m_diversity->wasRecentlyUsed(candidate.imageBytes, candidate.metadata.url)) {
            std::cout << "[SelectionEngine] " << candidate.sourceName << " image was used recently, skipping" << std::endl;
            continue;
        }
        candidate.qualityMeta = report.metadata;
        survivors.push_back(std::move(candidate));
    }
    return survivors;
}

std::vector<domain::ScoredCandidate> SelectionEngine::scoreAll(const std::vector<domain::Candidate>& candidates,
                                                               const domain::Event& event,
                                                               const std::string& generatedText) const {
    std::vector<std::future<domain::ScoredCandidate>> pending;
    pending.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        pending.push_back(std::async(std::launch::async, [this, &candidate, &event, &generatedText] {
            return m_scorer.score(candidate, event, generatedText);
        }));
    }
    std::vector<domain::ScoredCandidate> scored;
    scored.reserve(pending.size());
    for (auto& f : pending) {
        scored.push_back(f.get());
    }
    return scored;
}

void SelectionEngine::rank(std::vector<domain::ScoredCandidate>& scored) const {
    auto registryIndex = [this](const std::string& name) {
        for (std::size_t i = 0; i < m_config.sources.size(); ++i) {
            if (m_config.sources[i].name == name) return i;
        }
        return m_config.sources.size();
    };
    auto priorityRank = [this](const std::string& name) {
        const auto* source = findSource(name);
        return source ? source->priorityRank : std::numeric_limits<int>::max();
    };
    std::stable_sort(scored.begin(), scored.end(),
                     [&](const domain::ScoredCandidate& a, const domain::ScoredCandidate& b) {
                         if (a.combinedScore != b.combinedScore) return a.combinedScore > b.combinedScore;
                         const int ra = priorityRank(a.candidate.sourceName);
                         const int rb = priorityRank(b.candidate.sourceName);
                         if (ra != rb) return ra < rb;
                         return registryIndex(a.candidate.sourceName) < registryIndex(b.candidate.sourceName);
                     });
}

domain::SelectionOutcome SelectionEngine::runPipeline(const domain::Event& event,
                                                      const std::string& generatedText,
                                                      const std::string& searchTerm,
                                                      const std::vector<std::string>& recentSources) {
    enter(Stage::Fetching);
    auto ordered = m_optimizer->order(recentSources);
    const auto topCount = static_cast<std::size_t>(std::max(0, m_config.selection.topSourcesCount));
    if (ordered.size() > topCount) ordered.resize(topCount);
    auto fetched = m_collector.collect(ordered, searchTerm, event.year, m_config.selection.parallelTimeoutMs);

    enter(Stage::Filtering);
    auto survivors = filter(std::move(fetched));
    if (survivors.empty()) {
        enter(Stage::Rejected);
        return Reject("no candidate passed the quality and reuse checks");
    }

    enter(Stage::Scoring);
    auto scored = scoreAll(survivors, event, generatedText);

    enter(Stage::Deciding);
    rank(scored);
    for (const auto& s : scored) {
        std::cout << "[SelectionEngine] " << s.candidate.sourceName << ": "
                  << domain::VerdictToString(s.verification.verdict) << " " << s.verification.confidence
                  << "% style " << s.style.preferenceScore << " combined " << s.combinedScore << std::endl;
    }

    const auto& best = scored.front();
    if (!IsAcceptable(best.verification, m_config.selection.acceptConfidence)) {
        enter(Stage::Rejected);
        std::ostringstream reason;
        reason << "best candidate from " << best.candidate.sourceName << " was "
               << domain::VerdictToString(best.verification.verdict) << " at " << best.verification.confidence << "%";
        return Reject(reason.str(), best);
    }

    enter(Stage::Accepted);
    domain::SelectionInfo info;
    info.source = best.candidate.sourceName;
    info.confidence = best.verification.confidence;
    info.verdict = best.verification.verdict;
    info.styleInfo = best.style;
    info.url = best.candidate.metadata.url;
    info.title = best.candidate.metadata.title;
    m_cache->store(event, info);

    domain::AcceptedSelection accepted;
    accepted.bytes = best.candidate.imageBytes;
    accepted.source = best.candidate.sourceName;
    accepted.confidence = best.verification.confidence;
    accepted.verdict = best.verification.verdict;
    accepted.styleInfo = best.style;
    accepted.metadata = best.candidate.metadata;
    accepted.combinedScore = best.combinedScore;
    accepted.selectionId = nextSelectionId();
    m_engagement->trackSelection(accepted.selectionId, accepted.source, accepted.confidence,
                                 accepted.verdict, accepted.styleInfo);
    m_diversity->markUsed(accepted.bytes, accepted.metadata.url, accepted.source, event.description);
    std::cout << "[SelectionEngine] Selected " << accepted.source << " (" << accepted.confidence
              << "%) as " << accepted.selectionId << std::endl;
    return accepted;
}

bool SelectionEngine::recordEngagement(const std::string& selectionId, const domain::EngagementMetrics& metrics) {
    return m_engagement->recordEngagement(selectionId, metrics);
}

} // namespace chronolens::application
