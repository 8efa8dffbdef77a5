/**
 * @file CandidateCollector.hpp
 * @brief Concurrent fan-out over image sources with per-source deadlines.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Candidate.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/ImageSource.hpp"

namespace chronolens::application {

/**
 * @class CandidateCollector
 * @brief Launches one fetch per source and gathers whatever settles in time.
 *
 * Each fetch runs on a detached worker that owns a reference to its source,
 * so a source that never returns cannot block the caller past its deadline.
 * A late result is discarded when the worker eventually finishes.
 */
class CandidateCollector {
public:
    CandidateCollector(std::vector<domain::SourceConfig> registry,
                       std::map<std::string, std::shared_ptr<domain::ImageSource>> sources);

    /**
     * @brief Fetches from every named source concurrently.
     * @param sourceNames Sources to query, in priority order.
     * @param overallTimeoutMs Cap applied to every source deadline.
     * @return Raw candidates (qualityMeta unset) in the order of sourceNames.
     */
    std::vector<domain::Candidate> collect(const std::vector<std::string>& sourceNames,
                                           const std::string& searchTerm,
                                           std::optional<int> year,
                                           int overallTimeoutMs) const;

    /** @brief Single-source fetch under the source's own deadline. */
    std::optional<domain::Candidate> fetchOne(const std::string& sourceName,
                                              const std::string& searchTerm,
                                              std::optional<int> year) const;

    bool hasSource(const std::string& sourceName) const;

private:
    int timeoutFor(const std::string& sourceName) const;

    std::vector<domain::SourceConfig> m_registry;
    std::map<std::string, std::shared_ptr<domain::ImageSource>> m_sources;
};

} // namespace chronolens::application
