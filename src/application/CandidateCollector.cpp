/**
 * @file CandidateCollector.cpp
 * @brief Implementation of CandidateCollector.
 */

#include "application/CandidateCollector.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <thread>

namespace chronolens::application {

namespace {

using FetchResult = std::optional<domain::FetchedImage>;
using SteadyClock = std::chrono::steady_clock;

struct PendingFetch {
    std::string sourceName;
    std::future<FetchResult> result;
    SteadyClock::time_point deadline;
};

std::future<FetchResult> LaunchFetch(std::shared_ptr<domain::ImageSource> source,
                                     const std::string& searchTerm,
                                     std::optional<int> year) {
    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();
    std::thread([promise, source, searchTerm, year]() {
        try {
            promise->set_value(source->fetch(searchTerm, year));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

std::optional<domain::Candidate> Settle(PendingFetch& pending) {
    if (pending.result.wait_until(pending.deadline) != std::future_status::ready) {
        std::cerr << "[CandidateCollector] " << pending.sourceName << " timed out" << std::endl;
        return std::nullopt;
    }
    try {
        auto fetched = pending.result.get();
        if (!fetched || fetched->bytes.empty()) {
            std::cout << "[CandidateCollector] " << pending.sourceName << " returned nothing" << std::endl;
            return std::nullopt;
        }
        domain::Candidate candidate;
        candidate.sourceName = pending.sourceName;
        candidate.imageBytes = std::move(fetched->bytes);
        candidate.metadata = std::move(fetched->metadata);
        return candidate;
    } catch (const std::exception& e) {
        std::cerr << "[CandidateCollector] " << pending.sourceName << " failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[CandidateCollector] " << pending.sourceName << " failed with unknown error" << std::endl;
    }
    return std::nullopt;
}

} // namespace

CandidateCollector::CandidateCollector(std::vector<domain::SourceConfig> registry,
                                       std::map<std::string, std::shared_ptr<domain::ImageSource>> sources)
    : m_registry(std::move(registry)), m_sources(std::move(sources)) {}

bool CandidateCollector::hasSource(const std::string& sourceName) const {
    auto it = m_sources.find(sourceName);
    return it != m_sources.end() && it->second;
}

int CandidateCollector::timeoutFor(const std::string& sourceName) const {
    auto it = std::find_if(m_registry.begin(), m_registry.end(),
                           [&](const domain::SourceConfig& s) { return s.name == sourceName; });
    return it != m_registry.end() ? it->timeoutMs : domain::SourceConfig{}.timeoutMs;
}

std::vector<domain::Candidate> CandidateCollector::collect(const std::vector<std::string>& sourceNames,
                                                           const std::string& searchTerm,
                                                           std::optional<int> year,
                                                           int overallTimeoutMs) const {
    const auto start = SteadyClock::now();
    const auto overallDeadline = start + std::chrono::milliseconds(overallTimeoutMs);

    std::vector<PendingFetch> pending;
    for (const auto& name : sourceNames) {
        if (!hasSource(name)) {
            std::cerr << "[CandidateCollector] No adapter for source " << name << std::endl;
            continue;
        }
        auto deadline = std::min(start + std::chrono::milliseconds(timeoutFor(name)), overallDeadline);
        pending.push_back({name, LaunchFetch(m_sources.at(name), searchTerm, year), deadline});
    }

    std::vector<domain::Candidate> candidates;
    for (auto& p : pending) {
        if (auto candidate = Settle(p)) {
            candidates.push_back(std::move(*candidate));
        }
    }
    std::cout << "[CandidateCollector] " << candidates.size() << "/" << sourceNames.size()
              << " sources returned images" << std::endl;
    return candidates;
}

std::optional<domain::Candidate> CandidateCollector::fetchOne(const std::string& sourceName,
                                                              const std::string& searchTerm,
                                                              std::optional<int> year) const {
    if (!hasSource(sourceName)) {
        std::cerr << "[CandidateCollector] No adapter for source " << sourceName << std::endl;
        return std::nullopt;
    }
    PendingFetch p{sourceName, LaunchFetch(m_sources.at(sourceName), searchTerm, year),
                   SteadyClock::now() + std::chrono::milliseconds(timeoutFor(sourceName))};
    return Settle(p);
}

} // namespace chronolens::application
