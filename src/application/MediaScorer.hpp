/**
 * @file MediaScorer.hpp
 * @brief Adapter around the vision oracle: match verification and style classification.
 */

#pragma once
#include <memory>
#include <string>
#include "application/StylePreferences.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Event.hpp"
#include "domain/Verification.hpp"
#include "domain/VisionOracle.hpp"

namespace chronolens::application {

/**
 * @class MediaScorer
 * @brief Builds oracle requests and parses their answers into typed results.
 *
 * No oracle failure escapes this class: transport or parse errors become an
 * ERROR verdict with confidence 0, or an all-"unknown" style profile.
 */
class MediaScorer {
public:
    /**
     * @param oracle Vision service.
     * @param preferences Learned style preference; when null every style scores 50.
     * @param settings Weights of the combined score.
     */
    MediaScorer(std::shared_ptr<domain::VisionOracle> oracle,
                std::shared_ptr<StylePreferences> preferences,
                domain::SelectionSettings settings = {});

    domain::VerificationResult verify(const domain::Candidate& candidate,
                                      const domain::Event& event,
                                      const std::string& generatedText) const;

    domain::StyleProfile style(const domain::Candidate& candidate) const;

    /** @brief Runs verify() and style() concurrently, then combines them. */
    domain::ScoredCandidate score(const domain::Candidate& candidate,
                                  const domain::Event& event,
                                  const std::string& generatedText) const;

    /** @brief weight_v * confidence + weight_s * preferenceScore. */
    double combine(const domain::VerificationResult& verification, const domain::StyleProfile& style) const;

    static std::string BuildVerificationPrompt(const domain::Candidate& candidate,
                                               const domain::Event& event,
                                               const std::string& generatedText);

    /** @brief Parses the oracle's verification JSON with exhaustive defaults. */
    static domain::VerificationResult ParseVerification(const std::string& raw);

    /** @brief Parses the oracle's style JSON; unknown dimensions stay "unknown". */
    static domain::StyleProfile ParseStyle(const std::string& raw);

private:
    std::shared_ptr<domain::VisionOracle> m_oracle;
    std::shared_ptr<StylePreferences> m_preferences;
    domain::SelectionSettings m_settings;
};

} // namespace chronolens::application
