/**
 * @file QualityFilter.hpp
 * @brief Cheap technical rejection of unusable images before any oracle call.
 */

#pragma once
#include <string>
#include "domain/Candidate.hpp"
#include "domain/EngineConfig.hpp"

namespace chronolens::application {

/**
 * @struct QualityReport
 * @brief Verdict of the filter. metadata is zeroed when the bytes could not be decoded.
 */
struct QualityReport {
    bool passed = false;
    std::string reason;
    domain::QualityMeta metadata;
};

/**
 * @class QualityFilter
 * @brief Checks resolution, payload size and aspect ratio. Deterministic and non-throwing.
 */
class QualityFilter {
public:
    explicit QualityFilter(domain::QualityThresholds thresholds = {});

    QualityReport check(const domain::ImageBytes& bytes) const;

    const domain::QualityThresholds& thresholds() const { return m_thresholds; }

private:
    domain::QualityThresholds m_thresholds;
};

} // namespace chronolens::application
