/**
 * @file Candidate.hpp
 * @brief Unverified image fetched from one source for one event.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronolens::domain {

using ImageBytes = std::vector<std::uint8_t>;

/**
 * @struct ImageMetadata
 * @brief Descriptive metadata reported by a source alongside the image payload.
 */
struct ImageMetadata {
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::optional<std::string> date;
    std::string searchTerm;
};

/**
 * @struct QualityMeta
 * @brief Technical properties measured by the quality filter.
 */
struct QualityMeta {
    int width = 0;
    int height = 0;
    std::size_t byteSize = 0;
};

/**
 * @struct FetchedImage
 * @brief Raw result of a source fetch, before any filtering.
 */
struct FetchedImage {
    ImageBytes bytes;
    ImageMetadata metadata;
};

/**
 * @struct Candidate
 * @brief A fetched image attributed to its source. Discarded after scoring unless selected.
 */
struct Candidate {
    std::string sourceName;
    ImageBytes imageBytes;
    ImageMetadata metadata;
    QualityMeta qualityMeta;
};

} // namespace chronolens::domain
