/**
 * @file ImageSource.hpp
 * @brief Port for a named external image provider.
 */

#pragma once
#include <optional>
#include <string>
#include "Candidate.hpp"

namespace chronolens::domain {

/**
 * @class ImageSource
 * @brief Best-effort fetcher. May return nothing, throw, or block past its deadline.
 */
class ImageSource {
public:
    virtual ~ImageSource() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Looks up an image for the search term.
     * @param searchTerm Leading words of the event description.
     * @param year Event year, when the source can use it.
     * @return The raw payload and metadata, or nullopt when nothing was found.
     */
    virtual std::optional<FetchedImage> fetch(const std::string& searchTerm, std::optional<int> year) = 0;
};

} // namespace chronolens::domain
