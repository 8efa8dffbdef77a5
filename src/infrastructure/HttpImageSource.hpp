/**
 * @file HttpImageSource.hpp
 * @brief ImageSource that delegates to an HTTP fetcher service.
 */

#pragma once

#include "domain/ImageSource.hpp"
#include "domain/EngineConfig.hpp"
#include <string>

namespace chronolens::infrastructure {

/**
 * @class HttpImageSource
 * @brief Issues GET <path>?q=<term>&year=<year> and treats the body as the image.
 *
 * Metadata is read from the X-Image-Title, X-Image-Url and X-Image-Date
 * response headers. Any status other than 200 means "no image".
 */
class HttpImageSource : public domain::ImageSource {
public:
    explicit HttpImageSource(const domain::SourceConfig& config);

    std::string name() const override { return m_name; }

    std::optional<domain::FetchedImage> fetch(const std::string& searchTerm, std::optional<int> year) override;

private:
    std::string m_name;
    std::string m_host;
    int m_port;
    std::string m_path;
    int m_timeoutMs;
};

} // namespace chronolens::infrastructure
