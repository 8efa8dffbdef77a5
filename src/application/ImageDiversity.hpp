/**
 * @file ImageDiversity.hpp
 * @brief Reuse guard that keeps one picture from being posted for several events.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/Clock.hpp"
#include "domain/Candidate.hpp"
#include "domain/KeyValueStore.hpp"

namespace chronolens::application {

/**
 * @struct UsedImage
 * @brief One accepted image. hash is empty when the digest could not be computed.
 */
struct UsedImage {
    std::string hash;
    std::optional<std::string> url;
    std::string source;
    std::int64_t usedAt = 0;
    std::string description;
};

struct DiversityStats {
    std::size_t total = 0;
    std::size_t withinCooldown = 0;
};

/**
 * @class ImageDiversity
 * @brief Remembers the newest kMaxImages accepted images by content hash and URL.
 *
 * An image matching either key within kCooldownDays counts as recently used.
 */
class ImageDiversity {
public:
    static constexpr std::size_t kMaxImages = 100;
    static constexpr int kCooldownDays = 30;
    static constexpr std::size_t kDescriptionLength = 100;

    explicit ImageDiversity(std::shared_ptr<domain::KeyValueStore> store,
                            Clock clock = SystemNowMillis,
                            std::string documentKey = "image-diversity");

    bool wasRecentlyUsed(const domain::ImageBytes& bytes, const std::optional<std::string>& url);

    void markUsed(const domain::ImageBytes& bytes,
                  const std::optional<std::string>& url,
                  const std::string& source,
                  const std::string& description);

    /** @brief All retained records, oldest first. */
    std::vector<UsedImage> records();

    DiversityStats stats();

private:
    static std::string HashOf(const domain::ImageBytes& bytes);
    bool withinCooldown(const UsedImage& image, std::int64_t now) const;
    std::vector<UsedImage> loadDocument();
    bool saveDocument(const std::vector<UsedImage>& images);

    std::shared_ptr<domain::KeyValueStore> m_store;
    Clock m_clock;
    std::string m_documentKey;
    std::mutex m_mutex;
};

} // namespace chronolens::application
