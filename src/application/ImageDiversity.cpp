/**
 * @file ImageDiversity.cpp
 * @brief Implementation of ImageDiversity.
 */

#include "application/ImageDiversity.hpp"
#include "application/JsonCodec.hpp"
#include "infrastructure/ContentHash.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace chronolens::application {

using json = nlohmann::json;

ImageDiversity::ImageDiversity(std::shared_ptr<domain::KeyValueStore> store, Clock clock, std::string documentKey)
    : m_store(std::move(store)), m_clock(std::move(clock)), m_documentKey(std::move(documentKey)) {}

std::string ImageDiversity::HashOf(const domain::ImageBytes& bytes) {
    try {
        return infrastructure::ContentHash::Md5Hex(bytes);
    } catch (const std::exception& e) {
        std::cerr << "[ImageDiversity] Hash failed, matching by URL only: " << e.what() << std::endl;
        return "";
    }
}

bool ImageDiversity::withinCooldown(const UsedImage& image, std::int64_t now) const {
    return now - image.usedAt < kCooldownDays * kMillisPerDay;
}

std::vector<UsedImage> ImageDiversity::loadDocument() {
    std::vector<UsedImage> images;
    std::optional<std::string> raw;
    try {
        raw = m_store->get(m_documentKey);
    } catch (const std::exception& e) {
        std::cerr << "[ImageDiversity] Error reading history: " << e.what() << std::endl;
        return images;
    }
    if (!raw || raw->empty()) {
        return images;
    }

    try {
        json j = json::parse(*raw);
        if (!j.is_object() || !j.contains("recentImages") || !j["recentImages"].is_array()) {
            std::cerr << "[ImageDiversity] History has no 'recentImages' array, starting empty" << std::endl;
            return images;
        }
        for (const auto& item : j["recentImages"]) {
            if (!item.is_object()) continue;
            UsedImage image;
            image.hash = JsonCodec::StringOr(item, "hash");
            std::string url = JsonCodec::StringOr(item, "url");
            if (!url.empty()) image.url = url;
            image.source = JsonCodec::StringOr(item, "source");
            image.usedAt = JsonCodec::IntegerField(item, "usedAt").value_or(0);
            image.description = JsonCodec::StringOr(item, "description");
            images.push_back(std::move(image));
        }
    } catch (const json::exception& e) {
        std::cerr << "[ImageDiversity] History unreadable, starting empty: " << e.what() << std::endl;
        images.clear();
    }
    return images;
}

bool ImageDiversity::saveDocument(const std::vector<UsedImage>& images) {
    json recent = json::array();
    for (const auto& image : images) {
        json item = {
            {"hash", image.hash},
            {"source", image.source},
            {"usedAt", image.usedAt},
            {"description", image.description}
        };
        item["url"] = image.url ? json(*image.url) : json(nullptr);
        recent.push_back(item);
    }
    json j = {{"recentImages", recent}};

    try {
        std::string text = j.dump(2, ' ', false, json::error_handler_t::replace);
        if (!m_store->set(m_documentKey, text)) {
            std::cerr << "[ImageDiversity] Error writing history" << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ImageDiversity] Error writing history: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool ImageDiversity::wasRecentlyUsed(const domain::ImageBytes& bytes, const std::optional<std::string>& url) {
    const std::string hash = HashOf(bytes);
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto images = loadDocument();
    const std::int64_t now = m_clock();

    for (const auto& image : images) {
        if (!withinCooldown(image, now)) continue;
        const bool sameHash = !hash.empty() && image.hash == hash;
        const bool sameUrl = url && !url->empty() && image.url && *image.url == *url;
        if (sameHash || sameUrl) {
            std::cout << "[ImageDiversity] Image already used "
                      << (now - image.usedAt) / kMillisPerDay << " days ago for \""
                      << image.description << "\"" << std::endl;
            return true;
        }
    }
    return false;
}

void ImageDiversity::markUsed(const domain::ImageBytes& bytes,
                              const std::optional<std::string>& url,
                              const std::string& source,
                              const std::string& description) {
    UsedImage image;
    image.hash = HashOf(bytes);
    if (url && !url->empty()) image.url = url;
    image.source = source;
    image.description = JsonCodec::Utf8Prefix(description, kDescriptionLength);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto images = loadDocument();
    image.usedAt = m_clock();
    images.push_back(image);
    if (images.size() > kMaxImages) {
        images.erase(images.begin(), images.end() - static_cast<std::ptrdiff_t>(kMaxImages));
    }

    if (saveDocument(images)) {
        std::cout << "[ImageDiversity] Recorded image from " << source << " (" << images.size()
                  << " in history)" << std::endl;
    }
}

std::vector<UsedImage> ImageDiversity::records() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadDocument();
}

DiversityStats ImageDiversity::stats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto images = loadDocument();
    const std::int64_t now = m_clock();

    DiversityStats stats;
    stats.total = images.size();
    for (const auto& image : images) {
        if (withinCooldown(image, now)) ++stats.withinCooldown;
    }
    return stats;
}

} // namespace chronolens::application
