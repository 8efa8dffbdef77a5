/**
 * @file FileKeyValueStore.hpp
 * @brief KeyValueStore backed by one JSON file per key.
 */

#pragma once
#include "domain/KeyValueStore.hpp"
#include <mutex>
#include <string>

namespace chronolens::infrastructure {

/**
 * @class FileKeyValueStore
 * @brief Stores each document as <root>/<key>.json.
 *
 * Writes go to a temp file first and are renamed into place, so a crash never
 * leaves a half-written document behind.
 */
class FileKeyValueStore : public domain::KeyValueStore {
public:
    explicit FileKeyValueStore(std::string rootDir);

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    std::vector<std::string> list() override;
    bool remove(const std::string& key) override;

private:
    std::string pathFor(const std::string& key) const;
    bool performAtomicWrite(const std::string& filename, const std::string& content);

    std::string m_rootDir;
    std::mutex m_mutex;
};

} // namespace chronolens::infrastructure
