/**
 * @file KeyValueStore.hpp
 * @brief Storage port for persisted documents.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace chronolens::domain {

/**
 * @class KeyValueStore
 * @brief Abstract document store. Values are serialized JSON text.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /** @brief Returns the stored document or nullopt when absent/unreadable. */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /** @brief Replaces the document. Returns false when the write failed. */
    virtual bool set(const std::string& key, const std::string& value) = 0;

    /** @brief Lists all keys currently held. */
    virtual std::vector<std::string> list() = 0;

    /** @brief Removes a document. Returns false when it could not be removed. */
    virtual bool remove(const std::string& key) = 0;
};

} // namespace chronolens::domain
