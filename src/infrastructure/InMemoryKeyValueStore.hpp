/**
 * @file InMemoryKeyValueStore.hpp
 * @brief Process-local KeyValueStore, used by tests and dry runs.
 */

#pragma once
#include "domain/KeyValueStore.hpp"
#include <map>
#include <mutex>
#include <string>

namespace chronolens::infrastructure {

class InMemoryKeyValueStore : public domain::KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_values.find(key);
        if (it == m_values.end()) return std::nullopt;
        return it->second;
    }

    bool set(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failWrites) return false;
        m_values[key] = value;
        return true;
    }

    std::vector<std::string> list() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> keys;
        for (const auto& [key, value] : m_values) {
            keys.push_back(key);
        }
        return keys;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.erase(key);
        return true;
    }

    /** @brief Makes every subsequent set() fail, to exercise persistence-failure paths. */
    void setFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failWrites = fail;
    }

private:
    std::map<std::string, std::string> m_values;
    std::mutex m_mutex;
    bool m_failWrites = false;
};

} // namespace chronolens::infrastructure
