/**
 * @file FileKeyValueStore.cpp
 * @brief Implementation of FileKeyValueStore.
 */

#include "infrastructure/FileKeyValueStore.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace chronolens::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kExtension = ".json";
}

FileKeyValueStore::FileKeyValueStore(std::string rootDir) : m_rootDir(std::move(rootDir)) {}

std::string FileKeyValueStore::pathFor(const std::string& key) const {
    return (fs::path(m_rootDir) / (key + kExtension)).string();
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    fs::path p = pathFor(key);

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        return std::nullopt;
    }

    std::ifstream in(p);
    if (!in.is_open()) {
        std::cerr << "[FileKeyValueStore] Failed to open " << p << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool FileKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return performAtomicWrite(pathFor(key), value);
}

std::vector<std::string> FileKeyValueStore::list() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> keys;

    std::error_code ec;
    if (!fs::is_directory(m_rootDir, ec)) {
        return keys;
    }
    for (const auto& entry : fs::directory_iterator(m_rootDir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kExtension) {
            keys.push_back(entry.path().stem().string());
        }
    }
    return keys;
}

bool FileKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    fs::remove(pathFor(key), ec);
    if (ec) {
        std::cerr << "[FileKeyValueStore] Remove failed for " << key << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool FileKeyValueStore::performAtomicWrite(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // filename.<timestamp>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[FileKeyValueStore] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[FileKeyValueStore] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[FileKeyValueStore] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[FileKeyValueStore] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace chronolens::infrastructure
