/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the engine configuration (chronolens.json).
 *
 * Provides a unified way to access the source registry and tuning values
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include "domain/EngineConfig.hpp"

namespace chronolens::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Built-in configuration: the curated archive registry and default thresholds.
     */
    static domain::EngineConfig Defaults();

    /**
     * @brief Reads the configuration file, filling absent keys from Defaults().
     * @param configPath Path to a JSON document. A missing file yields Defaults().
     * @throws std::runtime_error if the file is malformed or a value is invalid.
     */
    static domain::EngineConfig Load(const std::string& configPath);

    /**
     * @brief Parses configuration from JSON text.
     * @throws std::runtime_error on malformed JSON or invalid values.
     */
    static domain::EngineConfig Parse(const std::string& jsonText);

    /**
     * @brief Rejects configurations the engine cannot run with.
     * @throws std::runtime_error describing the first problem found.
     */
    static void Validate(const domain::EngineConfig& config);
};

} // namespace chronolens::infrastructure
