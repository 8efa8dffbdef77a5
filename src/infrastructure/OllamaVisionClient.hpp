/**
 * @file OllamaVisionClient.hpp
 * @brief VisionOracle backed by a multimodal model on an Ollama server.
 */

#pragma once

#include "domain/VisionOracle.hpp"
#include "domain/EngineConfig.hpp"
#include <string>

namespace chronolens::infrastructure {

class OllamaVisionClient : public domain::VisionOracle {
public:
    explicit OllamaVisionClient(const domain::OracleSettings& settings);

    /** @brief Sends a POST request to /api/generate with the image attached. */
    std::optional<std::string> analyze(const std::string& systemPrompt,
                                       const std::string& userPrompt,
                                       const std::string& imageBase64) override;

private:
    std::string m_host;
    int m_port;
    std::string m_model;
    int m_timeoutSeconds;
};

} // namespace chronolens::infrastructure
