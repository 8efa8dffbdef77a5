/**
 * @file VisionOracle.hpp
 * @brief Port for the AI vision service used to verify and classify images.
 */

#pragma once
#include <optional>
#include <string>

namespace chronolens::domain {

/**
 * @class VisionOracle
 * @brief Opaque scoring oracle. Returns the raw JSON text produced by the model.
 */
class VisionOracle {
public:
    virtual ~VisionOracle() = default;

    /**
     * @brief Sends an image with instructions and returns the model's JSON answer.
     * @param systemPrompt Instructions that must enforce JSON-only output.
     * @param userPrompt Request body.
     * @param imageBase64 Base64-encoded image payload.
     * @return Raw response text, or nullopt on transport failure.
     */
    virtual std::optional<std::string> analyze(const std::string& systemPrompt,
                                               const std::string& userPrompt,
                                               const std::string& imageBase64) = 0;
};

} // namespace chronolens::domain
