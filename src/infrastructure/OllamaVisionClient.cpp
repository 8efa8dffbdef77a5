#include "infrastructure/OllamaVisionClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace chronolens::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kVerificationTemperature = 0.3;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaVisionClient::OllamaVisionClient(const domain::OracleSettings& settings)
    : m_host(settings.host),
      m_port(settings.port),
      m_model(settings.model),
      m_timeoutSeconds(settings.timeoutSeconds) {}

std::optional<std::string> OllamaVisionClient::analyze(const std::string& systemPrompt,
                                                       const std::string& userPrompt,
                                                       const std::string& imageBase64) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeoutSeconds);

    json requestData = {
        {"model", m_model},
        {"system", systemPrompt},
        {"prompt", userPrompt},
        {"images", json::array({imageBase64})},
        {"format", "json"},
        {"stream", false},
        {"options", {
            {"temperature", kVerificationTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("response") && body["response"].is_string()) {
                return body["response"].get<std::string>();
            }
            std::cerr << "[OllamaVisionClient] Response without 'response' field" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OllamaVisionClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[OllamaVisionClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[OllamaVisionClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        }
    }
    return std::nullopt;
}

} // namespace chronolens::infrastructure
