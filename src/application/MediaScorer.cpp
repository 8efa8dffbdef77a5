/**
 * @file MediaScorer.cpp
 * @brief Implementation of MediaScorer.
 */

#include "application/MediaScorer.hpp"
#include "application/JsonCodec.hpp"
#include "infrastructure/Base64.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace chronolens::application {

using json = nlohmann::json;

namespace {

const char* kVerificationSystemPrompt =
    "Expert at verifying historical image accuracy using visual analysis. Respond ONLY in valid JSON.";

const char* kStyleSystemPrompt =
    "You classify the visual style of images. Respond ONLY in valid JSON.";

const char* kStylePrompt =
    "Analyze this image's visual style. Respond in JSON:\n"
    "{\n"
    "  \"type\": \"photograph\" | \"illustration\" | \"painting\" | \"engraving\" | \"map\" | \"document\",\n"
    "  \"era\": \"modern\" | \"vintage\" | \"historical\" | \"ancient\",\n"
    "  \"colorScheme\": \"color\" | \"black-and-white\" | \"sepia\",\n"
    "  \"composition\": \"portrait\" | \"landscape\" | \"close-up\" | \"wide-shot\",\n"
    "  \"subject\": \"person\" | \"building\" | \"landscape\" | \"event\" | \"artifact\" | \"diagram\"\n"
    "}";

domain::VerificationResult ErrorResult(const std::string& reason) {
    domain::VerificationResult result;
    result.verdict = domain::Verdict::Error;
    result.confidence = 0;
    result.reasoning = reason;
    return result;
}

std::string UrlTail(const std::string& url) {
    return url.size() > 50 ? url.substr(url.size() - 50) : url;
}

} // namespace

MediaScorer::MediaScorer(std::shared_ptr<domain::VisionOracle> oracle,
                         std::shared_ptr<StylePreferences> preferences,
                         domain::SelectionSettings settings)
    : m_oracle(std::move(oracle)), m_preferences(std::move(preferences)), m_settings(settings) {}

std::string MediaScorer::BuildVerificationPrompt(const domain::Candidate& candidate,
                                                 const domain::Event& event,
                                                 const std::string& generatedText) {
    const auto& meta = candidate.metadata;
    std::ostringstream p;
    p << "You are verifying that an image matches a historical event. Be STRICT but FAIR.\n\n"
      << "EVENT:\n"
      << "Year: " << event.year << "\n"
      << "Description: " << event.description << "\n\n"
      << "GENERATED TEXT:\n\"" << generatedText << "\"\n\n"
      << "IMAGE METADATA:\n"
      << "Source: " << candidate.sourceName << "\n"
      << "Search Term Used: " << meta.searchTerm << "\n";
    if (meta.title) p << "Title: " << *meta.title << "\n";
    if (meta.date) p << "Date: " << *meta.date << "\n";
    if (meta.url) p << "URL Fragment: " << UrlTail(*meta.url) << "\n";
    p << "\nANALYZE THE ACTUAL IMAGE:\n"
      << "1. Look at what the image actually shows\n"
      << "2. Check if it matches the person/event/time period described\n"
      << "3. Look for name mismatches\n"
      << "4. Check for anachronisms (modern photos for old events = WRONG)\n"
      << "5. Generic historical photos from the correct era = OK if relevant\n\n"
      << "Respond in JSON:\n"
      << "{\n"
      << "  \"confidence\": 85,\n"
      << "  \"verdict\": \"APPROVED\" | \"QUESTIONABLE\" | \"WRONG\",\n"
      << "  \"reasoning\": \"Specific explanation based on what you SEE in the image\",\n"
      << "  \"visualDescription\": \"Brief description of what the image shows\"\n"
      << "}\n\n"
      << "GUIDELINES:\n"
      << "- APPROVED (70-100): clearly shows the event/person/era, or a relevant photo from the correct period\n"
      << "- QUESTIONABLE (50-69): generic historical image, loosely related\n"
      << "- WRONG (0-49): wrong person, wrong era, modern photo, or unrelated";
    return p.str();
}

domain::VerificationResult MediaScorer::ParseVerification(const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::exception& e) {
        return ErrorResult(std::string("Unparseable oracle response: ") + e.what());
    }
    if (!j.is_object()) {
        return ErrorResult("Oracle response is not a JSON object");
    }

    domain::VerificationResult result;
    result.verdict = domain::VerdictFromString(JsonCodec::StringOr(j, "verdict", "QUESTIONABLE"));
    long long confidence = JsonCodec::IntegerField(j, "confidence").value_or(0);
    result.confidence = static_cast<int>(std::clamp(confidence, 0LL, 100LL));
    result.reasoning = JsonCodec::StringOr(j, "reasoning");
    result.visualDescription = JsonCodec::StringOr(j, "visualDescription");
    return result;
}

domain::StyleProfile MediaScorer::ParseStyle(const std::string& raw) {
    try {
        return JsonCodec::StyleFromJson(json::parse(raw));
    } catch (const json::exception& e) {
        std::cerr << "[MediaScorer] Unparseable style response: " << e.what() << std::endl;
        return domain::StyleProfile{};
    }
}

domain::VerificationResult MediaScorer::verify(const domain::Candidate& candidate,
                                               const domain::Event& event,
                                               const std::string& generatedText) const {
    domain::VerificationResult result;
    try {
        auto response = m_oracle->analyze(kVerificationSystemPrompt,
                                          BuildVerificationPrompt(candidate, event, generatedText),
                                          infrastructure::Base64::Encode(candidate.imageBytes));
        if (!response) {
            result = ErrorResult("Verification service unavailable");
        } else {
            result = ParseVerification(*response);
        }
    } catch (const std::exception& e) {
        result = ErrorResult(std::string("Verification failed: ") + e.what());
    } catch (...) {
        result = ErrorResult("Verification failed: unknown error");
    }

    if (result.verdict == domain::Verdict::Error) {
        std::cerr << "[MediaScorer] " << candidate.sourceName << " verification error: " << result.reasoning << std::endl;
    } else {
        std::cout << "[MediaScorer] " << candidate.sourceName << ": " << domain::VerdictToString(result.verdict)
                  << " (" << result.confidence << "%)" << std::endl;
        if (!result.visualDescription.empty()) {
            std::cout << "[MediaScorer] Visual: " << result.visualDescription << std::endl;
        }
    }
    return result;
}

domain::StyleProfile MediaScorer::style(const domain::Candidate& candidate) const {
    try {
        auto response = m_oracle->analyze(kStyleSystemPrompt, kStylePrompt,
                                          infrastructure::Base64::Encode(candidate.imageBytes));
        if (!response) {
            std::cerr << "[MediaScorer] " << candidate.sourceName << " style analysis unavailable" << std::endl;
            return domain::StyleProfile{};
        }
        return ParseStyle(*response);
    } catch (const std::exception& e) {
        std::cerr << "[MediaScorer] " << candidate.sourceName << " style analysis failed: " << e.what() << std::endl;
        return domain::StyleProfile{};
    } catch (...) {
        std::cerr << "[MediaScorer] " << candidate.sourceName << " style analysis failed: unknown error" << std::endl;
        return domain::StyleProfile{};
    }
}

double MediaScorer::combine(const domain::VerificationResult& verification, const domain::StyleProfile& style) const {
    return m_settings.verificationWeight * verification.confidence + m_settings.styleWeight * style.preferenceScore;
}

domain::ScoredCandidate MediaScorer::score(const domain::Candidate& candidate,
                                           const domain::Event& event,
                                           const std::string& generatedText) const {
    auto verification = std::async(std::launch::async, [&] { return verify(candidate, event, generatedText); });
    auto styleProfile = std::async(std::launch::async, [&] { return style(candidate); });

    domain::ScoredCandidate scored;
    scored.candidate = candidate;
    scored.verification = verification.get();
    scored.style = styleProfile.get();
    scored.style.preferenceScore = m_preferences ? m_preferences->preferenceScore(scored.style) : 50.0;
    scored.combinedScore = combine(scored.verification, scored.style);
    return scored;
}

} // namespace chronolens::application
