#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include "application/MediaScorer.hpp"
#include "TestSupport.hpp"

using namespace chronolens;
using application::MediaScorer;

namespace {

domain::Candidate MakeCandidate(const domain::ImageBytes& bytes) {
    domain::Candidate candidate;
    candidate.sourceName = "Wikipedia";
    candidate.imageBytes = bytes;
    candidate.metadata.title = "Buzz Aldrin on the Moon";
    candidate.metadata.date = "1969-07-20";
    candidate.metadata.url = "https://upload.example.org/commons/a/a8/Aldrin_Apollo_11_original_scan_full_resolution.jpg";
    candidate.metadata.searchTerm = "Apollo 11 moon landing astronauts";
    return candidate;
}

void TestParseVerification() {
    std::cout << "[Test] Defensive verification parsing..." << std::endl;
    auto ok = MediaScorer::ParseVerification(
        R"({"verdict":"APPROVED","confidence":88,"reasoning":"Lunar surface","visualDescription":"Astronaut"})");
    assert(ok.verdict == domain::Verdict::Approved);
    assert(ok.confidence == 88);
    assert(ok.reasoning == "Lunar surface");
    assert(ok.visualDescription == "Astronaut");

    auto missing = MediaScorer::ParseVerification("{}");
    assert(missing.verdict == domain::Verdict::Questionable);
    assert(missing.confidence == 0);
    assert(missing.reasoning.empty());

    auto odd = MediaScorer::ParseVerification(R"({"verdict":"MAYBE","confidence":"73"})");
    assert(odd.verdict == domain::Verdict::Questionable);
    assert(odd.confidence == 73);

    assert(MediaScorer::ParseVerification(R"({"verdict":"WRONG","confidence":250})").confidence == 100);
    assert(MediaScorer::ParseVerification(R"({"verdict":"WRONG","confidence":-5})").confidence == 0);
    assert(MediaScorer::ParseVerification(R"({"verdict":"APPROVED","confidence":69.6})").confidence == 70);
    assert(MediaScorer::ParseVerification(R"({"verdict":42,"confidence":null})").verdict == domain::Verdict::Questionable);

    auto broken = MediaScorer::ParseVerification("I think this is APPROVED");
    assert(broken.verdict == domain::Verdict::Error);
    assert(broken.confidence == 0);
    assert(!broken.reasoning.empty());
    assert(MediaScorer::ParseVerification("[1,2]").verdict == domain::Verdict::Error);
    std::cout << "[PASS] Defaults applied, malformed answers become ERROR." << std::endl;
}

void TestParseStyle() {
    std::cout << "[Test] Defensive style parsing..." << std::endl;
    auto style = MediaScorer::ParseStyle(R"({"type":"photograph","era":"vintage","colorScheme":"black-and-white"})");
    assert(style.type == "photograph");
    assert(style.era == "vintage");
    assert(style.colorScheme == "black-and-white");
    assert(style.composition == "unknown");
    assert(style.subject == "unknown");

    auto broken = MediaScorer::ParseStyle("not json");
    assert(broken.type == "unknown" && broken.era == "unknown" && broken.colorScheme == "unknown");
    std::cout << "[PASS] Unknown dimensions stay \"unknown\"." << std::endl;
}

void TestOracleFailures() {
    std::cout << "[Test] Oracle transport failures..." << std::endl;
    auto oracle = std::make_shared<test::MockVisionOracle>();
    MediaScorer scorer(oracle, nullptr);
    auto candidate = MakeCandidate(test::MakeNoisePng(640, 640, 5));
    domain::Event event{1969, "Apollo 11 moon landing astronauts"};

    oracle->setUnavailable(true);
    auto unavailable = scorer.verify(candidate, event, "Men walk on the Moon.");
    assert(unavailable.verdict == domain::Verdict::Error);
    assert(unavailable.confidence == 0);
    assert(scorer.style(candidate).type == "unknown");

    oracle->setUnavailable(false);
    oracle->setThrows(true);
    auto thrown = scorer.verify(candidate, event, "Men walk on the Moon.");
    assert(thrown.verdict == domain::Verdict::Error);
    assert(thrown.reasoning.find("connection reset") != std::string::npos);
    assert(scorer.style(candidate).era == "unknown");

    oracle->setThrows(false);
    oracle->setThrowsForeign(true);
    auto scored = scorer.score(candidate, event, "Men walk on the Moon.");
    assert(scored.verification.verdict == domain::Verdict::Error);
    assert(scored.verification.reasoning == "Verification failed: unknown error");
    assert(scored.style.type == "unknown");
    assert(scored.style.preferenceScore == 50.0);
    std::cout << "[PASS] Failures never escape the scorer." << std::endl;
}

void TestPromptAndScore() {
    std::cout << "[Test] Prompt content and combined score..." << std::endl;
    auto oracle = std::make_shared<test::MockVisionOracle>();
    auto bytes = test::MakeNoisePng(640, 640, 6);
    oracle->setVerification(bytes, R"({"verdict":"APPROVED","confidence":90,"reasoning":"ok"})");
    oracle->setStyle(bytes, R"({"type":"photograph","era":"vintage","colorScheme":"black-and-white"})");

    MediaScorer scorer(oracle, nullptr);
    auto candidate = MakeCandidate(bytes);
    domain::Event event{1969, "Apollo 11 moon landing astronauts"};

    auto scored = scorer.score(candidate, event, "Men walk on the Moon.");
    assert(oracle->calls() == 2);
    assert(scored.verification.verdict == domain::Verdict::Approved);
    assert(scored.style.type == "photograph");
    assert(scored.style.preferenceScore == 50.0);
    assert(std::fabs(scored.combinedScore - (0.7 * 90 + 0.3 * 50)) < 1e-9);
    assert(scored.candidate.sourceName == "Wikipedia");

    auto prompt = oracle->lastVerificationPrompt();
    const std::string& url = *candidate.metadata.url;
    assert(prompt.find("Year: 1969") != std::string::npos);
    assert(prompt.find("Apollo 11 moon landing astronauts") != std::string::npos);
    assert(prompt.find("Men walk on the Moon.") != std::string::npos);
    assert(prompt.find("Buzz Aldrin on the Moon") != std::string::npos);
    assert(prompt.find("1969-07-20") != std::string::npos);
    assert(prompt.find(url.substr(url.size() - 50)) != std::string::npos);
    assert(prompt.find(url) == std::string::npos);

    domain::SelectionSettings weights;
    weights.verificationWeight = 1.0;
    weights.styleWeight = 0.0;
    MediaScorer verificationOnly(oracle, nullptr, weights);
    domain::VerificationResult v;
    v.confidence = 77;
    assert(verificationOnly.combine(v, domain::StyleProfile{}) == 77.0);
    std::cout << "[PASS] Verify and style joined into one scored candidate." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MediaScorer tests..." << std::endl;
    TestParseVerification();
    TestParseStyle();
    TestOracleFailures();
    TestPromptAndScore();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
