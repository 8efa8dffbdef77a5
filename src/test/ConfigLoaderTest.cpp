#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include "infrastructure/ConfigLoader.hpp"

using namespace chronolens;
using infrastructure::ConfigLoader;

namespace {

bool Throws(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void TestDefaults() {
    std::cout << "[Test] Built-in defaults..." << std::endl;
    auto config = ConfigLoader::Defaults();
    ConfigLoader::Validate(config);
    assert(config.sources.size() == 5);
    assert(config.sources[0].name == "Library of Congress");
    assert(config.sources[0].reliabilityScore == 95);
    assert(config.sources[3].name == "Wikipedia");
    assert(!config.sources[4].enabled);
    assert(config.quality.minWidth == 600 && config.quality.minHeight == 600);
    assert(config.selection.topSourcesCount == 3);
    assert(config.selection.acceptConfidence == 70);

    auto missing = ConfigLoader::Load((std::filesystem::temp_directory_path() / "chronolens-does-not-exist.json").string());
    assert(missing.sources.size() == 5);
    std::cout << "[PASS] Missing file falls back to the default registry." << std::endl;
}

void TestParseOverrides() {
    std::cout << "[Test] Partial configuration..." << std::endl;
    auto config = ConfigLoader::Parse(R"({
        "sources": [
            {"name": "Archive", "host": "localhost", "port": 8088, "path": "/fetch/archive", "timeoutMs": 4000},
            {"name": "Museum", "enabled": false, "priorityRank": 7}
        ],
        "selection": {"acceptConfidence": 75},
        "oracle": {"model": "llava:7b"},
        "storage": {"dataDir": "/var/lib/chronolens"}
    })");
    assert(config.sources.size() == 2);
    assert(config.sources[0].name == "Archive");
    assert(config.sources[0].priorityRank == 1);
    assert(config.sources[0].port == 8088);
    assert(config.sources[0].path == "/fetch/archive");
    assert(config.sources[0].timeoutMs == 4000);
    assert(!config.sources[1].enabled);
    assert(config.sources[1].priorityRank == 7);
    assert(config.selection.acceptConfidence == 75);
    assert(config.selection.topSourcesCount == 3);
    assert(config.oracle.model == "llava:7b");
    assert(config.oracle.port == 11434);
    assert(config.storage.dataDir == "/var/lib/chronolens");

    auto path = std::filesystem::temp_directory_path() / "chronolens-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"quality": {"minWidth": 800}})";
    }
    auto fromFile = ConfigLoader::Load(path.string());
    assert(fromFile.quality.minWidth == 800);
    assert(fromFile.sources.size() == 5);
    std::filesystem::remove(path);
    std::cout << "[PASS] Missing keys keep their defaults." << std::endl;
}

void TestInvalidConfigurations() {
    std::cout << "[Test] Invalid configurations throw..." << std::endl;
    assert(Throws([] { ConfigLoader::Parse("{ not json"); }));
    assert(Throws([] { ConfigLoader::Parse("[]"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"sources": {}})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"sources": []})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"sources": [{"name": "A", "enabled": false}]})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"sources": [{"enabled": true}]})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"sources": [{"name": "A"}, {"name": "A"}]})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"sources": [{"name": "A", "timeoutMs": 0}]})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"quality": {"minHeight": 300}})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"quality": {"minWidth": "wide"}})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"quality": {"minBytes": 10, "maxBytes": 5}})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"selection": {"acceptConfidence": 120}})"); }));
    assert(Throws([] { ConfigLoader::Parse(R"({"optimizer": {"recencyPenalty": 1.5}})"); }));

    // The 600x400 floor itself is allowed.
    auto floor = ConfigLoader::Parse(R"({"quality": {"minHeight": 400}})");
    assert(floor.quality.minHeight == 400);
    std::cout << "[PASS] Malformed or inconsistent settings are rejected." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader tests..." << std::endl;
    TestDefaults();
    TestParseOverrides();
    TestInvalidConfigurations();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
