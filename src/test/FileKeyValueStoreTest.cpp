#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "application/EngagementStore.hpp"
#include "application/ResultCache.hpp"
#include "infrastructure/FileKeyValueStore.hpp"

using namespace chronolens;
namespace fs = std::filesystem;

namespace {

void TestBasicOperations(const fs::path& root) {
    std::cout << "[Test] get/set/list/remove..." << std::endl;
    infrastructure::FileKeyValueStore store((root / "nested" / "data").string());

    assert(!store.get("image-cache"));
    assert(store.list().empty());

    assert(store.set("image-cache", "{\"a\": 1}"));
    assert(store.set("image-engagement", "{\"posts\": []}"));
    assert(store.get("image-cache") == std::string("{\"a\": 1}"));

    assert(store.set("image-cache", "{}"));
    assert(store.get("image-cache") == std::string("{}"));

    auto keys = store.list();
    std::sort(keys.begin(), keys.end());
    assert((keys == std::vector<std::string>{"image-cache", "image-engagement"}));

    assert(store.remove("image-cache"));
    assert(!store.get("image-cache"));
    assert(store.list().size() == 1);

    for (const auto& entry : fs::directory_iterator(root / "nested" / "data")) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] One JSON file per key, no temp files left behind." << std::endl;
}

void TestStatePersistsAcrossInstances(const fs::path& root) {
    std::cout << "[Test] Cache and engagement survive a restart..." << std::endl;
    domain::Event apollo{1969, "Apollo 11 moon landing astronauts"};
    {
        auto store = std::make_shared<infrastructure::FileKeyValueStore>((root / "state").string());
        application::ResultCache cache(store);
        application::EngagementStore engagement(store);

        domain::SelectionInfo info;
        info.source = "Wikipedia";
        info.confidence = 88;
        info.url = "https://example.org/apollo.jpg";
        cache.store(apollo, info);
        engagement.trackSelection("sel-1", "Wikipedia", 88, domain::Verdict::Approved, {});
    }

    auto store = std::make_shared<infrastructure::FileKeyValueStore>((root / "state").string());
    application::ResultCache cache(store);
    application::EngagementStore engagement(store);
    auto entry = cache.peek(apollo);
    assert(entry);
    assert(entry->source == "Wikipedia");
    assert(entry->url == std::string("https://example.org/apollo.jpg"));
    assert(engagement.records().size() == 1);
    assert(engagement.recordEngagement("sel-1", {3, 1, 0, 40}));
    std::cout << "[PASS] Documents reload from disk." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FileKeyValueStore tests..." << std::endl;
    fs::path root = fs::temp_directory_path() / "chronolens_kv_test";
    fs::remove_all(root);

    TestBasicOperations(root);
    TestStatePersistsAcrossInstances(root);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
