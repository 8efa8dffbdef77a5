#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include "application/EngagementStore.hpp"
#include "infrastructure/InMemoryKeyValueStore.hpp"
#include "TestSupport.hpp"

using namespace chronolens;

namespace {

domain::StyleProfile Style(const std::string& type) {
    domain::StyleProfile style;
    style.type = type;
    style.era = "vintage";
    style.colorScheme = "black-and-white";
    style.composition = "wide-shot";
    style.subject = "event";
    return style;
}

void TestTrackAndRecord() {
    std::cout << "[Test] Track selection and record metrics once..." << std::endl;
    auto store = std::make_shared<infrastructure::InMemoryKeyValueStore>();
    test::FakeClock clock;
    application::EngagementStore engagement(store, clock.fn());

    engagement.trackSelection("sel-1", "Wikipedia", 88, domain::Verdict::Approved, Style("photograph"));
    auto records = engagement.records();
    assert(records.size() == 1);
    assert(records[0].sourceName == "Wikipedia");
    assert(records[0].confidence == 88);
    assert(!records[0].hasMetrics());
    assert(records[0].style.type == "photograph");

    clock.advance(60000);
    assert(engagement.recordEngagement("sel-1", {10, 3, 2, 500}));
    records = engagement.records();
    assert(records[0].likes == 10);
    assert(records[0].retweets == 3);
    assert(records[0].replies == 2);
    assert(records[0].impressions == 500);
    assert(records[0].updatedAt == records[0].timestamp + 60000);
    assert(records[0].engagementScore() == 10 + 6 + 3);

    // Second update and unknown ids are ignored.
    assert(!engagement.recordEngagement("sel-1", {99, 99, 99, 99}));
    assert(engagement.records()[0].likes == 10);
    assert(!engagement.recordEngagement("sel-unknown", {1, 1, 1, 1}));
    std::cout << "[PASS] Metrics are set exactly once." << std::endl;
}

void TestFifoRetention() {
    std::cout << "[Test] Log keeps the last 100 records..." << std::endl;
    auto store = std::make_shared<infrastructure::InMemoryKeyValueStore>();
    application::EngagementStore engagement(store);

    for (int i = 0; i < 130; ++i) {
        engagement.trackSelection("sel-" + std::to_string(i), "Source" + std::to_string(i % 4), 80,
                                  domain::Verdict::Approved, Style("photograph"));
    }
    auto records = engagement.records();
    assert(records.size() == application::EngagementStore::kMaxRecords);
    assert(records.front().selectionId == "sel-30");
    assert(records.back().selectionId == "sel-129");
    assert(!engagement.recordEngagement("sel-0", {1, 1, 1, 1}));
    std::cout << "[PASS] Oldest records dropped first." << std::endl;
}

void TestRecentSourcesAndStyles() {
    std::cout << "[Test] Recent sources and styles..." << std::endl;
    auto store = std::make_shared<infrastructure::InMemoryKeyValueStore>();
    application::EngagementStore engagement(store);

    assert(engagement.recentSources().empty());
    const char* sources[] = {"A", "B", "C", "D", "E", "F", "G"};
    for (int i = 0; i < 7; ++i) {
        engagement.trackSelection("sel-" + std::to_string(i), sources[i], 75, domain::Verdict::Approved,
                                  Style(i % 2 == 0 ? "photograph" : "painting"));
    }
    auto recent = engagement.recentSources();
    assert((recent == std::vector<std::string>{"C", "D", "E", "F", "G"}));
    assert(engagement.recentSources(2) == (std::vector<std::string>{"F", "G"}));

    auto styles = engagement.recentStyles(3);
    assert(styles.size() == 3);
    assert(styles[0].type == "photograph" && styles[1].type == "painting" && styles[2].type == "photograph");
    std::cout << "[PASS] Trailing windows in selection order." << std::endl;
}

void TestStatsAndFailures() {
    std::cout << "[Test] Stats and persistence failures..." << std::endl;
    auto store = std::make_shared<infrastructure::InMemoryKeyValueStore>();
    application::EngagementStore engagement(store);

    engagement.trackSelection("a", "Wikipedia", 80, domain::Verdict::Approved, Style("photograph"));
    engagement.trackSelection("b", "Wikipedia", 90, domain::Verdict::Approved, Style("photograph"));
    engagement.trackSelection("c", "Smithsonian", 70, domain::Verdict::Approved, Style("painting"));
    engagement.recordEngagement("a", {4, 2, 2, 100});
    engagement.recordEngagement("b", {6, 0, 0, 100});

    auto stats = engagement.stats();
    assert(stats.totalRecords == 3);
    assert(stats.recordsWithMetrics == 2);
    assert(stats.avgLikes == 5.0);
    assert(stats.avgRetweets == 1.0);
    assert(stats.avgReplies == 1.0);

    store->setFailWrites(true);
    engagement.trackSelection("d", "Wikipedia", 80, domain::Verdict::Approved, Style("photograph"));
    assert(engagement.records().size() == 3);
    assert(!engagement.recordEngagement("c", {1, 1, 1, 1}));

    store->setFailWrites(false);
    store->set("image-engagement", "{\"posts\": 42}");
    assert(engagement.records().empty());
    store->set("image-engagement", "garbage");
    assert(engagement.records().empty());
    std::cout << "[PASS] Failures degrade to an empty or unchanged log." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EngagementStore tests..." << std::endl;
    TestTrackAndRecord();
    TestFifoRetention();
    TestRecentSourcesAndStyles();
    TestStatsAndFailures();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
