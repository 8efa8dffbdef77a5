#include <cassert>
#include <iostream>
#include <string>
#include "application/QualityFilter.hpp"
#include "TestSupport.hpp"

using namespace chronolens;

namespace {

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

void TestAcceptsGoodImage() {
    std::cout << "[Test] Good image passes..." << std::endl;
    application::QualityFilter filter;
    auto bytes = test::MakeNoisePng(900, 700, 7);
    auto report = filter.check(bytes);
    assert(report.passed);
    assert(report.metadata.width == 900);
    assert(report.metadata.height == 700);
    assert(report.metadata.byteSize == bytes.size());
    assert(StartsWith(report.reason, "Quality OK"));
    std::cout << "[PASS] " << report.reason << std::endl;
}

void TestRejectsSmallDimensions() {
    std::cout << "[Test] Small dimensions rejected..." << std::endl;
    application::QualityFilter filter;
    auto report = filter.check(test::MakeNoisePng(640, 480, 1));
    assert(!report.passed);
    assert(StartsWith(report.reason, "Image too small"));
    assert(report.metadata.width == 640 && report.metadata.height == 480);

    domain::QualityThresholds relaxed;
    relaxed.minHeight = 400;
    assert(application::QualityFilter(relaxed).check(test::MakeNoisePng(640, 480, 1)).passed);
    std::cout << "[PASS] " << report.reason << std::endl;
}

void TestRejectsByteSize() {
    std::cout << "[Test] Byte size bounds..." << std::endl;
    application::QualityFilter filter;
    auto flat = filter.check(test::MakeFlatPng(800, 800));
    assert(!flat.passed);
    assert(StartsWith(flat.reason, "File too small"));

    domain::QualityThresholds tight;
    tight.maxBytes = 100 * 1024;
    auto large = application::QualityFilter(tight).check(test::MakeNoisePng(800, 600, 2));
    assert(!large.passed);
    assert(StartsWith(large.reason, "File too large"));
    std::cout << "[PASS] Too small and too large payloads rejected." << std::endl;
}

void TestRejectsExtremeAspect() {
    std::cout << "[Test] Extreme aspect ratio rejected..." << std::endl;
    application::QualityFilter filter;
    auto report = filter.check(test::MakeNoisePng(2000, 600, 3));
    assert(!report.passed);
    assert(StartsWith(report.reason, "Aspect ratio too extreme"));
    assert(filter.check(test::MakeNoisePng(1800, 600, 3)).passed);
    std::cout << "[PASS] " << report.reason << std::endl;
}

void TestRejectsMalformedInput() {
    std::cout << "[Test] Empty and corrupt payloads rejected..." << std::endl;
    application::QualityFilter filter;

    auto empty = filter.check({});
    assert(!empty.passed);
    assert(StartsWith(empty.reason, "quality check failed"));

    domain::ImageBytes garbage(64 * 1024, 0xAB);
    auto corrupt = filter.check(garbage);
    assert(!corrupt.passed);
    assert(StartsWith(corrupt.reason, "quality check failed"));
    assert(corrupt.metadata.width == 0 && corrupt.metadata.height == 0);

    // PNG signature followed by junk.
    domain::ImageBytes badPng = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    badPng.resize(40 * 1024, 0x11);
    assert(!filter.check(badPng).passed);
    std::cout << "[PASS] Malformed input never passes." << std::endl;
}

void TestSizeCheckedBeforeDecode() {
    std::cout << "[Test] Payload size checked before decoding..." << std::endl;
    application::QualityFilter filter;

    domain::ImageBytes oversized(filter.thresholds().maxBytes + 1, 0x5A);
    auto large = filter.check(oversized);
    assert(!large.passed);
    assert(StartsWith(large.reason, "File too large"));
    assert(large.metadata.byteSize == oversized.size());
    assert(large.metadata.width == 0 && large.metadata.height == 0);

    domain::ImageBytes tiny(4 * 1024, 0x5A);
    auto small = filter.check(tiny);
    assert(!small.passed);
    assert(StartsWith(small.reason, "File too small"));
    assert(small.metadata.width == 0 && small.metadata.height == 0);
    std::cout << "[PASS] " << large.reason << " / " << small.reason << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting QualityFilter tests..." << std::endl;
    TestAcceptsGoodImage();
    TestRejectsSmallDimensions();
    TestRejectsByteSize();
    TestRejectsExtremeAspect();
    TestRejectsMalformedInput();
    TestSizeCheckedBeforeDecode();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
