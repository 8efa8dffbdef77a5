/**
 * @file TestSupport.hpp
 * @brief Mocks of the domain ports and synthetic images shared by the test executables.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "domain/ImageSource.hpp"
#include "domain/VisionOracle.hpp"
#include "infrastructure/Base64.hpp"

namespace chronolens::test {

/** @brief Grayscale noise PNG; noise keeps the payload well above the minimum size. */
inline domain::ImageBytes MakeNoisePng(int width, int height, std::uint64_t seed) {
    cv::Mat image(height, width, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(image, cv::RNG::UNIFORM, cv::Scalar(0), cv::Scalar(256));
    std::vector<uchar> encoded;
    cv::imencode(".png", image, encoded);
    return domain::ImageBytes(encoded.begin(), encoded.end());
}

/** @brief Flat-colour PNG; compresses to a few hundred bytes. */
inline domain::ImageBytes MakeFlatPng(int width, int height) {
    cv::Mat image(height, width, CV_8UC1, cv::Scalar(128));
    std::vector<uchar> encoded;
    cv::imencode(".png", image, encoded);
    return domain::ImageBytes(encoded.begin(), encoded.end());
}

/**
 * @class MockImageSource
 * @brief Scripted ImageSource: returns an image, nothing, throws, or stalls.
 *
 * A stall ends after the stall time or on release(). waitIdle() blocks until
 * no fetch is running, so tests can join workers the engine left behind.
 */
class MockImageSource : public domain::ImageSource {
public:
    enum class Mode { Image, Nothing, Throw, Stall };

    MockImageSource(std::string name, domain::ImageBytes bytes, Mode mode = Mode::Image)
        : m_name(std::move(name)), m_bytes(std::move(bytes)), m_mode(mode) {}

    std::string name() const override { return m_name; }

    std::optional<domain::FetchedImage> fetch(const std::string& searchTerm, std::optional<int>) override {
        ++m_calls;
        InFlight inFlight(*this);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastSearchTerm = searchTerm;
        }
        switch (m_mode.load()) {
            case Mode::Nothing:
                return std::nullopt;
            case Mode::Throw:
                throw std::runtime_error(m_name + " is down");
            case Mode::Stall: {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait_for(lock, std::chrono::milliseconds(m_stallMs.load()), [this] { return m_released; });
                break;
            }
            case Mode::Image:
                break;
        }
        domain::FetchedImage image;
        image.bytes = m_bytes;
        image.metadata.title = m_name + " image";
        image.metadata.url = "https://example.org/" + m_name + "/image.png";
        image.metadata.searchTerm = searchTerm;
        return image;
    }

    void setMode(Mode mode) { m_mode = mode; }
    void setStallMs(int ms) { m_stallMs = ms; }
    int calls() const { return m_calls.load(); }
    std::string lastSearchTerm() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastSearchTerm;
    }
    const domain::ImageBytes& bytes() const { return m_bytes; }

    /** @brief Ends current and future stalls immediately. */
    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_released = true;
        }
        m_cv.notify_all();
    }

    void waitIdle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_inFlight == 0; });
    }

private:
    struct InFlight {
        explicit InFlight(MockImageSource& source) : m_source(source) {
            std::lock_guard<std::mutex> lock(m_source.m_mutex);
            ++m_source.m_inFlight;
        }
        ~InFlight() {
            {
                std::lock_guard<std::mutex> lock(m_source.m_mutex);
                --m_source.m_inFlight;
            }
            m_source.m_cv.notify_all();
        }
        MockImageSource& m_source;
    };

    std::string m_name;
    domain::ImageBytes m_bytes;
    std::atomic<Mode> m_mode;
    std::atomic<int> m_stallMs{1500};
    std::atomic<int> m_calls{0};
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_released = false;
    int m_inFlight = 0;
    std::string m_lastSearchTerm;
};

/**
 * @class MockVisionOracle
 * @brief Answers by image: verification and style responses are registered per payload.
 */
class MockVisionOracle : public domain::VisionOracle {
public:
    void setVerification(const domain::ImageBytes& image, std::string response) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_verification[infrastructure::Base64::Encode(image)] = std::move(response);
    }

    void setStyle(const domain::ImageBytes& image, std::string response) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_style[infrastructure::Base64::Encode(image)] = std::move(response);
    }

    void setUnavailable(bool unavailable) { m_unavailable = unavailable; }
    void setThrows(bool throws) { m_throws = throws; }
    /** @brief Throws a value that is not a std::exception. */
    void setThrowsForeign(bool throws) { m_throwsForeign = throws; }

    std::optional<std::string> analyze(const std::string& systemPrompt,
                                       const std::string& userPrompt,
                                       const std::string& imageBase64) override {
        ++m_calls;
        if (m_throws) throw std::runtime_error("connection reset");
        if (m_throwsForeign) throw 42;
        if (m_unavailable) return std::nullopt;

        std::lock_guard<std::mutex> lock(m_mutex);
        const bool isStyle = systemPrompt.find("style") != std::string::npos;
        if (!isStyle) m_lastVerificationPrompt = userPrompt;
        auto& table = isStyle ? m_style : m_verification;
        auto it = table.find(imageBase64);
        if (it == table.end()) {
            return isStyle ? std::string("{}") : std::string(R"({"verdict":"WRONG","confidence":10})");
        }
        return it->second;
    }

    int calls() const { return m_calls.load(); }
    std::string lastVerificationPrompt() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastVerificationPrompt;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_verification;
    std::map<std::string, std::string> m_style;
    std::string m_lastVerificationPrompt;
    std::atomic<bool> m_unavailable{false};
    std::atomic<bool> m_throws{false};
    std::atomic<bool> m_throwsForeign{false};
    std::atomic<int> m_calls{0};
};

/** @brief Manually advanced clock for time-dependent tests. */
struct FakeClock {
    std::shared_ptr<std::atomic<std::int64_t>> now = std::make_shared<std::atomic<std::int64_t>>(1700000000000LL);

    std::function<std::int64_t()> fn() const {
        auto shared = now;
        return [shared]() { return shared->load(); };
    }
    void advance(std::int64_t ms) { *now += ms; }
};

} // namespace chronolens::test
