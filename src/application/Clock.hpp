/**
 * @file Clock.hpp
 * @brief Injectable wall clock (milliseconds since the Unix epoch).
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace chronolens::application {

using Clock = std::function<std::int64_t()>;

inline std::int64_t SystemNowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

} // namespace chronolens::application
