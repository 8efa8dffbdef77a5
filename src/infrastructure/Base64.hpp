/**
 * @file Base64.hpp
 * @brief Base64 encoding for image payloads sent to the vision oracle.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace chronolens::infrastructure {

class Base64 {
public:
    static std::string Encode(const std::vector<std::uint8_t>& data);
};

} // namespace chronolens::infrastructure
