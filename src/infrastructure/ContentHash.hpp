/**
 * @file ContentHash.hpp
 * @brief Content digests of image payloads.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace chronolens::infrastructure {

class ContentHash {
public:
    /**
     * @brief MD5 of the bytes as 32 lowercase hex digits.
     * @throws std::runtime_error when OpenSSL fails.
     */
    static std::string Md5Hex(const std::vector<std::uint8_t>& data);
};

} // namespace chronolens::infrastructure
