/**
 * @file Event.hpp
 * @brief The historical fact an image is selected for.
 */

#pragma once
#include <string>

namespace chronolens::domain {

/**
 * @struct Event
 * @brief A dated historical event supplied by the caller. Treated as immutable.
 */
struct Event {
    int year = 0;
    std::string description;
};

} // namespace chronolens::domain
