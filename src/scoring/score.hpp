#pragma once

#include <string>

namespace optiscan::scoring {

/// Success estimate attached to an opportunity
struct Score {
    double success_probability{0.0};  // [0, 100]
    std::string confidence;           // "low" .. "very high"
    std::string reasoning;
};

}  // namespace optiscan::scoring
