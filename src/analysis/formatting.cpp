/// @file formatting.cpp
/// @brief Display formatting helpers

#include "analysis/formatting.h"

#include <cmath>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace insightx::analysis {

namespace {

/// @brief Insert thousands separators into the integer part of a fixed string
std::string GroupThousands(const std::string& fixed) {
    size_t start = (!fixed.empty() && fixed[0] == '-') ? 1 : 0;
    size_t dot = fixed.find('.');
    size_t int_end = dot == std::string::npos ? fixed.size() : dot;

    std::string out = fixed.substr(0, start);
    size_t digits = int_end - start;
    for (size_t i = 0; i < digits; ++i) {
        out.push_back(fixed[start + i]);
        size_t remaining = digits - i - 1;
        if (remaining > 0 && remaining % 3 == 0) {
            out.push_back(',');
        }
    }
    out.append(fixed, int_end, std::string::npos);
    return out;
}

}  // namespace

double RoundTo(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

std::string FormatNumber(double value, int places) {
    double rounded = RoundTo(value, places);
    if (rounded == 0.0) {
        rounded = 0.0;  // drop negative zero
    }
    return GroupThousands(absl::StrFormat("%.*f", places, rounded));
}

std::string FormatCount(double value) {
    return FormatNumber(value, 0);
}

std::string FormatCurrency(double value) {
    std::string number = FormatNumber(std::fabs(value), 2);
    return RoundTo(value, 2) < 0 ? absl::StrCat("-₹", number) : absl::StrCat("₹", number);
}

std::string FormatPercent(double value, int places) {
    return absl::StrCat(FormatNumber(value, places), "%");
}

std::string FormatPercentagePoints(double value, int places) {
    std::string number = FormatNumber(value, places);
    if (RoundTo(value, places) > 0) {
        return absl::StrCat("+", number, " pp");
    }
    return absl::StrCat(number, " pp");
}

}  // namespace insightx::analysis
