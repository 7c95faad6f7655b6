#pragma once

/// @file formatting.h
/// @brief Display formatting for counts, currency and percentages

#include <string>

namespace insightx::analysis {

/// @brief Round half away from zero to `places` decimals
double RoundTo(double value, int places);

/// @brief "10,000"
std::string FormatCount(double value);

/// @brief "₹1,234.50"; negative values keep the sign before the symbol
std::string FormatCurrency(double value);

/// @brief "3.45%"
std::string FormatPercent(double value, int places = 2);

/// @brief "+0.85 pp" / "-1.20 pp"
std::string FormatPercentagePoints(double value, int places = 2);

/// @brief Plain number with grouping and a fixed number of decimals
std::string FormatNumber(double value, int places);

}  // namespace insightx::analysis
