/// @file grounding_checker.cpp
/// @brief Grounding check implementation

#include "explain/grounding_checker.h"

#include <algorithm>
#include <cmath>
#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_replace.h>

namespace insightx::explain {

namespace {

/// Leading letters mark an identifier such as "Q1" rather than a figure
const std::regex& NumberPattern() {
    static const std::regex pattern(
        R"(([A-Za-z_]*)(\d{1,3}(?:,\d{3})+(?:\.\d+)?|\d+(?:\.\d+)?))");
    return pattern;
}

const std::regex& DatePattern() {
    static const std::regex pattern(R"(\d{4}-\d{2}(?:-\d{2})?(?:[ T]\d{2}:\d{2}(?::\d{2})?)?)");
    return pattern;
}

bool HasDigit(std::string_view text) {
    return std::any_of(text.begin(), text.end(),
                       [](char c) { return absl::ascii_isdigit(static_cast<unsigned char>(c)); });
}

/// A literal that is itself a number ("0", "1") is a figure, not a label
bool IsPlainNumber(std::string_view text) {
    double ignored = 0.0;
    return absl::SimpleAtod(absl::StrReplaceAll(text, {{",", ""}}), &ignored);
}

bool IsWordChar(char c) {
    return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Replace whole-word occurrences of `literal` with a space
void EraseLiteral(std::string_view literal, std::string& text) {
    size_t pos = 0;
    while ((pos = text.find(literal, pos)) != std::string::npos) {
        size_t end = pos + literal.size();
        bool starts_word = pos == 0 || !IsWordChar(text[pos - 1]) || !IsWordChar(literal.front());
        bool ends_word = end == text.size() || !IsWordChar(text[end]) || !IsWordChar(literal.back());
        if (starts_word && ends_word) {
            text.replace(pos, literal.size(), " ");
            ++pos;
        } else {
            pos = end;
        }
    }
}

void AddFilterConstants(const analysis::FilterSet& filters, std::vector<double>& values,
                        std::vector<std::string>& literals) {
    for (const auto& filter : filters) {
        if (filter.min) values.push_back(*filter.min);
        if (filter.max) values.push_back(*filter.max);
        for (const auto& value : filter.values) {
            literals.push_back(value);
        }
        literals.push_back(filter.ToString());
    }
}

}  // namespace

GroundingChecker::GroundingChecker(const analysis::ComputedResult& result,
                                   const analysis::Intent& intent,
                                   const data::DatasetSchema& schema) {
    for (const auto& number : result.numbers) {
        if (number.value) values_.push_back(*number.value);
        const auto& calc = number.calculation;
        if (calc.numerator) values_.push_back(*calc.numerator);
        if (calc.denominator) values_.push_back(*calc.denominator);
        if (calc.numerator && calc.denominator && *calc.denominator != 0.0) {
            values_.push_back(100.0 * *calc.numerator / *calc.denominator);
        }
        values_.push_back(static_cast<double>(calc.sample_size));

        exempt_literals_.push_back(number.label);
        exempt_literals_.push_back(calc.formula);
    }

    const analysis::QueryTrace& trace = result.query_trace;
    exempt_literals_.push_back(trace.formula);
    exempt_literals_.push_back(trace.predicate);
    exempt_literals_.push_back(trace.time_window);

    if (result.series) {
        for (const auto& point : result.series->points) {
            exempt_literals_.push_back(point.x);
            exempt_literals_.push_back(point.group);
        }
        exempt_literals_.push_back(result.series->title);
    }

    AddFilterConstants(intent.filters, values_, exempt_literals_);
    if (intent.segments) {
        AddFilterConstants(intent.segments->a, values_, exempt_literals_);
        AddFilterConstants(intent.segments->b, values_, exempt_literals_);
    }
    if (intent.top_k) {
        values_.push_back(static_cast<double>(*intent.top_k));
    }
    if (intent.time_range) {
        exempt_literals_.push_back(intent.time_range->ToString());
    }

    for (const auto& column : schema.columns()) {
        for (const auto& value : column.permitted_values) {
            exempt_literals_.push_back(value);
        }
    }

    // Only literals that contain digits can hide a figure; longest first so
    // "Failure Rate (25-34)" is removed before "25-34"
    exempt_literals_.erase(
        std::remove_if(exempt_literals_.begin(), exempt_literals_.end(),
                       [](const std::string& literal) {
                           return !HasDigit(literal) || IsPlainNumber(literal);
                       }),
        exempt_literals_.end());
    std::sort(exempt_literals_.begin(), exempt_literals_.end(),
              [](const std::string& a, const std::string& b) {
                  return a.size() != b.size() ? a.size() > b.size() : a < b;
              });
    exempt_literals_.erase(std::unique(exempt_literals_.begin(), exempt_literals_.end()),
                           exempt_literals_.end());
}

std::string GroundingChecker::StripExempt(std::string_view text) const {
    std::string stripped(text);
    for (const auto& literal : exempt_literals_) {
        EraseLiteral(literal, stripped);
    }
    return std::regex_replace(stripped, DatePattern(), " ");
}

bool GroundingChecker::IsGrounded(double token, int decimals) const {
    double tolerance = 0.5 * std::pow(10.0, -decimals) + 1e-9;
    for (double value : values_) {
        if (std::fabs(std::fabs(value) - token) <= tolerance) {
            return true;
        }
    }
    return false;
}

GroundingReport GroundingChecker::Check(std::string_view text) const {
    GroundingReport report;
    std::string stripped = StripExempt(text);

    auto begin = std::sregex_iterator(stripped.begin(), stripped.end(), NumberPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        if (match[1].length() > 0) {
            continue;
        }
        std::string token = match[2].str();
        std::string digits = absl::StrReplaceAll(token, {{",", ""}});

        double value = 0.0;
        if (!absl::SimpleAtod(digits, &value)) {
            continue;
        }
        size_t dot = digits.find('.');
        int decimals = dot == std::string::npos ? 0 : static_cast<int>(digits.size() - dot - 1);

        ++report.tokens_checked;
        if (!IsGrounded(value, decimals)) {
            report.grounded = false;
            if (std::find(report.ungrounded.begin(), report.ungrounded.end(), token) ==
                report.ungrounded.end()) {
                report.ungrounded.push_back(token);
            }
        }
    }
    return report;
}

}  // namespace insightx::explain
