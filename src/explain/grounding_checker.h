#pragma once

/// @file grounding_checker.h
/// @brief Verifies that generated text only cites computed figures

#include <string>
#include <string_view>
#include <vector>

#include "analysis/computed_result.h"
#include "analysis/intent.h"
#include "data/dataset_schema.h"

namespace insightx::explain {

/// @brief Outcome of a grounding check
struct GroundingReport {
    bool grounded = true;

    /// Numeric tokens with no matching computed value, as written
    std::vector<std::string> ungrounded;

    size_t tokens_checked = 0;
};

/// @brief Grounding check against one ComputedResult
///
/// Every numeric token in the text must match a grounded value within half
/// a unit of the token's last printed decimal place ("3.5" matches 3.45,
/// "3" matches 3.45, "3.3" does not). Grounded values are each number's
/// value, numerator, denominator and sample size, the percentage
/// numerator/denominator, the trace's row counts and the constants the user
/// supplied in the intent. Literal labels, dimension values, formulas and
/// dates are removed before tokenising.
class GroundingChecker {
public:
    GroundingChecker(const analysis::ComputedResult& result,
                     const analysis::Intent& intent,
                     const data::DatasetSchema& schema = data::DatasetSchema::Default());

    GroundingReport Check(std::string_view text) const;

    const std::vector<double>& grounded_values() const { return values_; }

private:
    bool IsGrounded(double token, int decimals) const;
    std::string StripExempt(std::string_view text) const;

    std::vector<double> values_;
    std::vector<std::string> exempt_literals_;
};

}  // namespace insightx::explain
