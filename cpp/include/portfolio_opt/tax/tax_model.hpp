#pragma once

#include "../core/types.hpp"
#include <limits>
#include <span>

namespace portfolio_opt {

// One marginal bracket: income up to `threshold` (exclusive of lower brackets)
// is taxed at `rate`. The top bracket has an infinite threshold.
struct TaxBracket {
    double threshold;
    double rate;
};

inline constexpr double NO_LIMIT = std::numeric_limits<double>::infinity();

// Immutable bracket data for one filing status
struct BracketTable {
    std::span<const TaxBracket> ordinary;
    std::span<const TaxBracket> qualified;
};

// Lookup of the process-wide table; throws InvalidFilingStatus for
// values outside the enumeration.
[[nodiscard]] const BracketTable& bracket_table(FilingStatus status);

// Tax owed on the income slice [from, to) under a marginal bracket schedule
[[nodiscard]] double tax_on_range(double from, double to, std::span<const TaxBracket> brackets);

// Progressive tax on ordinary income (salary + non-qualified dividends)
[[nodiscard]] double ordinary_tax(double ordinary_income, FilingStatus status);

// Qualified dividends stacked on top of ordinary income, taxed at the
// qualified rate of the bracket each slice falls in.
[[nodiscard]] double qualified_tax(double qualified_income, double ordinary_income, FilingStatus status);

struct TaxBreakdown {
    double ordinary{0.0};
    double qualified{0.0};

    [[nodiscard]] double total() const { return ordinary + qualified; }
};

[[nodiscard]] TaxBreakdown tax_breakdown(double qualified_income, double ordinary_income, FilingStatus status);

// Sum of post-tax qualified and ordinary income
[[nodiscard]] double after_tax_income(double qualified_income, double ordinary_income, FilingStatus status);

}  // namespace portfolio_opt
