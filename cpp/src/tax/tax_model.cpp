#include "portfolio_opt/tax/tax_model.hpp"
#include "portfolio_opt/core/errors.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace portfolio_opt {

namespace {

// 2024 federal ordinary income brackets
constexpr std::array<TaxBracket, 7> SINGLE_ORDINARY{{
    {11600.0, 0.10},
    {47150.0, 0.12},
    {100525.0, 0.22},
    {191950.0, 0.24},
    {243725.0, 0.32},
    {609350.0, 0.35},
    {NO_LIMIT, 0.37},
}};

constexpr std::array<TaxBracket, 7> MARRIED_JOINTLY_ORDINARY{{
    {23200.0, 0.10},
    {94300.0, 0.12},
    {201050.0, 0.22},
    {383900.0, 0.24},
    {487450.0, 0.32},
    {731200.0, 0.35},
    {NO_LIMIT, 0.37},
}};

constexpr std::array<TaxBracket, 7> MARRIED_SEPARATELY_ORDINARY{{
    {11600.0, 0.10},
    {47150.0, 0.12},
    {100525.0, 0.22},
    {191950.0, 0.24},
    {243725.0, 0.32},
    {365600.0, 0.35},
    {NO_LIMIT, 0.37},
}};

constexpr std::array<TaxBracket, 7> HEAD_OF_HOUSEHOLD_ORDINARY{{
    {16550.0, 0.10},
    {63100.0, 0.12},
    {100500.0, 0.22},
    {191950.0, 0.24},
    {243700.0, 0.32},
    {609350.0, 0.35},
    {NO_LIMIT, 0.37},
}};

// 2024 qualified dividend / long-term gain brackets
constexpr std::array<TaxBracket, 3> SINGLE_QUALIFIED{{
    {47025.0, 0.0},
    {518900.0, 0.15},
    {NO_LIMIT, 0.20},
}};

constexpr std::array<TaxBracket, 3> MARRIED_JOINTLY_QUALIFIED{{
    {94050.0, 0.0},
    {583750.0, 0.15},
    {NO_LIMIT, 0.20},
}};

constexpr std::array<TaxBracket, 3> MARRIED_SEPARATELY_QUALIFIED{{
    {47025.0, 0.0},
    {291850.0, 0.15},
    {NO_LIMIT, 0.20},
}};

constexpr std::array<TaxBracket, 3> HEAD_OF_HOUSEHOLD_QUALIFIED{{
    {63000.0, 0.0},
    {551350.0, 0.15},
    {NO_LIMIT, 0.20},
}};

const BracketTable SINGLE_TABLE{SINGLE_ORDINARY, SINGLE_QUALIFIED};
const BracketTable MARRIED_JOINTLY_TABLE{MARRIED_JOINTLY_ORDINARY, MARRIED_JOINTLY_QUALIFIED};
const BracketTable MARRIED_SEPARATELY_TABLE{MARRIED_SEPARATELY_ORDINARY, MARRIED_SEPARATELY_QUALIFIED};
const BracketTable HEAD_OF_HOUSEHOLD_TABLE{HEAD_OF_HOUSEHOLD_ORDINARY, HEAD_OF_HOUSEHOLD_QUALIFIED};

void check_income(double income, const char* name) {
    if (!std::isfinite(income) || income < 0.0) {
        throw std::invalid_argument(std::string(name) + " must be a finite non-negative amount");
    }
}

}  // namespace

const BracketTable& bracket_table(FilingStatus status) {
    switch (status) {
        case FilingStatus::Single:
            return SINGLE_TABLE;
        case FilingStatus::MarriedFilingJointly:
            return MARRIED_JOINTLY_TABLE;
        case FilingStatus::MarriedFilingSeparately:
            return MARRIED_SEPARATELY_TABLE;
        case FilingStatus::HeadOfHousehold:
            return HEAD_OF_HOUSEHOLD_TABLE;
    }
    throw InvalidFilingStatus(std::to_string(static_cast<int>(status)));
}

double tax_on_range(double from, double to, std::span<const TaxBracket> brackets) {
    if (to <= from) {
        return 0.0;
    }
    double tax = 0.0;
    double previous = 0.0;
    for (const auto& bracket : brackets) {
        const double overlap = std::min(to, bracket.threshold) - std::max(from, previous);
        if (overlap > 0.0) {
            tax += overlap * bracket.rate;
        }
        previous = bracket.threshold;
        if (previous >= to) {
            break;
        }
    }
    return tax;
}

double ordinary_tax(double ordinary_income, FilingStatus status) {
    check_income(ordinary_income, "ordinary_income");
    return tax_on_range(0.0, ordinary_income, bracket_table(status).ordinary);
}

double qualified_tax(double qualified_income, double ordinary_income, FilingStatus status) {
    check_income(qualified_income, "qualified_income");
    check_income(ordinary_income, "ordinary_income");
    return tax_on_range(
        ordinary_income, ordinary_income + qualified_income, bracket_table(status).qualified
    );
}

TaxBreakdown tax_breakdown(double qualified_income, double ordinary_income, FilingStatus status) {
    TaxBreakdown breakdown;
    breakdown.ordinary = ordinary_tax(ordinary_income, status);
    breakdown.qualified = qualified_tax(qualified_income, ordinary_income, status);
    return breakdown;
}

double after_tax_income(double qualified_income, double ordinary_income, FilingStatus status) {
    const TaxBreakdown taxes = tax_breakdown(qualified_income, ordinary_income, status);
    return (ordinary_income - taxes.ordinary) + (qualified_income - taxes.qualified);
}

}  // namespace portfolio_opt
