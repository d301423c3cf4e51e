#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portfolio_opt/portfolio_opt.hpp"

using namespace portfolio_opt;
using Catch::Approx;

TEST_CASE("Ordinary tax", "[tax]") {
    SECTION("Zero income owes nothing") {
        REQUIRE(ordinary_tax(0.0, FilingStatus::Single) == 0.0);
        REQUIRE(after_tax_income(0.0, 0.0, FilingStatus::HeadOfHousehold) == 0.0);
    }

    SECTION("First bracket only") {
        REQUIRE(ordinary_tax(10000.0, FilingStatus::Single) == Approx(1000.0));
    }

    SECTION("Marginal computation across brackets") {
        // 11600 * 10% + 35550 * 12% + 2850 * 22%
        REQUIRE(ordinary_tax(50000.0, FilingStatus::Single) == Approx(6053.0));
        // 23200 * 10% + 71100 * 12% + 5700 * 22%
        REQUIRE(ordinary_tax(100000.0, FilingStatus::MarriedFilingJointly) == Approx(12106.0));
    }

    SECTION("Top bracket has no limit") {
        REQUIRE(ordinary_tax(1000000.0, FilingStatus::Single) == Approx(328187.75));
    }

    SECTION("Statuses use their own tables") {
        const double single = ordinary_tax(80000.0, FilingStatus::Single);
        const double joint = ordinary_tax(80000.0, FilingStatus::MarriedFilingJointly);
        const double head = ordinary_tax(80000.0, FilingStatus::HeadOfHousehold);
        REQUIRE(joint < head);
        REQUIRE(head < single);
        // Separate filers share the single table below 365600
        REQUIRE(ordinary_tax(300000.0, FilingStatus::MarriedFilingSeparately)
                == Approx(ordinary_tax(300000.0, FilingStatus::Single)));
        REQUIRE(ordinary_tax(500000.0, FilingStatus::MarriedFilingSeparately)
                > ordinary_tax(500000.0, FilingStatus::Single));
    }
}

TEST_CASE("Qualified tax", "[tax]") {
    SECTION("Zero rate below the first threshold") {
        REQUIRE(qualified_tax(20000.0, 0.0, FilingStatus::Single) == 0.0);
    }

    SECTION("Stacked on top of ordinary income") {
        // 7025 at 0%, 12975 at 15%
        REQUIRE(qualified_tax(20000.0, 40000.0, FilingStatus::Single) == Approx(1946.25));
    }

    SECTION("Ordinary income above the 15% threshold pushes every slice up") {
        REQUIRE(qualified_tax(10000.0, 600000.0, FilingStatus::Single) == Approx(2000.0));
    }

    SECTION("Breakdown and after-tax income agree") {
        const TaxBreakdown taxes = tax_breakdown(20000.0, 40000.0, FilingStatus::Single);
        REQUIRE(taxes.ordinary == Approx(4568.0));
        REQUIRE(taxes.qualified == Approx(1946.25));
        REQUIRE(taxes.total() == Approx(6514.25));
        REQUIRE(after_tax_income(20000.0, 40000.0, FilingStatus::Single) == Approx(53485.75));
    }

    SECTION("Qualified income is taxed no more than ordinary income") {
        for (double income : {5000.0, 50000.0, 250000.0}) {
            const double as_qualified = after_tax_income(income, 30000.0, FilingStatus::Single);
            const double as_ordinary = after_tax_income(0.0, 30000.0 + income, FilingStatus::Single);
            REQUIRE(as_qualified >= as_ordinary);
        }
    }
}

TEST_CASE("Tax input errors", "[tax]") {
    SECTION("Negative or non-finite income") {
        REQUIRE_THROWS_AS(ordinary_tax(-1.0, FilingStatus::Single), std::invalid_argument);
        REQUIRE_THROWS_AS(qualified_tax(1.0, -5.0, FilingStatus::Single), std::invalid_argument);
        REQUIRE_THROWS_AS(
            after_tax_income(std::numeric_limits<double>::quiet_NaN(), 0.0, FilingStatus::Single),
            std::invalid_argument
        );
    }

    SECTION("Status outside the enumeration") {
        const auto bogus = static_cast<FilingStatus>(42);
        REQUIRE_THROWS_AS(ordinary_tax(1000.0, bogus), InvalidFilingStatus);
        REQUIRE_THROWS_AS(bracket_table(bogus), ValidationError);
    }

    SECTION("Filing status strings") {
        REQUIRE(parse_filing_status("single") == FilingStatus::Single);
        REQUIRE(parse_filing_status("married_filing_jointly") == FilingStatus::MarriedFilingJointly);
        REQUIRE(parse_filing_status("married_filing_separately") == FilingStatus::MarriedFilingSeparately);
        REQUIRE(parse_filing_status("head_of_household") == FilingStatus::HeadOfHousehold);
        REQUIRE(std::string(to_string(FilingStatus::HeadOfHousehold)) == "head_of_household");

        try {
            (void)parse_filing_status("married-joint");
            FAIL("expected InvalidFilingStatus");
        } catch (const InvalidFilingStatus& e) {
            REQUIRE(e.field() == "filing_status");
        }
    }
}
