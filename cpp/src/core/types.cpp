#include "portfolio_opt/core/types.hpp"
#include "portfolio_opt/core/errors.hpp"
#include <stdexcept>
#include <string>

namespace portfolio_opt {

const char* to_string(FilingStatus status) {
    switch (status) {
        case FilingStatus::Single:
            return "single";
        case FilingStatus::MarriedFilingJointly:
            return "married_filing_jointly";
        case FilingStatus::MarriedFilingSeparately:
            return "married_filing_separately";
        case FilingStatus::HeadOfHousehold:
            return "head_of_household";
    }
    throw InvalidFilingStatus(std::to_string(static_cast<int>(status)));
}

FilingStatus parse_filing_status(std::string_view name) {
    if (name == "single") return FilingStatus::Single;
    if (name == "married_filing_jointly") return FilingStatus::MarriedFilingJointly;
    if (name == "married_filing_separately") return FilingStatus::MarriedFilingSeparately;
    if (name == "head_of_household") return FilingStatus::HeadOfHousehold;
    throw InvalidFilingStatus(std::string(name));
}

const char* to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::MaxIterations:
            return "max_iterations";
        case TerminationReason::Stagnation:
            return "stagnation";
        case TerminationReason::DeadlineExceeded:
            return "deadline_exceeded";
        case TerminationReason::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

TerminationReason parse_termination_reason(std::string_view name) {
    if (name == "max_iterations") return TerminationReason::MaxIterations;
    if (name == "stagnation") return TerminationReason::Stagnation;
    if (name == "deadline_exceeded") return TerminationReason::DeadlineExceeded;
    if (name == "cancelled") return TerminationReason::Cancelled;
    throw std::invalid_argument("Unknown termination reason: " + std::string(name));
}

}  // namespace portfolio_opt
