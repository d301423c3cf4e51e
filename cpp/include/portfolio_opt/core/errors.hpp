#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace portfolio_opt {

// Request rejected before any optimization work; carries the offending field
class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string field, const std::string& message)
        : std::runtime_error(message), field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const { return field_; }

private:
    std::string field_;
};

class InvalidFilingStatus : public ValidationError {
public:
    explicit InvalidFilingStatus(const std::string& value)
        : ValidationError("filing_status", "Unrecognized filing status: " + value) {}
};

// Admission queue at capacity; retryable, no work was done
class OverloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Numeric fault (NaN / overflow) in a computed result; treated as a defect
class InternalFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace portfolio_opt
