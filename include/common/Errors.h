#pragma once

#include <stdexcept>
#include <string>

namespace stratlab {

// Raised when an analytics or lifecycle call receives input that validation
// should already have rejected (caller bug, not a runtime condition).
class ContractViolation : public std::invalid_argument {
public:
    explicit ContractViolation(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace stratlab
