#pragma once

#include <stdexcept>
#include <string>

namespace DiffExpr {

/**
 * @brief Thrown when an input expression table cannot be read or is malformed.
 */
class TableFormatError : public std::runtime_error {
public:
    explicit TableFormatError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown under DegeneratePolicy::FAIL when a gene has a zero or non-finite standard error.
 */
class DegenerateInputError : public std::runtime_error {
public:
    DegenerateInputError(const std::string& gene, const std::string& msg)
        : std::runtime_error(msg), gene_(gene) {}

    const std::string& gene() const { return gene_; }

private:
    std::string gene_;
};

} // namespace DiffExpr
