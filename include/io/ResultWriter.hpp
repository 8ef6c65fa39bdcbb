#pragma once

#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include "core/GeneStatistics.hpp"

namespace DiffExpr {

/**
 * @brief Output options of the comparison table.
 */
struct ResultOutputOptions {
    int precision = std::numeric_limits<double>::max_digits10;  ///< Significant digits, enough to round-trip
    std::string na_token = "NA";                                ///< Written for NaN values
};

/**
 * @brief Writes the comparison result table as CSV.
 *
 * Columns:
 *   gene, mean_a, mean_b, mean_diff, ci_low, ci_high, z_statistic, p_value,
 *   std_error, n_a, n_b, z_test_significant, ci_test_significant
 *
 * Booleans are written as True/False. Rows keep the order of the input vector.
 */
class ResultWriter {
public:
    ResultWriter() = default;
    explicit ResultWriter(const ResultOutputOptions& options) : options_(options) {}

    /**
     * @brief Writes @p results to @p filepath, replacing any existing file.
     * @throws std::runtime_error if the file cannot be opened or written.
     */
    void write_csv(const std::vector<GeneComparison>& results, const std::string& filepath) const;

    void write(const std::vector<GeneComparison>& results, std::ostream& os) const;

    static const std::vector<std::string>& columns();

    const ResultOutputOptions& options() const { return options_; }

private:
    ResultOutputOptions options_;

    void write_value(std::ostream& os, double value) const;
};

/**
 * @brief Reads a table written by ResultWriter back into records.
 *
 * Group variances are not part of the table and are left at 0.
 *
 * @throws std::runtime_error if the file is missing or its header or rows do not match.
 */
std::vector<GeneComparison> read_comparison_table(const std::string& filepath);

} // namespace DiffExpr
