#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "GeneStatistics.hpp"
#include "Types.hpp"

namespace DiffExpr {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores paths to input/output files and the parameters of the per-gene test.
 * Validated by both CLI11 (basic checks) and internal validate() method (cross-field logic).
 */
struct Config {
    // Input/Output
    std::string first_expressions_path;   ///< Table of the first cell type, group A (Required)
    std::string second_expressions_path;  ///< Table of the second cell type, group B (Required)
    std::string output_path = "expression_comparison_results.csv";  ///< Comparison result table

    // Input tables
    TableLayout layout = TableLayout::GENES_AS_COLUMNS;          ///< Orientation of both input tables
    std::vector<std::string> drop_columns = {"Cell_type"};       ///< Annotation columns that are not genes

    // Test parameters
    double confidence_level = 0.95;                              ///< Level of the difference CI
    double alpha = 0.05;                                         ///< Threshold of the z-test call
    VarianceModel variance_model = VarianceModel::UNPOOLED;      ///< Standard error estimator
    DegeneratePolicy degenerate_policy = DegeneratePolicy::EMIT_NAN;  ///< Zero standard error handling

    int threads = 1;  ///< Number of threads for the per-gene loop

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Optional log file (no colors), empty = console only

    /**
     * @brief Validates configuration logic.
     *
     * Performs checks that CLI11 cannot handle or that apply when the Config is
     * filled programmatically:
     * - Required input paths are set
     * - Confidence level and alpha lie strictly inside (0, 1)
     * - Thread count is positive
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief Test parameters handed to compare_samples().
     */
    TestSettings test_settings() const {
        TestSettings s;
        s.confidence_level = confidence_level;
        s.alpha = alpha;
        s.variance_model = variance_model;
        return s;
    }

    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace DiffExpr
