#pragma once

#include <string>
#include <vector>

#include "ExpressionMatrix.hpp"
#include "GeneStatistics.hpp"
#include "Types.hpp"

namespace DiffExpr {

/**
 * @brief Options for comparing two expression matrices.
 */
struct ComparatorConfig {
    TestSettings test;                                            ///< Per-gene test parameters
    DegeneratePolicy degenerate_policy = DegeneratePolicy::EMIT_NAN;
    int num_threads = 1;                                          ///< Threads for the per-gene loop
};

/**
 * @brief Summary of one comparison run.
 */
struct ComparisonSummary {
    int genes_first = 0;         ///< Genes in the first (group A) matrix
    int genes_second = 0;        ///< Genes in the second (group B) matrix
    int genes_compared = 0;      ///< Size of the intersection
    int genes_degenerate = 0;    ///< Genes with zero or non-finite standard error
    int genes_z_significant = 0;
    int genes_ci_significant = 0;
};

/**
 * @brief Runs the per-gene z-test over the genes shared by two groups.
 *
 * Output order is the first matrix's gene order restricted to genes that
 * also occur in the second matrix, independent of the thread count.
 */
class ExpressionComparator {
public:
    explicit ExpressionComparator(const ComparatorConfig& config = ComparatorConfig()) : config_(config) {}

    /**
     * @brief Compares group A (@p first) against group B (@p second).
     *
     * @return One GeneComparison per shared gene.
     * @throws DegenerateInputError under DegeneratePolicy::FAIL if any shared
     *         gene has a zero or non-finite standard error (the first such gene in output order is named).
     */
    std::vector<GeneComparison> compare(const ExpressionMatrix& first, const ExpressionMatrix& second);

    /**
     * @brief Statistics of the last compare() call.
     */
    const ComparisonSummary& summary() const { return summary_; }

    const ComparatorConfig& config() const { return config_; }

private:
    ComparatorConfig config_;
    ComparisonSummary summary_;
};

} // namespace DiffExpr
