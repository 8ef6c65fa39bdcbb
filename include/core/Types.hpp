#pragma once

#include <string>

namespace DiffExpr {

/**
 * @brief Orientation of an input expression table.
 *
 * - GENES_AS_COLUMNS: header lists genes, each row is one cell (default)
 * - GENES_AS_ROWS: header lists cells, each row is one gene
 */
enum class TableLayout {
    GENES_AS_COLUMNS,
    GENES_AS_ROWS
};

/**
 * @brief Variance estimator used for the standard error of the mean difference.
 */
enum class VarianceModel {
    UNPOOLED,  ///< s_a^2/n_a + s_b^2/n_b
    POOLED     ///< s_p^2 * (1/n_a + 1/n_b)
};

/**
 * @brief What to do with a gene whose standard error is zero.
 */
enum class DegeneratePolicy {
    EMIT_NAN,  ///< Keep means and difference, set z, p and CI bounds to NaN
    FAIL       ///< Abort the whole run with DegenerateInputError
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed per-gene output
};

inline std::string layout_to_string(TableLayout layout) {
    switch (layout) {
        case TableLayout::GENES_AS_COLUMNS: return "genes-as-columns";
        case TableLayout::GENES_AS_ROWS: return "genes-as-rows";
        default: return "unknown";
    }
}

inline std::string variance_model_to_string(VarianceModel model) {
    switch (model) {
        case VarianceModel::UNPOOLED: return "unpooled";
        case VarianceModel::POOLED: return "pooled";
        default: return "unknown";
    }
}

inline std::string degenerate_policy_to_string(DegeneratePolicy policy) {
    switch (policy) {
        case DegeneratePolicy::EMIT_NAN: return "nan";
        case DegeneratePolicy::FAIL: return "fail";
        default: return "unknown";
    }
}

} // namespace DiffExpr
