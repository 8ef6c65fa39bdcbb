#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "Types.hpp"

namespace DiffExpr {

/**
 * @brief Parameters of the per-gene hypothesis test.
 */
struct TestSettings {
    double confidence_level = 0.95;                    ///< Level of all confidence intervals
    double alpha = 0.05;                               ///< Significance threshold for the z-test call
    VarianceModel variance_model = VarianceModel::UNPOOLED;
};

/**
 * @brief Sample size, mean and unbiased variance of one group.
 *
 * A group of size 1, or a group whose values are all identical, has variance 0.
 */
struct GroupSummary {
    size_t n = 0;
    double mean = 0.0;
    double variance = 0.0;
    double sum_sq_dev = 0.0;  ///< Sum of squared deviations from the mean
};

/**
 * @brief Closed interval [low, high]; NaN bounds mean "undefined".
 */
struct Interval {
    double low = NAN;
    double high = NAN;

    bool defined() const { return !std::isnan(low) && !std::isnan(high); }
    double width() const { return high - low; }
};

/**
 * @brief Result of comparing one gene between group A and group B.
 *
 * mean_diff is always A - B. For a degenerate gene (std_error zero or not finite) the
 * z-statistic, p-value and CI bounds are NaN and both calls are false,
 * except ci_test_significant which only depends on the per-group intervals.
 */
struct GeneComparison {
    std::string gene;
    size_t n_a = 0;
    size_t n_b = 0;
    double mean_a = 0.0;
    double mean_b = 0.0;
    double var_a = 0.0;
    double var_b = 0.0;
    double mean_diff = 0.0;
    double std_error = 0.0;
    double ci_low = NAN;
    double ci_high = NAN;
    double z_statistic = NAN;
    double p_value = NAN;
    bool z_test_significant = false;   ///< p_value < alpha
    bool ci_test_significant = false;  ///< Per-group confidence intervals do not overlap

    /// Zero or non-finite standard error, or a difference beyond double range
    bool degenerate() const {
        return !(std_error > 0.0) || !std::isfinite(std_error) || !std::isfinite(mean_diff);
    }
};

/**
 * @brief Mean and unbiased variance (divisor n - 1) of a sample.
 * @throws std::invalid_argument if @p values is empty.
 */
GroupSummary summarize(const std::vector<double>& values);

/**
 * @brief Upper tail of the standard normal distribution, 1 - Phi(z).
 */
double normal_sf(double z);

/**
 * @brief Two-sided p-value of a z-statistic, 2 * (1 - Phi(|z|)).
 */
double two_sided_p_value(double z);

/**
 * @brief Two-sided standard normal critical value, e.g. 1.959964 for 0.95.
 */
double normal_critical_value(double confidence_level);

/**
 * @brief Standard error of m_a - m_b under the given variance model.
 *
 * The pooled model with n_a + n_b - 2 == 0 yields 0.
 */
double standard_error(const GroupSummary& a, const GroupSummary& b, VarianceModel model);

/**
 * @brief Student-t confidence interval of one group's mean.
 *
 * Undefined (NaN bounds) when n < 2.
 */
Interval mean_confidence_interval(const GroupSummary& group, double confidence_level);

/**
 * @brief True if the closed intervals share at least one point.
 *
 * Undefined intervals never intersect.
 */
bool intervals_intersect(const Interval& first, const Interval& second);

/**
 * @brief Two-sample z-test of one gene.
 *
 * Pure function of the two samples and the settings; does not apply any
 * degenerate-input policy, it only reports degenerate() on the result.
 *
 * @param gene Gene identifier copied into the result.
 * @param a Values of group A (non-empty).
 * @param b Values of group B (non-empty).
 * @param settings Confidence level, alpha and variance model.
 */
GeneComparison compare_samples(const std::string& gene, const std::vector<double>& a, const std::vector<double>& b,
                               const TestSettings& settings = TestSettings());

} // namespace DiffExpr
