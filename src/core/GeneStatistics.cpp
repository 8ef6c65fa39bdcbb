#include "core/GeneStatistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

namespace DiffExpr {

GroupSummary summarize(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("summarize: empty sample");
    }

    GroupSummary s;
    s.n = values.size();

    // Two-pass: mean first, then squared deviations
    const double n = static_cast<double>(s.n);
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    if (std::isfinite(sum)) {
        s.mean = sum / n;
    } else {
        // Sum overflowed; scaled terms keep the mean within the range of the values
        s.mean = 0.0;
        for (double v : values) {
            s.mean += v / n;
        }
    }

    auto minmax = std::minmax_element(values.begin(), values.end());
    if (s.n < 2 || *minmax.first == *minmax.second) {
        // Constant sample: rounding in the mean must not leak a tiny variance
        s.mean = s.n < 2 ? values.front() : *minmax.first;
        return s;
    }

    double ss = 0.0;
    for (double v : values) {
        double d = v - s.mean;
        ss += d * d;
    }
    s.sum_sq_dev = ss;
    s.variance = ss / static_cast<double>(s.n - 1);
    return s;
}

double normal_sf(double z) {
    static const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    return boost::math::cdf(boost::math::complement(standard_normal, z));
}

double two_sided_p_value(double z) {
    if (std::isnan(z)) return NAN;
    return std::min(1.0, 2.0 * normal_sf(std::abs(z)));
}

double normal_critical_value(double confidence_level) {
    static const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    return boost::math::quantile(boost::math::complement(standard_normal, (1.0 - confidence_level) / 2.0));
}

double standard_error(const GroupSummary& a, const GroupSummary& b, VarianceModel model) {
    const double n_a = static_cast<double>(a.n);
    const double n_b = static_cast<double>(b.n);

    switch (model) {
        case VarianceModel::POOLED: {
            const double dof = n_a + n_b - 2.0;
            if (dof <= 0.0) return 0.0;
            const double pooled = (a.sum_sq_dev + b.sum_sq_dev) / dof;
            return std::sqrt(pooled * (1.0 / n_a + 1.0 / n_b));
        }
        case VarianceModel::UNPOOLED:
        default:
            return std::sqrt(a.variance / n_a + b.variance / n_b);
    }
}

Interval mean_confidence_interval(const GroupSummary& group, double confidence_level) {
    Interval ci;
    if (group.n < 2) {
        return ci;
    }

    const double sem = std::sqrt(group.variance / static_cast<double>(group.n));
    boost::math::students_t_distribution<double> dist(static_cast<double>(group.n - 1));
    const double t_star = boost::math::quantile(boost::math::complement(dist, (1.0 - confidence_level) / 2.0));

    ci.low = group.mean - t_star * sem;
    ci.high = group.mean + t_star * sem;
    return ci;
}

bool intervals_intersect(const Interval& first, const Interval& second) {
    if (!first.defined() || !second.defined()) {
        return false;
    }
    const double overlap = std::min(first.high, second.high) - std::max(first.low, second.low);
    return overlap >= 0.0;
}

GeneComparison compare_samples(const std::string& gene, const std::vector<double>& a, const std::vector<double>& b,
                               const TestSettings& settings) {
    const GroupSummary sa = summarize(a);
    const GroupSummary sb = summarize(b);

    GeneComparison r;
    r.gene = gene;
    r.n_a = sa.n;
    r.n_b = sb.n;
    r.mean_a = sa.mean;
    r.mean_b = sb.mean;
    r.var_a = sa.variance;
    r.var_b = sb.variance;
    r.mean_diff = sa.mean - sb.mean;
    r.std_error = standard_error(sa, sb, settings.variance_model);

    // Per-group interval call does not need a pooled standard error
    const Interval ci_a = mean_confidence_interval(sa, settings.confidence_level);
    const Interval ci_b = mean_confidence_interval(sb, settings.confidence_level);
    r.ci_test_significant = ci_a.defined() && ci_b.defined() && !intervals_intersect(ci_a, ci_b);

    if (r.degenerate()) {
        return r;
    }

    const double z_star = normal_critical_value(settings.confidence_level);
    r.z_statistic = r.mean_diff / r.std_error;
    r.p_value = two_sided_p_value(r.z_statistic);
    r.ci_low = r.mean_diff - z_star * r.std_error;
    r.ci_high = r.mean_diff + z_star * r.std_error;
    r.z_test_significant = r.p_value < settings.alpha;
    return r;
}

} // namespace DiffExpr
