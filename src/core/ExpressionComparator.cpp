#include "core/ExpressionComparator.hpp"

#include <sstream>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace DiffExpr {

std::vector<GeneComparison> ExpressionComparator::compare(const ExpressionMatrix& first,
                                                          const ExpressionMatrix& second) {
    summary_ = ComparisonSummary();
    summary_.genes_first = first.num_genes();
    summary_.genes_second = second.num_genes();

    const std::vector<std::string> genes = first.shared_genes(second);
    const int n = static_cast<int>(genes.size());
    summary_.genes_compared = n;

    const int only_first = summary_.genes_first - n;
    const int only_second = summary_.genes_second - n;
    if (only_first > 0 || only_second > 0) {
        LOG_WARNING(std::to_string(only_first) + " genes only in " + first.name + ", " + std::to_string(only_second) +
                    " genes only in " + second.name + "; comparing the " + std::to_string(n) + " shared genes");
    }
    if (n == 0) {
        LOG_WARNING("No genes shared between " + first.name + " and " + second.name);
        return {};
    }

    std::vector<GeneComparison> results(n);
    std::vector<std::string> errors(n);

    const int num_threads = config_.num_threads > 0 ? config_.num_threads : 1;

// Each iteration writes only its own slot, so row order does not depend on scheduling
#pragma omp parallel for schedule(dynamic, 64) num_threads(num_threads)
    for (int i = 0; i < n; ++i) {
        try {
            const int row_a = first.find_gene(genes[i]);
            const int row_b = second.find_gene(genes[i]);
            results[i] = compare_samples(genes[i], first.gene_values(row_a), second.gene_values(row_b),
                                         config_.test);
        } catch (const std::exception& e) {
            errors[i] = e.what();
        }
    }

    for (int i = 0; i < n; ++i) {
        if (!errors[i].empty()) {
            throw std::runtime_error("Gene '" + genes[i] + "': " + errors[i]);
        }

        const GeneComparison& r = results[i];
        if (r.degenerate()) {
            summary_.genes_degenerate++;
            if (config_.degenerate_policy == DegeneratePolicy::FAIL) {
                throw DegenerateInputError(r.gene, "Gene '" + r.gene +
                                                       "' has a zero or non-finite standard error; z-statistic is undefined");
            }
            LOG_DEBUG("Gene '" + r.gene + "' is degenerate (standard error " + std::to_string(r.std_error) + ")");
        }
        if (r.z_test_significant) summary_.genes_z_significant++;
        if (r.ci_test_significant) summary_.genes_ci_significant++;
    }

    if (summary_.genes_degenerate > 0) {
        LOG_WARNING(std::to_string(summary_.genes_degenerate) +
                    " genes have a zero or non-finite standard error; z-statistic, p-value and CI reported as NA");
    }

    std::ostringstream ss;
    ss << "Compared " << n << " genes: " << summary_.genes_z_significant << " significant by z-test (alpha="
       << config_.test.alpha << "), " << summary_.genes_ci_significant << " with non-overlapping group CIs";
    LOG_INFO(ss.str());

    return results;
}

} // namespace DiffExpr
