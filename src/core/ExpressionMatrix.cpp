#include "core/ExpressionMatrix.hpp"

#include "core/Errors.hpp"

namespace DiffExpr {

void ExpressionMatrix::build(const std::vector<std::string>& genes, const std::vector<std::string>& samples,
                             const std::vector<std::vector<double>>& rows) {
    if (genes.size() != rows.size()) {
        throw TableFormatError(name + ": " + std::to_string(genes.size()) + " gene ids for " +
                               std::to_string(rows.size()) + " rows");
    }

    gene_index_.clear();
    gene_index_.reserve(genes.size());
    for (size_t g = 0; g < genes.size(); ++g) {
        if (!gene_index_.emplace(genes[g], static_cast<int>(g)).second) {
            throw TableFormatError(name + ": duplicate gene identifier '" + genes[g] + "'");
        }
    }

    const int n_genes = static_cast<int>(genes.size());
    const int n_samples = static_cast<int>(samples.size());
    values.resize(n_genes, n_samples);

    for (int g = 0; g < n_genes; ++g) {
        if (static_cast<int>(rows[g].size()) != n_samples) {
            throw TableFormatError(name + ": gene '" + genes[g] + "' has " + std::to_string(rows[g].size()) +
                                   " values, expected " + std::to_string(n_samples));
        }
        for (int s = 0; s < n_samples; ++s) {
            values(g, s) = rows[g][s];
        }
    }

    gene_ids = genes;
    sample_ids = samples;
}

int ExpressionMatrix::find_gene(const std::string& gene) const {
    auto it = gene_index_.find(gene);
    return it == gene_index_.end() ? -1 : it->second;
}

std::vector<double> ExpressionMatrix::gene_values(int row) const {
    std::vector<double> out(static_cast<size_t>(values.cols()));
    for (Eigen::Index s = 0; s < values.cols(); ++s) {
        out[static_cast<size_t>(s)] = values(row, s);
    }
    return out;
}

std::vector<std::string> ExpressionMatrix::shared_genes(const ExpressionMatrix& other) const {
    std::vector<std::string> shared;
    shared.reserve(gene_ids.size());
    for (const auto& gene : gene_ids) {
        if (other.has_gene(gene)) {
            shared.push_back(gene);
        }
    }
    return shared;
}

} // namespace DiffExpr
