#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>

namespace DiffExpr {

/**
 * @brief Expression values of one cell-type group, Genes x Samples.
 *
 * Rows correspond to genes in the order they appeared in the source table,
 * columns correspond to sampled cells.
 */
class ExpressionMatrix {
public:
    std::string name;                      ///< Label used in log messages (usually the file name)
    std::vector<std::string> gene_ids;     ///< Maps row index to gene identifier
    std::vector<std::string> sample_ids;   ///< Maps column index to cell identifier
    Eigen::MatrixXd values;                ///< Expression values (genes x samples)

    int num_genes() const { return static_cast<int>(gene_ids.size()); }
    int num_samples() const { return static_cast<int>(sample_ids.size()); }
    bool empty() const { return gene_ids.empty(); }

    /**
     * @brief Builds the matrix from gene-major rows.
     *
     * @param genes Gene identifiers, one per row of @p rows.
     * @param samples Sample identifiers, one per value in each row.
     * @param rows Expression values, rows[g][s].
     * @throws TableFormatError on duplicate gene ids or ragged rows.
     */
    void build(const std::vector<std::string>& genes, const std::vector<std::string>& samples,
               const std::vector<std::vector<double>>& rows);

    /**
     * @brief Row index of a gene, or -1 if absent.
     */
    int find_gene(const std::string& gene) const;

    bool has_gene(const std::string& gene) const { return find_gene(gene) >= 0; }

    /**
     * @brief Copy of the samples measured for the gene at @p row.
     */
    std::vector<double> gene_values(int row) const;

    /**
     * @brief Genes of this matrix that also appear in @p other, in this matrix's order.
     */
    std::vector<std::string> shared_genes(const ExpressionMatrix& other) const;

private:
    std::unordered_map<std::string, int> gene_index_;
};

} // namespace DiffExpr
