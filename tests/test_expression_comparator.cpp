/**
 * @file test_expression_comparator.cpp
 * @brief Tests for comparing two ExpressionMatrix objects gene by gene
 */

#include <gtest/gtest.h>

#include <cmath>
#include <set>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/ExpressionComparator.hpp"
#include "core/ExpressionMatrix.hpp"

using namespace DiffExpr;

namespace {

ExpressionMatrix make_matrix(const std::string& name, const std::vector<std::string>& genes,
                             const std::vector<std::vector<double>>& rows) {
    std::vector<std::string> samples;
    for (size_t s = 0; s < (rows.empty() ? 0 : rows[0].size()); ++s) {
        samples.push_back(name + "_cell" + std::to_string(s));
    }
    ExpressionMatrix m;
    m.name = name;
    m.build(genes, samples, rows);
    return m;
}

}  // namespace

class ExpressionComparatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Group A: 4 genes x 3 cells, Group B: 4 genes x 4 cells
        // Shared: GeneY, GeneX, GeneZ (A order); GeneOnlyA / GeneOnlyB are not
        group_a = make_matrix("a.csv", {"GeneY", "GeneOnlyA", "GeneX", "GeneZ"},
                              {{5.0, 7.0, 6.0},
                               {1.0, 1.0, 2.0},
                               {10.0, 10.0, 10.0},
                               {0.5, 0.7, 0.2}});
        group_b = make_matrix("b.csv", {"GeneZ", "GeneX", "GeneOnlyB", "GeneY"},
                              {{0.4, 0.9, 0.1, 0.3},
                               {10.0, 10.0, 10.0, 10.0},
                               {3.0, 3.0, 3.0, 4.0},
                               {1.0, 2.0, 3.0, 2.0}});
    }

    ExpressionMatrix group_a;
    ExpressionMatrix group_b;
};

TEST_F(ExpressionComparatorTest, OutputCoversExactlyTheSharedGenesInFirstOrder) {
    ExpressionComparator comparator;
    auto results = comparator.compare(group_a, group_b);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].gene, "GeneY");
    EXPECT_EQ(results[1].gene, "GeneX");
    EXPECT_EQ(results[2].gene, "GeneZ");

    std::set<std::string> genes;
    for (const auto& r : results) genes.insert(r.gene);
    EXPECT_EQ(genes.size(), results.size());
    EXPECT_EQ(genes.count("GeneOnlyA"), 0u);
    EXPECT_EQ(genes.count("GeneOnlyB"), 0u);

    const auto& summary = comparator.summary();
    EXPECT_EQ(summary.genes_first, 4);
    EXPECT_EQ(summary.genes_second, 4);
    EXPECT_EQ(summary.genes_compared, 3);
    EXPECT_EQ(summary.genes_degenerate, 1);
}

TEST_F(ExpressionComparatorTest, UsesTheRightRowsOfEachGroup) {
    ExpressionComparator comparator;
    auto results = comparator.compare(group_a, group_b);

    const GeneComparison& y = results[0];
    EXPECT_DOUBLE_EQ(y.mean_a, 6.0);
    EXPECT_DOUBLE_EQ(y.mean_b, 2.0);
    EXPECT_DOUBLE_EQ(y.mean_diff, 4.0);
    EXPECT_EQ(y.n_a, 3u);
    EXPECT_EQ(y.n_b, 4u);
    EXPECT_TRUE(y.z_test_significant);
}

TEST_F(ExpressionComparatorTest, DegenerateGeneReportedAsNaNByDefault) {
    ExpressionComparator comparator;
    auto results = comparator.compare(group_a, group_b);

    const GeneComparison& x = results[1];
    EXPECT_TRUE(x.degenerate());
    EXPECT_DOUBLE_EQ(x.mean_diff, 0.0);
    EXPECT_TRUE(std::isnan(x.z_statistic));
    EXPECT_TRUE(std::isnan(x.p_value));
    EXPECT_TRUE(std::isnan(x.ci_low));
    EXPECT_TRUE(std::isnan(x.ci_high));
}

TEST_F(ExpressionComparatorTest, DegenerateGeneFailsUnderFailPolicy) {
    ComparatorConfig config;
    config.degenerate_policy = DegeneratePolicy::FAIL;
    ExpressionComparator comparator(config);

    try {
        comparator.compare(group_a, group_b);
        FAIL() << "Expected DegenerateInputError";
    } catch (const DegenerateInputError& e) {
        EXPECT_EQ(e.gene(), "GeneX");
    }
}

TEST_F(ExpressionComparatorTest, InvariantsHoldForEveryRecord) {
    ExpressionComparator comparator;
    for (const auto& r : comparator.compare(group_a, group_b)) {
        if (r.degenerate()) continue;
        EXPECT_LE(r.ci_low, r.mean_diff) << r.gene;
        EXPECT_GE(r.ci_high, r.mean_diff) << r.gene;
        EXPECT_GE(r.p_value, 0.0) << r.gene;
        EXPECT_LE(r.p_value, 1.0) << r.gene;
    }
}

TEST_F(ExpressionComparatorTest, SwappedGroupsAreSymmetric) {
    ExpressionComparator comparator;
    auto ab = comparator.compare(group_a, group_b);
    auto ba = comparator.compare(group_b, group_a);

    // Reverse comparison follows group B's gene order
    ASSERT_EQ(ba.size(), 3u);
    EXPECT_EQ(ba[0].gene, "GeneZ");
    EXPECT_EQ(ba[1].gene, "GeneX");
    EXPECT_EQ(ba[2].gene, "GeneY");

    for (const auto& r : ab) {
        const GeneComparison* other = nullptr;
        for (const auto& s : ba) {
            if (s.gene == r.gene) other = &s;
        }
        ASSERT_NE(other, nullptr);
        EXPECT_DOUBLE_EQ(r.mean_diff, -other->mean_diff);
        if (r.degenerate()) {
            EXPECT_TRUE(other->degenerate());
            continue;
        }
        EXPECT_DOUBLE_EQ(r.z_statistic, -other->z_statistic);
        EXPECT_DOUBLE_EQ(r.p_value, other->p_value);
        EXPECT_DOUBLE_EQ(r.ci_high - r.ci_low, other->ci_high - other->ci_low);
    }
}

TEST_F(ExpressionComparatorTest, ThreadCountDoesNotChangeResults) {
    // Enough genes to spread over several chunks
    std::vector<std::string> genes;
    std::vector<std::vector<double>> rows_a;
    std::vector<std::vector<double>> rows_b;
    for (int g = 0; g < 500; ++g) {
        genes.push_back("G" + std::to_string(g));
        rows_a.push_back({g * 0.1, g * 0.2 + 1.0, std::sin(g) + 2.0, 3.0});
        rows_b.push_back({std::cos(g), 0.5, g * 0.01, 1.0, 2.0});
    }
    ExpressionMatrix a = make_matrix("a", genes, rows_a);
    ExpressionMatrix b = make_matrix("b", genes, rows_b);

    ComparatorConfig single;
    ComparatorConfig multi;
    multi.num_threads = 4;

    auto r1 = ExpressionComparator(single).compare(a, b);
    auto r4 = ExpressionComparator(multi).compare(a, b);

    ASSERT_EQ(r1.size(), r4.size());
    for (size_t i = 0; i < r1.size(); ++i) {
        EXPECT_EQ(r1[i].gene, r4[i].gene);
        EXPECT_EQ(r1[i].gene, genes[i]);
        EXPECT_DOUBLE_EQ(r1[i].mean_diff, r4[i].mean_diff);
        EXPECT_DOUBLE_EQ(r1[i].p_value, r4[i].p_value);
    }
}

TEST(ExpressionComparatorEdgeTest, DisjointGenesGiveEmptyTable) {
    ExpressionMatrix a = make_matrix("a", {"G1"}, {{1.0, 2.0}});
    ExpressionMatrix b = make_matrix("b", {"G2"}, {{1.0, 2.0}});

    ExpressionComparator comparator;
    auto results = comparator.compare(a, b);
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(comparator.summary().genes_compared, 0);
}

TEST(ExpressionComparatorEdgeTest, HugeValuesCountAsDegenerate) {
    ExpressionMatrix a = make_matrix("a", {"G1", "G2"}, {{1e308, 1.5e308, 1.2e308}, {5.0, 7.0, 6.0}});
    ExpressionMatrix b = make_matrix("b", {"G1", "G2"}, {{1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}});

    ExpressionComparator comparator;
    auto results = comparator.compare(a, b);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].degenerate());
    EXPECT_TRUE(std::isnan(results[0].ci_high));
    EXPECT_FALSE(results[1].degenerate());
    EXPECT_EQ(comparator.summary().genes_degenerate, 1);

    ComparatorConfig config;
    config.degenerate_policy = DegeneratePolicy::FAIL;
    EXPECT_THROW(ExpressionComparator(config).compare(a, b), DegenerateInputError);
}

TEST(ExpressionMatrixTest, RejectsDuplicateGenes) {
    EXPECT_THROW(make_matrix("dup", {"G1", "G1"}, {{1.0}, {2.0}}), TableFormatError);
}

TEST(ExpressionMatrixTest, RejectsRaggedRows) {
    ExpressionMatrix m;
    EXPECT_THROW(m.build({"G1", "G2"}, {"c1", "c2"}, {{1.0, 2.0}, {3.0}}), TableFormatError);
}

TEST(ExpressionMatrixTest, LookupAndValues) {
    ExpressionMatrix m = make_matrix("m", {"G1", "G2"}, {{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
    EXPECT_EQ(m.num_genes(), 2);
    EXPECT_EQ(m.num_samples(), 3);
    EXPECT_EQ(m.find_gene("G2"), 1);
    EXPECT_EQ(m.find_gene("G3"), -1);
    EXPECT_EQ(m.gene_values(1), (std::vector<double>{4.0, 5.0, 6.0}));
}
