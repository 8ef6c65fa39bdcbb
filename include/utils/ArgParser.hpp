#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

#include "core/Config.hpp"

namespace DiffExpr {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @param exit_code If non-null, receives the process exit status when parsing
     *        stops execution: 0 for --help, nonzero for a parse error.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config, int* exit_code = nullptr) {
        CLI::App app{"diffexpr - Per-gene differential expression between two cell types (two-sample z-test)"};

        // Input/Output
        app.add_option("-a,--first-cell-type-expressions", config.first_expressions_path,
                       "CSV table with gene expressions of the first cell type (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-b,--second-cell-type-expressions", config.second_expressions_path,
                       "CSV table with gene expressions of the second cell type (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--save-results-table", config.output_path,
                       "Output table (Default: expression_comparison_results.csv)");

        // Input layout
        bool genes_as_rows = false;
        app.add_flag("--genes-as-rows", genes_as_rows,
                     "Input tables have one gene per row instead of one gene per column");

        app.add_option("--drop-column", config.drop_columns,
                       "Annotation column excluded from the gene set, repeatable (Default: Cell_type)");

        // Test parameters
        app.add_option("--confidence-level", config.confidence_level,
                       "Confidence level of the mean difference interval (Default: 0.95)")
            ->check(CLI::Range(0.5, 0.999999));

        app.add_option("--alpha", config.alpha, "Significance threshold of the z-test call (Default: 0.05)")
            ->check(CLI::Range(1e-12, 0.5));

        std::string variance_str = "unpooled";
        app.add_option("--variance", variance_str, "Standard error estimator: unpooled, pooled (Default: unpooled)")
            ->check(CLI::IsMember({"unpooled", "pooled"}, CLI::ignore_case));

        std::string degenerate_str = "nan";
        app.add_option("--degenerate", degenerate_str,
                       "Genes with zero variance in both groups: nan (report NA), fail (abort) (Default: nan)")
            ->check(CLI::IsMember({"nan", "fail"}, CLI::ignore_case));

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also append log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help (exit code 0) and errors both stop execution
            const int code = app.exit(e);
            if (exit_code) *exit_code = code;
            return false;
        }

        config.layout = genes_as_rows ? TableLayout::GENES_AS_ROWS : TableLayout::GENES_AS_COLUMNS;

        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };
        auto it = log_level_map.find(to_lower(log_level_str));
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        config.variance_model =
            to_lower(variance_str) == "pooled" ? VarianceModel::POOLED : VarianceModel::UNPOOLED;

        config.degenerate_policy =
            to_lower(degenerate_str) == "fail" ? DegeneratePolicy::FAIL : DegeneratePolicy::EMIT_NAN;

        return true;
    }

private:
    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }
};

} // namespace Utils
} // namespace DiffExpr
