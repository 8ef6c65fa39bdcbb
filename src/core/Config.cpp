#include "core/Config.hpp"

#include "utils/Logger.hpp"

namespace DiffExpr {

bool Config::validate() const {
    bool valid = true;

    if (first_expressions_path.empty()) {
        LOG_ERROR("First cell type expression table is required.");
        valid = false;
    }

    if (second_expressions_path.empty()) {
        LOG_ERROR("Second cell type expression table is required.");
        valid = false;
    }

    if (output_path.empty()) {
        LOG_ERROR("Output table path must not be empty.");
        valid = false;
    }

    if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
        LOG_ERROR("confidence_level must be strictly between 0 and 1, got " + std::to_string(confidence_level));
        valid = false;
    }

    if (!(alpha > 0.0 && alpha < 1.0)) {
        LOG_ERROR("alpha must be strictly between 0 and 1, got " + std::to_string(alpha));
        valid = false;
    }

    if (threads <= 0) {
        LOG_ERROR("threads must be positive.");
        valid = false;
    }

    if (!first_expressions_path.empty() && first_expressions_path == output_path) {
        LOG_ERROR("Output table would overwrite the first input table: " + output_path);
        valid = false;
    }

    if (!second_expressions_path.empty() && second_expressions_path == output_path) {
        LOG_ERROR("Output table would overwrite the second input table: " + output_path);
        valid = false;
    }

    return valid;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "First cell type: " << first_expressions_path << std::endl;
    std::cout << "Second cell type: " << second_expressions_path << std::endl;
    std::cout << "Output table: " << output_path << std::endl;
    std::cout << "Layout: " << layout_to_string(layout) << std::endl;
    std::cout << "Dropped columns: ";
    for (size_t i = 0; i < drop_columns.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << drop_columns[i];
    }
    std::cout << (drop_columns.empty() ? "None" : "") << std::endl;
    std::cout << "Confidence level: " << confidence_level << std::endl;
    std::cout << "Alpha: " << alpha << std::endl;
    std::cout << "Variance model: " << variance_model_to_string(variance_model) << std::endl;
    std::cout << "Degenerate genes: " << degenerate_policy_to_string(degenerate_policy) << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

} // namespace DiffExpr
