#include <iostream>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/ExpressionComparator.hpp"
#include "io/ExpressionTableReader.hpp"
#include "io/ResultWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    DiffExpr::Utils::ResourceMonitor monitor;

    DiffExpr::Config config;

    int parse_exit_code = 1;
    if (!DiffExpr::Utils::ArgParser::parse(argc, argv, config, &parse_exit_code)) {
        return parse_exit_code;  // 0 after --help
    }

    auto& logger = DiffExpr::Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    try {
        if (!config.log_file.empty()) {
            logger.set_log_file(config.log_file);
        }

        if (!config.validate()) {
            LOG_ERROR("Configuration validation failed.");
            return 1;
        }

        if (config.is_debug()) {
            config.print();
        }

        DiffExpr::Utils::ScopedLogger main_scope("Expression comparison");

        DiffExpr::TableReadOptions read_options;
        read_options.layout = config.layout;
        read_options.drop_columns = config.drop_columns;
        DiffExpr::ExpressionTableReader reader(read_options);

        LOG_INFO("[1] Loading expression tables...");
        DiffExpr::ExpressionMatrix first = reader.read(config.first_expressions_path);
        DiffExpr::ExpressionMatrix second = reader.read(config.second_expressions_path);

        LOG_INFO("[2] Comparing genes...");
        DiffExpr::ComparatorConfig comparator_config;
        comparator_config.test = config.test_settings();
        comparator_config.degenerate_policy = config.degenerate_policy;
        comparator_config.num_threads = config.threads;

        DiffExpr::ExpressionComparator comparator(comparator_config);
        auto results = comparator.compare(first, second);

        LOG_INFO("[3] Writing " + std::to_string(results.size()) + " rows to " + config.output_path);
        DiffExpr::ResultWriter writer;
        writer.write_csv(results, config.output_path);

    } catch (const DiffExpr::DegenerateInputError& e) {
        LOG_ERROR("Degenerate input: " + std::string(e.what()) +
                  " (rerun with --degenerate nan to report NA instead)");
        return 1;
    } catch (const DiffExpr::TableFormatError& e) {
        LOG_ERROR("Input table error: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    LOG_INFO("Finished.");
    if (config.is_debug()) {
        monitor.print_stats("Total Execution");
    }

    return 0;
}
