#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/ExpressionMatrix.hpp"
#include "core/Types.hpp"

namespace DiffExpr {

/**
 * @brief How an expression CSV is laid out.
 */
struct TableReadOptions {
    TableLayout layout = TableLayout::GENES_AS_COLUMNS;
    std::vector<std::string> drop_columns = {"Cell_type"};  ///< Non-gene annotation columns (or rows)
};

/**
 * @brief Loads one cell-type group from a CSV table.
 *
 * The first field of every line is an index (cell id, or gene id when genes
 * are rows) and the header line names the remaining columns:
 *
 * ```
 * ,Cell_type,GeneA,GeneB      <- genes as columns (default)
 * cell_1,B,0.0,1.3
 * cell_2,B,2.1,0.7
 * ```
 *
 * Every value has to be a finite number; anything else throws TableFormatError
 * with the file name and line number.
 */
class ExpressionTableReader {
public:
    explicit ExpressionTableReader(const TableReadOptions& options = TableReadOptions()) : options_(options) {}

    /**
     * @brief Reads @p path into an ExpressionMatrix named after the file.
     * @throws TableFormatError if the file is missing, unreadable or malformed.
     */
    ExpressionMatrix read(const std::string& path) const;

    /**
     * @brief Parses an already opened stream; @p name is used in error messages.
     */
    ExpressionMatrix parse(std::istream& in, const std::string& name) const;

    const TableReadOptions& options() const { return options_; }

    /**
     * @brief Splits one CSV line, honoring double-quoted fields ("" is a literal quote).
     */
    static std::vector<std::string> split_csv_line(const std::string& line);

private:
    TableReadOptions options_;

    bool is_dropped(const std::string& id) const;
};

} // namespace DiffExpr
