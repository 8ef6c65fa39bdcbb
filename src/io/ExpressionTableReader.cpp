#include "io/ExpressionTableReader.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace DiffExpr {

namespace {

struct CsvLine {
    int line_no;
    std::vector<std::string> fields;
};

std::string where(const std::string& name, int line_no) {
    return name + ":" + std::to_string(line_no);
}

double parse_value(const std::string& field, const std::string& name, int line_no) {
    if (field.empty()) {
        throw TableFormatError(where(name, line_no) + ": missing expression value");
    }

    const char* begin = field.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);

    // Allow surrounding blanks, nothing else. Subnormals are accepted even though
    // strtod reports ERANGE for them; overflow shows up as an infinite result.
    while (*end == ' ' || *end == '\t') ++end;
    if (end == begin || *end != '\0' || !std::isfinite(v)) {
        throw TableFormatError(where(name, line_no) + ": not a finite number: '" + field + "'");
    }
    return v;
}

/**
 * @brief Reads all non-blank lines; the first one is the header.
 */
std::vector<CsvLine> read_lines(std::istream& in, const std::string& name) {
    std::vector<CsvLine> lines;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        lines.push_back({line_no, ExpressionTableReader::split_csv_line(line)});
    }

    if (in.bad()) {
        throw TableFormatError(name + ": read error");
    }
    if (lines.empty()) {
        throw TableFormatError(name + ": empty table");
    }
    return lines;
}

}  // namespace

std::vector<std::string> ExpressionTableReader::split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

bool ExpressionTableReader::is_dropped(const std::string& id) const {
    return std::find(options_.drop_columns.begin(), options_.drop_columns.end(), id) != options_.drop_columns.end();
}

ExpressionMatrix ExpressionTableReader::read(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw TableFormatError("Cannot open expression table: " + path);
    }
    return parse(ifs, std::filesystem::path(path).filename().string());
}

ExpressionMatrix ExpressionTableReader::parse(std::istream& in, const std::string& name) const {
    const std::vector<CsvLine> lines = read_lines(in, name);
    const CsvLine& header = lines.front();
    const size_t width = header.fields.size();

    if (width < 2) {
        throw TableFormatError(where(name, header.line_no) + ": header has no data columns");
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].fields.size() != width) {
            throw TableFormatError(where(name, lines[i].line_no) + ": expected " + std::to_string(width) +
                                   " fields, found " + std::to_string(lines[i].fields.size()));
        }
    }

    std::vector<std::string> genes;
    std::vector<std::string> samples;
    std::vector<std::vector<double>> rows;

    if (options_.layout == TableLayout::GENES_AS_COLUMNS) {
        std::vector<size_t> gene_cols;
        for (size_t c = 1; c < width; ++c) {
            if (is_dropped(header.fields[c])) {
                LOG_DEBUG(name + ": dropping column '" + header.fields[c] + "'");
                continue;
            }
            gene_cols.push_back(c);
            genes.push_back(header.fields[c]);
        }

        rows.assign(genes.size(), std::vector<double>());
        for (auto& row : rows) {
            row.reserve(lines.size() - 1);
        }

        for (size_t i = 1; i < lines.size(); ++i) {
            const CsvLine& line = lines[i];
            samples.push_back(line.fields[0]);
            for (size_t g = 0; g < gene_cols.size(); ++g) {
                rows[g].push_back(parse_value(line.fields[gene_cols[g]], name, line.line_no));
            }
        }
    } else {
        samples.assign(header.fields.begin() + 1, header.fields.end());

        for (size_t i = 1; i < lines.size(); ++i) {
            const CsvLine& line = lines[i];
            if (is_dropped(line.fields[0])) {
                LOG_DEBUG(name + ": dropping row '" + line.fields[0] + "'");
                continue;
            }
            std::vector<double> row;
            row.reserve(width - 1);
            for (size_t c = 1; c < width; ++c) {
                row.push_back(parse_value(line.fields[c], name, line.line_no));
            }
            genes.push_back(line.fields[0]);
            rows.push_back(std::move(row));
        }
    }

    if (genes.empty()) {
        throw TableFormatError(name + ": no genes");
    }
    if (samples.empty()) {
        throw TableFormatError(name + ": no samples");
    }

    ExpressionMatrix matrix;
    matrix.name = name;
    matrix.build(genes, samples, rows);

    LOG_INFO("Loaded " + name + ": " + std::to_string(matrix.num_genes()) + " genes x " +
             std::to_string(matrix.num_samples()) + " cells (" + layout_to_string(options_.layout) + ")");
    return matrix;
}

} // namespace DiffExpr
