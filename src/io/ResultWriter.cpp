#include "io/ResultWriter.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <stdexcept>

#include "io/ExpressionTableReader.hpp"

namespace DiffExpr {

namespace {

std::string quote_if_needed(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

double parse_number(const std::string& field, const std::string& na_token, int line_no) {
    if (field == na_token) {
        return NAN;
    }
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        throw std::runtime_error("Result table line " + std::to_string(line_no) + ": bad number '" + field + "'");
    }
    return v;
}

size_t parse_count(const std::string& field, int line_no) {
    const char* begin = field.c_str();
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE || field[0] == '-') {
        throw std::runtime_error("Result table line " + std::to_string(line_no) + ": bad count '" + field + "'");
    }
    return static_cast<size_t>(v);
}

bool parse_bool(const std::string& field, int line_no) {
    if (field == "True") return true;
    if (field == "False") return false;
    throw std::runtime_error("Result table line " + std::to_string(line_no) + ": bad boolean '" + field + "'");
}

/**
 * @brief Reads one CSV record, joining physical lines while a quoted field is open.
 *
 * Trailing '\r' is stripped from every physical line.
 */
bool read_record(std::istream& in, std::string& record, int& line_no) {
    std::string line;
    if (!std::getline(in, line)) {
        return false;
    }
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    record = line;

    const int first_line = line_no;
    while (std::count(record.begin(), record.end(), '"') % 2 != 0) {
        if (!std::getline(in, line)) {
            throw std::runtime_error("Result table line " + std::to_string(first_line) +
                                     ": unterminated quoted field");
        }
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        record += "\n" + line;
    }
    return true;
}

}  // namespace

const std::vector<std::string>& ResultWriter::columns() {
    static const std::vector<std::string> cols = {"gene",        "mean_a",  "mean_b",    "mean_diff",
                                                  "ci_low",      "ci_high", "z_statistic", "p_value",
                                                  "std_error",   "n_a",     "n_b",
                                                  "z_test_significant", "ci_test_significant"};
    return cols;
}

void ResultWriter::write_value(std::ostream& os, double value) const {
    if (std::isnan(value)) {
        os << options_.na_token;
    } else {
        os << value;
    }
}

void ResultWriter::write(const std::vector<GeneComparison>& results, std::ostream& os) const {
    const auto& cols = columns();
    for (size_t i = 0; i < cols.size(); ++i) {
        os << (i > 0 ? "," : "") << cols[i];
    }
    os << "\n";

    os << std::setprecision(options_.precision);
    for (const auto& r : results) {
        os << quote_if_needed(r.gene);
        for (double v : {r.mean_a, r.mean_b, r.mean_diff, r.ci_low, r.ci_high, r.z_statistic, r.p_value,
                         r.std_error}) {
            os << ",";
            write_value(os, v);
        }
        os << "," << r.n_a << "," << r.n_b;
        os << "," << (r.z_test_significant ? "True" : "False");
        os << "," << (r.ci_test_significant ? "True" : "False");
        os << "\n";
    }
}

void ResultWriter::write_csv(const std::vector<GeneComparison>& results, const std::string& filepath) const {
    std::ofstream ofs(filepath);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filepath);
    }

    write(results, ofs);
    ofs.close();

    if (ofs.fail()) {
        throw std::runtime_error("Failed writing result table: " + filepath);
    }
}

std::vector<GeneComparison> read_comparison_table(const std::string& filepath) {
    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open result table: " + filepath);
    }

    const std::string na = ResultOutputOptions().na_token;
    const auto& cols = ResultWriter::columns();

    std::string line;
    int line_no = 0;
    if (!read_record(ifs, line, line_no) || ExpressionTableReader::split_csv_line(line) != cols) {
        throw std::runtime_error("Unexpected result table header in " + filepath);
    }

    std::vector<GeneComparison> results;
    while (read_record(ifs, line, line_no)) {
        if (line.empty()) continue;

        auto fields = ExpressionTableReader::split_csv_line(line);
        if (fields.size() != cols.size()) {
            throw std::runtime_error("Result table line " + std::to_string(line_no) + ": expected " +
                                     std::to_string(cols.size()) + " fields");
        }

        GeneComparison r;
        r.gene = fields[0];
        r.mean_a = parse_number(fields[1], na, line_no);
        r.mean_b = parse_number(fields[2], na, line_no);
        r.mean_diff = parse_number(fields[3], na, line_no);
        r.ci_low = parse_number(fields[4], na, line_no);
        r.ci_high = parse_number(fields[5], na, line_no);
        r.z_statistic = parse_number(fields[6], na, line_no);
        r.p_value = parse_number(fields[7], na, line_no);
        r.std_error = parse_number(fields[8], na, line_no);
        r.n_a = parse_count(fields[9], line_no);
        r.n_b = parse_count(fields[10], line_no);
        r.z_test_significant = parse_bool(fields[11], line_no);
        r.ci_test_significant = parse_bool(fields[12], line_no);
        results.push_back(r);
    }
    return results;
}

} // namespace DiffExpr
