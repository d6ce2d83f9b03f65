#include "libwcal/io/microdata_csv.hpp"

#include "libwcal/core/logging.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/tokenizer.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wcal::io {

namespace {

using Tokenizer = boost::tokenizer<boost::escaped_list_separator<char>>;

// Comma-separated fields; double quotes protect commas and a backslash
// escapes a quote inside them.
std::vector<std::string> split_fields(const std::string& line, int line_no) {
    std::vector<std::string> fields;
    try {
        const Tokenizer tokens(line, boost::escaped_list_separator<char>('\\', ',', '"'));
        for (const auto& token : tokens) {
            fields.push_back(boost::algorithm::trim_copy(token));
        }
    } catch (const boost::escaped_list_error& e) {
        std::ostringstream oss;
        oss << "read_microdata_csv: line " << line_no << ": " << e.what();
        throw std::runtime_error(oss.str());
    }
    return fields;
}

bool parse_number(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

std::string quote_if_needed(const std::string& text) {
    if (text.find_first_of(",\"\\") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

void write_number(std::ostream& out, double v) {
    if (std::isfinite(v)) {
        out << v;
    }
}

} // namespace

data::MicrodataTable read_microdata_csv(std::istream& in, const std::string& weight_column) {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> cells;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        boost::algorithm::trim_right(line);
        if (boost::algorithm::trim_copy(line).empty() || line[0] == '#') {
            continue;
        }
        auto fields = split_fields(line, line_no);
        if (header.empty()) {
            header = std::move(fields);
            cells.resize(header.size());
            continue;
        }
        if (fields.size() != header.size()) {
            std::ostringstream oss;
            oss << "read_microdata_csv: line " << line_no << " has " << fields.size()
                << " fields, header has " << header.size();
            throw std::runtime_error(oss.str());
        }
        for (std::size_t c = 0; c < fields.size(); ++c) {
            cells[c].push_back(std::move(fields[c]));
        }
    }
    if (header.empty()) {
        throw std::runtime_error("read_microdata_csv: missing header row");
    }

    std::size_t weight_idx = header.size();
    for (std::size_t c = 0; c < header.size(); ++c) {
        if (header[c] == weight_column) {
            weight_idx = c;
        }
    }
    if (weight_idx == header.size()) {
        throw std::runtime_error("read_microdata_csv: weight column '" + weight_column + "' not found");
    }

    std::vector<double> weights(cells[weight_idx].size());
    for (std::size_t r = 0; r < weights.size(); ++r) {
        if (!parse_number(cells[weight_idx][r], weights[r])) {
            std::ostringstream oss;
            oss << "read_microdata_csv: record " << r + 1 << " has unparseable weight '"
                << cells[weight_idx][r] << "'";
            throw std::runtime_error(oss.str());
        }
    }

    data::MicrodataTable table(std::move(weights), weight_column);
    for (std::size_t c = 0; c < header.size(); ++c) {
        if (c == weight_idx) {
            continue;
        }
        std::vector<double> values(cells[c].size(), std::numeric_limits<double>::quiet_NaN());
        bool numeric = true;
        for (std::size_t r = 0; r < values.size() && numeric; ++r) {
            if (!cells[c][r].empty()) {
                numeric = parse_number(cells[c][r], values[r]);
            }
        }
        if (numeric) {
            table.add_numeric(header[c], std::move(values));
        } else {
            table.add_categorical(header[c], std::move(cells[c]));
        }
    }
    table.place_weight_column(weight_idx);
    wcal::log::logger()->debug("Read {} records with {} columns", table.size(), header.size());
    return table;
}

data::MicrodataTable load_microdata_csv(const std::string& path, const std::string& weight_column) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("load_microdata_csv: cannot open " + path);
    }
    try {
        return read_microdata_csv(file, weight_column);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

void write_microdata_csv(std::ostream& out,
                         const data::MicrodataTable& records,
                         const std::vector<double>& calibrated) {
    if (calibrated.size() != records.size()) {
        throw std::invalid_argument("write_microdata_csv: calibrated weights do not match the record count");
    }
    const auto& columns = records.column_order();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        out << (c ? "," : "") << quote_if_needed(columns[c]);
    }
    out << ",original_weight,weight_adjustment\n";

    out << std::setprecision(17);
    const auto& original = records.weights();
    for (std::size_t r = 0; r < records.size(); ++r) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c) {
                out << ',';
            }
            const auto& name = columns[c];
            if (name == records.weight_column()) {
                write_number(out, calibrated[r]);
            } else if (records.has_numeric(name)) {
                write_number(out, records.numeric(name)[r]);
            } else {
                out << quote_if_needed(records.categorical(name)[r]);
            }
        }
        out << ',';
        write_number(out, original[r]);
        out << ',';
        write_number(out, calibrated[r] / original[r]);
        out << '\n';
    }
}

void save_microdata_csv(const std::string& path,
                        const data::MicrodataTable& records,
                        const std::vector<double>& calibrated) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("save_microdata_csv: cannot open " + path + " for writing");
    }
    write_microdata_csv(file, records, calibrated);
}

} // namespace wcal::io
