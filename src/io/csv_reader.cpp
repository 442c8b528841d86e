#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace investcalc {

CsvReader::CsvReader(std::istream& is, char delimiter, char comment)
    : is_(is), delimiter_(delimiter), comment_(comment), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    while (std::getline(is_, line)) {
        ++line_number_;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == comment_) {
            continue;
        }

        std::stringstream ss(trimmed);
        std::string cell;
        while (std::getline(ss, cell, delimiter_)) {
            row.push_back(trim(cell));
        }
        break;
    }

    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

size_t CsvReader::column_index(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        throw std::runtime_error("CSV header is missing column: " + name);
    }
    return static_cast<size_t>(it - header.begin());
}

double CsvReader::parse_double(const std::string& cell) const {
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid number '" + cell + "' on line " + std::to_string(line_number_));
    }
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace investcalc
