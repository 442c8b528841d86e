#ifndef INVESTCALC_CSV_READER_HPP
#define INVESTCALC_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace investcalc {

// Line-oriented CSV reader. Cells are trimmed; blank lines and lines
// starting with the comment character are skipped. Quoted cells are not
// supported.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',', char comment = '#');

    // Next data row, or an empty vector at end of input
    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based line number of the last row returned
    size_t line_number() const { return line_number_; }

    // Index of a header column; throws std::runtime_error if missing
    static size_t column_index(const std::vector<std::string>& header, const std::string& name);

    // std::stod with the offending cell and line in the error message
    double parse_double(const std::string& cell) const;

private:
    std::istream& is_;
    char delimiter_;
    char comment_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace investcalc

#endif // INVESTCALC_CSV_READER_HPP
