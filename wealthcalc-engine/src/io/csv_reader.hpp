#ifndef WEALTHCALC_IO_CSV_READER_HPP
#define WEALTHCALC_IO_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace wealthcalc {

// Minimal CSV tokenizer for asset class files.
// Supports double-quoted cells ("Private, Credit") and skips lines starting with '#'.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-comment row, cells trimmed. Empty vector at end of input.
    std::vector<std::string> read_row();
    bool has_more();

private:
    std::istream& is_;
    char delimiter_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace wealthcalc

#endif // WEALTHCALC_IO_CSV_READER_HPP
