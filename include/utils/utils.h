#pragma once

#include <string>
#include <vector>

namespace qkdsim {
namespace utils {

class Formatter {
public:
    static std::string formatPercent(double fraction, int precision = 1);
    static std::string formatFixed(double value, int precision = 4);
    static std::string padLeft(const std::string& str, size_t width, char padChar = ' ');
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
};

class TableFormatter {
public:
    void setHeaders(const std::vector<std::string>& hdrs);
    // Numeric columns read better right-aligned.
    void alignRight(size_t column);
    void addRow(const std::vector<std::string>& row);
    std::string render() const;
    size_t rowCount() const { return rows.size(); }

private:
    std::string renderRow(const std::vector<std::string>& row) const;
    std::string renderSeparator() const;

    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
    std::vector<bool> rightAligned;
};

}
}
