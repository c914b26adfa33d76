#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <cctype>

namespace qkdsim {
namespace utils {

std::string Formatter::formatPercent(double fraction, int precision) {
    if (!std::isfinite(fraction)) return "-";
    return formatFixed(fraction * 100.0, precision) + "%";
}

std::string Formatter::formatFixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Formatter::padLeft(const std::string& str, size_t width, char padChar) {
    return str.size() >= width ? str : std::string(width - str.size(), padChar) + str;
}

std::string Formatter::padRight(const std::string& str, size_t width, char padChar) {
    return str.size() >= width ? str : str + std::string(width - str.size(), padChar);
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Formatter::trim(const std::string& str) {
    const char* ws = " \t\n\r";
    size_t start = str.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    return str.substr(start, str.find_last_not_of(ws) - start + 1);
}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers = hdrs;
    columnWidths.assign(headers.size(), 0);
    rightAligned.resize(headers.size(), false);
    for (size_t i = 0; i < headers.size(); i++) {
        columnWidths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
            columnWidths[i] = std::max(columnWidths[i], row[i].size());
        }
    }
}

void TableFormatter::alignRight(size_t column) {
    if (column >= rightAligned.size()) rightAligned.resize(column + 1, false);
    rightAligned[column] = true;
}

void TableFormatter::addRow(const std::vector<std::string>& row) {
    rows.push_back(row);
    for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], row[i].size());
    }
}

std::string TableFormatter::render() const {
    std::ostringstream ss;
    ss << renderSeparator() << renderRow(headers) << renderSeparator();
    for (const auto& row : rows) ss << renderRow(row);
    ss << renderSeparator();
    return ss.str();
}

std::string TableFormatter::renderRow(const std::vector<std::string>& row) const {
    std::ostringstream ss;
    ss << '|';
    for (size_t i = 0; i < columnWidths.size(); i++) {
        std::string cell = i < row.size() ? row[i] : "";
        bool right = i < rightAligned.size() && rightAligned[i];
        ss << ' ' << (right ? Formatter::padLeft(cell, columnWidths[i]) : Formatter::padRight(cell, columnWidths[i]))
           << " |";
    }
    ss << '\n';
    return ss.str();
}

std::string TableFormatter::renderSeparator() const {
    std::string line = "+";
    for (size_t width : columnWidths) line += std::string(width + 2, '-') + '+';
    return line + '\n';
}

}
}
