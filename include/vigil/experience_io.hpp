#pragma once

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vigil/core.hpp"
#include "vigil/errors.hpp"

namespace vigil {

inline std::string trim_ws(std::string_view s) {
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

/**
 * Split one CSV line into numbers.
 *
 * Quoted cells may contain commas. Empty cells are skipped.
 *
 * @throws ConfigError naming the row and column of a bad cell
 */
inline void parse_csv_line(std::string_view line, std::vector<double>& out,
                           std::size_t row = static_cast<std::size_t>(-1)) {
    std::string cell;
    bool in_quotes = false;
    std::size_t col = 1;
    auto throw_err = [&](const char* msg) {
        if (row != static_cast<std::size_t>(-1)) {
            std::ostringstream oss;
            oss << msg << " at row " << row << " column " << col;
            throw ConfigError(oss.str());
        }
        throw ConfigError(msg);
    };
    auto flush = [&]() {
        auto t = trim_ws(cell);
        if (t.empty())
            return;
        std::size_t used = 0;
        double v = 0.0;
        try {
            v = std::stod(t, &used);
        } catch (const std::exception&) {
            throw_err("invalid number in CSV");
        }
        if (used != t.size())
            throw_err("invalid number in CSV");
        out.push_back(v);
    };
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_quotes) {
            flush();
            cell.clear();
            ++col;
        } else {
            cell.push_back(c);
        }
    }
    if (in_quotes)
        throw_err("unterminated quoted field in CSV");
    flush();
}

/**
 * Read experiences from rows of `action,reward,feature...`.
 *
 * Blank lines and lines starting with `#` are ignored. Every row must carry
 * the same number of features.
 */
inline std::vector<Experience> read_experiences_csv(std::istream& in) {
    std::vector<Experience> out;
    std::string line;
    std::size_t row = 0;
    std::size_t width = 0;
    std::vector<double> values;
    while (std::getline(in, line)) {
        ++row;
        auto t = trim_ws(line);
        if (t.empty() || t.front() == '#')
            continue;
        values.clear();
        parse_csv_line(t, values, row);
        if (values.size() < 3)
            throw ConfigError("row " + std::to_string(row) +
                              " needs an action, a reward and at least one feature");
        if (width == 0)
            width = values.size();
        else if (values.size() != width)
            throw ConfigError("row " + std::to_string(row) + " has " +
                              std::to_string(values.size()) + " columns, expected " +
                              std::to_string(width));
        double action = values[0];
        if (action != std::floor(action) || action < 0.0 || action > 2.0)
            throw ConfigError("row " + std::to_string(row) + " has invalid action " +
                              std::to_string(action));
        Experience e;
        e.action = static_cast<int>(action);
        e.reward = values[1];
        e.state.assign(values.begin() + 2, values.end());
        e.timestamp = static_cast<std::int64_t>(row);
        out.push_back(std::move(e));
    }
    return out;
}

inline std::vector<Experience> read_experiences_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigError("failed to open " + path);
    return read_experiences_csv(in);
}

} // namespace vigil
