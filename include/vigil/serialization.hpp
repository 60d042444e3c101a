#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vigil/core.hpp"
#include "vigil/errors.hpp"

namespace vigil {

using json = nlohmann::json;

/**
 * Encode a double for JSON output.
 *
 * JSON has no representation for NaN or infinities, so those are written as
 * the strings `"NaN"`, `"Infinity"` and `"-Infinity"`.
 */
inline json encode_number(double v) {
    if (std::isnan(v))
        return "NaN";
    if (std::isinf(v))
        return v > 0 ? "Infinity" : "-Infinity";
    return v;
}

/** Inverse of `encode_number`. */
inline double decode_number(const json& j) {
    if (j.is_number())
        return j.get<double>();
    if (j.is_string()) {
        const auto& s = j.get_ref<const std::string&>();
        if (s == "NaN")
            return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity")
            return std::numeric_limits<double>::infinity();
        if (s == "-Infinity")
            return -std::numeric_limits<double>::infinity();
    }
    throw CheckpointIOError("expected a number, got " + j.dump());
}

inline json encode_numbers(const std::vector<double>& values) {
    json arr = json::array();
    for (double v : values)
        arr.push_back(encode_number(v));
    return arr;
}

inline std::vector<double> decode_numbers(const json& j) {
    if (!j.is_array())
        throw CheckpointIOError("expected an array of numbers");
    std::vector<double> out;
    out.reserve(j.size());
    for (const auto& v : j)
        out.push_back(decode_number(v));
    return out;
}

/** Overwrite `out` with `j[key]` when the key is present. */
template <class T> inline void read_optional(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        out = it->template get<T>();
}

inline void read_optional(const json& j, const char* key, std::optional<std::uint64_t>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return;
    if (it->is_null())
        out.reset();
    else
        out = it->get<std::uint64_t>();
}

inline json optional_to_json(const std::optional<std::uint64_t>& v) {
    return v ? json(*v) : json(nullptr);
}

// Matrices are stored as nested `row -> column` arrays.
inline void to_json(json& j, const Matrix& m) {
    j = json::array();
    for (const auto& row : m.to_rows())
        j.push_back(encode_numbers(row));
}

inline void from_json(const json& j, Matrix& m) {
    if (!j.is_array())
        throw CheckpointIOError("matrix must be an array of rows");
    std::vector<std::vector<double>> rows;
    rows.reserve(j.size());
    for (const auto& r : j)
        rows.push_back(decode_numbers(r));
    try {
        m = Matrix::from_rows(rows);
    } catch (const ShapeError& e) {
        throw CheckpointIOError(e.what());
    }
}

inline void to_json(json& j, const LayerShape& s) { j = json{{"rows", s.rows}, {"cols", s.cols}}; }

inline void from_json(const json& j, LayerShape& s) {
    j.at("rows").get_to(s.rows);
    j.at("cols").get_to(s.cols);
}

} // namespace vigil
