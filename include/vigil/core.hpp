#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "vigil/errors.hpp"

namespace vigil {

/**
 * @brief Dense row-major matrix of doubles.
 *
 * Weights are stored as `rows = fan_in`, `cols = fan_out` so that a layer is
 * evaluated as `output = input · W`. Copying a matrix always copies its
 * storage; snapshots therefore never alias live parameters.
 */
class Matrix {
  public:
    Matrix() = default;
    Matrix(std::size_t rows, std::size_t cols, double value = 0.0)
        : rows_{rows}, cols_{cols}, data_(rows * cols, value) {}
    Matrix(std::size_t rows, std::size_t cols, std::vector<double> data)
        : rows_{rows}, cols_{cols}, data_{std::move(data)} {
        if (data_.size() != rows_ * cols_)
            throw ShapeError("matrix storage does not match " + std::to_string(rows_) + "x" +
                             std::to_string(cols_));
    }

    /** Build a matrix from nested rows; every row must have the same width. */
    static Matrix from_rows(const std::vector<std::vector<double>>& rows) {
        if (rows.empty())
            return Matrix{};
        std::size_t cols = rows.front().size();
        std::vector<double> data;
        data.reserve(rows.size() * cols);
        for (const auto& r : rows) {
            if (r.size() != cols)
                throw ShapeError("ragged matrix rows");
            data.insert(data.end(), r.begin(), r.end());
        }
        return Matrix{rows.size(), cols, std::move(data)};
    }

    std::vector<std::vector<double>> to_rows() const {
        std::vector<std::vector<double>> out(rows_);
        for (std::size_t r = 0; r < rows_; ++r)
            out[r].assign(data_.begin() + static_cast<std::ptrdiff_t>(r * cols_),
                          data_.begin() + static_cast<std::ptrdiff_t>((r + 1) * cols_));
        return out;
    }

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    double& operator()(std::size_t r, std::size_t c) { return data_[r * cols_ + c]; }
    double operator()(std::size_t r, std::size_t c) const { return data_[r * cols_ + c]; }

    const std::vector<double>& data() const { return data_; }
    std::vector<double>& data() { return data_; }

    bool same_shape(const Matrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_;
    }

    bool operator==(const Matrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
    }
    bool operator!=(const Matrix& other) const { return !(*this == other); }

  private:
    std::size_t rows_{0};
    std::size_t cols_{0};
    std::vector<double> data_{};
};

/** Ordered list of per-layer weight matrices. */
using ParameterSet = std::vector<Matrix>;

/** Shape of a dense layer: `rows` inputs feeding `cols` outputs. */
struct LayerShape {
    std::size_t rows{0};
    std::size_t cols{0};

    bool operator==(const LayerShape& o) const { return rows == o.rows && cols == o.cols; }
    bool operator!=(const LayerShape& o) const { return !(*this == o); }
};

inline std::string to_string(const LayerShape& s) {
    return std::to_string(s.rows) + "x" + std::to_string(s.cols);
}

/** Shapes of every matrix in a parameter set. */
inline std::vector<LayerShape> shapes_of(const ParameterSet& params) {
    std::vector<LayerShape> out;
    out.reserve(params.size());
    for (const auto& m : params)
        out.push_back({m.rows(), m.cols()});
    return out;
}

/** Allocate zero matrices matching the given shapes. */
inline ParameterSet zeros_like(const std::vector<LayerShape>& shapes) {
    ParameterSet out;
    out.reserve(shapes.size());
    for (const auto& s : shapes)
        out.emplace_back(s.rows, s.cols, 0.0);
    return out;
}

inline ParameterSet zeros_like(const ParameterSet& params) { return zeros_like(shapes_of(params)); }

/** Total number of scalar parameters. */
inline std::size_t parameter_count(const ParameterSet& params) {
    std::size_t n = 0;
    for (const auto& m : params)
        n += m.size();
    return n;
}

/**
 * Structural clone of a parameter set.
 *
 * Kept as a named operation so call sites that need an independent snapshot
 * say so explicitly. Non-finite values are copied bit for bit.
 */
inline ParameterSet clone_parameters(const ParameterSet& params) {
    ParameterSet out;
    out.reserve(params.size());
    for (const auto& m : params)
        out.emplace_back(m.rows(), m.cols(), m.data());
    return out;
}

/**
 * Validate that a parameter set matches the expected layer shapes.
 *
 * @throws ShapeError naming the first offending layer
 */
inline void require_shapes(const ParameterSet& params, const std::vector<LayerShape>& expected,
                           const char* what) {
    if (params.size() != expected.size())
        throw ShapeError(std::string(what) + " has " + std::to_string(params.size()) +
                         " layers, expected " + std::to_string(expected.size()));
    for (std::size_t i = 0; i < params.size(); ++i) {
        LayerShape got{params[i].rows(), params[i].cols()};
        if (got != expected[i])
            throw ShapeError(std::string(what) + " layer " + std::to_string(i) + " is " +
                             to_string(got) + ", expected " + to_string(expected[i]));
    }
}

/** Counts of non-finite values found in a scan. */
struct NonFiniteCounts {
    std::size_t nan{0};
    std::size_t inf{0};

    NonFiniteCounts& operator+=(const NonFiniteCounts& o) {
        nan += o.nan;
        inf += o.inf;
        return *this;
    }
};

inline NonFiniteCounts count_non_finite(const ParameterSet& params) {
    NonFiniteCounts c;
    for (const auto& m : params)
        for (double v : m.data()) {
            if (std::isnan(v))
                ++c.nan;
            else if (std::isinf(v))
                ++c.inf;
        }
    return c;
}

inline bool all_finite(const ParameterSet& params) {
    auto c = count_non_finite(params);
    return c.nan == 0 && c.inf == 0;
}

/** Auxiliary market context recorded with an experience. */
struct ExperienceMetadata {
    double price{0.0};
    double volume{0.0};
    double volatility{0.0};
    double confidence{0.0};
};

/** Action encoding shared by the buffer and the accuracy metrics. */
enum class Action : int { Hold = 0, Buy = 1, Sell = 2 };

/**
 * @brief One (state, action, reward) training sample.
 *
 * Experiences are produced by the external signal pipeline and owned by the
 * experience buffer once added. `td_error` and `priority` are maintained by
 * the buffer.
 */
struct Experience {
    std::vector<double> state{};
    int action{0};
    double reward{0.0};
    std::optional<std::vector<double>> next_state{};
    std::optional<double> td_error{};
    bool terminal{false};
    double priority{0.0};
    std::int64_t timestamp{0};
    std::string symbol{};
    ExperienceMetadata metadata{};
};

/** OHLCV bar delivered by the market data collaborator. */
struct MarketBar {
    std::string symbol{};
    std::int64_t timestamp{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

} // namespace vigil
