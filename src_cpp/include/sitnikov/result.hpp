#pragma once
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "sitnikov/errors.hpp"

namespace sitnikov {

// Trajectory of an integration run: one row per state component,
// one column per iteration (column 0 holds the initial values)
template <typename F>
class Result {
public:
    using Matrix = Eigen::Matrix<F, Eigen::Dynamic, Eigen::Dynamic>;
    using Vector = Eigen::Matrix<F, Eigen::Dynamic, 1>;

    Result() = default;

    // Zero-filled dimension x (steps + 1) matrix
    Result(std::size_t dimension, std::size_t steps)
        : m_(Matrix::Zero(static_cast<Eigen::Index>(dimension), columns(steps))) {}

    // Prepare a matrix for `steps` iterations and put `x` in the first column
    static Result prepare(const std::vector<F>& x, std::size_t steps) {
        Result result(x.size(), steps);
        result.set_state(0, x);
        return result;
    }

    std::size_t dimension() const { return static_cast<std::size_t>(m_.rows()); }
    std::size_t steps() const { return m_.cols() > 0 ? static_cast<std::size_t>(m_.cols()) - 1 : 0; }

    // Column and row indices are checked in every build; an index out of
    // range throws std::out_of_range
    void set_state(std::size_t i, const std::vector<F>& x) {
        check_column(i);
        if (x.size() != dimension()) throw DimensionMismatch(dimension(), x.size());
        m_.col(static_cast<Eigen::Index>(i)) =
            Eigen::Map<const Vector>(x.data(), static_cast<Eigen::Index>(x.size()));
    }

    std::vector<F> state(std::size_t i) const {
        check_column(i);
        std::vector<F> x(dimension());
        Eigen::Map<Vector>(x.data(), static_cast<Eigen::Index>(x.size())) =
            m_.col(static_cast<Eigen::Index>(i));
        return x;
    }

    std::vector<F> initial_values() const { return state(0); }

    // Time series of one state component
    std::vector<F> row(std::size_t j) const {
        check_row(j);
        std::vector<F> series(static_cast<std::size_t>(m_.cols()));
        for (Eigen::Index i = 0; i < m_.cols(); ++i) {
            series[static_cast<std::size_t>(i)] = m_(static_cast<Eigen::Index>(j), i);
        }
        return series;
    }

    F operator()(std::size_t j, std::size_t i) const {
        check_row(j);
        check_column(i);
        return m_(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i));
    }
    F& operator()(std::size_t j, std::size_t i) {
        check_row(j);
        check_column(i);
        return m_(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i));
    }

private:
    static Eigen::Index columns(std::size_t steps) {
        if (steps >= static_cast<std::size_t>(std::numeric_limits<Eigen::Index>::max())) {
            throw std::length_error("too many steps for a result buffer: " + std::to_string(steps));
        }
        return static_cast<Eigen::Index>(steps) + 1;
    }

    void check_column(std::size_t i) const {
        if (i >= static_cast<std::size_t>(m_.cols())) {
            throw std::out_of_range("column " + std::to_string(i) + " is out of range for " +
                                    std::to_string(m_.cols()) + " columns");
        }
    }

    void check_row(std::size_t j) const {
        if (j >= dimension()) {
            throw std::out_of_range("row " + std::to_string(j) + " is out of range for " +
                                    std::to_string(dimension()) + " rows");
        }
    }

    Matrix m_;
};

} // namespace sitnikov
