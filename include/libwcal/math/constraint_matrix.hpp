#pragma once

#include "libwcal/core/types.hpp"

#include <cstddef>
#include <vector>

namespace wcal::math {

// Dense row-major m x n matrix, one row per constraint and one column per
// record. The two products the calibrators need can be sharded by record
// range over num_threads worker threads; shard partials are reduced in a
// fixed order so results do not depend on scheduling.
class ConstraintMatrix {
public:
    ConstraintMatrix(std::size_t rows, std::size_t cols, int num_threads = 1);

    static ConstraintMatrix from_constraints(const std::vector<Constraint>& constraints,
                                             int num_threads = 1);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    int num_threads() const { return num_threads_; }

    double& operator()(std::size_t r, std::size_t c) { return data_[r * cols_ + c]; }
    double operator()(std::size_t r, std::size_t c) const { return data_[r * cols_ + c]; }
    const double* row(std::size_t r) const { return data_.data() + r * cols_; }

    void scale_row(std::size_t r, double factor);

    // out = A x, x has cols() entries.
    void multiply(const std::vector<double>& x, std::vector<double>& out) const;

    // out = A^T lambda, lambda has rows() entries.
    void multiply_transpose(const std::vector<double>& lambda, std::vector<double>& out) const;

private:
    std::size_t rows_;
    std::size_t cols_;
    int num_threads_;
    std::vector<double> data_;

    std::size_t shard_count() const;
};

} // namespace wcal::math
