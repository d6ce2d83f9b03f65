#include "libwcal/math/constraint_matrix.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace wcal::math {

namespace {

// Below this many records per shard the thread start-up dominates.
constexpr std::size_t MIN_SHARD = 4096;

template <typename Fn>
void run_sharded(std::size_t n, std::size_t shards, Fn&& fn) {
    if (shards <= 1) {
        fn(std::size_t{0}, std::size_t{0}, n);
        return;
    }
    const std::size_t chunk = (n + shards - 1) / shards;
    std::vector<std::thread> workers;
    workers.reserve(shards);
    for (std::size_t s = 0; s < shards; ++s) {
        const std::size_t begin = std::min(n, s * chunk);
        const std::size_t end = std::min(n, begin + chunk);
        workers.emplace_back([&fn, s, begin, end]() { fn(s, begin, end); });
    }
    for (auto& t : workers) {
        t.join();
    }
}

} // namespace

ConstraintMatrix::ConstraintMatrix(std::size_t rows, std::size_t cols, int num_threads)
    : rows_(rows), cols_(cols), num_threads_(std::max(1, num_threads)), data_(rows * cols, 0.0) {}

ConstraintMatrix ConstraintMatrix::from_constraints(const std::vector<Constraint>& constraints,
                                                    int num_threads) {
    const std::size_t n = constraints.empty() ? 0 : constraints.front().indicator.size();
    ConstraintMatrix A(constraints.size(), n, num_threads);
    for (std::size_t j = 0; j < constraints.size(); ++j) {
        const auto& ind = constraints[j].indicator;
        if (ind.size() != n) {
            throw std::invalid_argument("ConstraintMatrix: constraint '" + constraints[j].variable +
                                        "' has " + std::to_string(ind.size()) +
                                        " indicator entries, expected " + std::to_string(n));
        }
        std::copy(ind.begin(), ind.end(), A.data_.begin() + j * n);
    }
    return A;
}

void ConstraintMatrix::scale_row(std::size_t r, double factor) {
    double* p = data_.data() + r * cols_;
    for (std::size_t i = 0; i < cols_; ++i) {
        p[i] *= factor;
    }
}

std::size_t ConstraintMatrix::shard_count() const {
    const std::size_t by_size = std::max<std::size_t>(1, cols_ / MIN_SHARD);
    return std::min<std::size_t>(static_cast<std::size_t>(num_threads_), by_size);
}

void ConstraintMatrix::multiply(const std::vector<double>& x, std::vector<double>& out) const {
    if (x.size() != cols_) {
        throw std::invalid_argument("ConstraintMatrix::multiply: dimension mismatch");
    }
    const std::size_t shards = shard_count();
    std::vector<double> partial(shards * rows_, 0.0);

    run_sharded(cols_, shards, [&](std::size_t s, std::size_t begin, std::size_t end) {
        double* acc = partial.data() + s * rows_;
        for (std::size_t j = 0; j < rows_; ++j) {
            const double* a = row(j);
            double sum = 0.0;
            for (std::size_t i = begin; i < end; ++i) {
                sum += a[i] * x[i];
            }
            acc[j] = sum;
        }
    });

    out.assign(rows_, 0.0);
    for (std::size_t s = 0; s < shards; ++s) {
        for (std::size_t j = 0; j < rows_; ++j) {
            out[j] += partial[s * rows_ + j];
        }
    }
}

void ConstraintMatrix::multiply_transpose(const std::vector<double>& lambda,
                                          std::vector<double>& out) const {
    if (lambda.size() != rows_) {
        throw std::invalid_argument("ConstraintMatrix::multiply_transpose: dimension mismatch");
    }
    out.assign(cols_, 0.0);
    run_sharded(cols_, shard_count(), [&](std::size_t, std::size_t begin, std::size_t end) {
        for (std::size_t j = 0; j < rows_; ++j) {
            const double lj = lambda[j];
            if (lj == 0.0) {
                continue;
            }
            const double* a = row(j);
            for (std::size_t i = begin; i < end; ++i) {
                out[i] += a[i] * lj;
            }
        }
    });
}

} // namespace wcal::math
