#pragma once

#include <iterator>

// Compensated (Kahan) summation. The compensation term carries the low-order
// bits lost by each addition, so the error bound does not grow with the
// number of terms. Must not be compiled with -ffast-math, which would let the
// compiler fold the compensation away.
class KahanSum {
public:
    void add(double value) {
        const double y = value - compensation_;
        const double t = sum_ + y;
        compensation_ = (t - sum_) - y;
        sum_ = t;
    }

    KahanSum& operator+=(double value) {
        add(value);
        return *this;
    }

    double sum() const { return sum_; }
    double compensation() const { return compensation_; }

    void reset() {
        sum_ = 0.0;
        compensation_ = 0.0;
    }

private:
    double sum_ = 0.0;
    double compensation_ = 0.0;
};

template <typename Iterator>
double kahan_sum(Iterator first, Iterator last) {
    KahanSum acc;
    for (; first != last; ++first) {
        acc.add(static_cast<double>(*first));
    }
    return acc.sum();
}

template <typename Range>
double kahan_sum(const Range& values) {
    return kahan_sum(std::begin(values), std::end(values));
}
