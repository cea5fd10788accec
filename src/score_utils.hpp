#ifndef FAKEPROBE_SCORE_UTILS_HPP
#define FAKEPROBE_SCORE_UTILS_HPP

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace fakeprobe {

inline double clipScore(double value, double lo = 0.0, double hi = 100.0) {
    return std::max(lo, std::min(hi, value));
}

inline double meanOf(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Population standard deviation.
inline double stdOf(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double m = meanOf(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - m) * (v - m);
    }
    return std::sqrt(acc / static_cast<double>(values.size()));
}

// Pearson correlation; NaN when either side has no variance.
inline double pearson(const double* a, const double* b, size_t n) {
    if (n < 2) {
        return std::nan("");
    }
    double ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);

    double cov = 0.0, va = 0.0, vb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        cov += (a[i] - ma) * (b[i] - mb);
        va += (a[i] - ma) * (a[i] - ma);
        vb += (b[i] - mb) * (b[i] - mb);
    }
    if (va <= 0.0 || vb <= 0.0) {
        return std::nan("");
    }
    return cov / std::sqrt(va * vb);
}

} // namespace fakeprobe

#endif // FAKEPROBE_SCORE_UTILS_HPP
