#include "VectorMath.hpp"
#include <cmath>

namespace {

template <typename T>
double cosine(const std::vector<T>& a, const std::vector<T>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        dot_product += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

} // namespace

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    return cosine(a, b);
}

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    return cosine(a, b);
}

