#pragma once
// VectorMath.hpp
// Dense-vector helpers shared by the collaborative and content filters.

#include <vector>

// Cosine similarity: dot(a, b) / (|a| * |b|).
// Returns 0.0 when either vector has zero norm or the sizes differ.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);
