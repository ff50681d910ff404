#pragma once

#include <Eigen/Core>

namespace eigen_util {

// Numerically stable softmax: subtracts the max before exponentiating.
template <typename Array>
auto softmax(const Array& arr);

// sign(x) * log(1 + |x|), elementwise.
template <typename Array>
auto signed_log1p(const Array& arr);

// Divides x by its sum in place. If the sum is less than eps, leaves x unchanged and returns false.
template <typename Vector>
bool normalize(Vector& x, double eps = 1e-8);

// Global L2 norm, accumulated in double precision.
template <typename Vector>
double global_norm(const Vector& x);

}  // namespace eigen_util

#include "inline/util/EigenUtil.inl"
