#include "util/EigenUtil.hpp"

#include <cmath>

namespace eigen_util {

template <typename Array>
auto softmax(const Array& arr) {
  auto normalized_arr = arr.array() - arr.maxCoeff();
  auto z = normalized_arr.exp().eval();
  return (z / z.sum()).matrix().eval();
}

template <typename Array>
auto signed_log1p(const Array& arr) {
  return (arr.array().sign() * arr.array().abs().log1p()).matrix().eval();
}

template <typename Vector>
bool normalize(Vector& x, double eps) {
  double s = x.sum();
  if (s < eps) return false;
  if (s != 1) x /= s;
  return true;
}

template <typename Vector>
double global_norm(const Vector& x) {
  return std::sqrt(x.template cast<double>().squaredNorm());
}

}  // namespace eigen_util
