/**
 * @file dot_product.cpp
 * @brief Level builds of dot_product
 *
 * Plain loops: each level build lets the compiler vectorize them for its own
 * -march / -mcpu. Functions have internal linkage so the builds can be
 * linked side by side.
 */

#include <cstddef>

namespace {

constexpr std::size_t kLanes = 8;

float accumulate(const float (&partial)[kLanes]) {
  float sum = 0.0F;
  for (float value : partial) {
    sum += value;
  }
  return sum;
}

float dot(const float* a, const float* b, std::size_t count) {
  float partial[kLanes] = {};
  std::size_t i = 0;
  for (; i + kLanes <= count; i += kLanes) {
    for (std::size_t lane = 0; lane < kLanes; ++lane) {
      partial[lane] += a[i + lane] * b[i + lane];
    }
  }
  float sum = accumulate(partial);
  for (; i < count; ++i) {
    sum += a[i] * b[i];
  }
  return sum;
}

void axpy(float alpha, const float* x, float* y, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    y[i] += alpha * x[i];
  }
}

}  // namespace
