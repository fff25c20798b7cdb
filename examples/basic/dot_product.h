/**
 * @file dot_product.h
 * @brief Declarations of the multiversioned dot_product module
 */

#pragma once

#include <cstddef>

namespace dot_product {

/**
 * @brief Dot product of two float vectors of length `count`
 */
float dot(const float* a, const float* b, std::size_t count);

/**
 * @brief y[i] += alpha * x[i]
 */
void axpy(float alpha, const float* x, float* y, std::size_t count);

}  // namespace dot_product

// Registration list: C entries are exported per level, CXX entries stay internal
#define DOT_PRODUCT_EXPORTS(X) \
  X(C, dot)                    \
  X(C, axpy)                   \
  X(CXX, accumulate)
