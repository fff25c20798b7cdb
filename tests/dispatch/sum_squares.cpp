/**
 * @file sum_squares.cpp
 * @brief Header-less multiversioned unit (registered with FUNCTIONS)
 */

#include <cstddef>

static double sum_squares(const double* values, std::size_t count) {
  double sum = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    sum += values[i] * values[i];
  }
  return sum;
}
