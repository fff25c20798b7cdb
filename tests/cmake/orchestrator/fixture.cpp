/**
 * @file fixture.cpp
 * @brief Multiversioned unit of the orchestrator configure checks
 */

namespace {

int twice(int value) {
  return value * 2;
}

}  // namespace
