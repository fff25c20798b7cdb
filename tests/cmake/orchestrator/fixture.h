/**
 * @file fixture.h
 * @brief Module used by the orchestrator configure checks
 */

#pragma once

namespace fixture {

int twice(int value);

}  // namespace fixture

#define FIXTURE_EXPORTS(X) X(C, twice)
