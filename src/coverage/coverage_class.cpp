// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "coverage/coverage_class.h"

namespace tracecov {
namespace coverage {

const char* CoverageClassName(CoverageClass coverage) {
  switch (coverage) {
    case CoverageClass::FULL:
      return "full";
    case CoverageClass::SOME:
      return "some";
    case CoverageClass::NONE:
      return "none";
    case CoverageClass::DEAD:
      return "dead";
    case CoverageClass::INSIGNIFICANT:
      return "";
  }
  return "";
}

void CoverageTally::Add(CoverageClass coverage) {
  switch (coverage) {
    case CoverageClass::FULL:
      full++;
      break;
    case CoverageClass::SOME:
      some++;
      break;
    case CoverageClass::NONE:
      none++;
      break;
    case CoverageClass::DEAD:
      dead++;
      break;
    case CoverageClass::INSIGNIFICANT:
      break;
  }
}

}  // namespace coverage
}  // namespace tracecov
