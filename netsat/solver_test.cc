// Copyright 2026 The NetSAT authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "netsat/solver.h"

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "gutil/status_matchers.h"
#include "netsat/smt_program.h"

namespace netsat {
namespace {

using ::gutil::IsOkAndHolds;
using ::gutil::StatusIs;

TEST(Z3SolverTest, DecidesSatisfiablePrograms) {
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable("(declare-const a Int)\n"
                                   "(assert (> a 3))\n"
                                   "(check-sat)\n"),
              IsOkAndHolds(true));
}

TEST(Z3SolverTest, DecidesUnsatisfiablePrograms) {
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable("(declare-const a Int)\n"
                                   "(assert (> a 3))\n"
                                   "(assert (< a 2))\n"
                                   "(check-sat)\n"),
              IsOkAndHolds(false));
}

TEST(Z3SolverTest, PreambleIsSatisfiable) {
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable(SmtLibPreamble() + "(check-sat)\n"),
              IsOkAndHolds(true));
}

TEST(Z3SolverTest, QueriesDoNotShareDeclarations) {
  Z3Solver solver;
  constexpr char kProgram[] =
      "(declare-const a Int)\n(assert (= a 1))\n(check-sat)\n";
  EXPECT_THAT(solver.IsSatisfiable(kProgram), IsOkAndHolds(true));
  EXPECT_THAT(solver.IsSatisfiable(kProgram), IsOkAndHolds(true));
}

TEST(Z3SolverTest, UndeclaredSymbolIsInvalidArgument) {
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable("(assert (= b 1))\n(check-sat)\n"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(Z3SolverTest, DuplicateDeclarationIsInvalidArgument) {
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable("(declare-const a Int)\n"
                                   "(declare-const a Int)\n"
                                   "(check-sat)\n"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(Z3SolverTest, MissingCheckSatIsInternalError) {
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable("(declare-const a Int)\n"),
              StatusIs(absl::StatusCode::kInternal));
}

}  // namespace
}  // namespace netsat
