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
//
// -----------------------------------------------------------------------------
// File: solver.h
// -----------------------------------------------------------------------------
//
// The decision procedure that answers the satisfiability queries built by this
// library. Solvers consume complete SMT-LIB2 programs, see `smt_program.h`.

#ifndef NETSAT_NETSAT_SOLVER_H_
#define NETSAT_NETSAT_SOLVER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace netsat {

class Solver {
 public:
  virtual ~Solver() = default;

  // Returns whether the assertions of `smt_lib_program` are satisfiable. The
  // program must end with a single `(check-sat)`.
  //
  // Returns InvalidArgument if the program is rejected by the solver, and
  // Unknown if the solver cannot decide it.
  virtual absl::StatusOr<bool> IsSatisfiable(
      absl::string_view smt_lib_program) = 0;
};

// A solver backed by Z3. Each query is answered in a fresh Z3 context, so
// queries never share declarations.
class Z3Solver : public Solver {
 public:
  absl::StatusOr<bool> IsSatisfiable(
      absl::string_view smt_lib_program) override;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_SOLVER_H_
