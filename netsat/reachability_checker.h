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
// File: reachability_checker.h
// -----------------------------------------------------------------------------
//
// Bounded reachability checking of network programs: does some packet
// matching `entry`, forwarded through `program` for at most k hops, reach a
// packet matching `exit`?
//
// `program` must be of the form `(policy; topology)*`, where neither `policy`
// nor `topology` contains iteration or probabilistic choice. Links are
// allowed, typically in `topology`, and are compiled to filters and
// modifications of the switch and port fields.
//
// Each check compiles the question to an SMT-LIB2 program in a fresh
// `VerificationContext` and asks a `Solver`. If an expected verdict (an
// "oracle") is given, the check passes iff the solver agrees with it; on
// disagreement the program is written to
// `<dump_directory>/debug-<pid>-<n>.smt2` for inspection, where `n` counts the
// dumps of the process.
//
// Example:
//
//   ReachabilityChecker checker;
//   Policy network = Iterate(Sequence(Policy::Accept(), Link(1, 1, 2, 1)));
//   absl::StatusOr<bool> passed = checker.CheckReachability(
//       "s1 reaches s2", Match(FIELD_SWITCH, 1), network,
//       Match(FIELD_SWITCH, 2), /*expected=*/true);

#ifndef NETSAT_NETSAT_REACHABILITY_CHECKER_H_
#define NETSAT_NETSAT_REACHABILITY_CHECKER_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "netsat/formula.h"
#include "netsat/frontend.h"
#include "netsat/netsat.pb.h"
#include "netsat/solver.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {

// An additional constraint on the packet reached at the exit, compiled in the
// context of the check.
using SideCondition =
    std::function<Formula(const SymbolicPacket&, VerificationContext&)>;

// The reached packet satisfies `predicate`.
SideCondition SatisfiesPredicate(Predicate predicate);

// The reached packet was not dropped.
SideCondition IsNotDropped();

struct ReachabilityCheckerOptions {
  // Where programs are written when the verdict contradicts the oracle.
  std::string dump_directory = "/tmp";
  // Whether emitted programs carry comments.
  bool annotate = true;
};

class ReachabilityChecker {
 public:
  explicit ReachabilityChecker(
      std::unique_ptr<Solver> solver = std::make_unique<Z3Solver>(),
      ReachabilityCheckerOptions options = {});

  // Checks whether a packet matching `entry` can reach, within at most `k`
  // hops of `program`, a packet matching `exit` and all `side_conditions`.
  //
  // If `expected` is set, returns true iff the verdict equals `expected`.
  // Otherwise, returns the verdict.
  //
  // Returns InvalidArgument if `program` is not of the form
  // `(policy; topology)*` or `k < 0`, and propagates solver errors.
  absl::StatusOr<bool> CheckReachabilityK(
      int k, absl::string_view name, const Predicate& entry,
      const Policy& program, const Predicate& exit,
      absl::Span<const SideCondition> side_conditions,
      std::optional<bool> expected);

  // Same as above, with the hop bound of the topology formed by the links in
  // `program` and no side conditions.
  absl::StatusOr<bool> CheckReachability(absl::string_view name,
                                         const Predicate& entry,
                                         const Policy& program,
                                         const Predicate& exit,
                                         std::optional<bool> expected);

  // Runs the check described by `query`. The hop bound defaults to the one of
  // `CheckReachability`. Returns InvalidArgument if `query` is ill-formed.
  absl::StatusOr<bool> CheckQuery(const ReachabilityQueryProto& query);

  // Returns the SMT-LIB2 program that `CheckReachabilityK` submits to the
  // solver.
  absl::StatusOr<std::string> BuildProgram(
      int k, const Predicate& entry, const Policy& program,
      const Predicate& exit,
      absl::Span<const SideCondition> side_conditions) const;

 private:
  std::unique_ptr<Solver> solver_;
  ReachabilityCheckerOptions options_;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_REACHABILITY_CHECKER_H_
