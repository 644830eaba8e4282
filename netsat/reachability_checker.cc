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

#include "netsat/reachability_checker.h"

#include <unistd.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "gutil/io.h"
#include "gutil/status.h"
#include "netsat/formula.h"
#include "netsat/frontend.h"
#include "netsat/link_removal.h"
#include "netsat/netsat.pb.h"
#include "netsat/predicate_compiler.h"
#include "netsat/smt_program.h"
#include "netsat/solver.h"
#include "netsat/symbolic_packet.h"
#include "netsat/topology.h"
#include "netsat/unroller.h"
#include "netsat/verification_context.h"

namespace netsat {
namespace {

// Numbers the programs dumped on oracle mismatches, across all checkers of
// the process.
std::atomic<int> next_dump_id{0};

// Returns a dump file name in `directory` that no other checker of this or
// another process uses.
std::string NextDumpPath(absl::string_view directory) {
  return absl::StrCat(directory, "/debug-", getpid(), "-",
                      next_dump_id.fetch_add(1), ".smt2");
}

absl::string_view VerdictName(bool reachable) {
  return reachable ? "sat" : "unsat";
}

}  // namespace

SideCondition SatisfiesPredicate(Predicate predicate) {
  return [predicate = std::move(predicate)](const SymbolicPacket& packet,
                                            VerificationContext& context) {
    return CompilePredicate(predicate.GetProto(), packet, context);
  };
}

SideCondition IsNotDropped() {
  return [](const SymbolicPacket& packet, VerificationContext&) {
    return IsNotDropped(packet);
  };
}

ReachabilityChecker::ReachabilityChecker(std::unique_ptr<Solver> solver,
                                         ReachabilityCheckerOptions options)
    : solver_(std::move(solver)), options_(std::move(options)) {}

absl::StatusOr<std::string> ReachabilityChecker::BuildProgram(
    int k, const Predicate& entry, const Policy& program,
    const Predicate& exit,
    absl::Span<const SideCondition> side_conditions) const {
  VerificationContext context;
  SmtProgram smt_program;

  SymbolicPacket input = context.FreshPacket();
  smt_program.Assert(Formula::Comment(
      "entry", CompilePredicate(entry.GetProto(), input, context)));

  ASSIGN_OR_RETURN(
      UnrolledRelation unrolled,
      Unroll(RemoveLinks(program.GetProto()), input, k, context));
  smt_program.Assert(std::move(unrolled.formula));
  smt_program.Comment(absl::StrCat(
      "frontier: ",
      absl::StrJoin(unrolled.frontier, " ",
                    [](std::string* out, const SymbolicPacket& packet) {
                      out->append(packet.name());
                    })));

  std::vector<Formula> exits;
  exits.reserve(unrolled.frontier.size());
  for (const SymbolicPacket& reached : unrolled.frontier) {
    std::vector<Formula> conditions = {
        CompilePredicate(exit.GetProto(), reached, context)};
    for (const SideCondition& side_condition : side_conditions) {
      conditions.push_back(side_condition(reached, context));
    }
    exits.push_back(Formula::And(std::move(conditions)));
  }
  smt_program.Assert(Formula::Comment("exit", Formula::Or(std::move(exits))));

  return smt_program.ToSmtLib(context, options_.annotate);
}

absl::StatusOr<bool> ReachabilityChecker::CheckReachabilityK(
    int k, absl::string_view name, const Predicate& entry,
    const Policy& program, const Predicate& exit,
    absl::Span<const SideCondition> side_conditions,
    std::optional<bool> expected) {
  ASSIGN_OR_RETURN(std::string smt_program,
                   BuildProgram(k, entry, program, exit, side_conditions),
                   _.SetPrepend() << "[" << name << "] ");
  VLOG(1) << "[" << name << "] solver program:\n" << smt_program;

  ASSIGN_OR_RETURN(bool reachable, solver_->IsSatisfiable(smt_program),
                   _.SetPrepend() << "[" << name << "] ");

  if (!expected.has_value()) {
    LOG(INFO) << "[" << name << "] verdict: " << VerdictName(reachable);
    return reachable;
  }
  if (reachable == *expected) {
    LOG(INFO) << "[" << name << "] expected " << VerdictName(*expected)
              << " got " << VerdictName(reachable);
    return true;
  }

  LOG(ERROR) << "[" << name << "] expected " << VerdictName(*expected)
             << " got " << VerdictName(reachable);
  std::string path = NextDumpPath(options_.dump_directory);
  if (absl::Status status = gutil::WriteFile(smt_program, path);
      !status.ok()) {
    LOG(ERROR) << "[" << name << "] failed to dump solver program: " << status;
  } else {
    LOG(ERROR) << "[" << name << "] solver program dumped to " << path;
  }
  return false;
}

absl::StatusOr<bool> ReachabilityChecker::CheckReachability(
    absl::string_view name, const Predicate& entry, const Policy& program,
    const Predicate& exit, std::optional<bool> expected) {
  int k = Topology::FromPolicy(program.GetProto()).HopBound();
  return CheckReachabilityK(k, name, entry, program, exit,
                            /*side_conditions=*/{}, expected);
}

absl::StatusOr<bool> ReachabilityChecker::CheckQuery(
    const ReachabilityQueryProto& query) {
  ASSIGN_OR_RETURN(Predicate entry, Predicate::FromProto(query.entry()),
                   _.SetPrepend() << "invalid entry: ");
  ASSIGN_OR_RETURN(Policy program, Policy::FromProto(query.program()),
                   _.SetPrepend() << "invalid program: ");
  ASSIGN_OR_RETURN(Predicate exit, Predicate::FromProto(query.exit()),
                   _.SetPrepend() << "invalid exit: ");
  std::optional<bool> expected;
  if (query.has_expected_reachable()) expected = query.expected_reachable();
  if (!query.has_hop_bound()) {
    return CheckReachability(query.name(), entry, program, exit, expected);
  }
  return CheckReachabilityK(query.hop_bound(), query.name(), entry, program,
                            exit, /*side_conditions=*/{}, expected);
}

}  // namespace netsat
