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

#include "netsat/unroller.h"

#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "gutil/status.h"
#include "netsat/formula.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"
#include "netsat/policy_compiler.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {
namespace {

// Returns the relation between `input` and the packet reached after exactly
// `hops` applications of `policy; topology`, which is chained from fresh
// packet variables.
absl::StatusOr<CompiledPolicy> CompileHops(const PolicyProto& policy,
                                           const PolicyProto& topology,
                                           const SymbolicPacket& input,
                                           int hops,
                                           VerificationContext& context) {
  std::vector<Formula> chain;
  SymbolicPacket reached = input;
  for (int hop = 1; hop <= hops; ++hop) {
    ASSIGN_OR_RETURN(CompiledPolicy forwarded,
                     CompilePolicy(policy, reached, context));
    ASSIGN_OR_RETURN(CompiledPolicy moved,
                     CompilePolicy(topology, forwarded.output, context));
    chain.push_back(Formula::Comment(absl::StrCat("hop ", hop, ": policy"),
                                     std::move(forwarded.formula)));
    chain.push_back(Formula::Comment(absl::StrCat("hop ", hop, ": topology"),
                                     std::move(moved.formula)));
    reached = std::move(moved.output);
  }
  return CompiledPolicy{.formula = Formula::And(std::move(chain)),
                        .output = std::move(reached)};
}

}  // namespace

absl::StatusOr<UnrolledRelation> Unroll(const PolicyProto& star,
                                        const SymbolicPacket& input, int k,
                                        VerificationContext& context) {
  if (k < 0) {
    return gutil::InvalidArgumentErrorBuilder()
           << "hop bound must be non-negative, got " << k;
  }
  if (!star.has_iterate_op() ||
      !star.iterate_op().iterable().has_sequence_op()) {
    return gutil::InvalidArgumentErrorBuilder()
           << "policy not in accepted normal form: expected "
              "(policy; topology)*, got "
           << AsShorthandString(star);
  }
  const PolicyProto& policy = star.iterate_op().iterable().sequence_op().left();
  const PolicyProto& topology =
      star.iterate_op().iterable().sequence_op().right();
  // The body is rejected even when no hop is taken.
  RETURN_IF_ERROR(CheckIsCompilable(policy));
  RETURN_IF_ERROR(CheckIsCompilable(topology));

  std::vector<Formula> depths;
  std::vector<SymbolicPacket> frontier;
  depths.reserve(k + 1);
  frontier.reserve(k + 1);
  for (int depth = 0; depth <= k; ++depth) {
    ASSIGN_OR_RETURN(CompiledPolicy hops,
                     CompileHops(policy, topology, input, depth, context));
    // Filters do not allocate packets, so the chain may end in a packet of a
    // shallower depth. Every depth but the first reaches a fresh packet.
    SymbolicPacket reached = input;
    Formula relation = std::move(hops.formula);
    if (depth > 0) {
      reached = context.FreshPacket();
      relation = Formula::And(
          {std::move(relation), PacketEquals(hops.output, reached)});
    }
    Formula blacklisted = Formula::Comment(
        absl::StrCat(reached.name(), " was dropped"), IsDropped(reached));
    depths.push_back(Formula::Comment(
        absl::StrCat("forwarding in ", depth, " hops"),
        Formula::Or({std::move(relation), std::move(blacklisted)})));
    frontier.push_back(std::move(reached));
  }
  return UnrolledRelation{.formula = Formula::And(std::move(depths)),
                          .frontier = std::move(frontier)};
}

}  // namespace netsat
