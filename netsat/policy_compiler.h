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
// File: policy_compiler.h
// -----------------------------------------------------------------------------
//
// Compiles loop-free policies to relations between an input and an output
// packet variable.

#ifndef NETSAT_NETSAT_POLICY_COMPILER_H_
#define NETSAT_NETSAT_POLICY_COMPILER_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "netsat/formula.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {

// A policy compiled from a given input packet variable: `formula` relates the
// input to `output`.
struct CompiledPolicy {
  Formula formula;
  SymbolicPacket output;
};

// Compiles `policy` applied to `input`, allocating fresh packet variables in
// `context` as needed:
//
//  * Filter(p):         (CompilePredicate(p, input), input)
//  * Modify(f, v):      (mod-f(input, out, v), out) for a fresh `out`.
//  * Union(p1, p2):     ((f1 or f2) and o1 = o2, o1), where both branches are
//                       compiled from `input`.
//  * Sequence(p1, p2):  (f1 and f2, o2), where p2 is compiled from o1.
//
// Union unifies the outputs of its branches, it does not pick one of them.
//
// Returns InvalidArgument "policy not in accepted normal form" if `policy`
// contains an Iterate, Choice or Link, or an unset policy.
absl::StatusOr<CompiledPolicy> CompilePolicy(const PolicyProto& policy,
                                             const SymbolicPacket& input,
                                             VerificationContext& context);

// Returns the error `CompilePolicy` would return for `policy`, without
// allocating anything.
absl::Status CheckIsCompilable(const PolicyProto& policy);

}  // namespace netsat

#endif  // NETSAT_NETSAT_POLICY_COMPILER_H_
