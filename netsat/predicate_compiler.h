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
// File: predicate_compiler.h
// -----------------------------------------------------------------------------
//
// Compiles predicates to formulas over a single packet variable.

#ifndef NETSAT_NETSAT_PREDICATE_COMPILER_H_
#define NETSAT_NETSAT_PREDICATE_COMPILER_H_

#include "netsat/formula.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {

// Returns a formula that holds iff `packet` satisfies `predicate`.
//
// The result is in negation normal form: negations are pushed to the field
// tests using De Morgan's laws, and a negated field test compiles to the
// field's dedicated not-equals macro. Operand order is preserved.
//
// Field tests are compiled to applications of macros in `context`, which are
// created on first use. An unset predicate compiles to `false`, matching the
// evaluator. `predicate` is assumed to be valid, see `Predicate::FromProto`.
Formula CompilePredicate(const PredicateProto& predicate,
                         const SymbolicPacket& packet,
                         VerificationContext& context);

}  // namespace netsat

#endif  // NETSAT_NETSAT_PREDICATE_COMPILER_H_
