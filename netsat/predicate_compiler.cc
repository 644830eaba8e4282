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

#include "netsat/predicate_compiler.h"

#include <utility>

#include "absl/log/log.h"
#include "netsat/formula.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {
namespace {

// Compiles `predicate`, or its negation if `negated` is true.
Formula Compile(const PredicateProto& predicate, bool negated,
                const SymbolicPacket& packet, VerificationContext& context) {
  switch (predicate.predicate_case()) {
    case PredicateProto::kBoolConstant:
      return Formula::Bool(predicate.bool_constant().value() != negated);
    case PredicateProto::kMatch: {
      const PredicateProto::Match& match = predicate.match();
      return negated
                 ? context.FieldNotEquals(packet, match.field(), match.value())
                 : context.FieldEquals(packet, match.field(), match.value());
    }
    case PredicateProto::kAndOp: {
      Formula left =
          Compile(predicate.and_op().left(), negated, packet, context);
      Formula right =
          Compile(predicate.and_op().right(), negated, packet, context);
      return negated ? Formula::Or({std::move(left), std::move(right)})
                     : Formula::And({std::move(left), std::move(right)});
    }
    case PredicateProto::kOrOp: {
      Formula left =
          Compile(predicate.or_op().left(), negated, packet, context);
      Formula right =
          Compile(predicate.or_op().right(), negated, packet, context);
      return negated ? Formula::And({std::move(left), std::move(right)})
                     : Formula::Or({std::move(left), std::move(right)});
    }
    case PredicateProto::kNotOp:
      return Compile(predicate.not_op().negand(), !negated, packet, context);
    case PredicateProto::PREDICATE_NOT_SET:
      return Formula::Bool(negated);
  }
  LOG(DFATAL) << "Unhandled predicate kind: " << predicate.predicate_case();
  return Formula::Bool(negated);
}

}  // namespace

Formula CompilePredicate(const PredicateProto& predicate,
                         const SymbolicPacket& packet,
                         VerificationContext& context) {
  return Compile(predicate, /*negated=*/false, packet, context);
}

}  // namespace netsat
