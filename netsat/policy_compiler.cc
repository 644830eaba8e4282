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

#include "netsat/policy_compiler.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gutil/status.h"
#include "netsat/formula.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"
#include "netsat/predicate_compiler.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {
namespace {

gutil::StatusBuilder NotInNormalForm(absl::string_view constructor,
                                     const PolicyProto& policy) {
  return gutil::InvalidArgumentErrorBuilder()
         << "policy not in accepted normal form: found " << constructor
         << " in " << AsShorthandString(policy);
}

}  // namespace

absl::StatusOr<CompiledPolicy> CompilePolicy(const PolicyProto& policy,
                                             const SymbolicPacket& input,
                                             VerificationContext& context) {
  switch (policy.policy_case()) {
    case PolicyProto::kFilter:
      return CompiledPolicy{
          .formula = CompilePredicate(policy.filter(), input, context),
          .output = input,
      };
    case PolicyProto::kModification: {
      SymbolicPacket output = context.FreshPacket();
      return CompiledPolicy{
          .formula = context.Modify(input, output,
                                    policy.modification().field(),
                                    policy.modification().value()),
          .output = output,
      };
    }
    case PolicyProto::kUnionOp: {
      ASSIGN_OR_RETURN(CompiledPolicy left,
                       CompilePolicy(policy.union_op().left(), input, context));
      ASSIGN_OR_RETURN(
          CompiledPolicy right,
          CompilePolicy(policy.union_op().right(), input, context));
      Formula unified = PacketEquals(left.output, right.output);
      return CompiledPolicy{
          .formula = Formula::And(
              {Formula::Or({std::move(left.formula), std::move(right.formula)}),
               std::move(unified)}),
          .output = std::move(left.output),
      };
    }
    case PolicyProto::kSequenceOp: {
      ASSIGN_OR_RETURN(
          CompiledPolicy first,
          CompilePolicy(policy.sequence_op().left(), input, context));
      ASSIGN_OR_RETURN(
          CompiledPolicy second,
          CompilePolicy(policy.sequence_op().right(), first.output, context));
      return CompiledPolicy{
          .formula = Formula::And(
              {std::move(first.formula), std::move(second.formula)}),
          .output = std::move(second.output),
      };
    }
    case PolicyProto::kIterateOp:
      return NotInNormalForm("Iterate", policy);
    case PolicyProto::kChoiceOp:
      return NotInNormalForm("Choice", policy);
    case PolicyProto::kLink:
      return NotInNormalForm("Link", policy);
    case PolicyProto::POLICY_NOT_SET:
      return NotInNormalForm("unset policy", policy);
  }
  return gutil::InvalidArgumentErrorBuilder()
         << "policy not in accepted normal form: unknown policy case "
         << policy.policy_case();
}

absl::Status CheckIsCompilable(const PolicyProto& policy) {
  switch (policy.policy_case()) {
    case PolicyProto::kFilter:
    case PolicyProto::kModification:
      return absl::OkStatus();
    case PolicyProto::kUnionOp:
      RETURN_IF_ERROR(CheckIsCompilable(policy.union_op().left()));
      return CheckIsCompilable(policy.union_op().right());
    case PolicyProto::kSequenceOp:
      RETURN_IF_ERROR(CheckIsCompilable(policy.sequence_op().left()));
      return CheckIsCompilable(policy.sequence_op().right());
    case PolicyProto::kIterateOp:
      return NotInNormalForm("Iterate", policy);
    case PolicyProto::kChoiceOp:
      return NotInNormalForm("Choice", policy);
    case PolicyProto::kLink:
      return NotInNormalForm("Link", policy);
    case PolicyProto::POLICY_NOT_SET:
      return NotInNormalForm("unset policy", policy);
  }
  return gutil::InvalidArgumentErrorBuilder()
         << "policy not in accepted normal form: unknown policy case "
         << policy.policy_case();
}

}  // namespace netsat
