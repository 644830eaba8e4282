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

#include "netsat/frontend.h"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gutil/status.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"
#include "netsat/packet_field.h"

namespace netsat {
namespace {

absl::Status CheckIsValid(const PredicateProto& predicate);
absl::Status CheckIsValid(const PolicyProto& policy);

// Checks both operands of a binary `op`, prefixing errors with
// "<message>'s lhs/rhs is invalid: ".
template <typename BinaryOp>
absl::Status CheckOperands(const BinaryOp& op, absl::string_view message) {
  RETURN_IF_ERROR(CheckIsValid(op.left())).SetPrepend()
      << message << "'s lhs is invalid: ";
  RETURN_IF_ERROR(CheckIsValid(op.right())).SetPrepend()
      << message << "'s rhs is invalid: ";
  return absl::OkStatus();
}

absl::Status CheckFieldIsValid(Field field, absl::string_view context) {
  if (IsValidField(field)) return absl::OkStatus();
  return gutil::InvalidArgumentErrorBuilder()
         << context << "::field is invalid: " << Field_Name(field);
}

absl::Status CheckIsValid(const PredicateProto& predicate) {
  switch (predicate.predicate_case()) {
    case PredicateProto::kBoolConstant:
      return absl::OkStatus();
    case PredicateProto::kMatch:
      return CheckFieldIsValid(predicate.match().field(),
                               "PredicateProto::Match");
    case PredicateProto::kAndOp:
      return CheckOperands(predicate.and_op(), "PredicateProto::And");
    case PredicateProto::kOrOp:
      return CheckOperands(predicate.or_op(), "PredicateProto::Or");
    case PredicateProto::kNotOp:
      RETURN_IF_ERROR(CheckIsValid(predicate.not_op().negand())).SetPrepend()
          << "PredicateProto::Not's negand is invalid: ";
      return absl::OkStatus();
    case PredicateProto::PREDICATE_NOT_SET:
      break;
  }
  return gutil::InvalidArgumentErrorBuilder() << "PredicateProto is unset";
}

absl::Status CheckIsValid(const PolicyProto& policy) {
  switch (policy.policy_case()) {
    case PolicyProto::kFilter:
      return CheckIsValid(policy.filter());
    case PolicyProto::kModification:
      return CheckFieldIsValid(policy.modification().field(),
                               "PolicyProto::Modification");
    case PolicyProto::kLink:
      return absl::OkStatus();
    case PolicyProto::kSequenceOp:
      return CheckOperands(policy.sequence_op(), "PolicyProto::Sequence");
    case PolicyProto::kUnionOp:
      return CheckOperands(policy.union_op(), "PolicyProto::Union");
    case PolicyProto::kIterateOp:
      RETURN_IF_ERROR(CheckIsValid(policy.iterate_op().iterable()))
              .SetPrepend()
          << "PolicyProto::Iterate's iterable is invalid: ";
      return absl::OkStatus();
    case PolicyProto::kChoiceOp: {
      const double weight = policy.choice_op().left_weight();
      if (!(weight >= 0 && weight <= 1)) {
        return gutil::InvalidArgumentErrorBuilder()
               << "PolicyProto::Choice::left_weight must be within [0, 1], "
                  "got "
               << weight;
      }
      return CheckOperands(policy.choice_op(), "PolicyProto::Choice");
    }
    case PolicyProto::POLICY_NOT_SET:
      break;
  }
  return gutil::InvalidArgumentErrorBuilder() << "PolicyProto is unset";
}

}  // namespace

absl::StatusOr<Predicate> Predicate::FromProto(PredicateProto predicate_proto) {
  RETURN_IF_ERROR(CheckIsValid(predicate_proto));
  return Predicate(std::move(predicate_proto));
}

Predicate operator!(Predicate predicate) {
  return Predicate(NotProto(std::move(predicate).ToProto()));
}

Predicate operator&&(Predicate lhs, Predicate rhs) {
  return Predicate(
      AndProto(std::move(lhs).ToProto(), std::move(rhs).ToProto()));
}

Predicate operator||(Predicate lhs, Predicate rhs) {
  return Predicate(OrProto(std::move(lhs).ToProto(), std::move(rhs).ToProto()));
}

Predicate Predicate::True() { return Predicate(TrueProto()); }

Predicate Predicate::False() { return Predicate(FalseProto()); }

Predicate Match(Field field, int64_t value) {
  return Predicate(MatchProto(field, value));
}

absl::StatusOr<Policy> Policy::FromProto(PolicyProto policy_proto) {
  RETURN_IF_ERROR(CheckIsValid(policy_proto));
  return Policy(std::move(policy_proto));
}

Policy Filter(Predicate predicate) {
  return Policy(FilterProto(std::move(predicate).ToProto()));
}

Policy Modify(Field field, int64_t new_value) {
  return Policy(ModificationProto(field, new_value));
}

Policy Sequence(std::vector<Policy> policies) {
  if (policies.empty()) return Policy::Accept();
  PolicyProto proto = std::move(policies[0]).ToProto();
  for (size_t i = 1; i < policies.size(); ++i) {
    proto = SequenceProto(std::move(proto), std::move(policies[i]).ToProto());
  }
  return Policy(std::move(proto));
}

Policy Union(std::vector<Policy> policies) {
  if (policies.empty()) return Policy::Deny();
  PolicyProto proto = std::move(policies[0]).ToProto();
  for (size_t i = 1; i < policies.size(); ++i) {
    proto = UnionProto(std::move(proto), std::move(policies[i]).ToProto());
  }
  return Policy(std::move(proto));
}

Policy Iterate(Policy policy) {
  return Policy(IterateProto(std::move(policy).ToProto()));
}

Policy Link(int64_t src_switch, int64_t src_port, int64_t dst_switch,
            int64_t dst_port) {
  return Policy(LinkProto(src_switch, src_port, dst_switch, dst_port));
}

Policy Choice(Policy left, Policy right, double left_weight) {
  return Policy(ChoiceProto(std::move(left).ToProto(),
                            std::move(right).ToProto(), left_weight));
}

Policy Policy::Accept() { return Filter(Predicate::True()); }

Policy Policy::Deny() { return Filter(Predicate::False()); }

}  // namespace netsat
