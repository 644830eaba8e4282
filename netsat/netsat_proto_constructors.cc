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

#include "netsat/netsat_proto_constructors.h"

#include <cstdint>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "netsat/netsat.pb.h"
#include "netsat/packet_field.h"

namespace netsat {
namespace {

// Fills the `left` and `right` operands of a binary message.
template <typename BinaryOp, typename Operand>
void SetOperands(BinaryOp& op, Operand left, Operand right) {
  *op.mutable_left() = std::move(left);
  *op.mutable_right() = std::move(right);
}

void AppendShorthand(const PredicateProto& predicate, std::string& out);
void AppendShorthand(const PolicyProto& policy, std::string& out);

// Appends "(left <op> right)".
template <typename BinaryOp>
void AppendInfix(const BinaryOp& op, absl::string_view symbol,
                 std::string& out) {
  out.push_back('(');
  AppendShorthand(op.left(), out);
  absl::StrAppend(&out, symbol);
  AppendShorthand(op.right(), out);
  out.push_back(')');
}

void AppendShorthand(const PredicateProto& predicate, std::string& out) {
  switch (predicate.predicate_case()) {
    case PredicateProto::kBoolConstant:
      absl::StrAppend(&out, predicate.bool_constant().value() ? "true"
                                                              : "false");
      return;
    case PredicateProto::kMatch:
      absl::StrAppend(&out, "@", FieldName(predicate.match().field()), "==",
                      predicate.match().value());
      return;
    case PredicateProto::kAndOp:
      AppendInfix(predicate.and_op(), " && ", out);
      return;
    case PredicateProto::kOrOp:
      AppendInfix(predicate.or_op(), " || ", out);
      return;
    case PredicateProto::kNotOp:
      out.push_back('!');
      AppendShorthand(predicate.not_op().negand(), out);
      return;
    case PredicateProto::PREDICATE_NOT_SET:
      break;
  }
  absl::StrAppend(&out, "false");
}

void AppendShorthand(const PolicyProto& policy, std::string& out) {
  switch (policy.policy_case()) {
    case PolicyProto::kFilter:
      AppendShorthand(policy.filter(), out);
      return;
    case PolicyProto::kModification:
      absl::StrAppend(&out, "@", FieldName(policy.modification().field()),
                      ":=", policy.modification().value());
      return;
    case PolicyProto::kSequenceOp:
      AppendInfix(policy.sequence_op(), "; ", out);
      return;
    case PolicyProto::kUnionOp:
      AppendInfix(policy.union_op(), " + ", out);
      return;
    case PolicyProto::kIterateOp:
      out.push_back('(');
      AppendShorthand(policy.iterate_op().iterable(), out);
      absl::StrAppend(&out, ")*");
      return;
    case PolicyProto::kLink: {
      const PolicyProto::Link& link = policy.link();
      absl::StrAppend(&out, link.src_switch(), "@", link.src_port(), "=>",
                      link.dst_switch(), "@", link.dst_port());
      return;
    }
    case PolicyProto::kChoiceOp:
      AppendInfix(policy.choice_op(),
                  absl::StrCat(" (+)", policy.choice_op().left_weight(), " "),
                  out);
      return;
    case PolicyProto::POLICY_NOT_SET:
      break;
  }
  absl::StrAppend(&out, "deny");
}

}  // namespace

PredicateProto TrueProto() {
  PredicateProto predicate;
  predicate.mutable_bool_constant()->set_value(true);
  return predicate;
}

PredicateProto FalseProto() {
  PredicateProto predicate;
  predicate.mutable_bool_constant()->set_value(false);
  return predicate;
}

PredicateProto MatchProto(Field field, int64_t value) {
  PredicateProto predicate;
  predicate.mutable_match()->set_field(field);
  predicate.mutable_match()->set_value(value);
  return predicate;
}

PredicateProto AndProto(PredicateProto left, PredicateProto right) {
  PredicateProto predicate;
  SetOperands(*predicate.mutable_and_op(), std::move(left), std::move(right));
  return predicate;
}

PredicateProto OrProto(PredicateProto left, PredicateProto right) {
  PredicateProto predicate;
  SetOperands(*predicate.mutable_or_op(), std::move(left), std::move(right));
  return predicate;
}

PredicateProto NotProto(PredicateProto negand) {
  PredicateProto predicate;
  *predicate.mutable_not_op()->mutable_negand() = std::move(negand);
  return predicate;
}

PredicateProto LocatedAtProto(int64_t switch_id, int64_t port) {
  return AndProto(MatchProto(FIELD_SWITCH, switch_id),
                  MatchProto(FIELD_IN_PORT, port));
}

PolicyProto FilterProto(PredicateProto filter) {
  PolicyProto policy;
  *policy.mutable_filter() = std::move(filter);
  return policy;
}

PolicyProto ModificationProto(Field field, int64_t value) {
  PolicyProto policy;
  policy.mutable_modification()->set_field(field);
  policy.mutable_modification()->set_value(value);
  return policy;
}

PolicyProto SequenceProto(PolicyProto left, PolicyProto right) {
  PolicyProto policy;
  SetOperands(*policy.mutable_sequence_op(), std::move(left), std::move(right));
  return policy;
}

PolicyProto UnionProto(PolicyProto left, PolicyProto right) {
  PolicyProto policy;
  SetOperands(*policy.mutable_union_op(), std::move(left), std::move(right));
  return policy;
}

PolicyProto IterateProto(PolicyProto iterable) {
  PolicyProto policy;
  *policy.mutable_iterate_op()->mutable_iterable() = std::move(iterable);
  return policy;
}

PolicyProto LinkProto(int64_t src_switch, int64_t src_port, int64_t dst_switch,
                      int64_t dst_port) {
  PolicyProto policy;
  PolicyProto::Link& link = *policy.mutable_link();
  link.set_src_switch(src_switch);
  link.set_src_port(src_port);
  link.set_dst_switch(dst_switch);
  link.set_dst_port(dst_port);
  return policy;
}

PolicyProto ChoiceProto(PolicyProto left, PolicyProto right,
                        double left_weight) {
  PolicyProto policy;
  SetOperands(*policy.mutable_choice_op(), std::move(left), std::move(right));
  policy.mutable_choice_op()->set_left_weight(left_weight);
  return policy;
}

PolicyProto DenyProto() { return FilterProto(FalseProto()); }

PolicyProto AcceptProto() { return FilterProto(TrueProto()); }

PolicyProto MoveToProto(int64_t switch_id, int64_t port) {
  return SequenceProto(ModificationProto(FIELD_SWITCH, switch_id),
                       ModificationProto(FIELD_IN_PORT, port));
}

std::string AsShorthandString(const PredicateProto& predicate) {
  std::string out;
  AppendShorthand(predicate, out);
  return out;
}

std::string AsShorthandString(const PolicyProto& policy) {
  std::string out;
  AppendShorthand(policy, out);
  return out;
}

}  // namespace netsat
