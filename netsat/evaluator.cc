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

#include "netsat/evaluator.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "netsat/netsat.pb.h"

namespace netsat {
namespace {

std::optional<int64_t> ValueOf(const Packet& packet, Field field) {
  auto it = packet.find(field);
  if (it == packet.end()) return std::nullopt;
  return it->second;
}

PacketSet EvaluateUnion(const PolicyProto& left, const PolicyProto& right,
                        const Packet& packet) {
  PacketSet outputs = Evaluate(left, packet);
  outputs.merge(Evaluate(right, packet));
  return outputs;
}

// Returns the packets reachable from `packet` by zero or more applications of
// `body`. Each packet is expanded exactly once.
PacketSet EvaluateStar(const PolicyProto& body, const Packet& packet) {
  PacketSet reached = {packet};
  std::vector<Packet> worklist = {packet};
  while (!worklist.empty()) {
    Packet next = std::move(worklist.back());
    worklist.pop_back();
    for (const Packet& output : Evaluate(body, next)) {
      if (reached.insert(output).second) worklist.push_back(output);
    }
  }
  return reached;
}

}  // namespace

bool Evaluate(const PredicateProto& predicate, const Packet& packet) {
  switch (predicate.predicate_case()) {
    case PredicateProto::kBoolConstant:
      return predicate.bool_constant().value();
    case PredicateProto::kMatch:
      return ValueOf(packet, predicate.match().field()) ==
             predicate.match().value();
    case PredicateProto::kAndOp:
      return Evaluate(predicate.and_op().left(), packet) &&
             Evaluate(predicate.and_op().right(), packet);
    case PredicateProto::kOrOp:
      return Evaluate(predicate.or_op().left(), packet) ||
             Evaluate(predicate.or_op().right(), packet);
    case PredicateProto::kNotOp:
      return !Evaluate(predicate.not_op().negand(), packet);
    case PredicateProto::PREDICATE_NOT_SET:
      return false;
  }
  LOG(DFATAL) << "unknown predicate case: "
              << static_cast<int>(predicate.predicate_case());
  return false;
}

PacketSet Evaluate(const PolicyProto& policy, const Packet& packet) {
  switch (policy.policy_case()) {
    case PolicyProto::kFilter:
      if (!Evaluate(policy.filter(), packet)) return {};
      return {packet};
    case PolicyProto::kModification: {
      Packet output = packet;
      output[policy.modification().field()] = policy.modification().value();
      return {std::move(output)};
    }
    case PolicyProto::kSequenceOp:
      return Evaluate(policy.sequence_op().right(),
                      Evaluate(policy.sequence_op().left(), packet));
    case PolicyProto::kUnionOp:
      return EvaluateUnion(policy.union_op().left(), policy.union_op().right(),
                           packet);
    case PolicyProto::kChoiceOp:
      return EvaluateUnion(policy.choice_op().left(),
                           policy.choice_op().right(), packet);
    case PolicyProto::kIterateOp:
      return EvaluateStar(policy.iterate_op().iterable(), packet);
    case PolicyProto::kLink: {
      const PolicyProto::Link& link = policy.link();
      if (ValueOf(packet, FIELD_SWITCH) != link.src_switch() ||
          ValueOf(packet, FIELD_IN_PORT) != link.src_port()) {
        return {};
      }
      Packet output = packet;
      output[FIELD_SWITCH] = link.dst_switch();
      output[FIELD_IN_PORT] = link.dst_port();
      return {std::move(output)};
    }
    case PolicyProto::POLICY_NOT_SET:
      return {};
  }
  LOG(DFATAL) << "unknown policy case: "
              << static_cast<int>(policy.policy_case());
  return {};
}

PacketSet Evaluate(const PolicyProto& policy, const PacketSet& packets) {
  PacketSet outputs;
  for (const Packet& packet : packets) outputs.merge(Evaluate(policy, packet));
  return outputs;
}

PacketSet EvaluateBounded(const PolicyProto& body, const Packet& packet,
                          int max_hops) {
  PacketSet reached = {packet};
  PacketSet frontier = {packet};
  for (int hop = 0; hop < max_hops && !frontier.empty(); ++hop) {
    PacketSet next;
    for (const Packet& output : Evaluate(body, frontier)) {
      if (reached.insert(output).second) next.insert(output);
    }
    frontier = std::move(next);
  }
  return reached;
}

}  // namespace netsat
