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
// File: frontend.h
// -----------------------------------------------------------------------------
//
// This file contains the definitions for the user facing API to build
// forwarding predicates and policies.
//
// Under the hood, very minimal logic is performed at this stage. This API acts
// as a set of convenient helpers to generate a valid intermediate proto
// representation (IR). See `netsat.proto`.
#ifndef NETSAT_NETSAT_FRONTEND_H_
#define NETSAT_NETSAT_FRONTEND_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "netsat/netsat.pb.h"

namespace netsat {

// Represents a predicate, i.e. a Boolean combination of field tests on
// packets. It is useful to think of predicates as a "filter" on the set of
// packets at some given point in a program.
//
// This class provides overloads for `&&`, `||` and `!`, which follow
// conventional operator precedence:
//
//   Predicate at_s1 = Match(FIELD_SWITCH, 1) && !Match(FIELD_VLAN, 10);
//
// NOTE: SHORT CIRCUITING DOES NOT OCCUR! `Predicate::True() ||
// Predicate::False()` builds an `or_op`, not `True()`.
class Predicate {
 public:
  // Predicates are only constructible through helpers, e.g. `Match`, `True`,
  // `False` or `Predicate::FromProto(...)`.
  Predicate() = delete;

  // Creates a Predicate from `predicate_proto`.
  // If `predicate_proto` is ill-formed, returns InvalidArgument error.
  // A `predicate_proto` is considered valid if:
  //    - `bool_constant` is set, or
  //    - `match` is set and `match::field` is a valid, specified field, or
  //    - it is an `and_op`, `or_op` or `not_op` whose operands are all present
  //      and valid.
  static absl::StatusOr<Predicate> FromProto(PredicateProto predicate_proto);

  // Returns the underlying IR proto.
  PredicateProto ToProto() const& { return predicate_; }
  PredicateProto ToProto() && { return std::move(predicate_); }

  // Returns a reference to the underlying IR proto, valid for the lifetime of
  // this object or until it is moved.
  const PredicateProto& GetProto() const& { return predicate_; }

  friend Predicate operator&&(Predicate lhs, Predicate rhs);
  friend Predicate operator||(Predicate lhs, Predicate rhs);
  friend Predicate operator!(Predicate predicate);

  // Predicates that accept all or no packets.
  static Predicate True();
  static Predicate False();

  friend Predicate Match(Field, int64_t);

 private:
  explicit Predicate(PredicateProto pred) : predicate_(std::move(pred)) {}

  // Calling GetProto on an R-value predicate is at best inefficient and, more
  // likely, a bug. Use ToProto instead.
  const PredicateProto& GetProto() && = delete;

  PredicateProto predicate_;
};

// Tests whether `field` of a packet equals `value`.
//
//   netsat::Match(FIELD_ETH_TYPE, 0x0800)
//   netsat::Match(FIELD_SWITCH, 3)
Predicate Match(Field field, int64_t value);

// Represents a forwarding policy: a combination of filters, modifications,
// links and their parallel, sequential and iterated compositions.
//
//   Predicate at_src = Match(FIELD_SWITCH, 1) && Match(FIELD_IN_PORT, 1);
//   Policy forward = Sequence(Filter(at_src), Modify(FIELD_IN_PORT, 2));
//   Policy network = Iterate(Sequence(forward, Link(1, 2, 2, 1)));
class Policy {
 public:
  Policy() = delete;

  // Creates a Policy from `policy_proto`.
  // If `policy_proto` is ill-formed, returns InvalidArgument error.
  // A `policy_proto` is considered valid if:
  //   - `filter` is a valid PredicateProto,
  //   - `modification::field` is a valid, specified field,
  //   - `link` is set (any port and switch numbers are accepted),
  //   - `choice_op` has valid operands and a weight within [0, 1],
  //   - `sequence_op`, `union_op` and `iterate_op` have present and valid
  //     operands.
  // An empty PolicyProto is invalid.
  static absl::StatusOr<Policy> FromProto(PolicyProto policy_proto);

  // Returns the underlying IR proto.
  PolicyProto ToProto() const& { return policy_; }
  PolicyProto ToProto() && { return std::move(policy_); }

  // Returns a reference to the underlying IR proto, valid for the lifetime of
  // this object or until it is moved.
  const PolicyProto& GetProto() const& { return policy_; }

  friend Policy Filter(Predicate);
  friend Policy Modify(Field, int64_t);
  friend Policy Sequence(std::vector<Policy>);
  friend Policy Union(std::vector<Policy>);
  friend Policy Iterate(Policy);
  friend Policy Link(int64_t, int64_t, int64_t, int64_t);
  friend Policy Choice(Policy, Policy, double);

  // Policies that forward all packets unchanged, or drop all packets.
  static Policy Accept();
  static Policy Deny();

 private:
  explicit Policy(PolicyProto policy) : policy_(std::move(policy)) {}

  const PolicyProto& GetProto() && = delete;

  PolicyProto policy_;
};

// Returns a policy that filters packets by `predicate`.
Policy Filter(Predicate predicate);

// Sets `field` to `new_value`.
Policy Modify(Field field, int64_t new_value);

// Performs a left-to-right sequential composition of each policy in
// `policies`: Sequence({p0, p1, p2}) == Sequence({Sequence({p0, p1}), p2}).
//
// An empty list returns the Accept policy, while a singular entry is simply
// the policy itself.
Policy Sequence(std::vector<Policy> policies);

template <typename... T>
Policy Sequence(T&&... policies) {
  return Sequence({std::forward<T>(policies)...});
}

// Performs a left-to-right parallel composition of each policy in `policies`.
//
// An empty list returns the Deny policy, while a singular entry is simply the
// policy itself.
Policy Union(std::vector<Policy> policies);

template <typename... T>
Policy Union(T&&... policies) {
  return Union({std::forward<T>(policies)...});
}

// Iterates over the given policy 0 to many times (Kleene star).
//
// The SMT compiler only accepts iteration at the top level of a program, and
// only in the shape `Iterate(Sequence(policy, topology))`.
Policy Iterate(Policy policy);

// A unidirectional physical link that moves a packet located at
// `src_switch`:`src_port` to `dst_switch`:`dst_port`, and drops packets at any
// other location. Location is given by `FIELD_SWITCH` and `FIELD_IN_PORT`.
Policy Link(int64_t src_switch, int64_t src_port, int64_t dst_switch,
            int64_t dst_port);

// Probabilistic choice, taking `left` with probability `left_weight` and
// `right` otherwise. Rejected by the SMT compiler.
Policy Choice(Policy left, Policy right, double left_weight);

}  // namespace netsat

#endif  // NETSAT_NETSAT_FRONTEND_H_
