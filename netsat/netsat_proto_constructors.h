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
// File: netsat_proto_constructors.h
// -----------------------------------------------------------------------------
//
// Terse builders for `netsat.proto` messages, for code and tests that work on
// the IR directly rather than through `frontend.h`.

#ifndef NETSAT_NETSAT_NETSAT_PROTO_CONSTRUCTORS_H_
#define NETSAT_NETSAT_NETSAT_PROTO_CONSTRUCTORS_H_

#include <cstdint>
#include <string>

#include "netsat/netsat.pb.h"

namespace netsat {

// -- Predicates ---------------------------------------------------------------

PredicateProto TrueProto();
PredicateProto FalseProto();
PredicateProto MatchProto(Field field, int64_t value);
PredicateProto AndProto(PredicateProto left, PredicateProto right);
PredicateProto OrProto(PredicateProto left, PredicateProto right);
PredicateProto NotProto(PredicateProto negand);

// `@Switch==switch_id && @InPort==port`.
PredicateProto LocatedAtProto(int64_t switch_id, int64_t port);

// -- Policies -----------------------------------------------------------------

PolicyProto FilterProto(PredicateProto filter);
PolicyProto ModificationProto(Field field, int64_t value);
PolicyProto SequenceProto(PolicyProto left, PolicyProto right);
PolicyProto UnionProto(PolicyProto left, PolicyProto right);
PolicyProto IterateProto(PolicyProto iterable);
PolicyProto LinkProto(int64_t src_switch, int64_t src_port, int64_t dst_switch,
                      int64_t dst_port);
PolicyProto ChoiceProto(PolicyProto left, PolicyProto right,
                        double left_weight);

PolicyProto DenyProto();    // Drops every packet.
PolicyProto AcceptProto();  // Forwards every packet unchanged.

// `@Switch:=switch_id; @InPort:=port`.
PolicyProto MoveToProto(int64_t switch_id, int64_t port);

// -- Shorthand ----------------------------------------------------------------

// Renders `predicate` or `policy` in the usual NetKAT notation, fully
// parenthesized:
//
//   true, false, @Field==value, !p, (p && q), (p || q)       predicates
//   @Field:=value, (p; q), (p + q), (p)*                     policies
//   sw1@pt1=>sw2@pt2                                         links
//   (p (+)w q)                                               choice
//
// Unset predicates render as "false" and unset policies as "deny".
std::string AsShorthandString(const PredicateProto& predicate);
std::string AsShorthandString(const PolicyProto& policy);

}  // namespace netsat

#endif  // NETSAT_NETSAT_NETSAT_PROTO_CONSTRUCTORS_H_
