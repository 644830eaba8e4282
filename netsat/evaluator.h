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
// File: evaluator.h
// -----------------------------------------------------------------------------
//
// Concrete semantics of predicates and policies. Reachability verdicts
// computed by the solver are cross-checked against these functions in tests.

#ifndef NETSAT_NETSAT_EVALUATOR_H_
#define NETSAT_NETSAT_EVALUATOR_H_

#include <cstdint>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "netsat/netsat.pb.h"

namespace netsat {

// A concrete packet. A field missing from the map matches no value.
using Packet = absl::flat_hash_map<Field, int64_t>;

using PacketSet = absl::flat_hash_set<Packet>;

// Whether `packet` satisfies `predicate`. An unset predicate is false.
bool Evaluate(const PredicateProto& predicate, const Packet& packet);

// The packets that `policy` outputs on input `packet`. An unset policy drops
// every packet. `Link` behaves as its rewriting (see `link_removal.h`), and
// `Choice` as the union of its branches.
PacketSet Evaluate(const PolicyProto& policy, const Packet& packet);
PacketSet Evaluate(const PolicyProto& policy, const PacketSet& packets);

// The packets that `body` outputs after at most `max_hops` iterations on
// input `packet`, including `packet` itself.
PacketSet EvaluateBounded(const PolicyProto& body, const Packet& packet,
                          int max_hops);

}  // namespace netsat

#endif  // NETSAT_NETSAT_EVALUATOR_H_
