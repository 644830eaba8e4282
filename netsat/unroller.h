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
// File: unroller.h
// -----------------------------------------------------------------------------
//
// Bounded unrolling of network programs of the form `(policy; topology)*`,
// where `policy` describes the forwarding behavior of the switches and
// `topology` moves packets across links (see `RemoveLinks`).

#ifndef NETSAT_NETSAT_UNROLLER_H_
#define NETSAT_NETSAT_UNROLLER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "netsat/formula.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {

struct UnrolledRelation {
  // Conjunction over all depths d in 0..k of
  //   relation_d OR frontier[d] = nopacket,
  // where relation_d relates the input to frontier[d] in exactly d hops.
  Formula formula;
  // `frontier[d]` is the packet reached after exactly d hops; `frontier[0]` is
  // the input. Holds k+1 distinct packets; every depth but 0 is fresh.
  std::vector<SymbolicPacket> frontier;
};

// Unrolls `star`, which must be of the form `Iterate(Sequence(policy,
// topology))`, up to `k` hops starting from `input`.
//
// Each depth is compiled independently: the relation for depth d chains d
// fresh copies of `policy` followed by `topology`. A packet that is dropped at
// some depth satisfies the constraints of that depth vacuously.
//
// Returns InvalidArgument if `star` does not have the expected shape, if
// `k < 0`, or if `policy` or `topology` cannot be compiled, see
// `CompilePolicy`.
absl::StatusOr<UnrolledRelation> Unroll(const PolicyProto& star,
                                        const SymbolicPacket& input, int k,
                                        VerificationContext& context);

}  // namespace netsat

#endif  // NETSAT_NETSAT_UNROLLER_H_
