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
// File: link_removal.h
// -----------------------------------------------------------------------------

#ifndef NETSAT_NETSAT_LINK_REMOVAL_H_
#define NETSAT_NETSAT_LINK_REMOVAL_H_

#include "netsat/netsat.pb.h"

namespace netsat {

// Returns `policy` with every `Link(sw1, pt1, sw2, pt2)` replaced by
//
//   filter(switch == sw1 && in_port == pt1); switch := sw2; in_port := pt2
//
// All other nodes are kept as they are.
PolicyProto RemoveLinks(const PolicyProto& policy);

}  // namespace netsat

#endif  // NETSAT_NETSAT_LINK_REMOVAL_H_
