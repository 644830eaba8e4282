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
// File: verification_context.h
// -----------------------------------------------------------------------------
//
// All mutable state of one verification run: the macro cache, the counter
// from which fresh packet variables are named, and the list of packet
// variables the solver program has to declare.
//
// A new context is created for every check and dropped when the check ends,
// so no two checks share solver declarations. Contexts are not thread-safe,
// but independent contexts may be used concurrently.

#ifndef NETSAT_NETSAT_VERIFICATION_CONTEXT_H_
#define NETSAT_NETSAT_VERIFICATION_CONTEXT_H_

#include <cstdint>
#include <vector>

#include "absl/types/span.h"
#include "netsat/formula.h"
#include "netsat/macro_cache.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"

namespace netsat {

class VerificationContext {
 public:
  VerificationContext() = default;

  VerificationContext(const VerificationContext&) = delete;
  VerificationContext& operator=(const VerificationContext&) = delete;

  // Returns a packet variable that is distinct from all packet variables
  // previously returned by this context, and from the drop sentinel.
  SymbolicPacket FreshPacket();

  // All packet variables created so far, in creation order.
  absl::Span<const SymbolicPacket> packets() const { return packets_; }

  MacroCache& macro_cache() { return macro_cache_; }
  const MacroCache& macro_cache() const { return macro_cache_; }

  // Return the macro of the given family for `field`, creating it and the
  // macros it depends on on first use. See `MacroFamily`.
  MacroHandle EqualsMacro(Field field);
  MacroHandle NotEqualsMacro(Field field);
  MacroHandle PacketEqualsExceptMacro(Field field);
  MacroHandle ModifyMacro(Field field);

  // Applications of the above macros.
  Formula FieldEquals(const SymbolicPacket& packet, Field field,
                      int64_t value);
  Formula FieldNotEquals(const SymbolicPacket& packet, Field field,
                         int64_t value);
  Formula PacketEqualsExcept(const SymbolicPacket& x, const SymbolicPacket& y,
                             Field field);
  Formula Modify(const SymbolicPacket& input, const SymbolicPacket& output,
                 Field field, int64_t value);

 private:
  MacroCache macro_cache_;
  std::vector<SymbolicPacket> packets_;
};

// Returns the formula `a = b`.
Formula PacketEquals(const SymbolicPacket& a, const SymbolicPacket& b);

// Returns the formula stating that `packet` is the drop sentinel.
Formula IsDropped(const SymbolicPacket& packet);

// Returns the formula stating that `packet` is not the drop sentinel.
Formula IsNotDropped(const SymbolicPacket& packet);

}  // namespace netsat

#endif  // NETSAT_NETSAT_VERIFICATION_CONTEXT_H_
