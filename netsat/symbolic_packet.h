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
// File: symbolic_packet.h
// -----------------------------------------------------------------------------
//
// A `SymbolicPacket` names one packet variable of the solver sort `Packet`.
// Every packet variable in a verification run is created by a
// `VerificationContext` (see `verification_context.h`), which guarantees that
// names are fresh within the run.
//
// There is exactly one distinguished packet, the drop sentinel, returned by
// `SymbolicPacket::Drop()`. It stands for "no packet here": a packet that was
// filtered out, or that never existed. It is distinct from every packet
// variable.

#ifndef NETSAT_NETSAT_SYMBOLIC_PACKET_H_
#define NETSAT_NETSAT_SYMBOLIC_PACKET_H_

#include <string>
#include <utility>

#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace netsat {

// The SMT-LIB name of the drop sentinel.
inline constexpr absl::string_view kDropSentinelName = "nopacket";

class [[nodiscard]] SymbolicPacket {
 public:
  // Returns the drop sentinel.
  static SymbolicPacket Drop();

  bool IsDrop() const { return name_ == kDropSentinelName; }

  // The SMT-LIB symbol naming this packet.
  const std::string& name() const { return name_; }

  friend auto operator<=>(const SymbolicPacket& a,
                          const SymbolicPacket& b) = default;

  // Hashing, see https://abseil.io/docs/cpp/guides/hash.
  template <typename H>
  friend H AbslHashValue(H h, const SymbolicPacket& packet) {
    return H::combine(std::move(h), packet.name_);
  }

  // Formatting, see https://abseil.io/docs/cpp/guides/abslstringify.
  template <typename Sink>
  friend void AbslStringify(Sink& sink, const SymbolicPacket& packet) {
    absl::Format(&sink, "%s", packet.name_);
  }

 private:
  // Only `VerificationContext` hands out fresh packet variables.
  friend class VerificationContext;
  explicit SymbolicPacket(std::string name) : name_(std::move(name)) {}

  std::string name_;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_SYMBOLIC_PACKET_H_
