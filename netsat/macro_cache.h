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
// File: macro_cache.h
// -----------------------------------------------------------------------------
//
// A run-scoped table of macros: named, parameterized formulas that the solver
// program defines once (via `define-fun`) and then applies by name.
//
// A solver program may define each name only once, so macro *identity*
// matters: two requests for the same macro during one run must resolve to the
// same definition. `MacroCache` guarantees this by keying macros by
// `MacroKey` and invoking the builder only on a cache miss.
//
// Macros are handed out as lightweight `MacroHandle`s, following the same
// manager/handle pattern used for other run-scoped objects in this library.
// Handles are only meaningful for the cache that created them.

#ifndef NETSAT_NETSAT_MACRO_CACHE_H_
#define NETSAT_NETSAT_MACRO_CACHE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/functional/function_ref.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "netsat/formula.h"
#include "netsat/netsat.pb.h"

namespace netsat {

// The families of macros used by the compiler. Each family is instantiated
// once per field.
enum class MacroFamily {
  // `(x Packet) (v Int)`: false if x is the drop sentinel, else field(x) = v.
  kEquals,
  // `(x Packet) (v Int)`: true if x is the drop sentinel, else field(x) < v or
  // field(x) > v.
  kNotEquals,
  // `(x Packet) (y Packet)`: x and y agree on all fields except `field`. Two
  // drop sentinels are equal; a drop sentinel equals no other packet.
  kPacketEqualsExcept,
  // `(x Packet) (y Packet) (v Int)`: y is x with `field` set to v.
  kModify,
};

struct MacroKey {
  MacroFamily family;
  Field field;

  friend auto operator<=>(const MacroKey& a, const MacroKey& b) = default;

  template <typename H>
  friend H AbslHashValue(H h, const MacroKey& key) {
    return H::combine(std::move(h), key.family, key.field);
  }
};

// Returns the name of the macro identified by `key`, e.g. "Switch-equals",
// "Switch-not-equals", "packet-equals-except-Switch", or "mod-Switch".
std::string MacroName(const MacroKey& key);

// The solver sorts that macro parameters may range over.
enum class Sort { kPacket, kInt };

struct MacroParameter {
  std::string name;
  Sort sort;
};

// A Boolean-valued macro definition.
struct Macro {
  std::string name;
  std::vector<MacroParameter> parameters;
  Formula body;
};

// Returns the SMT-LIB2 definition of `macro`, e.g.
//   (define-fun Switch-equals ((x Packet) (v Int)) Bool (ite ...))
std::string ToSmtLibDefinition(const Macro& macro, bool with_comments = true);

class [[nodiscard]] MacroHandle {
 public:
  friend auto operator<=>(MacroHandle a, MacroHandle b) = default;

  template <typename H>
  friend H AbslHashValue(H h, MacroHandle handle) {
    return H::combine(std::move(h), handle.index_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, MacroHandle handle) {
    absl::Format(&sink, "MacroHandle<%d>", handle.index_);
  }

 private:
  // Only `MacroCache` can create handles.
  friend class MacroCache;
  explicit MacroHandle(uint32_t index) : index_(index) {}

  // Index into `MacroCache::macros_`.
  uint32_t index_;
};

class MacroCache {
 public:
  MacroCache() = default;

  // The cache is run-scoped state; it is never copied.
  MacroCache(const MacroCache&) = delete;
  MacroCache& operator=(const MacroCache&) = delete;

  // Returns the macro for `key`, calling `builder` to create it if this is the
  // first request for `key`.
  //
  // `builder` may itself call `GetOrCreate` for other keys, e.g. to define a
  // macro in terms of another one. Macros it creates are recorded before the
  // macro it returns, so `macros()` always lists dependencies first.
  // `builder` must not (transitively) request `key` itself.
  MacroHandle GetOrCreate(const MacroKey& key,
                          absl::FunctionRef<Macro()> builder);

  // Returns the handle for `key` if the macro was already created.
  std::optional<MacroHandle> Find(const MacroKey& key) const;

  const Macro& GetMacro(MacroHandle handle) const;

  // Returns the application of the macro to `arguments`. The number of
  // arguments must match the macro's parameters.
  Formula Apply(MacroHandle handle, std::vector<Term> arguments) const;

  // All macros, in creation order.
  absl::Span<const Macro> macros() const { return macros_; }
  int size() const { return macros_.size(); }

 private:
  std::vector<Macro> macros_;
  absl::flat_hash_map<MacroKey, MacroHandle> handle_by_key_;
  absl::flat_hash_set<std::string> names_;
  // Keys whose builder is currently running, to catch cyclic definitions.
  absl::flat_hash_set<MacroKey> under_construction_;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_MACRO_CACHE_H_
