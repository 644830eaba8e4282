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
// File: packet_field.h
// -----------------------------------------------------------------------------
//
// Helpers for the fixed set of packet fields defined by the `Field` enum in
// `netsat.proto`.

#ifndef NETSAT_NETSAT_PACKET_FIELD_H_
#define NETSAT_NETSAT_PACKET_FIELD_H_

#include <string>

#include "absl/types/span.h"
#include "netsat/netsat.pb.h"

namespace netsat {

// Returns all valid packet fields, in the order in which their accessors are
// declared in the solver program. Excludes `FIELD_UNSPECIFIED`.
absl::Span<const Field> AllFields();

// Returns true iff `field` is one of `AllFields()`.
bool IsValidField(Field field);

// Returns the name under which `field` is known to the solver, e.g. "Switch"
// for `FIELD_SWITCH`. These names are valid SMT-LIB symbols.
//
// Returns "Unspecified" for `FIELD_UNSPECIFIED` and for values outside the
// enum.
std::string FieldName(Field field);

}  // namespace netsat

#endif  // NETSAT_NETSAT_PACKET_FIELD_H_
