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
// File: smt_program.h
// -----------------------------------------------------------------------------
//
// Assembles the solver program of one verification run and renders it as
// SMT-LIB2 text. A rendered program has the following layout:
//
//   (declare-sort Packet 0)
//   (declare-fun InPort (Packet) Int)       ; one per field
//   ...
//   (declare-const nopacket Packet)
//   (define-fun ...)                        ; one per macro, in creation order
//   (declare-const pkt0 Packet)             ; one per packet variable
//   ...
//   (assert ...)                            ; assertions and top-level comments
//   (check-sat)

#ifndef NETSAT_NETSAT_SMT_PROGRAM_H_
#define NETSAT_NETSAT_SMT_PROGRAM_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "netsat/formula.h"
#include "netsat/verification_context.h"

namespace netsat {

// Returns the declarations that every program starts with: the `Packet` sort,
// one field accessor per field, and the drop sentinel.
std::string SmtLibPreamble();

class SmtProgram {
 public:
  SmtProgram() = default;

  // Appends `(assert formula)`.
  void Assert(Formula formula);

  // Appends a top-level `;` comment line.
  void Comment(absl::string_view text);

  int assertion_count() const { return assertion_count_; }

  // Renders the complete program. Macro definitions and packet declarations
  // are taken from `context`, which must be the context that the asserted
  // formulas were compiled in. Comments are omitted unless `with_comments`.
  std::string ToSmtLib(const VerificationContext& context,
                       bool with_comments = true) const;

 private:
  // Either an assertion or a comment.
  struct Command {
    std::optional<Formula> assertion;
    std::string comment;
  };

  std::vector<Command> commands_;
  int assertion_count_ = 0;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_SMT_PROGRAM_H_
