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

#include "netsat/smt_program.h"

#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "netsat/formula.h"
#include "netsat/macro_cache.h"
#include "netsat/netsat.pb.h"
#include "netsat/packet_field.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {

std::string SmtLibPreamble() {
  std::string preamble = "(declare-sort Packet 0)\n";
  for (Field field : AllFields()) {
    absl::StrAppend(&preamble, "(declare-fun ", FieldName(field),
                    " (Packet) Int)\n");
  }
  absl::StrAppend(&preamble, "(declare-const ", kDropSentinelName,
                  " Packet)\n");
  return preamble;
}

void SmtProgram::Assert(Formula formula) {
  commands_.push_back(Command{.assertion = std::move(formula)});
  ++assertion_count_;
}

void SmtProgram::Comment(absl::string_view text) {
  commands_.push_back(
      Command{.comment =
                  absl::StrReplaceAll(text, {{"\n", " "}, {"\r", " "}})});
}

std::string SmtProgram::ToSmtLib(const VerificationContext& context,
                                 bool with_comments) const {
  std::string program = SmtLibPreamble();
  for (const Macro& macro : context.macro_cache().macros()) {
    absl::StrAppend(&program, ToSmtLibDefinition(macro, with_comments), "\n");
  }
  for (const SymbolicPacket& packet : context.packets()) {
    absl::StrAppend(&program, "(declare-const ", packet.name(), " Packet)\n");
  }
  for (const Command& command : commands_) {
    if (command.assertion.has_value()) {
      absl::StrAppend(&program, "(assert ",
                      command.assertion->ToSmtLib(with_comments), ")\n");
    } else if (with_comments) {
      absl::StrAppend(&program, "; ", command.comment, "\n");
    }
  }
  program.append("(check-sat)\n");
  return program;
}

}  // namespace netsat
