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

#include "netsat/formula.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "netsat/netsat.pb.h"
#include "netsat/packet_field.h"
#include "netsat/symbolic_packet.h"

namespace netsat {

Term Term::Packet(const SymbolicPacket& packet) {
  Term term(Kind::kSymbol);
  term.symbol_ = packet.name();
  return term;
}

Term Term::Parameter(absl::string_view name) {
  Term term(Kind::kSymbol);
  term.symbol_ = std::string(name);
  return term;
}

Term Term::Integer(int64_t value) {
  Term term(Kind::kInteger);
  term.integer_ = value;
  return term;
}

Term Term::FieldOf(Field field, Term packet) {
  Term term(Kind::kFieldOf);
  term.field_ = field;
  term.packet_.push_back(std::move(packet));
  return term;
}

std::string Term::ToSmtLib() const {
  switch (kind_) {
    case Kind::kSymbol:
      return symbol_;
    case Kind::kInteger:
      // SMT-LIB has no negative literals.
      if (integer_ < 0) {
        // Negating INT64_MIN overflows, so go through the unsigned magnitude.
        return absl::StrCat("(- ", -static_cast<uint64_t>(integer_), ")");
      }
      return absl::StrCat(integer_);
    case Kind::kFieldOf:
      return absl::StrCat("(", FieldName(field_), " ", packet_[0].ToSmtLib(),
                          ")");
  }
  LOG(DFATAL) << "Unhandled term kind: " << static_cast<int>(kind_);
  return "";
}

Formula Formula::Bool(bool value) {
  Formula formula(Kind::kBool);
  formula.value_ = value;
  return formula;
}

Formula Formula::Equals(Term lhs, Term rhs) {
  Formula formula(Kind::kEquals);
  formula.terms_ = {std::move(lhs), std::move(rhs)};
  return formula;
}

Formula Formula::LessThan(Term lhs, Term rhs) {
  Formula formula(Kind::kLessThan);
  formula.terms_ = {std::move(lhs), std::move(rhs)};
  return formula;
}

Formula Formula::GreaterThan(Term lhs, Term rhs) {
  Formula formula(Kind::kGreaterThan);
  formula.terms_ = {std::move(lhs), std::move(rhs)};
  return formula;
}

Formula Formula::And(std::vector<Formula> operands) {
  Formula formula(Kind::kAnd);
  formula.operands_ = std::move(operands);
  return formula;
}

Formula Formula::Or(std::vector<Formula> operands) {
  Formula formula(Kind::kOr);
  formula.operands_ = std::move(operands);
  return formula;
}

Formula Formula::Ite(Formula condition, Formula then_formula,
                     Formula else_formula) {
  Formula formula(Kind::kIte);
  formula.operands_.reserve(3);
  formula.operands_.push_back(std::move(condition));
  formula.operands_.push_back(std::move(then_formula));
  formula.operands_.push_back(std::move(else_formula));
  return formula;
}

Formula Formula::Comment(absl::string_view text, Formula formula) {
  Formula comment(Kind::kComment);
  comment.text_ = absl::StrReplaceAll(text, {{"\n", " "}, {"\r", " "}});
  comment.operands_.push_back(std::move(formula));
  return comment;
}

Formula Formula::Apply(absl::string_view macro_name,
                       std::vector<Term> arguments) {
  Formula formula(Kind::kApply);
  formula.text_ = std::string(macro_name);
  formula.terms_ = std::move(arguments);
  return formula;
}

std::string Formula::ToSmtLib(bool with_comments) const {
  std::string output;
  AppendSmtLib(with_comments, output);
  return output;
}

void Formula::AppendSmtLib(bool with_comments, std::string& output) const {
  auto append_atom = [&](absl::string_view op) {
    absl::StrAppend(&output, "(", op, " ", terms_[0].ToSmtLib(), " ",
                    terms_[1].ToSmtLib(), ")");
  };
  auto append_nary = [&](absl::string_view op, absl::string_view unit) {
    if (operands_.empty()) {
      output.append(unit);
      return;
    }
    if (operands_.size() == 1) {
      operands_[0].AppendSmtLib(with_comments, output);
      return;
    }
    absl::StrAppend(&output, "(", op);
    for (const Formula& operand : operands_) {
      output.push_back(' ');
      operand.AppendSmtLib(with_comments, output);
    }
    output.push_back(')');
  };

  switch (kind_) {
    case Kind::kBool:
      output.append(value_ ? "true" : "false");
      return;
    case Kind::kEquals:
      append_atom("=");
      return;
    case Kind::kLessThan:
      append_atom("<");
      return;
    case Kind::kGreaterThan:
      append_atom(">");
      return;
    case Kind::kAnd:
      append_nary("and", "true");
      return;
    case Kind::kOr:
      append_nary("or", "false");
      return;
    case Kind::kIte:
      output.append("(ite ");
      operands_[0].AppendSmtLib(with_comments, output);
      output.push_back(' ');
      operands_[1].AppendSmtLib(with_comments, output);
      output.push_back(' ');
      operands_[2].AppendSmtLib(with_comments, output);
      output.push_back(')');
      return;
    case Kind::kComment:
      // A line comment runs to the end of the line, so the commented formula
      // starts on a fresh one.
      if (with_comments) absl::StrAppend(&output, "\n; ", text_, "\n");
      operands_[0].AppendSmtLib(with_comments, output);
      return;
    case Kind::kApply:
      if (terms_.empty()) {
        output.append(text_);
        return;
      }
      absl::StrAppend(&output, "(", text_);
      for (const Term& argument : terms_) {
        absl::StrAppend(&output, " ", argument.ToSmtLib());
      }
      output.push_back(')');
      return;
  }
  LOG(DFATAL) << "Unhandled formula kind: " << static_cast<int>(kind_);
}

}  // namespace netsat
