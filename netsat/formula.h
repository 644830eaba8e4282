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
// File: formula.h
// -----------------------------------------------------------------------------
//
// The logical intermediate representation that predicates and policies are
// compiled to, and its SMT-LIB2 rendering.
//
// Terms are packet variables (including the drop sentinel), integer constants,
// macro parameters, and field projections `field(packet)`. Formulas are
// Boolean constants, the atoms `=`, `<`, `>` over terms, if-then-else,
// conjunction, disjunction, macro application, and comments. A comment wraps a
// formula and is semantically transparent; it only annotates the emitted
// program.
//
// Both classes are plain immutable values. They are cheap enough for the
// formulas this library builds, which are linear in the size of the policy
// times the hop bound.

#ifndef NETSAT_NETSAT_FORMULA_H_
#define NETSAT_NETSAT_FORMULA_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"

namespace netsat {

class Term {
 public:
  Term() = delete;

  // The packet variable named by `packet`, or the drop sentinel.
  static Term Packet(const SymbolicPacket& packet);

  // A macro parameter, e.g. `x`. Only meaningful inside a macro body.
  static Term Parameter(absl::string_view name);

  static Term Integer(int64_t value);

  // The value of `field` in `packet`, where `packet` is a packet-sorted term.
  static Term FieldOf(Field field, Term packet);

  // Returns the SMT-LIB2 rendering of this term, e.g. `(Switch pkt3)`.
  std::string ToSmtLib() const;

  friend bool operator==(const Term& a, const Term& b) = default;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Term& term) {
    absl::Format(&sink, "%s", term.ToSmtLib());
  }

 private:
  enum class Kind { kSymbol, kInteger, kFieldOf };

  explicit Term(Kind kind) : kind_(kind) {}

  Kind kind_;
  std::string symbol_;
  int64_t integer_ = 0;
  Field field_ = FIELD_UNSPECIFIED;
  // The packet argument of `kFieldOf`, empty otherwise.
  std::vector<Term> packet_;
};

class Formula {
 public:
  Formula() = delete;

  static Formula True() { return Bool(true); }
  static Formula False() { return Bool(false); }
  static Formula Bool(bool value);

  static Formula Equals(Term lhs, Term rhs);
  static Formula LessThan(Term lhs, Term rhs);
  static Formula GreaterThan(Term lhs, Term rhs);

  // The conjunction/disjunction of `operands`, in order. An empty conjunction
  // is `true`, an empty disjunction is `false`.
  static Formula And(std::vector<Formula> operands);
  static Formula Or(std::vector<Formula> operands);

  static Formula Ite(Formula condition, Formula then_formula,
                     Formula else_formula);

  // Annotates `formula` with `text`. Newlines in `text` are replaced by
  // spaces.
  static Formula Comment(absl::string_view text, Formula formula);

  // Applies the macro named `macro_name` to `arguments`. Callers are expected
  // to go through `MacroCache::Apply`, which checks the arity.
  static Formula Apply(absl::string_view macro_name,
                       std::vector<Term> arguments);

  bool IsTrue() const { return kind_ == Kind::kBool && value_; }
  bool IsFalse() const { return kind_ == Kind::kBool && !value_; }

  // Returns the SMT-LIB2 rendering of this formula. Comments are rendered as
  // `;` line comments if `with_comments` is true, and dropped otherwise.
  std::string ToSmtLib(bool with_comments = true) const;

  friend bool operator==(const Formula& a, const Formula& b) = default;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Formula& formula) {
    absl::Format(&sink, "%s", formula.ToSmtLib());
  }

 private:
  enum class Kind {
    kBool,
    kEquals,
    kLessThan,
    kGreaterThan,
    kAnd,
    kOr,
    kIte,
    kComment,
    kApply,
  };

  explicit Formula(Kind kind) : kind_(kind) {}

  void AppendSmtLib(bool with_comments, std::string& output) const;

  Kind kind_;
  bool value_ = false;
  // The comment text for `kComment`, the macro name for `kApply`.
  std::string text_;
  std::vector<Term> terms_;
  std::vector<Formula> operands_;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_FORMULA_H_
