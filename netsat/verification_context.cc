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

#include "netsat/verification_context.h"

#include <cstdint>
#include <vector>

#include "absl/strings/str_cat.h"
#include "netsat/formula.h"
#include "netsat/macro_cache.h"
#include "netsat/netsat.pb.h"
#include "netsat/packet_field.h"
#include "netsat/symbolic_packet.h"

namespace netsat {
namespace {

// Parameter names shared by all macro definitions.
constexpr char kX[] = "x";
constexpr char kY[] = "y";
constexpr char kV[] = "v";

Term Drop() { return Term::Packet(SymbolicPacket::Drop()); }

Formula IsDropParameter(const char* name) {
  return Formula::Equals(Term::Parameter(name), Drop());
}

Term FieldOfParameter(Field field, const char* name) {
  return Term::FieldOf(field, Term::Parameter(name));
}

}  // namespace

SymbolicPacket VerificationContext::FreshPacket() {
  SymbolicPacket packet(absl::StrCat("pkt", packets_.size()));
  packets_.push_back(packet);
  return packet;
}

MacroHandle VerificationContext::EqualsMacro(Field field) {
  MacroKey key = {.family = MacroFamily::kEquals, .field = field};
  return macro_cache_.GetOrCreate(key, [&] {
    return Macro{
        .name = MacroName(key),
        .parameters = {{kX, Sort::kPacket}, {kV, Sort::kInt}},
        .body = Formula::Ite(
            IsDropParameter(kX), Formula::False(),
            Formula::Equals(FieldOfParameter(field, kX), Term::Parameter(kV))),
    };
  });
}

MacroHandle VerificationContext::NotEqualsMacro(Field field) {
  MacroKey key = {.family = MacroFamily::kNotEquals, .field = field};
  return macro_cache_.GetOrCreate(key, [&] {
    // The theory has no native disequality; `<` or `>` stands in for it.
    return Macro{
        .name = MacroName(key),
        .parameters = {{kX, Sort::kPacket}, {kV, Sort::kInt}},
        .body = Formula::Ite(
            IsDropParameter(kX), Formula::True(),
            Formula::Or({Formula::LessThan(FieldOfParameter(field, kX),
                                           Term::Parameter(kV)),
                         Formula::GreaterThan(FieldOfParameter(field, kX),
                                              Term::Parameter(kV))})),
    };
  });
}

MacroHandle VerificationContext::PacketEqualsExceptMacro(Field field) {
  MacroKey key = {.family = MacroFamily::kPacketEqualsExcept, .field = field};
  return macro_cache_.GetOrCreate(key, [&] {
    std::vector<Formula> agreements;
    for (Field other : AllFields()) {
      if (other == field) continue;
      agreements.push_back(Formula::Equals(FieldOfParameter(other, kX),
                                           FieldOfParameter(other, kY)));
    }
    return Macro{
        .name = MacroName(key),
        .parameters = {{kX, Sort::kPacket}, {kY, Sort::kPacket}},
        .body = Formula::Ite(
            IsDropParameter(kX), IsDropParameter(kY),
            Formula::Ite(IsDropParameter(kY), Formula::False(),
                         Formula::And(std::move(agreements)))),
    };
  });
}

MacroHandle VerificationContext::ModifyMacro(Field field) {
  MacroKey key = {.family = MacroFamily::kModify, .field = field};
  return macro_cache_.GetOrCreate(key, [&] {
    MacroHandle equals_except = PacketEqualsExceptMacro(field);
    return Macro{
        .name = MacroName(key),
        .parameters = {{kX, Sort::kPacket},
                       {kY, Sort::kPacket},
                       {kV, Sort::kInt}},
        .body = Formula::And(
            {macro_cache_.Apply(equals_except,
                                {Term::Parameter(kX), Term::Parameter(kY)}),
             Formula::Equals(FieldOfParameter(field, kY),
                             Term::Parameter(kV))}),
    };
  });
}

Formula VerificationContext::FieldEquals(const SymbolicPacket& packet,
                                         Field field, int64_t value) {
  MacroHandle macro = EqualsMacro(field);
  return macro_cache_.Apply(macro,
                            {Term::Packet(packet), Term::Integer(value)});
}

Formula VerificationContext::FieldNotEquals(const SymbolicPacket& packet,
                                            Field field, int64_t value) {
  MacroHandle macro = NotEqualsMacro(field);
  return macro_cache_.Apply(macro,
                            {Term::Packet(packet), Term::Integer(value)});
}

Formula VerificationContext::PacketEqualsExcept(const SymbolicPacket& x,
                                                const SymbolicPacket& y,
                                                Field field) {
  MacroHandle macro = PacketEqualsExceptMacro(field);
  return macro_cache_.Apply(macro, {Term::Packet(x), Term::Packet(y)});
}

Formula VerificationContext::Modify(const SymbolicPacket& input,
                                    const SymbolicPacket& output, Field field,
                                    int64_t value) {
  MacroHandle macro = ModifyMacro(field);
  return macro_cache_.Apply(macro, {Term::Packet(input), Term::Packet(output),
                                    Term::Integer(value)});
}

Formula PacketEquals(const SymbolicPacket& a, const SymbolicPacket& b) {
  return Formula::Equals(Term::Packet(a), Term::Packet(b));
}

Formula IsDropped(const SymbolicPacket& packet) {
  return PacketEquals(packet, SymbolicPacket::Drop());
}

Formula IsNotDropped(const SymbolicPacket& packet) {
  return Formula::Ite(IsDropped(packet), Formula::False(), Formula::True());
}

}  // namespace netsat
