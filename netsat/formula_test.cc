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
#include <limits>
#include <string>

#include "fuzztest/fuzztest.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "netsat/gtest_utils.h"
#include "netsat/netsat.pb.h"
#include "netsat/symbolic_packet.h"

namespace netsat {
namespace {

using ::netsat::netsat_test::FieldDomain;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

TEST(TermTest, IntegersRenderAsSmtLibNumerals) {
  EXPECT_EQ(Term::Integer(0).ToSmtLib(), "0");
  EXPECT_EQ(Term::Integer(42).ToSmtLib(), "42");
  EXPECT_EQ(Term::Integer(-7).ToSmtLib(), "(- 7)");
  EXPECT_EQ(Term::Integer(std::numeric_limits<int64_t>::min()).ToSmtLib(),
            "(- 9223372036854775808)");
}

TEST(TermTest, FieldProjectionRendersAsFunctionApplication) {
  EXPECT_EQ(Term::FieldOf(FIELD_SWITCH, Term::Parameter("x")).ToSmtLib(),
            "(Switch x)");
  EXPECT_EQ(
      Term::FieldOf(FIELD_IN_PORT, Term::Packet(SymbolicPacket::Drop()))
          .ToSmtLib(),
      "(InPort nopacket)");
}

TEST(FormulaTest, ConstantsRender) {
  EXPECT_EQ(Formula::True().ToSmtLib(), "true");
  EXPECT_EQ(Formula::False().ToSmtLib(), "false");
  EXPECT_TRUE(Formula::True().IsTrue());
  EXPECT_TRUE(Formula::False().IsFalse());
  EXPECT_FALSE(Formula::True().IsFalse());
}

TEST(FormulaTest, AtomsRender) {
  Term x = Term::Parameter("x");
  Term v = Term::Parameter("v");
  EXPECT_EQ(Formula::Equals(x, v).ToSmtLib(), "(= x v)");
  EXPECT_EQ(Formula::LessThan(x, v).ToSmtLib(), "(< x v)");
  EXPECT_EQ(Formula::GreaterThan(x, v).ToSmtLib(), "(> x v)");
}

TEST(FormulaTest, EmptyConnectivesAreUnits) {
  EXPECT_EQ(Formula::And({}).ToSmtLib(), "true");
  EXPECT_EQ(Formula::Or({}).ToSmtLib(), "false");
}

TEST(FormulaTest, SingletonConnectivesRenderTheirOperand) {
  EXPECT_EQ(Formula::And({Formula::False()}).ToSmtLib(), "false");
  EXPECT_EQ(Formula::Or({Formula::True()}).ToSmtLib(), "true");
}

TEST(FormulaTest, ConnectivesPreserveOperandOrder) {
  Formula a = Formula::Apply("a", {});
  Formula b = Formula::Apply("b", {});
  Formula c = Formula::Apply("c", {});
  EXPECT_EQ(Formula::And({a, b, c}).ToSmtLib(), "(and a b c)");
  EXPECT_EQ(Formula::Or({c, a}).ToSmtLib(), "(or c a)");
}

TEST(FormulaTest, IteRenders) {
  EXPECT_EQ(Formula::Ite(Formula::True(), Formula::False(), Formula::True())
                .ToSmtLib(),
            "(ite true false true)");
}

TEST(FormulaTest, MacroApplicationRenders) {
  EXPECT_EQ(Formula::Apply("Switch-equals",
                           {Term::Parameter("pkt0"), Term::Integer(3)})
                .ToSmtLib(),
            "(Switch-equals pkt0 3)");
}

TEST(FormulaTest, CommentsAreLineCommentsAndCanBeDropped) {
  Formula formula = Formula::Comment("hello\nworld", Formula::True());
  EXPECT_EQ(formula.ToSmtLib(), "\n; hello world\ntrue");
  EXPECT_EQ(formula.ToSmtLib(/*with_comments=*/false), "true");
}

TEST(FormulaTest, CommentInsideConnectiveKeepsOperandOnItsOwnLine) {
  Formula formula = Formula::And(
      {Formula::Comment("first", Formula::False()), Formula::True()});
  EXPECT_EQ(formula.ToSmtLib(), "(and \n; first\nfalse true)");
}

TEST(FormulaTest, EqualityIsStructural) {
  EXPECT_EQ(Formula::Equals(Term::Integer(1), Term::Integer(2)),
            Formula::Equals(Term::Integer(1), Term::Integer(2)));
  EXPECT_NE(Formula::Equals(Term::Integer(1), Term::Integer(2)),
            Formula::Equals(Term::Integer(2), Term::Integer(1)));
  EXPECT_NE(Formula::And({}), Formula::True());
}

void FieldNamesAppearInProjections(Field field) {
  std::string rendered =
      Formula::Equals(Term::FieldOf(field, Term::Parameter("x")),
                      Term::Integer(1))
          .ToSmtLib();
  EXPECT_THAT(rendered, StartsWith("(= ("));
  EXPECT_THAT(rendered, Not(HasSubstr("Unspecified")));
}
FUZZ_TEST(FormulaTest, FieldNamesAppearInProjections)
    .WithDomains(FieldDomain());

}  // namespace
}  // namespace netsat
