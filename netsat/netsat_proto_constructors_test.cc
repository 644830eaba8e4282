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

#include "netsat/netsat_proto_constructors.h"

#include <cstdint>

#include "fuzztest/fuzztest.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "gutil/proto_matchers.h"
#include "netsat/netsat.pb.h"

namespace netsat {
namespace {

using ::gutil::EqualsProto;

// -- Predicates ---------------------------------------------------------------

TEST(PredicateConstructorsTest, Constants) {
  EXPECT_THAT(TrueProto(), EqualsProto(R"pb(bool_constant { value: true })pb"));
  EXPECT_THAT(FalseProto(),
              EqualsProto(R"pb(bool_constant { value: false })pb"));
}

void MatchSetsFieldAndValue(Field field, int64_t value) {
  PredicateProto match = MatchProto(field, value);
  ASSERT_TRUE(match.has_match());
  EXPECT_EQ(match.match().field(), field);
  EXPECT_EQ(match.match().value(), value);
}
FUZZ_TEST(PredicateConstructorsTest, MatchSetsFieldAndValue);

void BinaryPredicatesKeepOperandOrder(PredicateProto left,
                                      PredicateProto right) {
  PredicateProto and_op = AndProto(left, right);
  EXPECT_THAT(and_op.and_op().left(), EqualsProto(left));
  EXPECT_THAT(and_op.and_op().right(), EqualsProto(right));

  PredicateProto or_op = OrProto(left, right);
  EXPECT_THAT(or_op.or_op().left(), EqualsProto(left));
  EXPECT_THAT(or_op.or_op().right(), EqualsProto(right));

  EXPECT_THAT(NotProto(left).not_op().negand(), EqualsProto(left));
}
FUZZ_TEST(PredicateConstructorsTest, BinaryPredicatesKeepOperandOrder);

TEST(PredicateConstructorsTest, LocatedAtMatchesSwitchAndPort) {
  EXPECT_THAT(LocatedAtProto(3, 7), EqualsProto(R"pb(
                and_op {
                  left { match { field: FIELD_SWITCH value: 3 } }
                  right { match { field: FIELD_IN_PORT value: 7 } }
                }
              )pb"));
}

// -- Policies -----------------------------------------------------------------

TEST(PolicyConstructorsTest, Modification) {
  EXPECT_THAT(
      ModificationProto(FIELD_VLAN, 10),
      EqualsProto(R"pb(modification { field: FIELD_VLAN value: 10 })pb"));
}

TEST(PolicyConstructorsTest, Link) {
  EXPECT_THAT(LinkProto(1, 2, 3, 4), EqualsProto(R"pb(
                link { src_switch: 1 src_port: 2 dst_switch: 3 dst_port: 4 }
              )pb"));
}

TEST(PolicyConstructorsTest, Choice) {
  EXPECT_THAT(ChoiceProto(AcceptProto(), DenyProto(), 0.25), EqualsProto(R"pb(
                choice_op {
                  left { filter { bool_constant { value: true } } }
                  right { filter { bool_constant { value: false } } }
                  left_weight: 0.25
                }
              )pb"));
}

TEST(PolicyConstructorsTest, DenyAndAcceptAreFilters) {
  EXPECT_THAT(DenyProto(),
              EqualsProto(R"pb(filter { bool_constant { value: false } })pb"));
  EXPECT_THAT(AcceptProto(),
              EqualsProto(R"pb(filter { bool_constant { value: true } })pb"));
}

TEST(PolicyConstructorsTest, MoveToSetsSwitchThenPort) {
  EXPECT_THAT(MoveToProto(2, 1), EqualsProto(R"pb(
                sequence_op {
                  left { modification { field: FIELD_SWITCH value: 2 } }
                  right { modification { field: FIELD_IN_PORT value: 1 } }
                }
              )pb"));
}

void CompositionsKeepOperandOrder(PolicyProto left, PolicyProto right) {
  PolicyProto sequence = SequenceProto(left, right);
  EXPECT_THAT(sequence.sequence_op().left(), EqualsProto(left));
  EXPECT_THAT(sequence.sequence_op().right(), EqualsProto(right));

  PolicyProto union_op = UnionProto(left, right);
  EXPECT_THAT(union_op.union_op().left(), EqualsProto(left));
  EXPECT_THAT(union_op.union_op().right(), EqualsProto(right));

  EXPECT_THAT(IterateProto(left).iterate_op().iterable(), EqualsProto(left));
}
FUZZ_TEST(PolicyConstructorsTest, CompositionsKeepOperandOrder);

// -- Shorthand ----------------------------------------------------------------

TEST(AsShorthandStringTest, Predicates) {
  EXPECT_EQ(AsShorthandString(NotProto(AndProto(
                MatchProto(FIELD_SWITCH, 1),
                OrProto(TrueProto(), MatchProto(FIELD_VLAN, 7))))),
            "!(@Switch==1 && (true || @Vlan==7))");
  EXPECT_EQ(AsShorthandString(PredicateProto()), "false");
}

TEST(AsShorthandStringTest, Policies) {
  EXPECT_EQ(AsShorthandString(IterateProto(SequenceProto(
                UnionProto(ModificationProto(FIELD_IN_PORT, 2), AcceptProto()),
                LinkProto(1, 2, 3, 4)))),
            "((@InPort:=2 + true); 1@2=>3@4)*");
  EXPECT_EQ(AsShorthandString(PolicyProto()), "deny");
}

TEST(AsShorthandStringTest, ChoiceIncludesWeight) {
  EXPECT_EQ(AsShorthandString(ChoiceProto(AcceptProto(), DenyProto(), 0.5)),
            "(true (+)0.5 false)");
}

TEST(AsShorthandStringTest, NegativeValues) {
  EXPECT_EQ(AsShorthandString(ModificationProto(FIELD_VLAN, -3)),
            "@Vlan:=-3");
}

}  // namespace
}  // namespace netsat
