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

#include "netsat/frontend.h"

#include <utility>

#include "absl/status/status.h"
#include "fuzztest/fuzztest.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "gutil/proto_matchers.h"
#include "gutil/status_matchers.h"
#include "netsat/gtest_utils.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"

namespace netsat {
namespace {

using ::gutil::EqualsProto;
using ::gutil::StatusIs;
using ::netsat::netsat_test::AtomicPolicyDomain;
using ::netsat::netsat_test::AtomicPredicateDomain;
using ::netsat::netsat_test::FieldDomain;
using ::testing::HasSubstr;

void MatchToProtoIsCorrect(Field field, int64_t value) {
  EXPECT_THAT(Match(field, value).ToProto(),
              EqualsProto(MatchProto(field, value)));
}
FUZZ_TEST(FrontEndTest, MatchToProtoIsCorrect)
    .WithDomains(FieldDomain(), fuzztest::Arbitrary<int64_t>());

TEST(FrontEndTest, TrueToProtoIsCorrect) {
  EXPECT_THAT(Predicate::True().ToProto(), EqualsProto(TrueProto()));
}

TEST(FrontEndTest, FalseToProtoIsCorrect) {
  EXPECT_THAT(Predicate::False().ToProto(), EqualsProto(FalseProto()));
}

void OperationOrderIsPreserved(Predicate a, Predicate b, Predicate c) {
  Predicate abc = !(a || b) && c || a;
  EXPECT_THAT(
      abc.ToProto(),
      EqualsProto(OrProto(
          AndProto(NotProto(OrProto(a.ToProto(), b.ToProto())), c.ToProto()),
          a.ToProto())));
}
FUZZ_TEST(FrontEndTest, OperationOrderIsPreserved)
    .WithDomains(/*a=*/AtomicPredicateDomain(),
                 /*b=*/AtomicPredicateDomain(),
                 /*c=*/AtomicPredicateDomain());

void FromProtoAcceptsProtosBuiltByFrontEnd(Predicate predicate) {
  EXPECT_OK(Predicate::FromProto(predicate.ToProto()));
}
FUZZ_TEST(FrontEndTest, FromProtoAcceptsProtosBuiltByFrontEnd)
    .WithDomains(AtomicPredicateDomain());

TEST(FrontEndTest, PredicateFromProtoRejectsUnsetPredicate) {
  EXPECT_THAT(Predicate::FromProto(PredicateProto()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(FrontEndTest, PredicateFromProtoRejectsUnspecifiedField) {
  EXPECT_THAT(Predicate::FromProto(MatchProto(FIELD_UNSPECIFIED, 1)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("FIELD_UNSPECIFIED")));
}

TEST(FrontEndTest, PredicateFromProtoRejectsMissingOperand) {
  PredicateProto and_with_missing_rhs = AndProto(TrueProto(), TrueProto());
  and_with_missing_rhs.mutable_and_op()->clear_right();
  EXPECT_THAT(Predicate::FromProto(and_with_missing_rhs),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("And's rhs is invalid")));
}

TEST(FrontEndTest, PolicyFromProtoRejectsUnsetPolicy) {
  EXPECT_THAT(Policy::FromProto(PolicyProto()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(FrontEndTest, PolicyFromProtoRejectsNestedInvalidPolicy) {
  EXPECT_THAT(Policy::FromProto(IterateProto(
                  SequenceProto(AcceptProto(), UnionProto(AcceptProto(),
                                                          PolicyProto())))),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Union's rhs is invalid")));
}

TEST(FrontEndTest, PolicyFromProtoRejectsOutOfRangeChoiceWeight) {
  EXPECT_THAT(
      Policy::FromProto(ChoiceProto(AcceptProto(), DenyProto(), 1.5)),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("left_weight")));
}

TEST(FrontEndTest, PolicyFromProtoAcceptsLinksAndChoices) {
  EXPECT_OK(Policy::FromProto(
      UnionProto(LinkProto(1, 1, 2, 1),
                 ChoiceProto(AcceptProto(), DenyProto(), 0.25))));
}

TEST(FrontEndTest, AcceptAndDenyAreFilters) {
  EXPECT_THAT(Policy::Accept().ToProto(), EqualsProto(AcceptProto()));
  EXPECT_THAT(Policy::Deny().ToProto(), EqualsProto(DenyProto()));
}

void FilterToProtoIsCorrect(Predicate predicate) {
  EXPECT_THAT(Filter(predicate).ToProto(),
              EqualsProto(FilterProto(predicate.ToProto())));
}
FUZZ_TEST(FrontEndTest, FilterToProtoIsCorrect)
    .WithDomains(AtomicPredicateDomain());

TEST(FrontEndTest, ModifyToProtoIsCorrect) {
  EXPECT_THAT(Modify(FIELD_VLAN, 7).ToProto(),
              EqualsProto(ModificationProto(FIELD_VLAN, 7)));
}

TEST(FrontEndTest, LinkToProtoIsCorrect) {
  EXPECT_THAT(Link(1, 2, 3, 4).ToProto(), EqualsProto(LinkProto(1, 2, 3, 4)));
}

TEST(FrontEndTest, EmptySequenceIsAccept) {
  EXPECT_THAT(Sequence().ToProto(), EqualsProto(AcceptProto()));
}

TEST(FrontEndTest, EmptyUnionIsDeny) {
  EXPECT_THAT(Union().ToProto(), EqualsProto(DenyProto()));
}

void SingleSequenceIsIdentity(Policy policy) {
  EXPECT_THAT(Sequence(policy).ToProto(), EqualsProto(policy.ToProto()));
}
FUZZ_TEST(FrontEndTest, SingleSequenceIsIdentity)
    .WithDomains(AtomicPolicyDomain());

void SequenceIsLeftAssociative(Policy a, Policy b, Policy c) {
  EXPECT_THAT(Sequence(a, b, c).ToProto(),
              EqualsProto(SequenceProto(
                  SequenceProto(a.ToProto(), b.ToProto()), c.ToProto())));
}
FUZZ_TEST(FrontEndTest, SequenceIsLeftAssociative)
    .WithDomains(AtomicPolicyDomain(), AtomicPolicyDomain(),
                 AtomicPolicyDomain());

void UnionIsLeftAssociative(Policy a, Policy b, Policy c) {
  EXPECT_THAT(Union(a, b, c).ToProto(),
              EqualsProto(UnionProto(UnionProto(a.ToProto(), b.ToProto()),
                                     c.ToProto())));
}
FUZZ_TEST(FrontEndTest, UnionIsLeftAssociative)
    .WithDomains(AtomicPolicyDomain(), AtomicPolicyDomain(),
                 AtomicPolicyDomain());

void IterateToProtoIsCorrect(Policy policy) {
  EXPECT_THAT(Iterate(policy).ToProto(),
              EqualsProto(IterateProto(policy.ToProto())));
}
FUZZ_TEST(FrontEndTest, IterateToProtoIsCorrect)
    .WithDomains(AtomicPolicyDomain());

}  // namespace
}  // namespace netsat
