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

#include "netsat/unroller.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "gutil/status_matchers.h"
#include "netsat/formula.h"
#include "netsat/macro_cache.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"
#include "netsat/smt_program.h"
#include "netsat/solver.h"
#include "netsat/symbolic_packet.h"
#include "netsat/verification_context.h"

namespace netsat {
namespace {

using ::gutil::IsOkAndHolds;
using ::gutil::StatusIs;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

PolicyProto Star(PolicyProto policy, PolicyProto topology) {
  return IterateProto(SequenceProto(std::move(policy), std::move(topology)));
}

// Moves packets from switch `from` to switch `to`, dropping all others.
PolicyProto Hop(int from, int to) {
  return SequenceProto(FilterProto(MatchProto(FIELD_SWITCH, from)),
                       ModificationProto(FIELD_SWITCH, to));
}

TEST(UnrollTest, NegativeHopBoundIsRejected) {
  VerificationContext context;
  EXPECT_THAT(Unroll(Star(AcceptProto(), AcceptProto()), context.FreshPacket(),
                     -1, context),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(UnrollTest, NonIterateIsRejected) {
  VerificationContext context;
  EXPECT_THAT(
      Unroll(SequenceProto(AcceptProto(), AcceptProto()),
             context.FreshPacket(), 1, context),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("policy not in accepted normal form")));
}

TEST(UnrollTest, IterateOfNonSequenceIsRejected) {
  VerificationContext context;
  EXPECT_THAT(
      Unroll(IterateProto(UnionProto(AcceptProto(), AcceptProto())),
             context.FreshPacket(), 1, context),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("policy not in accepted normal form")));
}

TEST(UnrollTest, ShapeErrorsInBodyPropagate) {
  VerificationContext context;
  EXPECT_THAT(Unroll(Star(AcceptProto(), LinkProto(1, 1, 2, 1)),
                     context.FreshPacket(), 1, context),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       AllOf(HasSubstr("policy not in accepted normal form"),
                             HasSubstr("Link"))));
  EXPECT_THAT(
      Unroll(Star(IterateProto(AcceptProto()), AcceptProto()),
             context.FreshPacket(), 1, context),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("Iterate")));
}

TEST(UnrollTest, ShapeErrorsInBodyAreReportedAtDepthZero) {
  VerificationContext context;
  EXPECT_THAT(Unroll(Star(AcceptProto(), LinkProto(1, 1, 2, 1)),
                     context.FreshPacket(), 0, context),
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("Link")));
  EXPECT_THAT(
      Unroll(Star(ChoiceProto(AcceptProto(), DenyProto(), 0.5), AcceptProto()),
             context.FreshPacket(), 0, context),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("Choice")));
  EXPECT_THAT(Unroll(Star(AcceptProto(), PolicyProto()), context.FreshPacket(),
                     0, context),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unset policy")));
}

TEST(UnrollTest, ZeroHopsOnlyConstrainsTheInput) {
  VerificationContext context;
  SymbolicPacket input = context.FreshPacket();
  ASSERT_OK_AND_ASSIGN(
      UnrolledRelation unrolled,
      Unroll(Star(AcceptProto(), AcceptProto()), input, 0, context));
  EXPECT_THAT(unrolled.frontier, testing::ElementsAre(input));
  EXPECT_EQ(unrolled.formula.ToSmtLib(/*with_comments=*/false),
            absl::StrCat("(or true (= ", input.name(), " nopacket))"));
}

TEST(UnrollTest, FrontierHasOneFreshPacketPerDepth) {
  for (int k = 0; k <= 4; ++k) {
    VerificationContext context;
    SymbolicPacket input = context.FreshPacket();
    ASSERT_OK_AND_ASSIGN(
        UnrolledRelation unrolled,
        Unroll(Star(AcceptProto(), AcceptProto()), input, k, context));
    ASSERT_THAT(unrolled.frontier, SizeIs(k + 1));
    EXPECT_EQ(unrolled.frontier[0], input);
    absl::flat_hash_set<SymbolicPacket> distinct(unrolled.frontier.begin(),
                                                 unrolled.frontier.end());
    EXPECT_THAT(distinct, SizeIs(k + 1));
  }
}

TEST(UnrollTest, EachDepthIsAnnotated) {
  VerificationContext context;
  ASSERT_OK_AND_ASSIGN(UnrolledRelation unrolled,
                       Unroll(Star(AcceptProto(), Hop(1, 2)),
                              context.FreshPacket(), 2, context));
  std::string rendered = unrolled.formula.ToSmtLib();
  EXPECT_THAT(rendered, AllOf(HasSubstr("; forwarding in 0 hops"),
                              HasSubstr("; forwarding in 1 hops"),
                              HasSubstr("; forwarding in 2 hops"),
                              HasSubstr("; hop 2: topology"),
                              HasSubstr(" was dropped")));
}

TEST(UnrollTest, MacrosAreSharedAcrossDepths) {
  VerificationContext context;
  ASSERT_OK_AND_ASSIGN(UnrolledRelation unrolled,
                       Unroll(Star(AcceptProto(), Hop(1, 2)),
                              context.FreshPacket(), 5, context));
  std::vector<std::string> names;
  for (const Macro& macro : context.macro_cache().macros()) {
    names.push_back(macro.name);
  }
  EXPECT_THAT(names, UnorderedElementsAre("Switch-equals",
                                          "packet-equals-except-Switch",
                                          "mod-Switch"));
}

TEST(UnrollTest, PacketsFollowTheTopology) {
  // 1 -> 2 -> 3, with the identity as switch policy.
  PolicyProto topology = UnionProto(Hop(1, 2), Hop(2, 3));
  VerificationContext context;
  SymbolicPacket input = context.FreshPacket();
  ASSERT_OK_AND_ASSIGN(UnrolledRelation unrolled,
                       Unroll(Star(AcceptProto(), topology), input, 3, context));
  SmtProgram program;
  program.Assert(context.FieldEquals(input, FIELD_SWITCH, 1));
  program.Assert(unrolled.formula);
  Z3Solver solver;

  SmtProgram two_hops = program;
  two_hops.Assert(context.FieldEquals(unrolled.frontier[2], FIELD_SWITCH, 3));
  EXPECT_THAT(solver.IsSatisfiable(two_hops.ToSmtLib(context)),
              IsOkAndHolds(true));

  SmtProgram one_hop = program;
  one_hop.Assert(context.FieldEquals(unrolled.frontier[1], FIELD_SWITCH, 3));
  EXPECT_THAT(solver.IsSatisfiable(one_hop.ToSmtLib(context)),
              IsOkAndHolds(false));

  // Switch 3 has no outgoing link, so the third hop drops the packet.
  SmtProgram three_hops = program;
  three_hops.Assert(IsNotDropped(unrolled.frontier[3]));
  EXPECT_THAT(solver.IsSatisfiable(three_hops.ToSmtLib(context)),
              IsOkAndHolds(false));
}

TEST(UnrollTest, DroppedPacketsSatisfyDeeperDepthsVacuously) {
  VerificationContext context;
  SymbolicPacket input = context.FreshPacket();
  ASSERT_OK_AND_ASSIGN(
      UnrolledRelation unrolled,
      Unroll(Star(FilterProto(FalseProto()), AcceptProto()), input, 3,
             context));
  SmtProgram program;
  program.Assert(context.FieldEquals(input, FIELD_SWITCH, 1));
  program.Assert(unrolled.formula);
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable(program.ToSmtLib(context)),
              IsOkAndHolds(true));

  for (int depth = 1; depth <= 3; ++depth) {
    SmtProgram reached = program;
    reached.Assert(IsNotDropped(unrolled.frontier[depth]));
    EXPECT_THAT(solver.IsSatisfiable(reached.ToSmtLib(context)),
                IsOkAndHolds(false))
        << "depth " << depth;
  }
}

TEST(UnrollTest, FilteringTopologyDoesNotConstrainTheInput) {
  // The topology drops everything, which must not make the input itself
  // unsatisfiable: only the deeper frontier packets are dropped.
  VerificationContext context;
  SymbolicPacket input = context.FreshPacket();
  ASSERT_OK_AND_ASSIGN(
      UnrolledRelation unrolled,
      Unroll(Star(AcceptProto(), DenyProto()), input, 2, context));
  SmtProgram program;
  program.Assert(IsNotDropped(input));
  program.Assert(unrolled.formula);
  Z3Solver solver;
  EXPECT_THAT(solver.IsSatisfiable(program.ToSmtLib(context)),
              IsOkAndHolds(true));
}

}  // namespace
}  // namespace netsat
