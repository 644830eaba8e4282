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

#include <string>

#include "absl/status/statusor.h"
#include "benchmark/benchmark.h"
#include "netsat/link_removal.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"
#include "netsat/smt_program.h"
#include "netsat/unroller.h"
#include "netsat/verification_context.h"

namespace netsat {
namespace {

// A fixed switch policy that forwards IPv4 traffic by destination, rewrites
// the VLAN of traffic to one host and drops everything else:
//
//   @EthType==0x800;
//   (@Ip4Dst==1; @InPort:=1 + @Ip4Dst==2; @Vlan:=7; @InPort:=2)
//
// We use this, rather than fuzztest::Domain, because we want a fixed policy
// that we can consistently benchmark on.
PolicyProto CreateFixedSwitchPolicy() {
  return SequenceProto(
      FilterProto(MatchProto(FIELD_ETH_TYPE, 0x800)),
      UnionProto(
          SequenceProto(FilterProto(MatchProto(FIELD_IP4_DST, 1)),
                        ModificationProto(FIELD_IN_PORT, 1)),
          SequenceProto(FilterProto(MatchProto(FIELD_IP4_DST, 2)),
                        SequenceProto(ModificationProto(FIELD_VLAN, 7),
                                      ModificationProto(FIELD_IN_PORT, 2)))));
}

// A line of `switch_count` switches, linked on port 2 of each switch to port 1
// of the next one.
PolicyProto CreateLineTopology(int switch_count) {
  PolicyProto topology = DenyProto();
  for (int i = 1; i < switch_count; ++i) {
    topology = UnionProto(topology, LinkProto(i, 2, i + 1, 1));
  }
  return RemoveLinks(topology);
}

PolicyProto CreateNetwork(int switch_count) {
  return IterateProto(SequenceProto(CreateFixedSwitchPolicy(),
                                    CreateLineTopology(switch_count)));
}

// Benchmarks unrolling the network `state.range(0)` times, excluding the
// rendering of the result.
void BM_Unroll(benchmark::State& state) {
  PolicyProto network = CreateNetwork(/*switch_count=*/8);
  for (auto s : state) {
    VerificationContext context;
    absl::StatusOr<UnrolledRelation> relation = Unroll(
        network, context.FreshPacket(), static_cast<int>(state.range(0)),
        context);
    benchmark::DoNotOptimize(relation);
  }
}
BENCHMARK(BM_Unroll)->Range(1, 64);

// Benchmarks unrolling the network `state.range(0)` times and rendering the
// complete SMT-LIB2 program, which is what each reachability check pays
// before calling the solver.
void BM_UnrollAndRender(benchmark::State& state) {
  PolicyProto network = CreateNetwork(/*switch_count=*/8);
  for (auto s : state) {
    VerificationContext context;
    absl::StatusOr<UnrolledRelation> relation = Unroll(
        network, context.FreshPacket(), static_cast<int>(state.range(0)),
        context);
    if (!relation.ok()) {
      state.SkipWithError(relation.status().ToString().c_str());
      break;
    }
    SmtProgram program;
    program.Assert(relation->formula);
    std::string text = program.ToSmtLib(context);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_UnrollAndRender)->Range(1, 64);

// Benchmarks rendering without comments, as done for unannotated programs.
void BM_UnrollAndRenderWithoutComments(benchmark::State& state) {
  PolicyProto network = CreateNetwork(/*switch_count=*/8);
  for (auto s : state) {
    VerificationContext context;
    absl::StatusOr<UnrolledRelation> relation = Unroll(
        network, context.FreshPacket(), static_cast<int>(state.range(0)),
        context);
    if (!relation.ok()) {
      state.SkipWithError(relation.status().ToString().c_str());
      break;
    }
    SmtProgram program;
    program.Assert(relation->formula);
    std::string text = program.ToSmtLib(context, /*with_comments=*/false);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_UnrollAndRenderWithoutComments)->Range(1, 64);

}  // namespace
}  // namespace netsat
