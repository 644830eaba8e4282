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

#include "netsat/gtest_utils.h"

#include <cstdint>
#include <utility>
#include <vector>

#include "fuzztest/fuzztest.h"
#include "netsat/evaluator.h"
#include "netsat/frontend.h"
#include "netsat/netsat.pb.h"
#include "netsat/packet_field.h"

namespace netsat::netsat_test {

using ::fuzztest::ContainerOf;
using ::fuzztest::ElementOf;
using ::fuzztest::InRange;
using ::fuzztest::Just;
using ::fuzztest::Map;
using ::fuzztest::OneOf;
using ::fuzztest::PairOf;

fuzztest::Domain<Field> FieldDomain() {
  return ElementOf<Field>(
      std::vector<Field>(AllFields().begin(), AllFields().end()));
}

fuzztest::Domain<int64_t> SmallValueDomain() { return InRange<int64_t>(0, 4); }

fuzztest::Domain<Packet> PacketDomain() {
  return ContainerOf<Packet>(PairOf(FieldDomain(), SmallValueDomain()));
}

fuzztest::Domain<Predicate> AtomicPredicateDomain() {
  return OneOf(Just(Predicate::True()), Just(Predicate::False()),
               Map(Match, FieldDomain(), SmallValueDomain()));
}

fuzztest::Domain<Predicate> CompoundPredicateDomain() {
  return Map(
      [](Predicate a, Predicate b, Predicate c, Predicate d) {
        return !(std::move(a) && std::move(b)) ||
               (std::move(c) && !std::move(d));
      },
      AtomicPredicateDomain(), AtomicPredicateDomain(),
      AtomicPredicateDomain(), AtomicPredicateDomain());
}

fuzztest::Domain<Policy> AtomicPolicyDomain() {
  return OneOf(Map(Filter, AtomicPredicateDomain()),
               Map(Modify, FieldDomain(), SmallValueDomain()));
}

}  // namespace netsat::netsat_test
