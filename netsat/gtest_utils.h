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

#ifndef NETSAT_NETSAT_GTEST_UTILS_H_
#define NETSAT_NETSAT_GTEST_UTILS_H_

#include <cstdint>

#include "fuzztest/fuzztest.h"
#include "netsat/evaluator.h"
#include "netsat/frontend.h"
#include "netsat/netsat.pb.h"

namespace netsat::netsat_test {

// Any valid, specified packet field.
fuzztest::Domain<Field> FieldDomain();

// Field values drawn from a small range, so that independently generated
// tests and modifications collide often.
fuzztest::Domain<int64_t> SmallValueDomain();

// Concrete packets with arbitrary subsets of fields set to small values.
fuzztest::Domain<Packet> PacketDomain();

// True, False, or a single field test.
fuzztest::Domain<Predicate> AtomicPredicateDomain();

// Predicates of the form `!(a && b) || (c && !d)` over atomic predicates,
// exercising every predicate constructor.
fuzztest::Domain<Predicate> CompoundPredicateDomain();

// A filter by an atomic predicate or a single modification.
fuzztest::Domain<Policy> AtomicPolicyDomain();

}  // namespace netsat::netsat_test

#endif  // NETSAT_NETSAT_GTEST_UTILS_H_
