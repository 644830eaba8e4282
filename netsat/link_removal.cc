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

#include "netsat/link_removal.h"

#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"

namespace netsat {

PolicyProto RemoveLinks(const PolicyProto& policy) {
  switch (policy.policy_case()) {
    case PolicyProto::kLink: {
      const PolicyProto::Link& link = policy.link();
      return SequenceProto(
          FilterProto(LocatedAtProto(link.src_switch(), link.src_port())),
          MoveToProto(link.dst_switch(), link.dst_port()));
    }
    case PolicyProto::kSequenceOp:
      return SequenceProto(RemoveLinks(policy.sequence_op().left()),
                           RemoveLinks(policy.sequence_op().right()));
    case PolicyProto::kUnionOp:
      return UnionProto(RemoveLinks(policy.union_op().left()),
                        RemoveLinks(policy.union_op().right()));
    case PolicyProto::kIterateOp:
      return IterateProto(RemoveLinks(policy.iterate_op().iterable()));
    case PolicyProto::kChoiceOp:
      return ChoiceProto(RemoveLinks(policy.choice_op().left()),
                         RemoveLinks(policy.choice_op().right()),
                         policy.choice_op().left_weight());
    case PolicyProto::kFilter:
    case PolicyProto::kModification:
    case PolicyProto::POLICY_NOT_SET:
      return policy;
  }
  return policy;
}

}  // namespace netsat
