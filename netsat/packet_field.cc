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

#include "netsat/packet_field.h"

#include <string>

#include "absl/types/span.h"
#include "netsat/netsat.pb.h"

namespace netsat {

absl::Span<const Field> AllFields() {
  static constexpr Field kAllFields[] = {
      FIELD_IN_PORT,      FIELD_ETH_SRC,     FIELD_ETH_DST,
      FIELD_ETH_TYPE,     FIELD_VLAN,        FIELD_VLAN_PCP,
      FIELD_IP_PROTO,     FIELD_IP4_SRC,     FIELD_IP4_DST,
      FIELD_TCP_SRC_PORT, FIELD_TCP_DST_PORT, FIELD_SWITCH,
  };
  return kAllFields;
}

bool IsValidField(Field field) {
  return field != FIELD_UNSPECIFIED && Field_IsValid(field);
}

std::string FieldName(Field field) {
  switch (field) {
    case FIELD_IN_PORT:
      return "InPort";
    case FIELD_ETH_SRC:
      return "EthSrc";
    case FIELD_ETH_DST:
      return "EthDst";
    case FIELD_ETH_TYPE:
      return "EthType";
    case FIELD_VLAN:
      return "Vlan";
    case FIELD_VLAN_PCP:
      return "VlanPcp";
    case FIELD_IP_PROTO:
      return "IPProto";
    case FIELD_IP4_SRC:
      return "IP4Src";
    case FIELD_IP4_DST:
      return "IP4Dst";
    case FIELD_TCP_SRC_PORT:
      return "TCPSrcPort";
    case FIELD_TCP_DST_PORT:
      return "TCPDstPort";
    case FIELD_SWITCH:
      return "Switch";
    default:
      return "Unspecified";
  }
}

}  // namespace netsat
