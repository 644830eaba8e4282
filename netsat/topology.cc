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

#include "netsat/topology.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/status/statusor.h"
#include "gutil/status.h"
#include "netsat/netsat.pb.h"
#include "netsat/netsat_proto_constructors.h"

namespace netsat {
namespace {

void CollectLinks(const PolicyProto& policy, Topology& topology) {
  switch (policy.policy_case()) {
    case PolicyProto::kLink:
      topology.AddLink({
          .src_switch = policy.link().src_switch(),
          .src_port = policy.link().src_port(),
          .dst_switch = policy.link().dst_switch(),
          .dst_port = policy.link().dst_port(),
      });
      return;
    case PolicyProto::kSequenceOp:
      CollectLinks(policy.sequence_op().left(), topology);
      CollectLinks(policy.sequence_op().right(), topology);
      return;
    case PolicyProto::kUnionOp:
      CollectLinks(policy.union_op().left(), topology);
      CollectLinks(policy.union_op().right(), topology);
      return;
    case PolicyProto::kIterateOp:
      CollectLinks(policy.iterate_op().iterable(), topology);
      return;
    case PolicyProto::kChoiceOp:
      CollectLinks(policy.choice_op().left(), topology);
      CollectLinks(policy.choice_op().right(), topology);
      return;
    case PolicyProto::kFilter:
    case PolicyProto::kModification:
    case PolicyProto::POLICY_NOT_SET:
      return;
  }
}

}  // namespace

Topology Topology::FromPolicy(const PolicyProto& policy) {
  Topology topology;
  CollectLinks(policy, topology);
  return topology;
}

void Topology::AddSwitch(int64_t id, std::string name) {
  switches_.try_emplace(id, std::move(name));
}

void Topology::AddLink(const TopologyLink& link) {
  if (std::find(links_.begin(), links_.end(), link) != links_.end()) return;
  AddSwitch(link.src_switch);
  AddSwitch(link.dst_switch);
  outgoing_links_[link.src_switch].push_back(links_.size());
  links_.push_back(link);
}

void Topology::AddBidirectionalLink(const TopologyLink& link) {
  AddLink(link);
  AddLink({
      .src_switch = link.dst_switch,
      .src_port = link.dst_port,
      .dst_switch = link.src_switch,
      .dst_port = link.src_port,
  });
}

std::vector<int64_t> Topology::GetSwitchIds() const {
  std::vector<int64_t> ids;
  ids.reserve(switches_.size());
  for (const auto& [id, name] : switches_) ids.push_back(id);
  return ids;
}

absl::StatusOr<std::string> Topology::GetSwitchName(int64_t switch_id) const {
  auto it = switches_.find(switch_id);
  if (it == switches_.end()) {
    return gutil::NotFoundErrorBuilder() << "unknown switch " << switch_id;
  }
  return it->second;
}

absl::StatusOr<std::vector<int64_t>> Topology::PortsOfSwitch(
    int64_t switch_id) const {
  if (!switches_.contains(switch_id)) {
    return gutil::NotFoundErrorBuilder()
           << "cannot get ports of unknown switch " << switch_id;
  }
  absl::btree_set<int64_t> ports;
  for (const TopologyLink& link : links_) {
    if (link.src_switch == switch_id) ports.insert(link.src_port);
    if (link.dst_switch == switch_id) ports.insert(link.dst_port);
  }
  return std::vector<int64_t>(ports.begin(), ports.end());
}

absl::StatusOr<std::pair<int64_t, int64_t>> Topology::GetPorts(
    int64_t src, int64_t dst) const {
  if (auto it = outgoing_links_.find(src); it != outgoing_links_.end()) {
    for (int index : it->second) {
      const TopologyLink& link = links_[index];
      if (link.dst_switch == dst) {
        return std::make_pair(link.src_port, link.dst_port);
      }
    }
  }
  return gutil::NotFoundErrorBuilder()
         << "no link from switch " << src << " to switch " << dst;
}

absl::StatusOr<TopologyLink> Topology::NextHop(int64_t switch_id,
                                               int64_t port) const {
  if (!switches_.contains(switch_id)) {
    return gutil::NotFoundErrorBuilder()
           << "cannot get next hop of unknown switch " << switch_id;
  }
  if (auto it = outgoing_links_.find(switch_id); it != outgoing_links_.end()) {
    for (int index : it->second) {
      if (links_[index].src_port == port) return links_[index];
    }
  }
  return gutil::NotFoundErrorBuilder()
         << "port " << port << " of switch " << switch_id
         << " is not connected";
}

absl::StatusOr<std::vector<TopologyLink>> Topology::ShortestPath(
    int64_t src, int64_t dst) const {
  for (int64_t id : {src, dst}) {
    if (!switches_.contains(id)) {
      return gutil::NotFoundErrorBuilder() << "unknown switch " << id;
    }
  }

  // Breadth-first search, remembering the link through which each switch was
  // first reached.
  absl::btree_map<int64_t, int> reached_by = {{src, -1}};
  std::queue<int64_t> frontier;
  frontier.push(src);
  while (!frontier.empty() && !reached_by.contains(dst)) {
    int64_t current = frontier.front();
    frontier.pop();
    auto it = outgoing_links_.find(current);
    if (it == outgoing_links_.end()) continue;
    for (int index : it->second) {
      int64_t next = links_[index].dst_switch;
      if (reached_by.try_emplace(next, index).second) frontier.push(next);
    }
  }
  if (!reached_by.contains(dst)) {
    return gutil::NotFoundErrorBuilder()
           << "no path from switch " << src << " to switch " << dst;
  }

  std::vector<TopologyLink> path;
  for (int64_t current = dst; current != src;) {
    const TopologyLink& link = links_[reached_by.at(current)];
    path.push_back(link);
    current = link.src_switch;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

absl::btree_map<int64_t, int> Topology::Distances(int64_t src) const {
  absl::btree_map<int64_t, int> distances = {{src, 0}};
  std::queue<int64_t> frontier;
  frontier.push(src);
  while (!frontier.empty()) {
    int64_t current = frontier.front();
    frontier.pop();
    auto it = outgoing_links_.find(current);
    if (it == outgoing_links_.end()) continue;
    int distance = distances.at(current) + 1;
    for (int index : it->second) {
      if (distances.try_emplace(links_[index].dst_switch, distance).second) {
        frontier.push(links_[index].dst_switch);
      }
    }
  }
  return distances;
}

int Topology::HopBound() const {
  int bound = 0;
  for (const auto& [id, name] : switches_) {
    for (const auto& [other, distance] : Distances(id)) {
      bound = std::max(bound, distance);
    }
  }
  return bound;
}

PolicyProto Topology::ToPolicy() const {
  if (links_.empty()) return DenyProto();
  PolicyProto policy = LinkProto(links_[0].src_switch, links_[0].src_port,
                                 links_[0].dst_switch, links_[0].dst_port);
  for (size_t i = 1; i < links_.size(); ++i) {
    policy = UnionProto(std::move(policy),
                        LinkProto(links_[i].src_switch, links_[i].src_port,
                                  links_[i].dst_switch, links_[i].dst_port));
  }
  return policy;
}

}  // namespace netsat
