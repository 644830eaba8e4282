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
//
// -----------------------------------------------------------------------------
// File: topology.h
// -----------------------------------------------------------------------------
//
// A network topology: switches connected by directed port-to-port links.
//
// The topology supplies the hop bound of reachability checks, see `HopBound`,
// and can be converted to and from the `Link` primitives of a policy.

#ifndef NETSAT_NETSAT_TOPOLOGY_H_
#define NETSAT_NETSAT_TOPOLOGY_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "netsat/netsat.pb.h"

namespace netsat {

// A directed link from `src_switch`:`src_port` to `dst_switch`:`dst_port`.
struct TopologyLink {
  int64_t src_switch;
  int64_t src_port;
  int64_t dst_switch;
  int64_t dst_port;

  friend auto operator<=>(const TopologyLink& a,
                          const TopologyLink& b) = default;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const TopologyLink& link) {
    absl::Format(&sink, "%d@%d=>%d@%d", link.src_switch, link.src_port,
                 link.dst_switch, link.dst_port);
  }
};

class Topology {
 public:
  Topology() = default;

  // Extracts the topology formed by all `Link`s occurring in `policy`.
  static Topology FromPolicy(const PolicyProto& policy);

  // Adds a switch. Adding a switch twice keeps the first name.
  void AddSwitch(int64_t id, std::string name = "");

  // Adds a directed link, and its endpoints if they are not known yet. Adding
  // the same link twice has no effect.
  void AddLink(const TopologyLink& link);

  // Adds `link` and its reverse.
  void AddBidirectionalLink(const TopologyLink& link);

  // Returns the ids of all switches, in increasing order.
  std::vector<int64_t> GetSwitchIds() const;

  // Returns the name given to `switch_id`, or NotFound.
  absl::StatusOr<std::string> GetSwitchName(int64_t switch_id) const;

  // All links, in insertion order.
  const std::vector<TopologyLink>& links() const { return links_; }

  // Returns the ports of `switch_id` that are connected to a link, in
  // increasing order. Returns NotFound for unknown switches.
  absl::StatusOr<std::vector<int64_t>> PortsOfSwitch(int64_t switch_id) const;

  // Returns the (source port, destination port) of the first link from `src`
  // to `dst`. Returns NotFound if there is no such link.
  absl::StatusOr<std::pair<int64_t, int64_t>> GetPorts(int64_t src,
                                                       int64_t dst) const;

  // Returns the link leaving `switch_id` through `port`. Returns NotFound for
  // unknown switches and unconnected ports.
  absl::StatusOr<TopologyLink> NextHop(int64_t switch_id, int64_t port) const;

  // Returns a path from `src` to `dst` with a minimal number of links. The
  // path from a switch to itself is empty.
  //
  // Returns NotFound if either switch is unknown or `dst` is not reachable from
  // `src`.
  absl::StatusOr<std::vector<TopologyLink>> ShortestPath(int64_t src,
                                                         int64_t dst) const;

  // Returns the longest shortest path length among all ordered pairs of
  // switches connected by some path, i.e. the diameter of the network ignoring
  // disconnected pairs. Returns 0 if there are no links.
  int HopBound() const;

  // Returns the union of `Link` policies for all links, or Deny if there are
  // none.
  PolicyProto ToPolicy() const;

 private:
  // Returns the number of links on a shortest path from `src` to every switch
  // reachable from it.
  absl::btree_map<int64_t, int> Distances(int64_t src) const;

  // Switch id -> name.
  absl::btree_map<int64_t, std::string> switches_;
  std::vector<TopologyLink> links_;
  // Switch id -> indices into `links_` of the links leaving it.
  absl::btree_map<int64_t, std::vector<int>> outgoing_links_;
};

}  // namespace netsat

#endif  // NETSAT_NETSAT_TOPOLOGY_H_
