// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "devguard/simulator.hpp"
#include "devguard/errors.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace devguard {

const char *change_kind_to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Rename:
        return "rename";
    case ChangeKind::Remove:
        return "remove";
    case ChangeKind::SignatureChange:
        return "signature";
    default:
        return "unknown";
    }
}

ChangeKind change_kind_from_string(const std::string &name) {
    if (name == "rename")
        return ChangeKind::Rename;
    if (name == "remove")
        return ChangeKind::Remove;
    if (name == "signature" || name == "signature_change")
        return ChangeKind::SignatureChange;
    throw ValidationError("unknown change kind: " + name);
}

EdgeMask propagation_mask(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Rename:
        return edge_bit(EdgeKind::Calls) | edge_bit(EdgeKind::ReferencesSchema) |
               edge_bit(EdgeKind::BindsEndpoint);
    case ChangeKind::SignatureChange:
        return edge_bit(EdgeKind::Calls) | edge_bit(EdgeKind::BindsEndpoint);
    case ChangeKind::Remove:
    default:
        return ALL_EDGES;
    }
}

ImpactResult BlastRadiusSimulator::simulate(const Snapshot &snapshot, const ChangeSpec &change,
                                            const CancellationToken &token) const {
    const Graph &graph = snapshot.graph;
    if (!graph.has_node(change.target))
        throw NotFoundError("unknown node id " + node_id_to_string(change.target));

    ImpactResult result;
    result.target = change.target;
    result.change = change.change;
    result.version = snapshot.version;

    const EdgeMask mask = propagation_mask(change.change);
    auto follows = [&](const Edge &edge) {
        if (mask & edge_bit(edge.kind))
            return true;
        return change.change == ChangeKind::Rename && edge.kind == EdgeKind::Imports &&
               edge.target == change.target;
    };

    std::unordered_set<NodeId> visited{change.target};
    std::unordered_map<NodeId, double> frontier{{change.target, 1.0}};
    size_t depth = 0;

    while (!frontier.empty()) {
        if (config_.max_depth != 0 && depth >= config_.max_depth)
            break;
        ++depth;

        // Best bottleneck confidence per newly reached node at this level
        std::unordered_map<NodeId, double> next;
        for (const auto &[id, confidence] : frontier) {
            token.check();
            for (size_t e : graph.in_edges(id)) {
                const Edge &edge = graph.edges()[e];
                if (!follows(edge) || visited.count(edge.source))
                    continue;

                double reached = std::min(confidence, edge.confidence);
                auto it = next.find(edge.source);
                if (it == next.end())
                    next.emplace(edge.source, reached);
                else
                    it->second = std::max(it->second, reached);
            }
        }

        for (const auto &[id, confidence] : next) {
            visited.insert(id);
            result.impacts.push_back({id, depth, confidence});
        }
        frontier = std::move(next);
    }

    std::sort(result.impacts.begin(), result.impacts.end(), [](const Impact &a, const Impact &b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        if (a.confidence != b.confidence)
            return a.confidence > b.confidence;
        return a.node < b.node;
    });
    return result;
}

} // namespace devguard
