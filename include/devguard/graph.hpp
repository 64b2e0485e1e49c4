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

#pragma once

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace devguard {

using json = nlohmann::json;

// Dependency graph over integer node ids. Edges point from the dependent
// to the dependency.
class Graph {
public:
    // Add a node; false if a node with the same id already exists
    bool add_node(Node node);

    // Add an edge. An identical (source, target, kind) edge is merged,
    // keeping the higher confidence. Throws ValidationError when either
    // endpoint is unknown.
    void add_edge(const Edge &edge);

    // Order edges and rebuild the adjacency indices
    void finalize();

    // Lookup
    const Node *find_node(NodeId id) const;
    bool has_node(NodeId id) const { return nodes_.count(id) != 0; }

    // File (or Module) node of a path, INVALID_NODE_ID if none
    NodeId file_node(const std::string &path) const;

    // Nodes ordered by id
    const std::map<NodeId, Node> &nodes() const { return nodes_; }

    // Edges ordered by (source, target, kind); valid after finalize()
    const std::vector<Edge> &edges() const { return edges_; }

    // Indices into edges() of the edges leaving / entering a node
    const std::vector<size_t> &out_edges(NodeId id) const;
    const std::vector<size_t> &in_edges(NodeId id) const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }

    // Serialize nodes and edges
    json to_json() const;

    // Load from JSON
    static Graph from_json(const json &j);

private:
    using EdgeKey = std::tuple<NodeId, NodeId, EdgeKind>;

    std::map<NodeId, Node> nodes_;
    std::map<EdgeKey, Edge> merged_;
    std::vector<Edge> edges_;
    std::unordered_map<NodeId, std::vector<size_t>> out_index_;
    std::unordered_map<NodeId, std::vector<size_t>> in_index_;
    std::unordered_map<std::string, NodeId> file_nodes_;
};

json node_to_json(const Node &node);
Node node_from_json(const json &j);

json edge_to_json(const Edge &edge);
Edge edge_from_json(const json &j);

} // namespace devguard
