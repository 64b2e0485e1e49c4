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

#include "devguard/graph.hpp"
#include "devguard/errors.hpp"

namespace devguard {

bool Graph::add_node(Node node) {
    NodeId id = node.id;
    if (nodes_.count(id)) {
        return false;
    }

    if (node.kind == NodeKind::File || node.kind == NodeKind::Module) {
        file_nodes_.emplace(node.path, id);
    }
    nodes_.emplace(id, std::move(node));
    return true;
}

void Graph::add_edge(const Edge &edge) {
    if (!has_node(edge.source) || !has_node(edge.target)) {
        throw ValidationError("Edge " + node_id_to_string(edge.source) + " -> " +
                              node_id_to_string(edge.target) + " references an unknown node");
    }

    EdgeKey key{edge.source, edge.target, edge.kind};
    auto it = merged_.find(key);
    if (it == merged_.end()) {
        merged_.emplace(key, edge);
    } else if (edge.confidence > it->second.confidence) {
        // Equal confidence keeps the first provenance seen
        it->second = edge;
    }
}

void Graph::finalize() {
    edges_.clear();
    out_index_.clear();
    in_index_.clear();
    edges_.reserve(merged_.size());

    // std::map iteration is already (source, target, kind) order
    for (const auto &[key, edge] : merged_) {
        size_t index = edges_.size();
        edges_.push_back(edge);
        out_index_[edge.source].push_back(index);
        in_index_[edge.target].push_back(index);
    }
}

const Node *Graph::find_node(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

NodeId Graph::file_node(const std::string &path) const {
    auto it = file_nodes_.find(path);
    return it != file_nodes_.end() ? it->second : INVALID_NODE_ID;
}

const std::vector<size_t> &Graph::out_edges(NodeId id) const {
    static const std::vector<size_t> empty;
    auto it = out_index_.find(id);
    return it != out_index_.end() ? it->second : empty;
}

const std::vector<size_t> &Graph::in_edges(NodeId id) const {
    static const std::vector<size_t> empty;
    auto it = in_index_.find(id);
    return it != in_index_.end() ? it->second : empty;
}

json node_to_json(const Node &node) {
    json j;
    j["id"] = node_id_to_string(node.id);
    j["kind"] = node_kind_to_string(node.kind);
    j["language"] = language_to_string(node.language);
    j["path"] = node.path;
    j["qualified_name"] = node.qualified_name;
    j["name"] = node.name;
    j["lines"] = {node.lines.first, node.lines.last};

    json signature = json::array();
    for (const auto &param : node.signature) {
        signature.push_back({{"name", param.name}, {"type", param.type}});
    }
    j["signature"] = std::move(signature);

    if (node.kind == NodeKind::Endpoint) {
        j["http_verb"] = node.http_verb;
        j["route"] = node.route;
    }
    return j;
}

Node node_from_json(const json &j) {
    Node node;
    node.id = node_id_from_string(j.at("id").get<std::string>());
    if (node.id == INVALID_NODE_ID) {
        throw ValidationError("Invalid node id: " + j.at("id").dump());
    }
    node.kind = node_kind_from_string(j.at("kind").get<std::string>());
    node.language = language_from_string(j.value("language", std::string("unknown")));
    node.path = j.at("path").get<std::string>();
    node.qualified_name = j.at("qualified_name").get<std::string>();
    node.name = j.value("name", node.qualified_name);

    if (j.contains("lines") && j["lines"].size() == 2) {
        node.lines.first = j["lines"][0].get<uint32_t>();
        node.lines.last = j["lines"][1].get<uint32_t>();
    }

    if (j.contains("signature")) {
        for (const auto &param : j["signature"]) {
            node.signature.push_back(
                {param.at("name").get<std::string>(), param.value("type", std::string())});
        }
    }

    node.http_verb = j.value("http_verb", std::string());
    node.route = j.value("route", std::string());
    return node;
}

json edge_to_json(const Edge &edge) {
    json j;
    j["source"] = node_id_to_string(edge.source);
    j["target"] = node_id_to_string(edge.target);
    j["kind"] = edge_kind_to_string(edge.kind);
    j["confidence"] = edge.confidence;
    j["provenance"]["path"] = edge.provenance.path;
    j["provenance"]["lines"] = {edge.provenance.lines.first, edge.provenance.lines.last};
    return j;
}

Edge edge_from_json(const json &j) {
    Edge edge;
    edge.source = node_id_from_string(j.at("source").get<std::string>());
    edge.target = node_id_from_string(j.at("target").get<std::string>());
    edge.kind = edge_kind_from_string(j.at("kind").get<std::string>());
    if (edge.source == INVALID_NODE_ID || edge.target == INVALID_NODE_ID) {
        throw ValidationError("Invalid edge endpoint id");
    }
    edge.confidence = j.value("confidence", 1.0);

    if (edge.confidence < 0.0 || edge.confidence > 1.0) {
        throw ValidationError("Edge confidence out of range [0, 1]");
    }

    if (j.contains("provenance")) {
        const auto &prov = j["provenance"];
        edge.provenance.path = prov.value("path", std::string());
        if (prov.contains("lines") && prov["lines"].size() == 2) {
            edge.provenance.lines.first = prov["lines"][0].get<uint32_t>();
            edge.provenance.lines.last = prov["lines"][1].get<uint32_t>();
        }
    }
    return edge;
}

// Serialize to JSON
json Graph::to_json() const {
    json j;

    json nodes = json::array();
    for (const auto &[id, node] : nodes_) {
        nodes.push_back(node_to_json(node));
    }
    j["nodes"] = std::move(nodes);

    json edges = json::array();
    for (const auto &edge : edges_) {
        edges.push_back(edge_to_json(edge));
    }
    j["edges"] = std::move(edges);

    return j;
}

// Load from JSON
Graph Graph::from_json(const json &j) {
    Graph g;

    try {
        for (const auto &item : j.at("nodes")) {
            Node node = node_from_json(item);
            NodeId id = node.id;
            if (!g.add_node(std::move(node))) {
                throw ValidationError("Duplicate node id " + node_id_to_string(id));
            }
        }

        for (const auto &item : j.at("edges")) {
            g.add_edge(edge_from_json(item));
        }
    } catch (const json::exception &e) {
        throw ValidationError(std::string("Malformed graph: ") + e.what());
    }

    g.finalize();
    return g;
}

} // namespace devguard
