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

#include "devguard/engine.hpp"
#include "devguard/errors.hpp"
#include "devguard/graph_builder.hpp"
#include "devguard/indexer.hpp"
#include <algorithm>
#include <iostream>

namespace devguard {

std::string symbol_display_name(const Node &node) {
    if (node.kind == NodeKind::File || node.kind == NodeKind::Module)
        return node.path;
    return node.path + "::" + node.qualified_name;
}

Engine::Engine(const EngineConfig &config) : config_(config) { validate_config(config_); }

SnapshotPtr Engine::ingest(const std::vector<Document> &documents,
                           const CancellationToken &token) {
    Indexer indexer(config_, token);
    IndexResult indexed = indexer.index(documents);

    token.check();
    GraphBuilder builder(config_.builder);
    BuildResult built = builder.build(std::move(indexed.contributions));
    token.check();

    Snapshot snapshot;
    snapshot.graph = std::move(built.graph);
    snapshot.diagnostics = std::move(built.diagnostics);
    snapshot.unparsed = std::move(indexed.unparsed);
    snapshot.scans = std::move(indexed.scans);
    snapshot.total_files = indexed.total_files;

    SnapshotPtr published = store_.publish(std::move(snapshot));

    if (config_.indexer.verbose) {
        const Indexer::Stats &stats = indexer.stats();
        std::cout << "Indexed " << stats.files_parsed << " files (" << stats.files_unparsed
                  << " unparsed, " << stats.assets_scanned << " other files scanned) on "
                  << indexer.num_threads() << " threads" << std::endl;
        std::cout << "Snapshot v" << published->version << ": " << published->graph.num_nodes()
                  << " nodes, " << published->graph.num_edges() << " edges, "
                  << published->diagnostics.size() << " unresolved references" << std::endl;
    }
    return published;
}

SnapshotPtr Engine::ingest_directory(const std::string &root, const CancellationToken &token) {
    Indexer indexer(config_, token);
    return ingest(indexer.read_directory(root), token);
}

SnapshotPtr Engine::load(Snapshot snapshot) { return store_.publish(std::move(snapshot)); }

SnapshotPtr Engine::require_snapshot() const {
    SnapshotPtr snapshot = store_.current();
    if (!snapshot)
        throw NotFoundError("no snapshot has been published");
    return snapshot;
}

IntegrityReport Engine::report(const CancellationToken &token) const {
    SnapshotPtr snapshot = require_snapshot();
    IntegrityAnalyzer analyzer(config_.analyzer);
    return analyzer.analyze(*snapshot, token);
}

ImpactResult Engine::simulate(const ChangeSpec &change, const CancellationToken &token) const {
    SnapshotPtr snapshot = require_snapshot();
    BlastRadiusSimulator simulator(config_.simulator);
    return simulator.simulate(*snapshot, change, token);
}

std::vector<std::string> Engine::find_symbols(const std::string &pattern) const {
    std::vector<std::string> matches;
    SnapshotPtr snapshot = store_.current();
    if (!snapshot)
        return matches;

    for (const auto &[id, node] : snapshot->graph.nodes()) {
        std::string name = symbol_display_name(node);
        if (name.find(pattern) != std::string::npos)
            matches.push_back(std::move(name));
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

NodeId Engine::resolve_symbol(const std::string &text) const {
    SnapshotPtr snapshot = require_snapshot();
    const Graph &graph = snapshot->graph;

    NodeId id = node_id_from_string(text);
    if (id != INVALID_NODE_ID && graph.has_node(id))
        return id;

    std::vector<NodeId> candidates;
    for (const auto &[node_id, node] : graph.nodes()) {
        if (node.qualified_name == text || symbol_display_name(node) == text)
            candidates.push_back(node_id);
    }

    if (candidates.size() == 1)
        return candidates.front();
    if (candidates.empty())
        throw NotFoundError("symbol not found: " + text);

    std::string message = "ambiguous symbol " + text + ":";
    for (NodeId candidate : candidates)
        message += " " + symbol_display_name(*graph.find_node(candidate));
    throw NotFoundError(message);
}

} // namespace devguard
