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

#include "devguard/integrity.hpp"
#include "devguard/workers.hpp"
#include <algorithm>
#include <exception>
#include <functional>
#include <iomanip>
#include <sstream>
#include <thread>
#include <tuple>
#include <unordered_map>

namespace devguard {

namespace {

constexpr EdgeMask CYCLE_EDGES = edge_bit(EdgeKind::Imports) | edge_bit(EdgeKind::Calls);
constexpr EdgeMask DEGREE_EDGES =
    edge_bit(EdgeKind::Imports) | edge_bit(EdgeKind::Calls) | edge_bit(EdgeKind::ReferencesSchema);

bool in_mask(EdgeMask mask, EdgeKind kind) { return (mask & edge_bit(kind)) != 0; }

std::string display_name(const Graph &graph, NodeId id) {
    const Node *node = graph.find_node(id);
    if (!node)
        return node_id_to_string(id);
    if (node->kind == NodeKind::File || node->kind == NodeKind::Module)
        return node->path;
    return node->path + "::" + node->qualified_name;
}

std::string basename_stem(const std::string &path) {
    std::string base = file_name(path);
    size_t dot = base.rfind('.');
    return dot == std::string::npos || dot == 0 ? base : base.substr(0, dot);
}

} // namespace

const char *finding_kind_to_string(FindingKind kind) {
    switch (kind) {
    case FindingKind::Cycle:
        return "cycle";
    case FindingKind::GodObject:
        return "god_object";
    case FindingKind::Orphan:
        return "orphan";
    case FindingKind::ProductionRisk:
        return "production_risk";
    default:
        return "unknown";
    }
}

void sort_findings(std::vector<Finding> &findings) {
    std::sort(findings.begin(), findings.end(), [](const Finding &a, const Finding &b) {
        // Higher severity first
        int sa = -static_cast<int>(a.severity);
        int sb = -static_cast<int>(b.severity);
        return std::tie(a.kind, sa, a.nodes, a.evidence) < std::tie(b.kind, sb, b.nodes, b.evidence);
    });
}

bool IntegrityAnalyzer::is_entry_point(const Node &node) const {
    // Only a file itself is an entry point by name; its declarations are not
    bool file = node.kind == NodeKind::File || node.kind == NodeKind::Module;
    std::string stem = file ? basename_stem(node.path) : std::string();

    for (const auto &pattern : config_.entry_point_patterns) {
        if (glob_match(pattern, node.name) || glob_match(pattern, node.qualified_name) ||
            glob_match(pattern, node.path) || (file && glob_match(pattern, stem))) {
            return true;
        }
    }
    return false;
}

std::vector<Finding> IntegrityAnalyzer::detect_cycles(const Graph &graph,
                                                      const CancellationToken &token) const {
    std::vector<Finding> findings;

    // Dense indices over nodes in id order
    std::vector<NodeId> ids;
    std::unordered_map<NodeId, int> dense;
    ids.reserve(graph.num_nodes());
    for (const auto &[id, node] : graph.nodes()) {
        dense[id] = static_cast<int>(ids.size());
        ids.push_back(id);
    }

    const int n = static_cast<int>(ids.size());
    std::vector<std::vector<int>> adjacency(n);
    std::vector<bool> self_loop(n, false);
    for (const auto &edge : graph.edges()) {
        if (!in_mask(CYCLE_EDGES, edge.kind))
            continue;
        int from = dense.at(edge.source);
        int to = dense.at(edge.target);
        if (from == to) {
            self_loop[from] = true;
            continue;
        }
        adjacency[from].push_back(to);
    }

    // Iterative Tarjan
    std::vector<int> index(n, -1), lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<int> stack;
    std::vector<std::vector<int>> components;
    int counter = 0;

    struct Frame {
        int node;
        size_t next;
    };

    for (int root = 0; root < n; ++root) {
        if (index[root] != -1)
            continue;

        std::vector<Frame> call_stack;
        call_stack.push_back({root, 0});
        index[root] = lowlink[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!call_stack.empty()) {
            token.check();
            Frame &frame = call_stack.back();
            int v = frame.node;

            if (frame.next < adjacency[v].size()) {
                int w = adjacency[v][frame.next++];
                if (index[w] == -1) {
                    index[w] = lowlink[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    call_stack.push_back({w, 0});
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            if (lowlink[v] == index[v]) {
                std::vector<int> component;
                int w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                components.push_back(std::move(component));
            }

            call_stack.pop_back();
            if (!call_stack.empty()) {
                int parent = call_stack.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }

    for (const auto &component : components) {
        bool self_calls = component.size() == 1 && self_loop[component.front()];
        if (component.size() < 2 && !self_calls)
            continue;

        Finding finding;
        finding.kind = FindingKind::Cycle;
        for (int member : component)
            finding.nodes.push_back(ids[member]);
        std::sort(finding.nodes.begin(), finding.nodes.end());

        // Every Imports/Calls edge inside the component
        bool imports = false;
        for (NodeId id : finding.nodes) {
            for (size_t e : graph.out_edges(id)) {
                const Edge &edge = graph.edges()[e];
                if (!in_mask(CYCLE_EDGES, edge.kind) ||
                    !std::binary_search(finding.nodes.begin(), finding.nodes.end(), edge.target))
                    continue;
                if (component.size() == 1 && edge.kind != EdgeKind::Calls)
                    continue;
                imports |= edge.kind == EdgeKind::Imports;
                finding.edges.push_back(edge);
            }
        }

        if (self_calls) {
            finding.severity = Severity::Low;
            finding.rule = "recursion";
        } else if (imports) {
            finding.severity = Severity::High;
            finding.rule = "circular_import";
        } else {
            finding.severity = Severity::Medium;
            finding.rule = "call_cycle";
        }

        std::ostringstream evidence;
        evidence << finding.nodes.size() << " node(s), " << finding.edges.size() << " edge(s): ";
        for (size_t i = 0; i < finding.nodes.size(); ++i) {
            if (i > 0)
                evidence << ", ";
            evidence << display_name(graph, finding.nodes[i]);
        }
        finding.evidence = evidence.str();
        findings.push_back(std::move(finding));
    }

    return findings;
}

std::vector<Finding> IntegrityAnalyzer::detect_god_objects(const Graph &graph,
                                                           const CancellationToken &token) const {
    std::vector<Finding> findings;
    if (graph.num_nodes() == 0)
        return findings;

    std::unordered_map<NodeId, size_t> degree;
    size_t total = 0;
    for (const auto &edge : graph.edges()) {
        if (!in_mask(DEGREE_EDGES, edge.kind))
            continue;
        degree[edge.source]++;
        degree[edge.target]++;
        total += 2;
    }

    double mean = static_cast<double>(total) / static_cast<double>(graph.num_nodes());
    double threshold =
        std::max(config_.god_multiplier * mean, static_cast<double>(config_.god_min_degree));

    for (const auto &[id, node] : graph.nodes()) {
        token.check();
        auto it = degree.find(id);
        size_t d = it != degree.end() ? it->second : 0;
        if (static_cast<double>(d) <= threshold)
            continue;

        Finding finding;
        finding.kind = FindingKind::GodObject;
        finding.rule = "god_object";
        finding.nodes.push_back(id);

        double ratio = static_cast<double>(d) / threshold;
        if (ratio >= config_.god_high_ratio)
            finding.severity = Severity::High;
        else if (ratio >= config_.god_medium_ratio)
            finding.severity = Severity::Medium;
        else
            finding.severity = Severity::Low;

        for (size_t e : graph.out_edges(id)) {
            if (in_mask(DEGREE_EDGES, graph.edges()[e].kind))
                finding.edges.push_back(graph.edges()[e]);
        }
        for (size_t e : graph.in_edges(id)) {
            const Edge &edge = graph.edges()[e];
            // Self-loops were already taken from the out list
            if (in_mask(DEGREE_EDGES, edge.kind) && edge.source != edge.target)
                finding.edges.push_back(edge);
        }

        std::ostringstream evidence;
        evidence << std::fixed << std::setprecision(2) << display_name(graph, id) << ": degree "
                 << d << " exceeds threshold " << threshold << " (mean degree " << mean << ")";
        finding.evidence = evidence.str();
        findings.push_back(std::move(finding));
    }

    return findings;
}

std::vector<Finding> IntegrityAnalyzer::detect_orphans(const Graph &graph,
                                                       const CancellationToken &token) const {
    std::vector<Finding> findings;
    const auto &exempt = config_.orphan_exempt_kinds;

    for (const auto &[id, node] : graph.nodes()) {
        token.check();
        if (!graph.in_edges(id).empty())
            continue;
        if (std::find(exempt.begin(), exempt.end(), node.kind) != exempt.end())
            continue;
        if (is_entry_point(node))
            continue;

        Finding finding;
        finding.kind = FindingKind::Orphan;
        finding.severity = Severity::Low;
        finding.rule = "orphan";
        finding.nodes.push_back(id);
        finding.evidence = display_name(graph, id) + " (" + node_kind_to_string(node.kind) +
                           ") has no inbound edges";
        findings.push_back(std::move(finding));
    }

    return findings;
}

std::vector<Finding> IntegrityAnalyzer::detect_production_risks(
    const Snapshot &snapshot, const CancellationToken &token) const {
    std::vector<Finding> findings;

    for (const auto &scan : snapshot.scans) {
        token.check();
        // Non-source files and repository-wide checks have no node
        NodeId file = scan.path.empty() ? INVALID_NODE_ID : snapshot.graph.file_node(scan.path);
        std::string where = scan.path.empty() ? "(repository)" : scan.path;

        auto risk = [&](const std::string &rule, Severity severity) {
            Finding finding;
            finding.kind = FindingKind::ProductionRisk;
            finding.severity = severity;
            finding.rule = rule;
            finding.path = scan.path;
            if (file != INVALID_NODE_ID)
                finding.nodes.push_back(file);
            return finding;
        };

        for (const auto &match : scan.matches) {
            Finding finding = risk(match.rule, match.severity);
            finding.evidence = where;
            if (match.line > 0)
                finding.evidence += ":" + std::to_string(match.line);
            finding.evidence += ": " + match.message;
            if (!match.excerpt.empty())
                finding.evidence += " [" + match.excerpt + "]";
            findings.push_back(std::move(finding));
        }

        if (scan.line_count == 0 || scan.todo_count < config_.todo_min_count)
            continue;

        double density = static_cast<double>(scan.todo_count) / static_cast<double>(scan.line_count);
        if (density <= config_.todo_density_threshold)
            continue;

        Finding finding = risk("todo_density", Severity::Low);
        std::ostringstream evidence;
        evidence << std::fixed << std::setprecision(3) << where << ": " << scan.todo_count
                 << " TODO/FIXME/HACK markers in " << scan.line_count << " lines (density "
                 << density << ")";
        finding.evidence = evidence.str();
        findings.push_back(std::move(finding));
    }

    return findings;
}

IntegrityReport IntegrityAnalyzer::analyze(const Snapshot &snapshot,
                                           const CancellationToken &token) const {
    IntegrityReport report;
    report.version = snapshot.version;
    report.coverage = snapshot.coverage();

    const Graph &graph = snapshot.graph;
    std::vector<Finding> results[4];
    std::exception_ptr errors[4];

    std::function<std::vector<Finding>()> detectors[4] = {
        [&] { return detect_cycles(graph, token); },
        [&] { return detect_god_objects(graph, token); },
        [&] { return detect_orphans(graph, token); },
        [&] { return detect_production_risks(snapshot, token); },
    };

    auto run = [&](int i) {
        try {
            results[i] = detectors[i]();
        } catch (...) {
            errors[i] = std::current_exception();
        }
    };

    if (config_.parallel_detectors) {
        std::vector<std::thread> threads;
        ThreadJoiner joiner(threads);
        for (int i = 0; i < 4; ++i)
            threads.emplace_back(run, i);
        joiner.join();
    } else {
        for (int i = 0; i < 4; ++i)
            run(i);
    }

    for (const auto &error : errors) {
        if (error)
            std::rethrow_exception(error);
    }

    for (auto &found : results) {
        report.findings.insert(report.findings.end(), std::make_move_iterator(found.begin()),
                               std::make_move_iterator(found.end()));
    }
    sort_findings(report.findings);
    return report;
}

} // namespace devguard
