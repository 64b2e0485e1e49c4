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

#include "cancellation.hpp"
#include "config.hpp"
#include "snapshot.hpp"
#include <string>
#include <vector>

namespace devguard {

enum class FindingKind { Cycle, GodObject, Orphan, ProductionRisk };

const char *finding_kind_to_string(FindingKind kind);

struct Finding {
    FindingKind kind = FindingKind::Cycle;
    Severity severity = Severity::Low;
    std::string rule;           // "circular_import", "god_object", "hardcoded_api_key", ...
    std::vector<NodeId> nodes;  // Implicated nodes, ascending
    std::vector<Edge> edges;    // Evidence edges
    std::string evidence;       // Human-readable evidence
    std::string path;           // Production risks: scanned file, "" for the repository
};

struct IntegrityReport {
    uint64_t version = 0;
    double coverage = 1.0;
    std::vector<Finding> findings;
};

// Runs the four read-only detectors over one snapshot
class IntegrityAnalyzer {
public:
    explicit IntegrityAnalyzer(const AnalyzerConfig &config) : config_(config) {}

    // All detectors; findings in report order. Throws CancelledError.
    IntegrityReport analyze(const Snapshot &snapshot,
                            const CancellationToken &token = CancellationToken{}) const;

    // Strongly connected components over Imports and Calls edges
    std::vector<Finding> detect_cycles(const Graph &graph, const CancellationToken &token) const;

    std::vector<Finding> detect_god_objects(const Graph &graph,
                                            const CancellationToken &token) const;

    std::vector<Finding> detect_orphans(const Graph &graph, const CancellationToken &token) const;

    std::vector<Finding> detect_production_risks(const Snapshot &snapshot,
                                                 const CancellationToken &token) const;

    // Glob-style entry point test against short name, qualified name and
    // path; File and Module nodes also match by file stem ("main" for app/main.py)
    bool is_entry_point(const Node &node) const;

private:
    AnalyzerConfig config_;
};

// Kind, then severity (High first), then node ids, then evidence
void sort_findings(std::vector<Finding> &findings);

} // namespace devguard
