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

#include "config.hpp"
#include "extractor.hpp"
#include "graph.hpp"
#include <string>
#include <vector>

namespace devguard {

// A reference that produced no edge
struct Diagnostic {
    NodeId source = INVALID_NODE_ID;
    std::string reference; // Name as written, or "VERB url" for endpoint calls
    EdgeKind kind = EdgeKind::Calls;
    std::string path;
    uint32_t line = 0;
    std::string reason; // "no match", "ambiguous: ...", "kind mismatch", "unknown module", ...
};

struct BuildResult {
    Graph graph;
    std::vector<Diagnostic> diagnostics;
};

// Merges per-file contributions into one graph. Contributions are processed
// in path order, so the result does not depend on the input order.
class GraphBuilder {
public:
    explicit GraphBuilder(const BuilderConfig &config) : config_(config) {}

    // Throws ValidationError for empty or escaping paths, duplicate paths
    // and node id collisions.
    BuildResult build(std::vector<FileContribution> contributions) const;

private:
    BuilderConfig config_;
};

json diagnostic_to_json(const Diagnostic &diagnostic);
Diagnostic diagnostic_from_json(const json &j);

} // namespace devguard
