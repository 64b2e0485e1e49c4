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
#include "integrity.hpp"
#include "simulator.hpp"
#include "snapshot.hpp"
#include <string>
#include <vector>

namespace devguard {

// Ingestion pipeline plus the current snapshot. Ingest publishes a new
// version; report and simulate run against whichever version is current
// when they start.
class Engine {
public:
    // Throws ConfigError for an invalid configuration
    explicit Engine(const EngineConfig &config);

    // Extract, build and publish. On ValidationError or CancelledError the
    // previous snapshot stays current.
    SnapshotPtr ingest(const std::vector<Document> &documents,
                       const CancellationToken &token = CancellationToken{});

    SnapshotPtr ingest_directory(const std::string &root,
                                 const CancellationToken &token = CancellationToken{});

    // Publish a previously serialized snapshot under a new version
    SnapshotPtr load(Snapshot snapshot);

    SnapshotPtr current() const { return store_.current(); }
    const SnapshotStore &store() const { return store_; }

    // Throw NotFoundError before the first publish
    IntegrityReport report(const CancellationToken &token = CancellationToken{}) const;
    ImpactResult simulate(const ChangeSpec &change,
                          const CancellationToken &token = CancellationToken{}) const;

    // Display names ("path" for files, "path::qualified" otherwise)
    // containing the pattern, sorted
    std::vector<std::string> find_symbols(const std::string &pattern) const;

    // Hex id, qualified name or "path::qualified". Throws NotFoundError
    // when nothing or more than one node matches.
    NodeId resolve_symbol(const std::string &text) const;

    const EngineConfig &config() const { return config_; }

private:
    EngineConfig config_;
    SnapshotStore store_;

    SnapshotPtr require_snapshot() const;
};

std::string symbol_display_name(const Node &node);

} // namespace devguard
