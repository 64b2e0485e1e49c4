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

#include "graph.hpp"
#include "graph_builder.hpp"
#include "risk_scanner.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace devguard {

// Immutable result of one ingestion batch. Holds no raw source text.
struct Snapshot {
    uint64_t version = 0;
    Graph graph;
    std::vector<UnparsedFile> unparsed;
    std::vector<Diagnostic> diagnostics;
    std::vector<FileScan> scans;
    size_t total_files = 0;

    // Parsed files / input files; 1.0 for an empty batch
    double coverage() const;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

// Holds the current snapshot. Readers take a pointer copy and keep using
// their version while newer ones are published; a version stays
// retrievable for as long as any reader holds it.
class SnapshotStore {
public:
    // Assign the next version and make the snapshot current
    SnapshotPtr publish(Snapshot snapshot);

    // Current snapshot, nullptr before the first publish
    SnapshotPtr current() const;

    // A retained version, nullptr once every holder has released it
    SnapshotPtr get(uint64_t version) const;

    // Versions still alive, ascending
    std::vector<uint64_t> retained_versions() const;

    uint64_t latest_version() const;

private:
    mutable std::mutex mutex_;
    SnapshotPtr current_;
    uint64_t next_version_ = 1;
    mutable std::map<uint64_t, std::weak_ptr<const Snapshot>> history_;

    void prune_locked() const;
};

} // namespace devguard
