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

enum class ChangeKind { Rename, Remove, SignatureChange };

const char *change_kind_to_string(ChangeKind kind);

// Accepts "rename", "remove", "signature" (or "signature_change").
// Throws ValidationError otherwise.
ChangeKind change_kind_from_string(const std::string &name);

// Edge kinds a change travels along. Rename also follows Imports edges
// that point at the changed node itself.
EdgeMask propagation_mask(ChangeKind kind);

struct ChangeSpec {
    NodeId target = INVALID_NODE_ID;
    ChangeKind change = ChangeKind::Remove;
};

struct Impact {
    NodeId node = INVALID_NODE_ID;
    size_t distance = 0;     // Shortest hop count from the target
    double confidence = 1.0; // Minimum edge confidence along the path
};

struct ImpactResult {
    NodeId target = INVALID_NODE_ID;
    ChangeKind change = ChangeKind::Remove;
    uint64_t version = 0;
    std::vector<Impact> impacts; // Distance, then confidence (high first), then id
};

class BlastRadiusSimulator {
public:
    explicit BlastRadiusSimulator(const SimulatorConfig &config) : config_(config) {}

    // Walk dependents of the target along reversed edges.
    // Throws NotFoundError for an unknown target and CancelledError.
    ImpactResult simulate(const Snapshot &snapshot, const ChangeSpec &change,
                          const CancellationToken &token = CancellationToken{}) const;

private:
    SimulatorConfig config_;
};

} // namespace devguard
