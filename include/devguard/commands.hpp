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

#include "engine.hpp"
#include <string>

namespace devguard {

// Where the snapshot comes from; exactly one field is set
struct InputSource {
    std::string batch;     // --input
    std::string directory; // --dir
    std::string snapshot;  // --load
};

// Command implementations; each returns the process exit code
int cmd_ingest(Engine &engine, const InputSource &source);
int cmd_graph(const Engine &engine, const std::string &output);
int cmd_audit(const Engine &engine, const std::string &output);
int cmd_impact(const Engine &engine, const std::string &symbol, const std::string &change,
               const std::string &output);
int cmd_search(const Engine &engine, const std::string &pattern);

// Helper functions
bool validate_symbol(const Engine &engine, const std::string &symbol, NodeId &id);
Snapshot load_snapshot(const std::string &filepath);

} // namespace devguard
