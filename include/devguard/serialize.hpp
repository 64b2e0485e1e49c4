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
#include "integrity.hpp"
#include "simulator.hpp"
#include "snapshot.hpp"
#include <string>
#include <vector>

namespace devguard {

// {"files": [{"path", "language"?, "content"}]}. Throws ValidationError.
std::vector<Document> documents_from_json(const json &j);

// Read a JSON ingestion batch from disk. Throws ValidationError.
std::vector<Document> load_batch(const std::string &filepath);

json unparsed_to_json(const UnparsedFile &file);
UnparsedFile unparsed_from_json(const json &j);

json scan_to_json(const FileScan &scan);
FileScan scan_from_json(const json &j);

// Full snapshot document, schema-tagged
json snapshot_to_json(const Snapshot &snapshot);

// Throws ValidationError for malformed input or an incompatible schema
Snapshot snapshot_from_json(const json &j);

json finding_to_json(const Finding &finding, const Graph &graph);
json report_to_json(const IntegrityReport &report, const Graph &graph);
json impact_to_json(const ImpactResult &result, const Graph &graph);

// Write JSON to a file, "-" for stdout. Returns false on I/O failure.
bool write_json(const json &j, const std::string &filepath);

} // namespace devguard
