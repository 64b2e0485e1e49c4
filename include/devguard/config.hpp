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

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace devguard {

using json = nlohmann::json;

// Extraction worker pool
struct IndexerConfig {
    unsigned int num_threads = 0; // 0 = auto-detect
    bool verbose = false;

    // Directory names skipped when reading a tree from disk
    std::vector<std::string> ignore_patterns = {"build",  "node_modules", "__pycache__", ".git",
                                                ".venv",  "venv",         "dist",        "target",
                                                ".cache", "coverage",     ".next",       "migrations"};
};

// Language adapter vocabulary
struct ExtractorConfig {
    // Base classes that turn a Python class into a Schema
    std::vector<std::string> schema_bases = {"BaseModel", "Schema",          "Model",
                                             "TypedDict", "SQLModel",        "Serializer",
                                             "ModelSerializer", "Document", "DeclarativeBase"};

    // Decorator attribute names that declare a Python route
    std::vector<std::string> route_decorators = {"get",    "post",    "put",   "patch",
                                                 "delete", "head",    "options", "route",
                                                 "api_route"};

    // Objects whose verb methods declare Express-style routes
    std::vector<std::string> route_objects = {"app", "router", "server", "routes"};

    // Objects whose verb methods are outgoing HTTP calls
    std::vector<std::string> http_clients = {"axios", "api", "http",  "client", "apiClient",
                                             "instance", "$http", "request", "ky", "superagent",
                                             "requests", "httpx", "session"};
};

// Graph Builder confidences for heuristic endpoint binding
struct BuilderConfig {
    double endpoint_exact_confidence = 0.9;
    double endpoint_param_confidence = 0.75;
    double endpoint_suffix_confidence = 0.5;
};

// One production-readiness rule, matched line by line
struct RiskRule {
    std::string name;
    std::string pattern; // ECMAScript regex
    Severity severity = Severity::Medium;
    bool ignore_case = false;
    std::vector<Language> languages; // Empty = every language
    std::string message;
    bool mask = false; // Mask the matched text in evidence (credentials)
    std::vector<std::string> files; // File name globs ("requirements*.txt"), empty = any file
};

struct AnalyzerConfig {
    // God object threshold = max(god_multiplier * mean degree, god_min_degree)
    double god_multiplier = 3.0;
    size_t god_min_degree = 10;
    double god_high_ratio = 2.0;
    double god_medium_ratio = 1.5;

    // Glob patterns matched against short name, qualified name and path, and
    // against the file stem for File and Module nodes
    std::vector<std::string> entry_point_patterns = {
        "main",  "__main__", "__init__", "app",    "index", "bootstrap",
        "setup", "test_*",   "*.test",   "*.spec", "conftest"};
    std::vector<NodeKind> orphan_exempt_kinds = {NodeKind::Endpoint};

    std::vector<RiskRule> risk_rules = default_risk_rules();
    double todo_density_threshold = 0.05; // Markers per line
    size_t todo_min_count = 3;

    // Longer lines are reported as long_line and not matched against risk_rules
    size_t max_scan_line_length = 4096;

    // File name globs that must never be committed
    std::vector<std::string> sensitive_files = {"*.env", "*id_rsa", "*master.key", ".DS_Store"};

    // Report a repository without a README at its root
    bool require_readme = true;

    // Run the four detectors on separate threads
    bool parallel_detectors = true;

    static std::vector<RiskRule> default_risk_rules();
};

struct SimulatorConfig {
    size_t max_depth = 0; // 0 = unlimited
};

struct EngineConfig {
    IndexerConfig indexer;
    ExtractorConfig extractor;
    BuilderConfig builder;
    AnalyzerConfig analyzer;
    SimulatorConfig simulator;
};

// Overlay the keys present in j onto defaults. Throws ConfigError.
EngineConfig config_from_json(const json &j);

// Read and parse a JSON config file. Throws ConfigError.
EngineConfig load_config(const std::string &filepath);

json config_to_json(const EngineConfig &config);

// Range checks and regex compilation. Throws ConfigError.
void validate_config(const EngineConfig &config);

} // namespace devguard
