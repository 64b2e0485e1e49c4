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

#include "devguard/commands.hpp"
#include "devguard/errors.hpp"
#include "devguard/serialize.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace devguard {

Snapshot load_snapshot(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ValidationError("Cannot open snapshot file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error &e) {
        throw ValidationError("Invalid JSON in " + filepath + ": " + e.what());
    }
    return snapshot_from_json(j);
}

bool validate_symbol(const Engine &engine, const std::string &symbol, NodeId &id) {
    try {
        id = engine.resolve_symbol(symbol);
        return true;
    } catch (const NotFoundError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }

    auto matches = engine.find_symbols(symbol);
    if (!matches.empty()) {
        std::cerr << "Did you mean one of these?" << std::endl;
        for (size_t i = 0; i < std::min(matches.size(), size_t(5)); ++i)
            std::cerr << "  " << matches[i] << std::endl;
    }
    return false;
}

int cmd_ingest(Engine &engine, const InputSource &source) {
    if (!source.snapshot.empty()) {
        engine.load(load_snapshot(source.snapshot));
    } else if (!source.directory.empty()) {
        engine.ingest_directory(source.directory);
    } else {
        engine.ingest(load_batch(source.batch));
    }

    SnapshotPtr snapshot = engine.current();
    if (engine.config().indexer.verbose) {
        for (const auto &file : snapshot->unparsed) {
            std::cout << "Unparsed: " << file.path << " (" << parse_failure_to_string(file.reason)
                      << ")" << std::endl;
        }
        std::cout << "Coverage: " << snapshot->coverage() * 100.0 << "%" << std::endl;
    }
    return 0;
}

int cmd_graph(const Engine &engine, const std::string &output) {
    return write_json(snapshot_to_json(*engine.current()), output) ? 0 : 1;
}

int cmd_audit(const Engine &engine, const std::string &output) {
    SnapshotPtr snapshot = engine.current();
    IntegrityReport report = engine.report();
    return write_json(report_to_json(report, snapshot->graph), output) ? 0 : 1;
}

int cmd_impact(const Engine &engine, const std::string &symbol, const std::string &change,
               const std::string &output) {
    ChangeSpec spec;
    spec.change = change_kind_from_string(change);
    if (!validate_symbol(engine, symbol, spec.target))
        return 2;

    SnapshotPtr snapshot = engine.current();
    ImpactResult result = engine.simulate(spec);
    return write_json(impact_to_json(result, snapshot->graph), output) ? 0 : 1;
}

int cmd_search(const Engine &engine, const std::string &pattern) {
    auto matches = engine.find_symbols(pattern);
    if (matches.empty()) {
        std::cout << "No symbols found matching: " << pattern << std::endl;
        return 0;
    }

    for (const auto &name : matches)
        std::cout << name << std::endl;
    std::cout << "\nTotal: " << matches.size() << " symbols" << std::endl;
    return 0;
}

} // namespace devguard
