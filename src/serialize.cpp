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

#include "devguard/serialize.hpp"
#include "devguard/errors.hpp"
#include "devguard/version.hpp"
#include <fstream>
#include <iostream>

namespace devguard {

namespace {

ParseFailure parse_failure_from_string(const std::string &name) {
    if (name == "syntax_error")
        return ParseFailure::SyntaxError;
    if (name == "unsupported_language")
        return ParseFailure::UnsupportedLanguage;
    if (name == "empty_file")
        return ParseFailure::EmptyFile;
    throw ValidationError("Unknown parse failure: " + name);
}

void describe_node(json &j, const Graph &graph, NodeId id) {
    const Node *node = graph.find_node(id);
    if (!node)
        return;
    j["kind"] = node_kind_to_string(node->kind);
    j["path"] = node->path;
    j["qualified_name"] = node->qualified_name;
}

} // namespace

std::vector<Document> documents_from_json(const json &j) {
    std::vector<Document> documents;

    try {
        for (const auto &item : j.at("files")) {
            Document doc;
            doc.path = item.at("path").get<std::string>();
            doc.content = item.at("content").get<std::string>();
            // Missing or unknown languages are derived from the extension
            if (item.contains("language") && !item["language"].is_null())
                doc.language = language_from_string(item["language"].get<std::string>());
            documents.push_back(std::move(doc));
        }
    } catch (const json::exception &e) {
        throw ValidationError(std::string("Malformed ingestion batch: ") + e.what());
    }

    return documents;
}

std::vector<Document> load_batch(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ValidationError("Cannot open input file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error &e) {
        throw ValidationError("Invalid JSON in " + filepath + ": " + e.what());
    }
    return documents_from_json(j);
}

json unparsed_to_json(const UnparsedFile &file) {
    return {{"path", file.path},
            {"language", language_to_string(file.language)},
            {"reason", parse_failure_to_string(file.reason)},
            {"detail", file.detail}};
}

UnparsedFile unparsed_from_json(const json &j) {
    UnparsedFile file;
    file.path = j.at("path").get<std::string>();
    file.language = language_from_string(j.value("language", std::string("unknown")));
    file.reason = parse_failure_from_string(j.at("reason").get<std::string>());
    file.detail = j.value("detail", std::string());
    return file;
}

json scan_to_json(const FileScan &scan) {
    json matches = json::array();
    for (const auto &match : scan.matches) {
        matches.push_back({{"rule", match.rule},
                           {"severity", severity_to_string(match.severity)},
                           {"line", match.line},
                           {"message", match.message},
                           {"excerpt", match.excerpt}});
    }
    return {{"path", scan.path},
            {"line_count", scan.line_count},
            {"todo_count", scan.todo_count},
            {"matches", std::move(matches)}};
}

FileScan scan_from_json(const json &j) {
    FileScan scan;
    scan.path = j.at("path").get<std::string>();
    scan.line_count = j.value("line_count", 0u);
    scan.todo_count = j.value("todo_count", size_t(0));
    if (j.contains("matches")) {
        for (const auto &item : j["matches"]) {
            RiskMatch match;
            match.rule = item.at("rule").get<std::string>();
            match.severity = severity_from_string(item.at("severity").get<std::string>());
            match.line = item.value("line", 0u);
            match.message = item.value("message", std::string());
            match.excerpt = item.value("excerpt", std::string());
            scan.matches.push_back(std::move(match));
        }
    }
    return scan;
}

json snapshot_to_json(const Snapshot &snapshot) {
    json j = snapshot.graph.to_json();
    j["version"] = snapshot.version;
    j["schema"] = SNAPSHOT_SCHEMA_VERSION;
    j["coverage"] = snapshot.coverage();
    j["total_files"] = snapshot.total_files;

    json unparsed = json::array();
    for (const auto &file : snapshot.unparsed)
        unparsed.push_back(unparsed_to_json(file));
    j["unparsed"] = std::move(unparsed);

    json diagnostics = json::array();
    for (const auto &diagnostic : snapshot.diagnostics)
        diagnostics.push_back(diagnostic_to_json(diagnostic));
    j["diagnostics"] = std::move(diagnostics);

    json scans = json::array();
    for (const auto &scan : snapshot.scans)
        scans.push_back(scan_to_json(scan));
    j["scans"] = std::move(scans);

    return j;
}

Snapshot snapshot_from_json(const json &j) {
    int major = 0, minor = 0, patch = 0;
    std::string schema = j.value("schema", std::string());
    if (!parse_version(schema, major, minor, patch)) {
        throw ValidationError("Snapshot has no valid schema version");
    }
    if (!is_schema_compatible(major, minor, patch)) {
        throw ValidationError("Incompatible snapshot schema " + schema + " (supported: " +
                              SNAPSHOT_SCHEMA_VERSION + ")");
    }

    Snapshot snapshot;
    snapshot.graph = Graph::from_json(j);

    try {
        snapshot.version = j.value("version", uint64_t(0));
        for (const auto &item : j.value("unparsed", json::array()))
            snapshot.unparsed.push_back(unparsed_from_json(item));
        for (const auto &item : j.value("diagnostics", json::array()))
            snapshot.diagnostics.push_back(diagnostic_from_json(item));
        for (const auto &item : j.value("scans", json::array()))
            snapshot.scans.push_back(scan_from_json(item));
        snapshot.total_files = j.value("total_files", snapshot.scans.size() + snapshot.unparsed.size());
    } catch (const json::exception &e) {
        throw ValidationError(std::string("Malformed snapshot: ") + e.what());
    }

    return snapshot;
}

json finding_to_json(const Finding &finding, const Graph &graph) {
    json j;
    j["kind"] = finding_kind_to_string(finding.kind);
    j["severity"] = severity_to_string(finding.severity);
    j["rule"] = finding.rule;

    json nodes = json::array();
    for (NodeId id : finding.nodes) {
        json node = {{"id", node_id_to_string(id)}};
        describe_node(node, graph, id);
        nodes.push_back(std::move(node));
    }
    j["nodes"] = std::move(nodes);

    json edges = json::array();
    for (const auto &edge : finding.edges)
        edges.push_back(edge_to_json(edge));
    j["edges"] = std::move(edges);

    j["evidence"] = finding.evidence;
    if (finding.kind == FindingKind::ProductionRisk)
        j["path"] = finding.path;
    return j;
}

json report_to_json(const IntegrityReport &report, const Graph &graph) {
    json findings = json::array();
    for (const auto &finding : report.findings)
        findings.push_back(finding_to_json(finding, graph));

    return {{"version", report.version},
            {"coverage", report.coverage},
            {"findings", std::move(findings)}};
}

json impact_to_json(const ImpactResult &result, const Graph &graph) {
    json impacts = json::array();
    for (const auto &impact : result.impacts) {
        json item = {{"node", node_id_to_string(impact.node)},
                     {"distance", impact.distance},
                     {"confidence", impact.confidence}};
        describe_node(item, graph, impact.node);
        impacts.push_back(std::move(item));
    }

    return {{"target", node_id_to_string(result.target)},
            {"change", change_kind_to_string(result.change)},
            {"version", result.version},
            {"impacts", std::move(impacts)}};
}

bool write_json(const json &j, const std::string &filepath) {
    if (filepath.empty() || filepath == "-") {
        std::cout << j.dump(2) << std::endl;
        return true;
    }

    std::ofstream file(filepath);
    if (!file) {
        std::cerr << "Error: Cannot open output file: " << filepath << std::endl;
        return false;
    }
    file << j.dump(2) << std::endl;
    return static_cast<bool>(file);
}

} // namespace devguard
