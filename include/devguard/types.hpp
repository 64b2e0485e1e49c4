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

#include <cstdint>
#include <string>
#include <vector>

namespace devguard {

// Node UID type - 64-bit FNV-1a hash of "path::qualified_name"
using NodeId = uint64_t;

// Reserved id, never produced for a real (path, name) pair in practice
constexpr NodeId INVALID_NODE_ID = 0;

// ============================================================================
// Languages
// ============================================================================

enum class Language { Unknown, Python, JavaScript, TypeScript };

inline const char *language_to_string(Language lang) {
    switch (lang) {
    case Language::Python:
        return "python";
    case Language::JavaScript:
        return "javascript";
    case Language::TypeScript:
        return "typescript";
    default:
        return "unknown";
    }
}

inline Language language_from_string(const std::string &name) {
    if (name == "python" || name == "py")
        return Language::Python;
    if (name == "javascript" || name == "js" || name == "jsx")
        return Language::JavaScript;
    if (name == "typescript" || name == "ts" || name == "tsx")
        return Language::TypeScript;
    return Language::Unknown;
}

// Get language from file extension (including the dot)
inline Language language_from_extension(const std::string &ext) {
    if (ext == ".py")
        return Language::Python;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs")
        return Language::JavaScript;
    if (ext == ".ts" || ext == ".tsx")
        return Language::TypeScript;
    return Language::Unknown;
}

// Get language from a path's extension
Language language_from_path(const std::string &path);

// ============================================================================
// Graph vocabulary
// ============================================================================

enum class NodeKind { File, Module, Function, Class, Endpoint, Schema, Component };

enum class EdgeKind { Imports, Calls, Implements, BindsEndpoint, ReferencesSchema };

constexpr size_t NUM_EDGE_KINDS = 5;

const char *node_kind_to_string(NodeKind kind);
const char *edge_kind_to_string(EdgeKind kind);

// Throw ValidationError on unknown names
NodeKind node_kind_from_string(const std::string &name);
EdgeKind edge_kind_from_string(const std::string &name);

// Bit for an EdgeKind inside an EdgeMask
using EdgeMask = uint32_t;
constexpr EdgeMask edge_bit(EdgeKind kind) { return EdgeMask(1) << static_cast<int>(kind); }
constexpr EdgeMask ALL_EDGES = (EdgeMask(1) << NUM_EDGE_KINDS) - 1;

enum class Severity { Low, Medium, High };

const char *severity_to_string(Severity severity);

// Throw ValidationError on unknown names
Severity severity_from_string(const std::string &name);

// Inclusive 1-based line range
struct LineSpan {
    uint32_t first = 0;
    uint32_t last = 0;
};

// Where an edge was found
struct Provenance {
    std::string path;
    LineSpan lines;
};

// One entry of a signature summary (parameter or schema field)
struct Param {
    std::string name;
    std::string type; // Empty when no type hint is available

    bool operator==(const Param &other) const {
        return name == other.name && type == other.type;
    }
};

struct Node {
    NodeId id = INVALID_NODE_ID;
    NodeKind kind = NodeKind::File;
    Language language = Language::Unknown;
    std::string path;           // Normalized originating file path
    std::string qualified_name; // In-file qualified name (e.g. "User.save")
    std::string name;           // Short name (e.g. "save")
    LineSpan lines;
    std::vector<Param> signature;

    // Endpoint nodes only
    std::string http_verb;
    std::string route;
};

struct Edge {
    NodeId source = INVALID_NODE_ID;
    NodeId target = INVALID_NODE_ID;
    EdgeKind kind = EdgeKind::Calls;
    double confidence = 1.0;
    Provenance provenance;
};

// ============================================================================
// Ingestion boundary
// ============================================================================

struct Document {
    std::string path;
    Language language = Language::Unknown;
    std::string content;
};

enum class ParseFailure { SyntaxError, UnsupportedLanguage, EmptyFile };

const char *parse_failure_to_string(ParseFailure reason);

struct UnparsedFile {
    std::string path;
    Language language = Language::Unknown;
    ParseFailure reason = ParseFailure::SyntaxError;
    std::string detail;
};

// ============================================================================
// Helpers
// ============================================================================

// Stable node id for a declared symbol
NodeId make_node_id(const std::string &path, const std::string &qualified_name);

// 16 lowercase hex digits
std::string node_id_to_string(NodeId id);

// Accepts the node_id_to_string form, returns INVALID_NODE_ID when malformed
NodeId node_id_from_string(const std::string &text);

// Forward slashes, no "./" or empty components. Returns empty string for
// paths that are empty or escape the root with "..".
std::string normalize_path(const std::string &path);

// Directory part of a normalized path ("" for top-level files)
std::string parent_dir(const std::string &path);

// Last component of a normalized path
std::string file_name(const std::string &path);

// '*' and '?' wildcards
bool glob_match(const std::string &pattern, const std::string &text);

} // namespace devguard
