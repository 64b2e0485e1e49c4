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
#include "types.hpp"
#include <string>
#include <vector>

namespace devguard {

// A symbol declared by one file. The first declaration of every
// contribution is the file's own File (or Module) node.
struct SymbolDecl {
    NodeKind kind = NodeKind::Function;
    std::string qualified_name; // In-file qualified name
    std::string name;           // Short name
    LineSpan lines;
    std::vector<Param> signature;
    std::string http_verb; // Endpoint only
    std::string route;     // Endpoint only
};

// A reference to a symbol by name, resolved later by the Graph Builder
struct Reference {
    std::string source; // Qualified name of the referencing declaration, "" = file node
    EdgeKind kind = EdgeKind::Calls;
    std::string name;   // Target as written, possibly dotted ("views.list_users")
    std::string module; // Module hint: dotted (Python) or path-like (scripts)
    std::string scope;  // Enclosing class for self/this calls
    LineSpan lines;
    std::vector<NodeKind> accepts; // Acceptable target kinds, empty = any

    bool local = false;  // Target is declared in the same file
    bool strict = false; // No short-name fallback (call through an unknown receiver)
};

// An outgoing HTTP call found in source (fetch, axios.get, requests.post, ...)
struct EndpointCall {
    std::string source; // Qualified name of the calling declaration, "" = file node
    std::string verb;   // Upper case; "ANY" when it cannot be determined
    std::string url;    // URL literal with "{}" for interpolated parts
    LineSpan lines;
};

// Everything one file contributes to the graph
struct FileContribution {
    std::string path; // Normalized
    Language language = Language::Unknown;
    std::string module_name; // Python dotted module or script path without extension
    uint32_t line_count = 0;

    std::vector<SymbolDecl> decls;
    std::vector<Reference> references;
    std::vector<EndpointCall> endpoint_calls;
};

struct ExtractionResult {
    bool ok = false;
    FileContribution contribution; // Valid when ok
    UnparsedFile failure;          // Valid when !ok
};

// Extract one document. Never throws for bad input: unsupported languages,
// empty files and syntax errors come back as an UnparsedFile.
ExtractionResult extract(const Document &doc, const ExtractorConfig &config);

// Language adapters, selected by extract() from the document's language
ExtractionResult extract_python(const Document &doc, const ExtractorConfig &config);
ExtractionResult extract_script(const Document &doc, const ExtractorConfig &config);

// Failed result carrying an UnparsedFile record
ExtractionResult unparsed_result(const Document &doc, Language lang, ParseFailure reason,
                                 std::string detail);

// Module names derived from a normalized path
std::string python_module_name(const std::string &path);
std::string script_module_name(const std::string &path);

// Literal value of a quoted string node text; "{}" replaces interpolations
std::string unquote_literal(const std::string &text);

// True for get/post/put/patch/delete/head/options (any case)
bool is_http_verb(const std::string &name);

std::string to_upper(std::string s);

} // namespace devguard
