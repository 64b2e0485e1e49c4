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

#include "devguard/types.hpp"
#include "devguard/errors.hpp"
#include <cstdio>

namespace devguard {

Language language_from_path(const std::string &path) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return Language::Unknown;
    return language_from_extension(path.substr(dot));
}

const char *node_kind_to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::File:
        return "file";
    case NodeKind::Module:
        return "module";
    case NodeKind::Function:
        return "function";
    case NodeKind::Class:
        return "class";
    case NodeKind::Endpoint:
        return "endpoint";
    case NodeKind::Schema:
        return "schema";
    case NodeKind::Component:
        return "component";
    }
    return "unknown";
}

const char *edge_kind_to_string(EdgeKind kind) {
    switch (kind) {
    case EdgeKind::Imports:
        return "imports";
    case EdgeKind::Calls:
        return "calls";
    case EdgeKind::Implements:
        return "implements";
    case EdgeKind::BindsEndpoint:
        return "binds_endpoint";
    case EdgeKind::ReferencesSchema:
        return "references_schema";
    }
    return "unknown";
}

NodeKind node_kind_from_string(const std::string &name) {
    static const NodeKind kinds[] = {NodeKind::File,     NodeKind::Module,   NodeKind::Function,
                                     NodeKind::Class,    NodeKind::Endpoint, NodeKind::Schema,
                                     NodeKind::Component};
    for (NodeKind kind : kinds) {
        if (name == node_kind_to_string(kind))
            return kind;
    }
    throw ValidationError("Unknown node kind: " + name);
}

EdgeKind edge_kind_from_string(const std::string &name) {
    static const EdgeKind kinds[] = {EdgeKind::Imports, EdgeKind::Calls, EdgeKind::Implements,
                                     EdgeKind::BindsEndpoint, EdgeKind::ReferencesSchema};
    for (EdgeKind kind : kinds) {
        if (name == edge_kind_to_string(kind))
            return kind;
    }
    throw ValidationError("Unknown edge kind: " + name);
}

const char *severity_to_string(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    }
    return "unknown";
}

Severity severity_from_string(const std::string &name) {
    if (name == "low")
        return Severity::Low;
    if (name == "medium")
        return Severity::Medium;
    if (name == "high")
        return Severity::High;
    throw ValidationError("Unknown severity: " + name);
}

const char *parse_failure_to_string(ParseFailure reason) {
    switch (reason) {
    case ParseFailure::SyntaxError:
        return "syntax_error";
    case ParseFailure::UnsupportedLanguage:
        return "unsupported_language";
    case ParseFailure::EmptyFile:
        return "empty_file";
    }
    return "unknown";
}

NodeId make_node_id(const std::string &path, const std::string &qualified_name) {
    // FNV-1a, 64 bit
    constexpr uint64_t offset_basis = 14695981039346656037ULL;
    constexpr uint64_t prime = 1099511628211ULL;

    uint64_t hash = offset_basis;
    auto feed = [&](const std::string &s) {
        for (unsigned char c : s) {
            hash ^= c;
            hash *= prime;
        }
    };
    feed(path);
    feed("::");
    feed(qualified_name);

    return hash == INVALID_NODE_ID ? 1 : hash;
}

std::string node_id_to_string(NodeId id) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(id));
    return std::string(buf, 16);
}

NodeId node_id_from_string(const std::string &text) {
    if (text.empty() || text.size() > 16)
        return INVALID_NODE_ID;

    NodeId id = 0;
    for (char c : text) {
        id <<= 4;
        if (c >= '0' && c <= '9')
            id |= static_cast<NodeId>(c - '0');
        else if (c >= 'a' && c <= 'f')
            id |= static_cast<NodeId>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F')
            id |= static_cast<NodeId>(c - 'A' + 10);
        else
            return INVALID_NODE_ID;
    }
    return id;
}

std::string normalize_path(const std::string &path) {
    std::vector<std::string> parts;
    size_t pos = 0;

    // Split path by '/' or '\\'
    while (pos <= path.size()) {
        size_t next_slash = path.find_first_of("/\\", pos);
        if (next_slash == std::string::npos)
            next_slash = path.size();

        std::string component = path.substr(pos, next_slash - pos);
        if (component == "..") {
            if (parts.empty())
                return "";
            parts.pop_back();
        } else if (!component.empty() && component != ".") {
            parts.push_back(std::move(component));
        }
        pos = next_slash + 1;
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += '/';
        out += parts[i];
    }
    return out;
}

std::string parent_dir(const std::string &path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

std::string file_name(const std::string &path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool glob_match(const std::string &pattern, const std::string &text) {
    size_t p = 0, t = 0;
    size_t star = std::string::npos, resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

} // namespace devguard
