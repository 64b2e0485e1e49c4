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

#include "devguard/graph_builder.hpp"
#include "devguard/errors.hpp"
#include "devguard/routes.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace devguard {

namespace {

const char *SCRIPT_EXTENSIONS[] = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs"};

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string last_segment(const std::string &dotted) {
    size_t dot = dotted.rfind('.');
    return dot == std::string::npos ? dotted : dotted.substr(dot + 1);
}

std::vector<std::string> dir_components(const std::string &path) {
    std::vector<std::string> parts;
    std::string dir = parent_dir(path);
    size_t pos = 0;
    while (!dir.empty() && pos <= dir.size()) {
        size_t slash = dir.find('/', pos);
        if (slash == std::string::npos)
            slash = dir.size();
        parts.push_back(dir.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return parts;
}

size_t common_depth(const std::vector<std::string> &a, const std::vector<std::string> &b) {
    size_t depth = 0;
    while (depth < a.size() && depth < b.size() && a[depth] == b[depth])
        ++depth;
    return depth;
}

std::string top_component(const std::string &path) {
    return path.substr(0, path.find('/'));
}

struct FileEntry {
    std::string path;
    Language language = Language::Unknown;
    std::string module_name;
    NodeId file_id = INVALID_NODE_ID;
    std::unordered_map<std::string, NodeId> local; // In-file qualified name -> id
};

struct Resolution {
    NodeId id = INVALID_NODE_ID;
    std::string reason;
};

// Name indexes over every declared node, used to resolve references
class Resolver {
public:
    explicit Resolver(const Graph &graph) : graph_(graph) {}

    void add_file(const FileEntry &file) {
        files_by_path_[file.path] = &file;
        if (file.language == Language::Python) {
            python_modules_[file.module_name] = &file;
        } else {
            script_modules_[file.module_name].push_back(&file);
        }
        full_[file.module_name].push_back(file.file_id);
    }

    void add_symbol(const FileEntry &file, const Node &node) {
        full_[file.module_name + "." + node.qualified_name].push_back(node.id);
        qualified_[node.qualified_name].push_back(node.id);
        short_[node.name].push_back(node.id);
        module_of_[node.id] = &file;
    }

    Resolution resolve(const Reference &ref, const FileEntry &file) const;

private:
    bool accepted(const Reference &ref, NodeId id) const {
        if (ref.accepts.empty())
            return true;
        const Node *node = graph_.find_node(id);
        return node && std::find(ref.accepts.begin(), ref.accepts.end(), node->kind) !=
                           ref.accepts.end();
    }

    const FileEntry *resolve_module(const std::string &module, const FileEntry &from) const;
    const FileEntry *resolve_python_module(const std::string &module, const FileEntry &from) const;
    const FileEntry *resolve_script_module(const std::string &module, const FileEntry &from) const;

    // Candidates filtered by kind, then narrowed by path proximity
    bool pick(const Reference &ref, std::vector<NodeId> candidates, const FileEntry &from,
              Resolution &out, bool &kind_mismatch) const;

    const Graph &graph_;
    std::map<std::string, const FileEntry *> files_by_path_;
    std::map<std::string, const FileEntry *> python_modules_;
    std::map<std::string, std::vector<const FileEntry *>> script_modules_;
    std::unordered_map<std::string, std::vector<NodeId>> full_;
    std::unordered_map<std::string, std::vector<NodeId>> qualified_;
    std::unordered_map<std::string, std::vector<NodeId>> short_;
    std::unordered_map<NodeId, const FileEntry *> module_of_;
};

const FileEntry *Resolver::resolve_module(const std::string &module,
                                          const FileEntry &from) const {
    if (from.language == Language::Python)
        return resolve_python_module(module, from);
    return resolve_script_module(module, from);
}

const FileEntry *Resolver::resolve_python_module(const std::string &module,
                                                 const FileEntry &from) const {
    auto it = python_modules_.find(module);
    if (it != python_modules_.end())
        return it->second;

    // Source root below the analyzed root: "backend.app.models" for "app.models"
    std::vector<const FileEntry *> matches;
    for (const auto &[name, file] : python_modules_) {
        if (ends_with(name, "." + module))
            matches.push_back(file);
    }
    if (matches.size() == 1)
        return matches.front();

    auto here = dir_components(from.path);
    const FileEntry *best = nullptr;
    size_t best_depth = 0;
    bool tie = false;
    for (const FileEntry *file : matches) {
        size_t depth = common_depth(here, dir_components(file->path));
        if (depth > best_depth) {
            best = file;
            best_depth = depth;
            tie = false;
        } else if (depth == best_depth) {
            tie = true;
        }
    }
    return tie ? nullptr : best;
}

const FileEntry *Resolver::resolve_script_module(const std::string &module,
                                                 const FileEntry &from) const {
    std::string base;
    if (module[0] == '.') {
        std::string dir = parent_dir(from.path);
        base = normalize_path(dir.empty() ? module : dir + "/" + module);
    } else if (module[0] == '/') {
        base = normalize_path(module);
    } else if (module.compare(0, 2, "@/") == 0 || module.compare(0, 2, "~/") == 0) {
        // Path alias: match by suffix, e.g. "@/api/users" -> "src/api/users"
        std::string suffix = module.substr(2);
        const FileEntry *found = nullptr;
        for (const auto &[name, files] : script_modules_) {
            if (name != suffix && !ends_with(name, "/" + suffix))
                continue;
            if (found || files.size() != 1)
                return nullptr;
            found = files.front();
        }
        return found;
    } else {
        return nullptr; // Bare package specifier
    }

    if (base.empty())
        return nullptr;

    auto lookup = [&](const std::string &path) -> const FileEntry * {
        auto it = files_by_path_.find(path);
        return it != files_by_path_.end() ? it->second : nullptr;
    };

    if (const FileEntry *file = lookup(base))
        return file;
    for (const char *ext : SCRIPT_EXTENSIONS) {
        if (const FileEntry *file = lookup(base + ext))
            return file;
    }
    for (const char *ext : SCRIPT_EXTENSIONS) {
        if (const FileEntry *file = lookup(base + "/index" + ext))
            return file;
    }
    return nullptr;
}

bool Resolver::pick(const Reference &ref, std::vector<NodeId> candidates, const FileEntry &from,
                    Resolution &out, bool &kind_mismatch) const {
    if (candidates.empty())
        return false;

    std::vector<NodeId> kept;
    for (NodeId id : candidates) {
        if (accepted(ref, id))
            kept.push_back(id);
    }
    if (kept.empty()) {
        kind_mismatch = true;
        return false;
    }
    std::sort(kept.begin(), kept.end());
    kept.erase(std::unique(kept.begin(), kept.end()), kept.end());

    auto path_of = [&](NodeId id) { return graph_.find_node(id)->path; };

    if (kept.size() > 1) {
        // Same file
        std::vector<NodeId> same;
        for (NodeId id : kept) {
            if (path_of(id) == from.path)
                same.push_back(id);
        }

        if (!same.empty()) {
            kept = same;
        } else {
            // Deepest common directory
            auto here = dir_components(from.path);
            size_t best = 0;
            std::vector<NodeId> nearest;
            for (NodeId id : kept) {
                size_t depth = common_depth(here, dir_components(path_of(id)));
                if (depth > best) {
                    best = depth;
                    nearest.clear();
                }
                if (depth == best && depth > 0)
                    nearest.push_back(id);
            }

            if (!nearest.empty()) {
                kept = nearest;
            } else {
                // Same top-level package
                std::vector<NodeId> package;
                for (NodeId id : kept) {
                    if (top_component(path_of(id)) == top_component(from.path))
                        package.push_back(id);
                }
                if (!package.empty())
                    kept = package;
            }
        }
    }

    if (kept.size() == 1) {
        out.id = kept.front();
        return true;
    }

    std::string reason = "ambiguous:";
    for (NodeId id : kept) {
        const Node *node = graph_.find_node(id);
        reason += " " + node->path + "::" + node->qualified_name;
    }
    out.reason = reason;
    return true;
}

Resolution Resolver::resolve(const Reference &ref, const FileEntry &file) const {
    Resolution result;
    bool kind_mismatch = false;

    if (ref.local) {
        auto it = file.local.find(ref.name);
        if (it != file.local.end() && accepted(ref, it->second)) {
            result.id = it->second;
        } else {
            result.reason = it == file.local.end() ? "no match" : "kind mismatch";
        }
        return result;
    }

    if (!ref.module.empty()) {
        const FileEntry *target = resolve_module(ref.module, file);

        if (target) {
            if (ref.name.empty())
                return Resolution{target->file_id, ""};

            auto it = target->local.find(ref.name);
            if (it != target->local.end() && accepted(ref, it->second))
                return Resolution{it->second, ""};

            // "from pkg import sub" / "sub.func()" through a package
            if (file.language == Language::Python) {
                size_t dot = ref.name.find('.');
                std::string head = ref.name.substr(0, dot);
                const FileEntry *sub = resolve_python_module(ref.module + "." + head, file);
                if (sub) {
                    if (dot == std::string::npos) {
                        if (ref.kind == EdgeKind::Imports || accepted(ref, sub->file_id))
                            return Resolution{sub->file_id, ""};
                    } else {
                        auto found = sub->local.find(ref.name.substr(dot + 1));
                        if (found != sub->local.end() && accepted(ref, found->second))
                            return Resolution{found->second, ""};
                    }
                }
            }

            // Re-exports and default exports land on the module itself
            if (ref.kind == EdgeKind::Imports)
                return Resolution{target->file_id, ""};
        } else if (ref.kind == EdgeKind::Imports) {
            result.reason = "unknown module";
            return result;
        }
    }

    if (!ref.scope.empty()) {
        auto it = file.local.find(ref.scope + "." + ref.name);
        if (it != file.local.end() && accepted(ref, it->second))
            return Resolution{it->second, ""};
    }

    auto lookup = [](const std::unordered_map<std::string, std::vector<NodeId>> &index,
                     const std::string &key) {
        auto it = index.find(key);
        return it != index.end() ? it->second : std::vector<NodeId>{};
    };

    // Full dotted name, then in-file qualified name
    if (pick(ref, lookup(full_, ref.name), file, result, kind_mismatch))
        return result;
    if (pick(ref, lookup(qualified_, ref.name), file, result, kind_mismatch))
        return result;

    bool dotted = ref.name.find('.') != std::string::npos;
    if (dotted) {
        // "views.list_users" matching "app.views.list_users"
        std::vector<NodeId> suffix;
        for (NodeId id : lookup(short_, last_segment(ref.name))) {
            const FileEntry *owner = module_of_.at(id);
            const Node *node = graph_.find_node(id);
            std::string full = owner->module_name + "." + node->qualified_name;
            if (ends_with(full, "." + ref.name) || ends_with(node->qualified_name, "." + ref.name))
                suffix.push_back(id);
        }
        if (pick(ref, suffix, file, result, kind_mismatch))
            return result;
    } else if (!ref.strict) {
        if (pick(ref, lookup(short_, ref.name), file, result, kind_mismatch))
            return result;
    }

    result.reason = kind_mismatch ? "kind mismatch" : "no match";
    return result;
}

struct EndpointEntry {
    NodeId id;
    std::string verb;
    RoutePattern pattern;
};

} // namespace

BuildResult GraphBuilder::build(std::vector<FileContribution> contributions) const {
    BuildResult result;
    Graph &graph = result.graph;

    // Validate and order
    for (auto &contribution : contributions) {
        if (contribution.path.empty()) {
            throw ValidationError("Document with an empty path");
        }
        std::string normalized = normalize_path(contribution.path);
        if (normalized.empty()) {
            throw ValidationError("Path escapes the analyzed root: " + contribution.path);
        }
        contribution.path = normalized;
    }

    std::sort(contributions.begin(), contributions.end(),
              [](const FileContribution &a, const FileContribution &b) { return a.path < b.path; });

    for (size_t i = 1; i < contributions.size(); ++i) {
        if (contributions[i].path == contributions[i - 1].path) {
            throw ValidationError("Duplicate document path: " + contributions[i].path);
        }
    }

    // Declare nodes
    std::vector<FileEntry> files(contributions.size());
    std::unordered_map<NodeId, std::pair<std::string, std::string>> owners;
    std::vector<EndpointEntry> endpoints;
    Resolver resolver(graph);

    for (size_t i = 0; i < contributions.size(); ++i) {
        const FileContribution &contribution = contributions[i];
        FileEntry &file = files[i];
        file.path = contribution.path;
        file.language = contribution.language;
        file.module_name = contribution.module_name;

        for (size_t d = 0; d < contribution.decls.size(); ++d) {
            const SymbolDecl &decl = contribution.decls[d];
            bool is_file = d == 0;

            // File nodes hash the path alone so a symbol named like its module never collides
            std::string key = is_file ? "" : decl.qualified_name;
            if (!is_file && file.local.count(key)) {
                continue; // Redefinition in the same file keeps the first
            }

            NodeId id = make_node_id(file.path, key);
            auto owner = owners.find(id);
            if (owner != owners.end()) {
                throw ValidationError("Node id collision between " + owner->second.first + "::" +
                                      owner->second.second + " and " + file.path + "::" + key);
            }
            owners.emplace(id, std::make_pair(file.path, key));

            Node node;
            node.id = id;
            node.kind = decl.kind;
            node.language = contribution.language;
            node.path = file.path;
            node.qualified_name = decl.qualified_name;
            node.name = decl.name;
            node.lines = decl.lines;
            node.signature = decl.signature;
            node.http_verb = decl.http_verb;
            node.route = decl.route;

            if (is_file) {
                file.file_id = id;
            } else {
                file.local.emplace(key, id);
            }
            if (node.kind == NodeKind::Endpoint) {
                endpoints.push_back({id, node.http_verb, parse_route(node.route)});
            }
            graph.add_node(std::move(node));
        }

        if (file.file_id == INVALID_NODE_ID) {
            throw ValidationError("Contribution without a file node: " + file.path);
        }
    }

    for (const auto &file : files) {
        resolver.add_file(file);
        for (const auto &[qualified, id] : file.local) {
            resolver.add_symbol(file, *graph.find_node(id));
        }
    }

    // Resolve references
    for (size_t i = 0; i < contributions.size(); ++i) {
        const FileContribution &contribution = contributions[i];
        const FileEntry &file = files[i];

        auto source_of = [&](const std::string &qualified) {
            if (qualified.empty())
                return file.file_id;
            auto it = file.local.find(qualified);
            return it != file.local.end() ? it->second : file.file_id;
        };

        for (const auto &ref : contribution.references) {
            NodeId source = source_of(ref.source);
            Resolution target = resolver.resolve(ref, file);

            if (target.id == INVALID_NODE_ID) {
                std::string name = ref.name.empty() ? ref.module : ref.name;
                result.diagnostics.push_back(
                    {source, name, ref.kind, file.path, ref.lines.first, target.reason});
                continue;
            }
            if (target.id == source && ref.kind != EdgeKind::Calls) {
                continue;
            }

            Edge edge;
            edge.source = source;
            edge.target = target.id;
            edge.kind = ref.kind;
            edge.confidence = 1.0;
            edge.provenance = {file.path, ref.lines};
            graph.add_edge(edge);

            // A symbol import is also an import of its module
            const Node *imported = graph.find_node(target.id);
            if (ref.kind == EdgeKind::Imports && imported->kind != NodeKind::File &&
                imported->kind != NodeKind::Module) {
                NodeId module = graph.file_node(imported->path);
                if (module != INVALID_NODE_ID && module != file.file_id) {
                    edge.target = module;
                    graph.add_edge(edge);
                }
            }
        }

        // Bind call sites to endpoints by verb and URL pattern
        for (const auto &call : contribution.endpoint_calls) {
            NodeId source = source_of(call.source);
            RoutePattern pattern = parse_route(call.url);

            double best = 0.0;
            std::vector<NodeId> bound;
            for (const auto &endpoint : endpoints) {
                if (!verbs_match(call.verb, endpoint.verb))
                    continue;
                double confidence = match_confidence(match_route(pattern, endpoint.pattern), config_);
                if (confidence <= 0.0 || confidence < best)
                    continue;
                if (confidence > best) {
                    best = confidence;
                    bound.clear();
                }
                bound.push_back(endpoint.id);
            }

            if (bound.empty()) {
                result.diagnostics.push_back({source, call.verb + " " + call.url,
                                              EdgeKind::BindsEndpoint, file.path, call.lines.first,
                                              "no matching endpoint"});
                continue;
            }

            for (NodeId endpoint : bound) {
                Edge edge;
                edge.source = source;
                edge.target = endpoint;
                edge.kind = EdgeKind::BindsEndpoint;
                edge.confidence = best;
                edge.provenance = {file.path, call.lines};
                graph.add_edge(edge);
            }
        }
    }

    graph.finalize();
    return result;
}

json diagnostic_to_json(const Diagnostic &diagnostic) {
    json j;
    j["source"] = node_id_to_string(diagnostic.source);
    j["reference"] = diagnostic.reference;
    j["kind"] = edge_kind_to_string(diagnostic.kind);
    j["path"] = diagnostic.path;
    j["line"] = diagnostic.line;
    j["reason"] = diagnostic.reason;
    return j;
}

Diagnostic diagnostic_from_json(const json &j) {
    Diagnostic diagnostic;
    diagnostic.source = node_id_from_string(j.at("source").get<std::string>());
    diagnostic.reference = j.at("reference").get<std::string>();
    diagnostic.kind = edge_kind_from_string(j.at("kind").get<std::string>());
    diagnostic.path = j.value("path", std::string());
    diagnostic.line = j.value("line", 0u);
    diagnostic.reason = j.value("reason", std::string());
    return diagnostic;
}

} // namespace devguard
