#include "devguard/extractor.hpp"
#include "devguard/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <set>

namespace devguard {

namespace {

// Globals and framework hooks that never resolve to analyzed code
const std::set<std::string> SCRIPT_BUILTINS = {
    "setTimeout", "setInterval", "clearTimeout", "clearInterval", "parseInt", "parseFloat",
    "isNaN",      "encodeURIComponent", "decodeURIComponent", "String", "Number", "Boolean",
    "Array",      "Object",     "Promise",      "Symbol",      "alert",    "structuredClone",
    "useState",   "useEffect",  "useMemo",      "useCallback", "useRef",   "useContext",
    "useReducer", "useLayoutEffect", "Date",    "Error",       "Map",      "Set"};

// Type names that never name a schema
const std::set<std::string> TYPE_BUILTINS = {
    "Promise", "Array", "Record", "Partial", "Required", "Readonly", "Pick", "Omit",
    "Map",     "Set",   "Date",   "Error",   "ReturnType", "Parameters", "Awaited",
    "ReactNode", "ReactElement", "FC", "JSX", "Element"};

const std::set<std::string> COMPONENT_BASES = {"Component", "PureComponent"};

// Wrappers whose first argument is the component itself: memo(() => ...)
const std::set<std::string> COMPONENT_WRAPPERS = {"memo", "forwardRef", "observer"};

std::string last_segment(const std::string &dotted) {
    size_t dot = dotted.rfind('.');
    return dot == std::string::npos ? dotted : dotted.substr(dot + 1);
}

std::string first_segment(const std::string &dotted) {
    size_t dot = dotted.find('.');
    return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

bool starts_upper(const std::string &name) {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0]));
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_dotted_name(TSNode node) {
    if (node_is(node, "identifier") || node_is(node, "this"))
        return true;
    return node_is(node, "member_expression") && is_dotted_name(child_by_field(node, "object"));
}

bool is_function_value(TSNode node) {
    return node_is(node, "arrow_function") || node_is(node, "function_expression") ||
           node_is(node, "function") || node_is(node, "generator_function");
}

bool is_string_value(TSNode node) {
    return node_is(node, "string") || node_is(node, "template_string");
}

std::vector<TSNode> arguments_of(TSNode call) {
    std::vector<TSNode> args;
    TSNode list = child_by_field(call, "arguments");
    uint32_t count = ts_node_is_null(list) ? 0 : ts_node_named_child_count(list);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(list, i);
        if (!node_is(arg, "comment"))
            args.push_back(arg);
    }
    return args;
}

std::string basename_of(const std::string &path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

class ScriptWalker {
public:
    ScriptWalker(const SourceParser &parser, const ExtractorConfig &config, FileContribution &out)
        : parser_(parser), config_(config), out_(out) {
        jsx_file_ = ends_with(out.path, ".jsx") || ends_with(out.path, ".tsx");
    }

    void run();

private:
    struct Scope {
        std::string qualified;
        NodeKind kind;
        uint32_t end_byte;
    };

    struct ImportBinding {
        std::string module;
        std::string symbol; // Empty for namespace and require bindings
    };

    std::string text(TSNode node) const { return parser_.node_text(node); }

    std::string source() const { return scopes_.empty() ? "" : scopes_.back().qualified; }

    std::string prefix() const { return scopes_.empty() ? "" : scopes_.back().qualified + "."; }

    bool in_class() const {
        return !scopes_.empty() &&
               (scopes_.back().kind == NodeKind::Class || scopes_.back().kind == NodeKind::Component);
    }

    std::string enclosing_class() const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            if (it->kind == NodeKind::Class || it->kind == NodeKind::Component)
                return it->qualified;
        }
        return "";
    }

    static bool configured(const std::vector<std::string> &names, const std::string &name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    size_t declare(NodeKind kind, const std::string &qualified, const std::string &name,
                   TSNode node, std::vector<Param> signature = {}) {
        SymbolDecl decl;
        decl.kind = kind;
        decl.qualified_name = qualified;
        decl.name = name;
        decl.lines = span_of(node);
        decl.signature = std::move(signature);
        out_.decls.push_back(std::move(decl));
        return out_.decls.size() - 1;
    }

    Reference &refer(EdgeKind kind, const std::string &from, const std::string &name, TSNode at) {
        Reference ref;
        ref.source = from;
        ref.kind = kind;
        ref.name = name;
        ref.lines = span_of(at);
        out_.references.push_back(std::move(ref));
        return out_.references.back();
    }

    bool contains_jsx(TSNode node) const;
    std::string annotation_text(TSNode type_annotation) const;
    std::string object_string(TSNode object, const char *key) const;

    std::vector<Param> parameters_of(TSNode function, const std::string &owner);
    void refer_types(TSNode type_node, const std::string &from);
    void refer_call(const std::string &callee, TSNode at, std::vector<NodeKind> accepts = {});
    void endpoint_call(const std::string &verb, TSNode url, TSNode at);

    void on_import(TSNode node);
    void on_function(TSNode node, TSNode name_node, TSNode function, uint32_t end_byte);
    void on_variable(TSNode node);
    void on_class(TSNode node);
    void on_method(TSNode node, TSNode function);
    void on_interface(TSNode node, TSNode body);
    void on_call(TSNode node);
    bool on_route(TSNode node, const std::string &verb, const std::vector<TSNode> &args);
    void on_new(TSNode node);
    void on_jsx(TSNode node);

    const SourceParser &parser_;
    const ExtractorConfig &config_;
    FileContribution &out_;

    std::vector<Scope> scopes_;
    std::map<std::string, ImportBinding> imports_; // Local name -> import
    bool jsx_file_ = false;
};

void ScriptWalker::run() {
    parser_.visit_nodes(parser_.root(), [&](TSNode node) {
        uint32_t start_byte = ts_node_start_byte(node);

        // Pop declarations that we've exited
        while (!scopes_.empty() && start_byte >= scopes_.back().end_byte) {
            scopes_.pop_back();
        }

        const char *type = ts_node_type(node);
        if (strcmp(type, "import_statement") == 0) {
            on_import(node);
            return false;
        }
        if (strcmp(type, "function_declaration") == 0 ||
            strcmp(type, "generator_function_declaration") == 0) {
            on_function(node, child_by_field(node, "name"), node, ts_node_end_byte(node));
        } else if (strcmp(type, "variable_declarator") == 0) {
            on_variable(node);
        } else if (strcmp(type, "class_declaration") == 0 ||
                   strcmp(type, "abstract_class_declaration") == 0) {
            on_class(node);
        } else if (strcmp(type, "method_definition") == 0) {
            on_method(node, node);
        } else if (strcmp(type, "public_field_definition") == 0 ||
                   strcmp(type, "field_definition") == 0) {
            TSNode value = child_by_field(node, "value");
            if (is_function_value(value))
                on_method(node, value);
        } else if (strcmp(type, "interface_declaration") == 0) {
            on_interface(node, child_by_field(node, "body"));
            return false;
        } else if (strcmp(type, "type_alias_declaration") == 0) {
            TSNode value = child_by_field(node, "value");
            if (node_is(value, "object_type"))
                on_interface(node, value);
            return false;
        } else if (strcmp(type, "call_expression") == 0) {
            on_call(node);
        } else if (strcmp(type, "new_expression") == 0) {
            on_new(node);
        } else if (strcmp(type, "jsx_opening_element") == 0 ||
                   strcmp(type, "jsx_self_closing_element") == 0) {
            on_jsx(node);
        } else if (strcmp(type, "comment") == 0 || strcmp(type, "string") == 0) {
            return false;
        }
        return true;
    });
}

bool ScriptWalker::contains_jsx(TSNode node) const {
    bool found = false;
    parser_.visit_nodes(node, [&](TSNode n) {
        if (found)
            return false;
        const char *type = ts_node_type(n);
        if (strcmp(type, "jsx_element") == 0 || strcmp(type, "jsx_self_closing_element") == 0 ||
            strcmp(type, "jsx_fragment") == 0) {
            found = true;
            return false;
        }
        return true;
    });
    return found;
}

// ": User | null" -> "User | null"
std::string ScriptWalker::annotation_text(TSNode type_annotation) const {
    std::string t = text(type_annotation);
    size_t start = t.find_first_not_of(": \t\n");
    return start == std::string::npos ? "" : t.substr(start);
}

// String value of key in an object literal ({ method: 'POST' })
std::string ScriptWalker::object_string(TSNode object, const char *key) const {
    if (!node_is(object, "object"))
        return "";
    uint32_t count = ts_node_named_child_count(object);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode pair = ts_node_named_child(object, i);
        if (!node_is(pair, "pair"))
            continue;
        TSNode k = child_by_field(pair, "key");
        std::string name = is_string_value(k) ? unquote_literal(text(k)) : text(k);
        TSNode value = child_by_field(pair, "value");
        if (name == key && is_string_value(value))
            return unquote_literal(text(value));
    }
    return "";
}

std::vector<Param> ScriptWalker::parameters_of(TSNode function, const std::string &owner) {
    std::vector<Param> signature;
    TSNode params = child_by_field(function, "parameters");
    if (ts_node_is_null(params)) {
        // Single bare arrow parameter: x => ...
        TSNode single = child_by_field(function, "parameter");
        if (!ts_node_is_null(single))
            signature.push_back({text(single), ""});
        return signature;
    }

    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        const char *type = ts_node_type(param);
        Param p;

        if (strcmp(type, "required_parameter") == 0 || strcmp(type, "optional_parameter") == 0) {
            TSNode pattern = child_by_field(param, "pattern");
            if (node_is(pattern, "this"))
                continue;
            p.name = text(pattern);
            TSNode annotation = child_by_field(param, "type");
            if (!ts_node_is_null(annotation)) {
                p.type = annotation_text(annotation);
                refer_types(annotation, owner);
            }
        } else if (strcmp(type, "assignment_pattern") == 0) {
            p.name = text(child_by_field(param, "left"));
        } else if (strcmp(type, "comment") == 0) {
            continue;
        } else {
            p.name = text(param);
        }
        signature.push_back(std::move(p));
    }

    TSNode return_type = child_by_field(function, "return_type");
    if (!ts_node_is_null(return_type))
        refer_types(return_type, owner);
    return signature;
}

void ScriptWalker::refer_types(TSNode type_node, const std::string &from) {
    parser_.visit_nodes(type_node, [&](TSNode node) {
        std::string name;
        bool strict = false;
        if (node_is(node, "type_identifier")) {
            name = text(node);
        } else if (node_is(node, "nested_type_identifier")) {
            name = text(node);
            strict = true;
        } else {
            return !node_is(node, "literal_type");
        }

        if (!TYPE_BUILTINS.count(name)) {
            Reference &ref = refer(EdgeKind::ReferencesSchema, from, name, node);
            ref.accepts = {NodeKind::Schema};
            ref.strict = strict;
            auto it = imports_.find(first_segment(name));
            if (it != imports_.end())
                ref.module = it->second.module;
        }
        return false;
    });
}

// Calls through an imported binding carry its module as a hint
void ScriptWalker::refer_call(const std::string &callee, TSNode at, std::vector<NodeKind> accepts) {
    std::string root = first_segment(callee);
    auto it = imports_.find(root);

    if (it == imports_.end()) {
        bool dotted = callee.find('.') != std::string::npos;
        // Member calls only resolve through classes or imports
        if (dotted && !starts_upper(root))
            return;
        if (!dotted && SCRIPT_BUILTINS.count(callee))
            return;
        Reference &ref = refer(EdgeKind::Calls, source(), callee, at);
        ref.strict = dotted;
        ref.accepts = std::move(accepts);
        return;
    }

    const ImportBinding &binding = it->second;
    std::string rest = callee.size() > root.size() ? callee.substr(root.size() + 1) : "";
    std::string name = binding.symbol;
    if (!rest.empty())
        name = name.empty() ? rest : name + "." + rest;
    if (name.empty())
        name = root;

    Reference &ref = refer(EdgeKind::Calls, source(), name, at);
    ref.module = binding.module;
    ref.strict = !rest.empty();
    ref.accepts = std::move(accepts);
}

void ScriptWalker::endpoint_call(const std::string &verb, TSNode url, TSNode at) {
    EndpointCall call;
    call.source = source();
    call.verb = verb;
    call.url = unquote_literal(text(url));
    call.lines = span_of(at);
    out_.endpoint_calls.push_back(std::move(call));
}

void ScriptWalker::on_import(TSNode node) {
    TSNode source_node = child_by_field(node, "source");
    std::string module = unquote_literal(text(source_node));
    if (module.empty())
        return;

    bool named = false;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode clause = ts_node_named_child(node, i);
        if (!node_is(clause, "import_clause"))
            continue;

        uint32_t parts = ts_node_named_child_count(clause);
        for (uint32_t j = 0; j < parts; ++j) {
            TSNode part = ts_node_named_child(clause, j);

            if (node_is(part, "identifier")) {
                // Default import: the local name usually matches the export
                std::string local = text(part);
                Reference &ref = refer(EdgeKind::Imports, source(), local, node);
                ref.module = module;
                imports_[local] = {module, local};
                named = true;
            } else if (node_is(part, "namespace_import")) {
                std::string local = text(ts_node_named_child(part, 0));
                imports_[local] = {module, ""};
            } else if (node_is(part, "named_imports")) {
                uint32_t specs = ts_node_named_child_count(part);
                for (uint32_t k = 0; k < specs; ++k) {
                    TSNode spec = ts_node_named_child(part, k);
                    if (!node_is(spec, "import_specifier"))
                        continue;
                    std::string name = text(child_by_field(spec, "name"));
                    TSNode alias = child_by_field(spec, "alias");
                    std::string local = ts_node_is_null(alias) ? name : text(alias);

                    Reference &ref = refer(EdgeKind::Imports, source(), name, spec);
                    ref.module = module;
                    imports_[local] = {module, name};
                    named = true;
                }
            }
        }
    }

    // import * as x / import './side-effect'
    if (!named) {
        Reference &ref = refer(EdgeKind::Imports, source(), "", node);
        ref.module = module;
    }
}

void ScriptWalker::on_function(TSNode node, TSNode name_node, TSNode function,
                               uint32_t end_byte) {
    std::string name = text(name_node);
    if (name.empty())
        return;
    std::string qualified = prefix() + name;

    TSNode body = child_by_field(function, "body");
    bool component = starts_upper(name) && (jsx_file_ || contains_jsx(body));
    NodeKind kind = component ? NodeKind::Component : NodeKind::Function;

    declare(kind, qualified, name, node, parameters_of(function, qualified));
    scopes_.push_back({qualified, kind, end_byte});
}

void ScriptWalker::on_variable(TSNode node) {
    TSNode name = child_by_field(node, "name");
    TSNode value = child_by_field(node, "value");

    if (node_is(value, "call_expression")) {
        TSNode callee = child_by_field(value, "function");
        std::vector<TSNode> args = arguments_of(value);

        // const x = require('./x'); the Imports reference comes from on_call
        if (node_is(callee, "identifier") && text(callee) == "require" && !args.empty() &&
            node_is(args[0], "string")) {
            if (node_is(name, "identifier"))
                imports_[text(name)] = {unquote_literal(text(args[0])), ""};
            return;
        }

        // const Card = memo((props) => ...)
        if (COMPONENT_WRAPPERS.count(last_segment(text(callee))) && !args.empty() &&
            is_function_value(args[0]) && node_is(name, "identifier")) {
            on_function(node, name, args[0], ts_node_end_byte(node));
        }
        return;
    }

    if (is_function_value(value) && node_is(name, "identifier"))
        on_function(node, name, value, ts_node_end_byte(node));
}

void ScriptWalker::on_class(TSNode node) {
    std::string name = text(child_by_field(node, "name"));
    if (name.empty())
        return;
    std::string qualified = prefix() + name;

    std::vector<std::pair<std::string, TSNode>> bases;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode heritage = ts_node_named_child(node, i);
        if (!node_is(heritage, "class_heritage"))
            continue;

        uint32_t clauses = ts_node_named_child_count(heritage);
        for (uint32_t j = 0; j < clauses; ++j) {
            TSNode clause = ts_node_named_child(heritage, j);
            if (node_is(clause, "extends_clause") || node_is(clause, "implements_clause")) {
                // TypeScript: extends_clause / implements_clause hold the base types
                uint32_t types = ts_node_named_child_count(clause);
                for (uint32_t k = 0; k < types; ++k) {
                    TSNode base = ts_node_named_child(clause, k);
                    if (node_is(base, "generic_type"))
                        base = child_by_field(base, "name");
                    if (is_dotted_name(base) || node_is(base, "type_identifier") ||
                        node_is(base, "nested_type_identifier"))
                        bases.emplace_back(text(base), base);
                }
            } else if (is_dotted_name(clause)) {
                bases.emplace_back(text(clause), clause);
            }
        }
    }

    bool component = false;
    for (const auto &base : bases) {
        if (COMPONENT_BASES.count(last_segment(base.first)))
            component = true;
    }

    NodeKind kind = component ? NodeKind::Component : NodeKind::Class;
    declare(kind, qualified, name, node);

    for (const auto &base : bases) {
        if (COMPONENT_BASES.count(last_segment(base.first)))
            continue;

        Reference &ref = refer(EdgeKind::Implements, qualified, base.first, base.second);
        ref.accepts = {NodeKind::Class, NodeKind::Component, NodeKind::Schema};
        ref.strict = base.first.find('.') != std::string::npos;
        auto it = imports_.find(first_segment(base.first));
        if (it != imports_.end()) {
            ref.module = it->second.module;
            if (!it->second.symbol.empty() && !ref.strict)
                ref.name = it->second.symbol;
        }
    }

    scopes_.push_back({qualified, kind, ts_node_end_byte(node)});
}

void ScriptWalker::on_method(TSNode node, TSNode function) {
    if (!in_class())
        return;

    TSNode name_node = child_by_field(node, "name");
    if (ts_node_is_null(name_node))
        name_node = child_by_field(node, "property");
    std::string name = text(name_node);
    if (name.empty())
        return;

    std::string qualified = prefix() + name;
    declare(NodeKind::Function, qualified, name, node, parameters_of(function, qualified));
    scopes_.push_back({qualified, NodeKind::Function, ts_node_end_byte(node)});
}

// interface User { id: number; profile: Profile } / type User = { ... }
void ScriptWalker::on_interface(TSNode node, TSNode body) {
    std::string name = text(child_by_field(node, "name"));
    if (name.empty())
        return;
    std::string qualified = prefix() + name;
    size_t index = declare(NodeKind::Schema, qualified, name, node);

    // interface Admin extends User
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode clause = ts_node_named_child(node, i);
        if (!node_is(clause, "extends_type_clause"))
            continue;
        uint32_t types = ts_node_named_child_count(clause);
        for (uint32_t k = 0; k < types; ++k) {
            TSNode base = ts_node_named_child(clause, k);
            if (node_is(base, "generic_type"))
                base = child_by_field(base, "name");
            Reference &ref = refer(EdgeKind::Implements, qualified, text(base), base);
            ref.accepts = {NodeKind::Schema};
        }
    }

    uint32_t members = ts_node_is_null(body) ? 0 : ts_node_named_child_count(body);
    for (uint32_t i = 0; i < members; ++i) {
        TSNode member = ts_node_named_child(body, i);
        if (!node_is(member, "property_signature"))
            continue;

        TSNode name_node = child_by_field(member, "name");
        std::string field = is_string_value(name_node) ? unquote_literal(text(name_node))
                                                       : text(name_node);
        if (field.empty())
            continue;
        std::string field_qualified = qualified + "." + field;

        TSNode annotation = child_by_field(member, "type");
        std::string field_type = ts_node_is_null(annotation) ? "" : annotation_text(annotation);

        out_.decls[index].signature.push_back({field, field_type});
        declare(NodeKind::Schema, field_qualified, field, member);

        Reference &owns = refer(EdgeKind::ReferencesSchema, qualified, field_qualified, member);
        owns.local = true;

        if (!ts_node_is_null(annotation))
            refer_types(annotation, field_qualified);
    }
}

void ScriptWalker::on_call(TSNode node) {
    TSNode callee = child_by_field(node, "function");
    std::vector<TSNode> args = arguments_of(node);

    if (node_is(callee, "identifier")) {
        std::string name = text(callee);

        // fetch(url, { method: 'POST' })
        if (name == "fetch") {
            if (!args.empty() && is_string_value(args[0])) {
                std::string verb = args.size() > 1 ? object_string(args[1], "method") : "";
                endpoint_call(verb.empty() ? "GET" : to_upper(verb), args[0], node);
            }
            return;
        }

        if (configured(config_.http_clients, name) && !args.empty()) {
            if (is_string_value(args[0])) {
                endpoint_call("GET", args[0], node);
                return;
            }
            // axios({ url, method })
            if (node_is(args[0], "object")) {
                std::string verb = object_string(args[0], "method");
                TSNode pairs = args[0];
                uint32_t count = ts_node_named_child_count(pairs);
                for (uint32_t i = 0; i < count; ++i) {
                    TSNode pair = ts_node_named_child(pairs, i);
                    if (node_is(pair, "pair") && text(child_by_field(pair, "key")) == "url" &&
                        is_string_value(child_by_field(pair, "value"))) {
                        endpoint_call(verb.empty() ? "GET" : to_upper(verb),
                                      child_by_field(pair, "value"), node);
                    }
                }
                return;
            }
        }

        if (name == "require") {
            if (!args.empty() && node_is(args[0], "string")) {
                Reference &ref = refer(EdgeKind::Imports, source(), "", node);
                ref.module = unquote_literal(text(args[0]));
            }
            return;
        }

        refer_call(name, node);
        return;
    }

    if (!node_is(callee, "member_expression"))
        return;

    TSNode object = child_by_field(callee, "object");
    std::string method = text(child_by_field(callee, "property"));
    std::string receiver = text(object);

    if (is_http_verb(method) || method == "all") {
        std::string verb = method == "all" ? "ANY" : to_upper(method);

        if (configured(config_.route_objects, receiver) && args.size() >= 2 &&
            is_string_value(args[0]) && on_route(node, verb, args)) {
            return;
        }

        if (!args.empty() && is_string_value(args[0]) && method != "all") {
            std::string url = unquote_literal(text(args[0]));
            bool literal_url = starts_with(url, "/") || starts_with(url, "http") ||
                               starts_with(url, "{}");
            if (configured(config_.http_clients, last_segment(receiver)) ||
                (literal_url && !configured(config_.route_objects, receiver))) {
                endpoint_call(verb, args[0], node);
                return;
            }
        }
    }

    if (receiver == "this") {
        Reference &ref = refer(EdgeKind::Calls, source(), method, node);
        ref.scope = enclosing_class();
        ref.strict = true;
        return;
    }

    if (is_dotted_name(object))
        refer_call(text(callee), node);
}

// app.get('/users/:id', auth, (req, res) => { ... })
bool ScriptWalker::on_route(TSNode node, const std::string &verb, const std::vector<TSNode> &args) {
    std::string route = unquote_literal(text(args[0]));
    if (route.empty() || route[0] != '/')
        route = "/" + route;
    std::string qualified = verb + " " + route;

    SymbolDecl decl;
    decl.kind = NodeKind::Endpoint;
    decl.qualified_name = qualified;
    decl.name = qualified;
    decl.lines = span_of(node);
    decl.http_verb = verb;
    decl.route = route;
    out_.decls.push_back(std::move(decl));

    for (size_t i = 1; i < args.size(); ++i) {
        TSNode handler = args[i];
        if (is_function_value(handler)) {
            // Inline handler: everything inside belongs to the endpoint
            if (i + 1 == args.size())
                scopes_.push_back({qualified, NodeKind::Endpoint, ts_node_end_byte(handler)});
            continue;
        }
        if (!is_dotted_name(handler))
            continue;

        std::string name = text(handler);
        Reference &ref = refer(EdgeKind::Calls, qualified, name, handler);
        ref.accepts = {NodeKind::Function, NodeKind::Class};
        ref.strict = name.find('.') != std::string::npos;
        auto it = imports_.find(first_segment(name));
        if (it != imports_.end()) {
            ref.module = it->second.module;
            std::string rest = name.size() > it->first.size() ? name.substr(it->first.size() + 1) : "";
            if (!it->second.symbol.empty())
                ref.name = rest.empty() ? it->second.symbol : it->second.symbol + "." + rest;
            else if (!rest.empty())
                ref.name = rest;
        }
    }
    return true;
}

void ScriptWalker::on_new(TSNode node) {
    TSNode constructor = child_by_field(node, "constructor");
    if (is_dotted_name(constructor))
        refer_call(text(constructor), node, {NodeKind::Class, NodeKind::Component, NodeKind::Function});
}

// <UserCard user={u} /> names a component; lower-case tags are DOM elements
void ScriptWalker::on_jsx(TSNode node) {
    TSNode name = child_by_field(node, "name");
    std::string tag = text(name);
    if (!starts_upper(tag))
        return;
    refer_call(tag, node, {NodeKind::Component, NodeKind::Function, NodeKind::Class});
}

} // namespace

ExtractionResult extract_script(const Document &doc, const ExtractorConfig &config) {
    Grammar grammar;
    if (!grammar_for(doc.language, doc.path, grammar)) {
        return unparsed_result(doc, doc.language, ParseFailure::UnsupportedLanguage,
                               "no grammar for " + doc.path);
    }

    SourceParser parser(grammar);
    if (!parser.parse(doc.content)) {
        return unparsed_result(doc, doc.language, ParseFailure::SyntaxError,
                               "parser produced no tree");
    }
    if (parser.has_error()) {
        return unparsed_result(doc, doc.language, ParseFailure::SyntaxError,
                               "syntax error at line " +
                                   std::to_string(parser.first_error_line()));
    }

    ExtractionResult result;
    FileContribution &out = result.contribution;
    out.path = doc.path;
    out.language = doc.language;
    out.module_name = script_module_name(doc.path);

    std::string base = basename_of(doc.path);
    std::string stem = base.substr(0, base.find('.'));

    SymbolDecl file;
    file.kind = stem == "index" ? NodeKind::Module : NodeKind::File;
    file.qualified_name = out.module_name;
    file.name = stem;
    file.lines = LineSpan{1, end_line(parser.root())};
    out.decls.push_back(std::move(file));

    ScriptWalker walker(parser, config, out);
    walker.run();

    result.ok = true;
    return result;
}

} // namespace devguard
