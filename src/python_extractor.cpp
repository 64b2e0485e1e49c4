#include "devguard/extractor.hpp"
#include "devguard/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <set>

namespace devguard {

namespace {

// Calls to these never resolve to analyzed code
const std::set<std::string> PYTHON_BUILTINS = {
    "print",      "len",        "range",    "str",      "int",       "float",   "bool",
    "list",       "dict",       "set",      "tuple",    "isinstance", "issubclass",
    "getattr",    "setattr",    "hasattr",  "super",    "type",      "open",    "enumerate",
    "zip",        "map",        "filter",   "sorted",   "reversed",  "min",     "max",
    "sum",        "any",        "all",      "abs",      "round",     "repr",    "iter",
    "next",       "id",         "hash",     "vars",     "format",    "object",  "frozenset",
    "bytes",      "callable",   "divmod",   "input",    "ord",       "chr"};

// Annotation names that never name a schema
const std::set<std::string> TYPE_BUILTINS = {
    "int",      "str",      "float",    "bool",     "bytes",   "None",     "list",
    "dict",     "set",      "tuple",    "object",   "type",    "Any",      "Optional",
    "Union",    "List",     "Dict",     "Set",      "Tuple",   "Sequence", "Iterable",
    "Iterator", "Mapping",  "Callable", "Literal",  "Annotated", "ClassVar", "Type",
    "datetime", "date",     "time",     "Decimal",  "UUID",    "Self",     "FrozenSet"};

// Decorators that say nothing about dependencies
const std::set<std::string> PASSIVE_DECORATORS = {
    "staticmethod", "classmethod", "property",  "dataclass", "abstractmethod",
    "cached_property", "setter",   "getter",    "deleter",   "wraps",
    "lru_cache",    "cache",       "override",  "api_view"};

const std::set<std::string> RELATION_FIELDS = {"ForeignKey", "OneToOneField", "ManyToManyField",
                                               "relationship"};

std::string last_segment(const std::string &dotted) {
    size_t dot = dotted.rfind('.');
    return dot == std::string::npos ? dotted : dotted.substr(dot + 1);
}

std::string parent_module(const std::string &dotted) {
    size_t dot = dotted.rfind('.');
    return dot == std::string::npos ? "" : dotted.substr(0, dot);
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_identifier(const std::string &s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0])))
        return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

bool is_dotted_name(TSNode node) {
    if (node_is(node, "identifier"))
        return true;
    return node_is(node, "attribute") && is_dotted_name(child_by_field(node, "object"));
}

std::string basename_of(const std::string &path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

class PythonWalker {
public:
    PythonWalker(const SourceParser &parser, const ExtractorConfig &config, FileContribution &out)
        : parser_(parser), config_(config), out_(out) {
        std::string base = basename_of(out.path);
        urls_file_ = base == "urls.py";
        if (base == "__init__.py") {
            package_ = out.module_name == "__init__" ? "" : out.module_name;
        } else {
            package_ = parent_module(out.module_name);
        }
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
        std::string symbol; // Empty for "import x" bindings
    };

    std::string text(TSNode node) const { return parser_.node_text(node); }

    std::string source() const { return scopes_.empty() ? "" : scopes_.back().qualified; }

    std::string prefix() const { return scopes_.empty() ? "" : scopes_.back().qualified + "."; }

    std::string enclosing_class() const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            if (it->kind == NodeKind::Class || it->kind == NodeKind::Schema)
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

    TSNode first_positional(TSNode call) const;
    std::string keyword_string(TSNode call, const char *key) const;
    std::vector<std::string> keyword_strings(TSNode call, const char *key) const;
    std::string resolve_relative(const std::string &spec) const;

    void refer_types(TSNode type_node, const std::string &from);
    void refer_call(const std::string &callee, const std::string &from, TSNode at);
    void declare_endpoint(const std::string &verb, const std::string &route,
                          const std::string &handler, TSNode at, bool local);

    void on_class(TSNode node);
    void on_schema_fields(TSNode body, const std::string &schema, size_t decl_index);
    void on_function(TSNode node);
    void on_decorated(TSNode node);
    void on_decorator(TSNode decorator, const std::string &target);
    bool on_route_decorator(TSNode call, const std::string &object, const std::string &attr,
                            const std::string &target);
    void on_import(TSNode node);
    void on_import_from(TSNode node);
    void on_assignment(TSNode node);
    void on_call(TSNode node);
    void on_django_route(TSNode call);

    const SourceParser &parser_;
    const ExtractorConfig &config_;
    FileContribution &out_;

    std::vector<Scope> scopes_;
    std::map<std::string, std::string> route_prefixes_; // Router variable -> prefix
    std::map<std::string, ImportBinding> imports_;      // Local name -> import
    std::string package_;
    bool urls_file_ = false;
};

void PythonWalker::run() {
    parser_.visit_nodes(parser_.root(), [&](TSNode node) {
        uint32_t start_byte = ts_node_start_byte(node);

        // Pop declarations that we've exited
        while (!scopes_.empty() && start_byte >= scopes_.back().end_byte) {
            scopes_.pop_back();
        }

        const char *type = ts_node_type(node);
        if (strcmp(type, "decorated_definition") == 0) {
            on_decorated(node);
        } else if (strcmp(type, "decorator") == 0) {
            return false; // Handled with the definition
        } else if (strcmp(type, "class_definition") == 0) {
            on_class(node);
        } else if (strcmp(type, "function_definition") == 0) {
            on_function(node);
        } else if (strcmp(type, "import_statement") == 0) {
            on_import(node);
            return false;
        } else if (strcmp(type, "import_from_statement") == 0) {
            on_import_from(node);
            return false;
        } else if (strcmp(type, "future_import_statement") == 0 ||
                   strcmp(type, "comment") == 0 || strcmp(type, "string") == 0) {
            return false;
        } else if (strcmp(type, "assignment") == 0) {
            on_assignment(node);
        } else if (strcmp(type, "call") == 0) {
            on_call(node);
        }
        return true;
    });
}

TSNode PythonWalker::first_positional(TSNode call) const {
    TSNode args = child_by_field(call, "arguments");
    if (!node_is(args, "argument_list"))
        return TSNode{};

    uint32_t count = ts_node_named_child_count(args);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (node_is(arg, "keyword_argument") || node_is(arg, "comment"))
            continue;
        return arg;
    }
    return TSNode{};
}

std::string PythonWalker::keyword_string(TSNode call, const char *key) const {
    TSNode args = child_by_field(call, "arguments");
    uint32_t count = ts_node_is_null(args) ? 0 : ts_node_named_child_count(args);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (!node_is(arg, "keyword_argument") || text(child_by_field(arg, "name")) != key)
            continue;
        TSNode value = child_by_field(arg, "value");
        if (node_is(value, "string"))
            return unquote_literal(text(value));
    }
    return "";
}

std::vector<std::string> PythonWalker::keyword_strings(TSNode call, const char *key) const {
    std::vector<std::string> values;
    TSNode args = child_by_field(call, "arguments");
    uint32_t count = ts_node_is_null(args) ? 0 : ts_node_named_child_count(args);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (!node_is(arg, "keyword_argument") || text(child_by_field(arg, "name")) != key)
            continue;

        TSNode value = child_by_field(arg, "value");
        uint32_t items = ts_node_named_child_count(value);
        for (uint32_t j = 0; j < items; ++j) {
            TSNode item = ts_node_named_child(value, j);
            if (node_is(item, "string"))
                values.push_back(unquote_literal(text(item)));
        }
    }
    return values;
}

// "..core" imported from app/api/users.py -> "app.core"
std::string PythonWalker::resolve_relative(const std::string &spec) const {
    size_t dots = 0;
    while (dots < spec.size() && spec[dots] == '.')
        ++dots;
    std::string rest = spec.substr(dots);

    std::string base = package_;
    for (size_t i = 1; i < dots; ++i)
        base = parent_module(base);

    if (base.empty())
        return rest;
    return rest.empty() ? base : base + "." + rest;
}

void PythonWalker::refer_types(TSNode type_node, const std::string &from) {
    if (ts_node_is_null(type_node))
        return;

    parser_.visit_nodes(type_node, [&](TSNode node) {
        std::string name;
        bool strict = false;
        if (node_is(node, "identifier")) {
            name = text(node);
        } else if (node_is(node, "attribute")) {
            if (!is_dotted_name(node))
                return true;
            name = text(node);
            strict = true;
        } else if (node_is(node, "string")) {
            // Forward reference: "User"
            name = unquote_literal(text(node));
            if (!is_identifier(name))
                return false;
        } else {
            return true;
        }

        if (!TYPE_BUILTINS.count(name)) {
            Reference &ref = refer(EdgeKind::ReferencesSchema, from, name, node);
            ref.accepts = {NodeKind::Schema};
            ref.strict = strict;
        }
        return false;
    });
}

// Calls through an imported name carry the module as a hint
void PythonWalker::refer_call(const std::string &callee, const std::string &from, TSNode at) {
    size_t dot = callee.find('.');
    std::string root = dot == std::string::npos ? callee : callee.substr(0, dot);
    std::string rest = dot == std::string::npos ? "" : callee.substr(dot + 1);

    auto it = imports_.find(root);
    if (it == imports_.end()) {
        // Attribute calls only resolve through classes or imports
        if (!rest.empty() && !std::isupper(static_cast<unsigned char>(root[0])))
            return;
        if (rest.empty() && PYTHON_BUILTINS.count(callee))
            return;
        Reference &ref = refer(EdgeKind::Calls, from, callee, at);
        ref.strict = !rest.empty();
        return;
    }

    const ImportBinding &binding = it->second;
    std::string name = binding.symbol;
    if (!rest.empty())
        name = name.empty() ? rest : name + "." + rest;
    if (name.empty())
        name = root;

    Reference &ref = refer(EdgeKind::Calls, from, name, at);
    ref.module = binding.module;
    ref.strict = !rest.empty();
}

void PythonWalker::declare_endpoint(const std::string &verb, const std::string &route,
                                    const std::string &handler, TSNode at, bool local) {
    std::string qualified = verb + " " + route;

    SymbolDecl decl;
    decl.kind = NodeKind::Endpoint;
    decl.qualified_name = qualified;
    decl.name = qualified;
    decl.lines = span_of(at);
    decl.http_verb = verb;
    decl.route = route;
    out_.decls.push_back(std::move(decl));

    Reference &ref = refer(EdgeKind::Calls, qualified, handler, at);
    ref.local = local;
    ref.accepts = {NodeKind::Function, NodeKind::Class};
    if (local)
        return;

    // views.user_detail with "from . import views"
    size_t dot = handler.find('.');
    std::string root = handler.substr(0, dot);
    std::string rest = dot == std::string::npos ? "" : handler.substr(dot + 1);
    ref.strict = !rest.empty();
    auto it = imports_.find(root);
    if (it != imports_.end()) {
        ref.module = it->second.module;
        std::string name = it->second.symbol;
        if (!rest.empty())
            name = name.empty() ? rest : name + "." + rest;
        if (!name.empty())
            ref.name = name;
    }
}

void PythonWalker::on_class(TSNode node) {
    std::string name = text(child_by_field(node, "name"));
    if (name.empty())
        return;
    std::string qualified = prefix() + name;

    std::vector<std::string> bases;
    TSNode supers = child_by_field(node, "superclasses");
    uint32_t count = ts_node_is_null(supers) ? 0 : ts_node_named_child_count(supers);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode base = ts_node_named_child(supers, i);
        if (node_is(base, "subscript"))
            base = child_by_field(base, "value"); // Generic[T]
        if (!is_dotted_name(base))
            continue;
        bases.push_back(text(base));
    }

    bool schema = false;
    for (const auto &base : bases) {
        if (configured(config_.schema_bases, last_segment(base)))
            schema = true;
    }

    TSNode parent = ts_node_parent(node);
    if (node_is(parent, "decorated_definition")) {
        uint32_t n = ts_node_named_child_count(parent);
        for (uint32_t i = 0; i < n; ++i) {
            TSNode decorator = ts_node_named_child(parent, i);
            if (!node_is(decorator, "decorator"))
                continue;
            TSNode expr = ts_node_named_child(decorator, 0);
            if (node_is(expr, "call"))
                expr = child_by_field(expr, "function");
            if (last_segment(text(expr)) == "dataclass")
                schema = true;
        }
    }

    NodeKind kind = schema ? NodeKind::Schema : NodeKind::Class;
    size_t index = declare(kind, qualified, name, node);

    for (const auto &base : bases) {
        if (base == "object")
            continue;
        Reference &ref = refer(EdgeKind::Implements, qualified, base, supers);
        ref.accepts = {NodeKind::Class, NodeKind::Schema};
        ref.strict = base.find('.') != std::string::npos;
    }

    if (schema)
        on_schema_fields(child_by_field(node, "body"), qualified, index);

    scopes_.push_back({qualified, kind, ts_node_end_byte(node)});
}

void PythonWalker::on_schema_fields(TSNode body, const std::string &schema, size_t decl_index) {
    uint32_t count = ts_node_is_null(body) ? 0 : ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(body, i);
        if (!node_is(stmt, "expression_statement"))
            continue;
        TSNode assign = ts_node_named_child(stmt, 0);
        if (!node_is(assign, "assignment"))
            continue;

        TSNode left = child_by_field(assign, "left");
        TSNode type = child_by_field(assign, "type");
        TSNode right = child_by_field(assign, "right");
        if (!node_is(left, "identifier"))
            continue;

        std::string callee;
        if (node_is(right, "call"))
            callee = last_segment(text(child_by_field(right, "function")));

        bool is_field = !ts_node_is_null(type) || ends_with(callee, "Field") ||
                        callee == "Column" || RELATION_FIELDS.count(callee);
        if (!is_field)
            continue;

        std::string field = text(left);
        std::string field_qualified = schema + "." + field;
        std::string field_type = ts_node_is_null(type) ? callee : text(type);

        out_.decls[decl_index].signature.push_back({field, field_type});
        declare(NodeKind::Schema, field_qualified, field, stmt);

        Reference &owns = refer(EdgeKind::ReferencesSchema, schema, field_qualified, stmt);
        owns.local = true;

        refer_types(type, field_qualified);

        // ForeignKey(User) / ForeignKey("User")
        if (RELATION_FIELDS.count(callee)) {
            TSNode target = first_positional(right);
            std::string name;
            if (node_is(target, "identifier"))
                name = text(target);
            else if (node_is(target, "string"))
                name = unquote_literal(text(target));
            if (is_identifier(name)) {
                Reference &ref = refer(EdgeKind::ReferencesSchema, field_qualified, name, target);
                ref.accepts = {NodeKind::Schema};
            }
        }
    }
}

void PythonWalker::on_function(TSNode node) {
    std::string name = text(child_by_field(node, "name"));
    if (name.empty())
        return;
    std::string qualified = prefix() + name;
    bool method = !scopes_.empty() && (scopes_.back().kind == NodeKind::Class ||
                                       scopes_.back().kind == NodeKind::Schema);

    std::vector<Param> signature;
    TSNode params = child_by_field(node, "parameters");
    uint32_t count = ts_node_is_null(params) ? 0 : ts_node_named_child_count(params);
    bool first = true;
    for (uint32_t i = 0; i < count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        const char *type = ts_node_type(param);
        TSNode type_node{};
        Param p;

        if (strcmp(type, "identifier") == 0) {
            p.name = text(param);
        } else if (strcmp(type, "typed_parameter") == 0) {
            p.name = text(ts_node_named_child(param, 0));
            type_node = child_by_field(param, "type");
        } else if (strcmp(type, "default_parameter") == 0) {
            p.name = text(child_by_field(param, "name"));
        } else if (strcmp(type, "typed_default_parameter") == 0) {
            p.name = text(child_by_field(param, "name"));
            type_node = child_by_field(param, "type");
        } else if (strcmp(type, "list_splat_pattern") == 0 ||
                   strcmp(type, "dictionary_splat_pattern") == 0) {
            p.name = text(param);
        } else {
            continue;
        }

        bool receiver = method && first && (p.name == "self" || p.name == "cls");
        first = false;
        if (receiver)
            continue;

        if (!ts_node_is_null(type_node)) {
            p.type = text(type_node);
            refer_types(type_node, qualified);
        }
        signature.push_back(std::move(p));
    }

    refer_types(child_by_field(node, "return_type"), qualified);

    declare(NodeKind::Function, qualified, name, node, std::move(signature));
    scopes_.push_back({qualified, NodeKind::Function, ts_node_end_byte(node)});
}

void PythonWalker::on_decorated(TSNode node) {
    TSNode definition = child_by_field(node, "definition");
    std::string name = text(child_by_field(definition, "name"));
    if (name.empty())
        return;
    std::string target = prefix() + name;

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (node_is(child, "decorator"))
            on_decorator(child, target);
    }
}

void PythonWalker::on_decorator(TSNode decorator, const std::string &target) {
    TSNode expr = ts_node_named_child(decorator, 0);
    TSNode callee = expr;
    if (node_is(expr, "call"))
        callee = child_by_field(expr, "function");
    if (!is_dotted_name(callee))
        return;

    std::string callee_text = text(callee);
    std::string attr = last_segment(callee_text);

    if (node_is(expr, "call") && node_is(callee, "attribute") &&
        configured(config_.route_decorators, attr)) {
        std::string object = text(child_by_field(callee, "object"));
        if (on_route_decorator(expr, object, attr, target))
            return;
    }

    if (PASSIVE_DECORATORS.count(attr))
        return;

    refer_call(callee_text, target, decorator);
}

bool PythonWalker::on_route_decorator(TSNode call, const std::string &object,
                                      const std::string &attr, const std::string &target) {
    TSNode first = first_positional(call);
    if (!node_is(first, "string"))
        return false;

    std::string route = unquote_literal(text(first));
    auto prefix_it = route_prefixes_.find(object);
    if (prefix_it != route_prefixes_.end())
        route = prefix_it->second + route;
    if (route.empty() || route[0] != '/')
        route = "/" + route;

    std::vector<std::string> verbs;
    if (is_http_verb(attr)) {
        verbs.push_back(to_upper(attr));
    } else {
        for (const auto &method : keyword_strings(call, "methods"))
            verbs.push_back(to_upper(method));
        if (verbs.empty())
            verbs.push_back("GET");
    }

    for (const auto &verb : verbs)
        declare_endpoint(verb, route, target, call, true);
    return true;
}

void PythonWalker::on_import(TSNode node) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode target = ts_node_named_child(node, i);
        if (node_is(target, "aliased_import"))
            target = child_by_field(target, "name");
        if (!node_is(target, "dotted_name"))
            continue;

        std::string module = text(target);
        Reference &ref = refer(EdgeKind::Imports, source(), "", node);
        ref.module = module;

        TSNode alias = child_by_field(ts_node_named_child(node, i), "alias");
        if (!ts_node_is_null(alias)) {
            imports_[text(alias)] = {module, ""};
        } else {
            std::string root = module.substr(0, module.find('.'));
            imports_[root] = {root, ""};
        }
    }
}

void PythonWalker::on_import_from(TSNode node) {
    TSNode module_node = child_by_field(node, "module_name");
    std::string module = node_is(module_node, "relative_import")
                             ? resolve_relative(text(module_node))
                             : text(module_node);
    if (module.empty())
        return;

    bool named = false;
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        const char *field = ts_node_field_name_for_child(node, i);
        if (!field || strcmp(field, "name") != 0)
            continue;

        TSNode target = ts_node_child(node, i);
        TSNode alias{};
        if (node_is(target, "aliased_import")) {
            alias = child_by_field(target, "alias");
            target = child_by_field(target, "name");
        }

        std::string name = text(target);
        Reference &ref = refer(EdgeKind::Imports, source(), name, node);
        ref.module = module;
        imports_[ts_node_is_null(alias) ? name : text(alias)] = {module, name};
        named = true;
    }

    // from x import *
    if (!named) {
        Reference &ref = refer(EdgeKind::Imports, source(), "", node);
        ref.module = module;
    }
}

// router = APIRouter(prefix="/users") / bp = Blueprint("x", __name__, url_prefix="/x")
void PythonWalker::on_assignment(TSNode node) {
    if (!scopes_.empty())
        return;

    TSNode left = child_by_field(node, "left");
    TSNode right = child_by_field(node, "right");
    if (!node_is(left, "identifier") || !node_is(right, "call"))
        return;

    std::string callee = last_segment(text(child_by_field(right, "function")));
    std::string route_prefix;
    if (callee == "APIRouter")
        route_prefix = keyword_string(right, "prefix");
    else if (callee == "Blueprint")
        route_prefix = keyword_string(right, "url_prefix");

    if (!route_prefix.empty())
        route_prefixes_[text(left)] = route_prefix;
}

void PythonWalker::on_call(TSNode node) {
    TSNode callee = child_by_field(node, "function");

    if (node_is(callee, "identifier")) {
        std::string name = text(callee);
        if (urls_file_ && (name == "path" || name == "re_path" || name == "url")) {
            on_django_route(node);
            return;
        }

        // FastAPI dependency injection: Depends(get_db)
        if (name == "Depends") {
            TSNode dep = first_positional(node);
            if (is_dotted_name(dep))
                refer_call(text(dep), source(), dep);
            return;
        }

        refer_call(name, source(), node);
        return;
    }

    if (!node_is(callee, "attribute"))
        return;

    TSNode object = child_by_field(callee, "object");
    std::string attr = text(child_by_field(callee, "attribute"));
    std::string receiver = text(object);

    if (receiver == "self" || receiver == "cls") {
        Reference &ref = refer(EdgeKind::Calls, source(), attr, node);
        ref.scope = enclosing_class();
        ref.strict = true;
        return;
    }

    if (is_http_verb(attr) && configured(config_.http_clients, last_segment(receiver))) {
        TSNode url = first_positional(node);
        if (node_is(url, "string")) {
            EndpointCall call;
            call.source = source();
            call.verb = to_upper(attr);
            call.url = unquote_literal(text(url));
            call.lines = span_of(node);
            out_.endpoint_calls.push_back(std::move(call));
            return;
        }
    }

    // Calls through computed receivers need type inference
    if (is_dotted_name(object))
        refer_call(text(callee), source(), node);
}

// path("users/<int:id>/", views.user_detail) in urls.py
void PythonWalker::on_django_route(TSNode call) {
    TSNode args = child_by_field(call, "arguments");
    std::vector<TSNode> positional;
    uint32_t count = ts_node_is_null(args) ? 0 : ts_node_named_child_count(args);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (!node_is(arg, "keyword_argument") && !node_is(arg, "comment"))
            positional.push_back(arg);
    }
    if (positional.size() < 2 || !node_is(positional[0], "string"))
        return;

    TSNode view = positional[1];
    if (node_is(view, "call")) {
        // UserList.as_view(); include(...) is not an endpoint
        TSNode fn = child_by_field(view, "function");
        if (!node_is(fn, "attribute") || text(child_by_field(fn, "attribute")) != "as_view")
            return;
        view = child_by_field(fn, "object");
    }
    if (!is_dotted_name(view))
        return;

    std::string route = unquote_literal(text(positional[0]));
    if (!route.empty() && route.front() == '^')
        route.erase(0, 1);
    if (!route.empty() && route.back() == '$')
        route.pop_back();
    if (route.empty() || route[0] != '/')
        route = "/" + route;

    declare_endpoint("ANY", route, text(view), call, false);
}

} // namespace

ExtractionResult extract_python(const Document &doc, const ExtractorConfig &config) {
    SourceParser parser(Grammar::Python);
    if (!parser.parse(doc.content)) {
        return unparsed_result(doc, Language::Python, ParseFailure::SyntaxError,
                               "parser produced no tree");
    }
    if (parser.has_error()) {
        return unparsed_result(doc, Language::Python, ParseFailure::SyntaxError,
                               "syntax error at line " +
                                   std::to_string(parser.first_error_line()));
    }

    ExtractionResult result;
    FileContribution &out = result.contribution;
    out.path = doc.path;
    out.language = Language::Python;
    out.module_name = python_module_name(doc.path);

    SymbolDecl file;
    file.kind = basename_of(doc.path) == "__init__.py" ? NodeKind::Module : NodeKind::File;
    file.qualified_name = out.module_name;
    file.name = last_segment(out.module_name);
    file.lines = LineSpan{1, end_line(parser.root())};
    out.decls.push_back(std::move(file));

    PythonWalker walker(parser, config, out);
    walker.run();

    result.ok = true;
    return result;
}

} // namespace devguard
