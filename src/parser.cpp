#include "devguard/parser.hpp"
#include <cstring>
#include <stdexcept>

namespace devguard {

bool grammar_for(Language lang, const std::string &path, Grammar &out) {
    switch (lang) {
        case Language::Python:
            out = Grammar::Python;
            return true;
        case Language::JavaScript:
            out = Grammar::JavaScript;
            return true;
        case Language::TypeScript:
            if (path.size() >= 4 && path.compare(path.size() - 4, 4, ".tsx") == 0) {
                out = Grammar::Tsx;
            } else {
                out = Grammar::TypeScript;
            }
            return true;
        default:
            return false;
    }
}

SourceParser::SourceParser(Grammar grammar) : grammar_(grammar) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    const TSLanguage* ts_lang = nullptr;
    switch (grammar) {
        case Grammar::Python:
            ts_lang = tree_sitter_python();
            break;
        case Grammar::JavaScript:
            ts_lang = tree_sitter_javascript();
            break;
        case Grammar::TypeScript:
            ts_lang = tree_sitter_typescript();
            break;
        case Grammar::Tsx:
            ts_lang = tree_sitter_tsx();
            break;
    }

    if (!ts_lang || !ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

SourceParser::~SourceParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

SourceParser::SourceParser(SourceParser&& other) noexcept
    : grammar_(other.grammar_)
    , parser_(other.parser_)
    , tree_(other.tree_)
    , source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

SourceParser& SourceParser::operator=(SourceParser&& other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        grammar_ = other.grammar_;
        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool SourceParser::parse(const std::string& source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

TSNode SourceParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

bool SourceParser::has_error() const {
    return tree_ && ts_node_has_error(root());
}

uint32_t SourceParser::first_error_line() const {
    if (!has_error()) return 0;

    uint32_t line = 0;
    visit_nodes(root(), [&](TSNode node) {
        if (line != 0) return false;
        if (ts_node_is_error(node) || ts_node_is_missing(node)) {
            line = start_line(node);
            return false;
        }
        // Only descend into subtrees that contain the error
        return ts_node_has_error(node);
    });
    return line;
}

std::string SourceParser::node_text(TSNode node) const {
    if (ts_node_is_null(node)) return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void SourceParser::visit_nodes(TSNode node, const std::function<bool(TSNode)>& visitor) const {
    if (ts_node_is_null(node)) return;

    // Use iterative approach with explicit stack to avoid recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current)) continue;

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

TSNode child_by_field(TSNode node, const char* field) {
    if (ts_node_is_null(node)) return node;
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::strlen(field)));
}

} // namespace devguard
