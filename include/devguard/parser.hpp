#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_javascript();
const TSLanguage *tree_sitter_typescript();
const TSLanguage *tree_sitter_tsx();
}

namespace devguard {

// Concrete grammar; TypeScript documents pick Tsx or TypeScript by extension
enum class Grammar { Python, JavaScript, TypeScript, Tsx };

// Grammar for a document, or false when the language has none
bool grammar_for(Language lang, const std::string &path, Grammar &out);

// Owns one tree-sitter parser and the tree of the last parse
class SourceParser {
public:

    explicit SourceParser(Grammar grammar);
    ~SourceParser();

    // Non-copyable
    SourceParser(const SourceParser &) = delete;
    SourceParser &operator=(const SourceParser &) = delete;

    // Movable
    SourceParser(SourceParser &&other) noexcept;
    SourceParser &operator=(SourceParser &&other) noexcept;

    // Parse source code; false only if tree-sitter produced no tree
    bool parse(const std::string &source);

    // Get root node
    TSNode root() const;

    // True when the tree contains ERROR or MISSING nodes
    bool has_error() const;

    // 1-based line of the first ERROR/MISSING node (0 if none)
    uint32_t first_error_line() const;

    // Get node text
    std::string node_text(TSNode node) const;

    const std::string &source() const { return source_; }

    // Pre-order walk without recursion. The visitor returns false to skip
    // the children of the node it was given.
    void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const;

private:

    Grammar grammar_;
    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;
};

// Small helpers shared by the language adapters

inline bool node_is(TSNode node, const char *type) {
    return !ts_node_is_null(node) && std::string(ts_node_type(node)) == type;
}

TSNode child_by_field(TSNode node, const char *field);

inline uint32_t start_line(TSNode node) { return ts_node_start_point(node).row + 1; }
inline uint32_t end_line(TSNode node) { return ts_node_end_point(node).row + 1; }

inline LineSpan span_of(TSNode node) { return LineSpan{start_line(node), end_line(node)}; }

} // namespace devguard
