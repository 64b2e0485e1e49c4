// test_types.cpp - Node ids, paths and vocabulary names

#include <gtest/gtest.h>

#include "devguard/errors.hpp"
#include "devguard/types.hpp"

using namespace devguard;

TEST(NodeIdTest, StableForSamePathAndName) {
    EXPECT_EQ(make_node_id("app/models.py", "User"), make_node_id("app/models.py", "User"));
    EXPECT_NE(make_node_id("app/models.py", "User"), make_node_id("app/schemas.py", "User"));
    EXPECT_NE(make_node_id("app/models.py", "User"), make_node_id("app/models.py", "User.save"));
}

TEST(NodeIdTest, FileIdDiffersFromSymbolNamedLikeModule) {
    EXPECT_NE(make_node_id("app/users.py", ""), make_node_id("app/users.py", "users"));
}

TEST(NodeIdTest, HexRoundTrip) {
    NodeId id = make_node_id("src/api.ts", "fetchUser");
    std::string text = node_id_to_string(id);
    EXPECT_EQ(text.size(), 16u);
    EXPECT_EQ(node_id_from_string(text), id);
}

TEST(NodeIdTest, MalformedHexIsInvalid) {
    EXPECT_EQ(node_id_from_string(""), INVALID_NODE_ID);
    EXPECT_EQ(node_id_from_string("xyz"), INVALID_NODE_ID);
    EXPECT_EQ(node_id_from_string("00112233445566778"), INVALID_NODE_ID);
}

TEST(PathTest, NormalizeCollapsesDotsAndSeparators) {
    EXPECT_EQ(normalize_path("./app//models.py"), "app/models.py");
    EXPECT_EQ(normalize_path("app\\api\\users.py"), "app/api/users.py");
    EXPECT_EQ(normalize_path("app/api/../models.py"), "app/models.py");
}

TEST(PathTest, NormalizeRejectsEscapes) {
    EXPECT_EQ(normalize_path("../secrets.py"), "");
    EXPECT_EQ(normalize_path("app/../../x.py"), "");
    EXPECT_EQ(normalize_path(""), "");
}

TEST(PathTest, ParentDir) {
    EXPECT_EQ(parent_dir("app/api/users.py"), "app/api");
    EXPECT_EQ(parent_dir("main.py"), "");
}

TEST(LanguageTest, FromPath) {
    EXPECT_EQ(language_from_path("app/main.py"), Language::Python);
    EXPECT_EQ(language_from_path("src/App.jsx"), Language::JavaScript);
    EXPECT_EQ(language_from_path("src/api.ts"), Language::TypeScript);
    EXPECT_EQ(language_from_path("src/App.tsx"), Language::TypeScript);
    EXPECT_EQ(language_from_path("README.md"), Language::Unknown);
}

TEST(VocabularyTest, KindNamesRoundTrip) {
    for (NodeKind kind : {NodeKind::File, NodeKind::Module, NodeKind::Function, NodeKind::Class,
                          NodeKind::Endpoint, NodeKind::Schema, NodeKind::Component}) {
        EXPECT_EQ(node_kind_from_string(node_kind_to_string(kind)), kind);
    }
    for (EdgeKind kind : {EdgeKind::Imports, EdgeKind::Calls, EdgeKind::Implements,
                          EdgeKind::BindsEndpoint, EdgeKind::ReferencesSchema}) {
        EXPECT_EQ(edge_kind_from_string(edge_kind_to_string(kind)), kind);
    }
}

TEST(VocabularyTest, UnknownNamesThrow) {
    EXPECT_THROW(node_kind_from_string("Widget"), ValidationError);
    EXPECT_THROW(edge_kind_from_string("Uses"), ValidationError);
    EXPECT_THROW(severity_from_string("critical"), ValidationError);
}
