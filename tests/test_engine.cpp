// test_engine.cpp - End-to-end ingestion, reports and impact queries

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

#include "devguard/engine.hpp"
#include "devguard/errors.hpp"
#include "test_fixtures.hpp"

using namespace devguard;
using namespace devguard::fixtures;

namespace fs = std::filesystem;

namespace {

const char *SCHEMAS_PY = R"(from pydantic import BaseModel

class UserOut(BaseModel):
    user_id: int
    email: str
)";

const char *API_PY = R"(from fastapi import APIRouter
from .schemas import UserOut

router = APIRouter(prefix="/users")

@router.get("/{user_id}")
def get_user(user_id: int) -> UserOut:
    return {"user_id": user_id, "email": ""}
)";

const char *CLIENT_TS = R"(export async function loadUser(id: number) {
  const res = await fetch(`/users/${id}`);
  return res.json();
}
)";

std::vector<Document> fullstack_batch() {
    return {document("backend/app/schemas.py", SCHEMAS_PY),
            document("backend/app/api.py", API_PY),
            document("frontend/src/client.ts", CLIENT_TS)};
}

const Impact *impact_on(const ImpactResult &result, NodeId id) {
    for (const auto &impact : result.impacts) {
        if (impact.node == id)
            return &impact;
    }
    return nullptr;
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    EngineConfig config;

    void SetUp() override { config.indexer.num_threads = 2; }
};

TEST_F(EngineTest, NothingPublishedYet) {
    Engine engine(config);
    EXPECT_EQ(engine.current(), nullptr);
    EXPECT_THROW(engine.report(), NotFoundError);
    EXPECT_THROW(engine.simulate({make_node_id("a.py", "f"), ChangeKind::Remove}), NotFoundError);
    EXPECT_THROW(engine.resolve_symbol("f"), NotFoundError);
    EXPECT_TRUE(engine.find_symbols("f").empty());
}

TEST_F(EngineTest, InvalidConfigIsRejected) {
    config.builder.endpoint_exact_confidence = 1.5;
    EXPECT_THROW(Engine engine(config), ConfigError);
}

TEST_F(EngineTest, FullStackGraph) {
    Engine engine(config);
    SnapshotPtr snapshot = engine.ingest(fullstack_batch());
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->version, 1u);
    EXPECT_EQ(snapshot->total_files, 3u);
    EXPECT_DOUBLE_EQ(snapshot->coverage(), 1.0);

    const Graph &graph = snapshot->graph;
    NodeId endpoint = make_node_id("backend/app/api.py", "GET /users/{user_id}");
    NodeId handler = make_node_id("backend/app/api.py", "get_user");
    NodeId schema = make_node_id("backend/app/schemas.py", "UserOut");
    NodeId caller = make_node_id("frontend/src/client.ts", "loadUser");

    ASSERT_TRUE(graph.has_node(endpoint));
    EXPECT_EQ(graph.find_node(endpoint)->kind, NodeKind::Endpoint);
    EXPECT_TRUE(has_edge(graph, endpoint, handler, EdgeKind::Calls));
    EXPECT_TRUE(has_edge(graph, handler, schema, EdgeKind::ReferencesSchema));

    const Edge *binding = find_edge(graph, caller, endpoint, EdgeKind::BindsEndpoint);
    ASSERT_NE(binding, nullptr);
    EXPECT_DOUBLE_EQ(binding->confidence, config.builder.endpoint_param_confidence);
    EXPECT_EQ(binding->provenance.path, "frontend/src/client.ts");
}

TEST_F(EngineTest, FieldRenameReachesFrontend) {
    Engine engine(config);
    engine.ingest(fullstack_batch());

    NodeId field = engine.resolve_symbol("UserOut.user_id");
    ImpactResult result = engine.simulate({field, ChangeKind::Rename});
    EXPECT_EQ(result.version, 1u);

    const Impact *schema = impact_on(result, make_node_id("backend/app/schemas.py", "UserOut"));
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->distance, 1u);

    const Impact *caller = impact_on(result, make_node_id("frontend/src/client.ts", "loadUser"));
    ASSERT_NE(caller, nullptr);
    EXPECT_EQ(caller->distance, 4u);
    EXPECT_DOUBLE_EQ(caller->confidence, config.builder.endpoint_param_confidence);

    EXPECT_EQ(impact_on(result, field), nullptr);
}

TEST_F(EngineTest, SameSnapshotForAnyInputOrder) {
    std::vector<Document> forward = fullstack_batch();
    std::vector<Document> backward(forward.rbegin(), forward.rend());

    Engine a(config);
    Engine b(config);
    SnapshotPtr first = a.ingest(forward);
    SnapshotPtr second = b.ingest(backward);

    EXPECT_EQ(first->graph.to_json(), second->graph.to_json());
    EXPECT_EQ(a.report().findings.size(), b.report().findings.size());
}

TEST_F(EngineTest, RejectedBatchKeepsPreviousSnapshot) {
    Engine engine(config);
    engine.ingest(fullstack_batch());

    std::vector<Document> duplicate = {document("app/x.py", "x = 1\n"),
                                       document("./app/x.py", "y = 2\n")};
    EXPECT_THROW(engine.ingest(duplicate), ValidationError);
    EXPECT_THROW(engine.ingest({document("../outside.py", "x = 1\n")}), ValidationError);

    ASSERT_NE(engine.current(), nullptr);
    EXPECT_EQ(engine.current()->version, 1u);
}

TEST_F(EngineTest, CancelledIngestPublishesNothing) {
    Engine engine(config);
    CancellationToken token;
    token.cancel();
    EXPECT_THROW(engine.ingest(fullstack_batch(), token), CancelledError);
    EXPECT_EQ(engine.current(), nullptr);
}

TEST_F(EngineTest, UnparsedFilesLowerCoverage) {
    Engine engine(config);
    std::vector<Document> batch = fullstack_batch();
    batch.push_back(document("docs/empty.py", "\n"));

    SnapshotPtr snapshot = engine.ingest(batch);
    ASSERT_EQ(snapshot->unparsed.size(), 1u);
    EXPECT_EQ(snapshot->unparsed[0].path, "docs/empty.py");
    EXPECT_EQ(snapshot->unparsed[0].reason, ParseFailure::EmptyFile);
    EXPECT_DOUBLE_EQ(snapshot->coverage(), 0.75);
    EXPECT_DOUBLE_EQ(engine.report().coverage, 0.75);
}

TEST_F(EngineTest, EachIngestIsANewVersion) {
    Engine engine(config);
    SnapshotPtr v1 = engine.ingest(fullstack_batch());
    SnapshotPtr v2 = engine.ingest({document("app/only.py", "def f():\n    pass\n")});

    EXPECT_EQ(v2->version, 2u);
    EXPECT_TRUE(v1->graph.has_node(make_node_id("backend/app/api.py", "get_user")));
    EXPECT_FALSE(v2->graph.has_node(make_node_id("backend/app/api.py", "get_user")));
    EXPECT_EQ(engine.report().version, 2u);
}

TEST_F(EngineTest, ResolveSymbolForms) {
    Engine engine(config);
    engine.ingest({document("a.py", "def helper():\n    pass\n\ndef only_a():\n    pass\n"),
                   document("b.py", "def helper():\n    pass\n")});

    NodeId only_a = make_node_id("a.py", "only_a");
    EXPECT_EQ(engine.resolve_symbol("only_a"), only_a);
    EXPECT_EQ(engine.resolve_symbol("a.py::only_a"), only_a);
    EXPECT_EQ(engine.resolve_symbol(node_id_to_string(only_a)), only_a);
    EXPECT_EQ(engine.resolve_symbol("b.py::helper"), make_node_id("b.py", "helper"));

    EXPECT_THROW(engine.resolve_symbol("helper"), NotFoundError);
    EXPECT_THROW(engine.resolve_symbol("missing"), NotFoundError);
}

TEST_F(EngineTest, FindSymbols) {
    Engine engine(config);
    engine.ingest(fullstack_batch());

    EXPECT_EQ(engine.find_symbols("get_"),
              std::vector<std::string>{"backend/app/api.py::get_user"});

    std::vector<std::string> schemas = engine.find_symbols("UserOut");
    EXPECT_TRUE(std::is_sorted(schemas.begin(), schemas.end()));
    EXPECT_EQ(schemas.size(), 3u); // UserOut, UserOut.user_id, UserOut.email
    EXPECT_TRUE(engine.find_symbols("no_such_symbol").empty());
}

TEST_F(EngineTest, IngestDirectory) {
    fs::path root = fs::temp_directory_path() / "devguard_engine_test";
    fs::remove_all(root);
    fs::create_directories(root / "pkg");
    fs::create_directories(root / "node_modules" / "lib");

    std::ofstream(root / "pkg" / "mod.py") << "def run():\n    pass\n";
    std::ofstream(root / "pkg" / "notes.txt") << "not source\n";
    std::ofstream(root / "node_modules" / "lib" / "index.js") << "function x() {}\n";

    Engine engine(config);
    SnapshotPtr snapshot = engine.ingest_directory(root.string());
    fs::remove_all(root);

    EXPECT_EQ(snapshot->total_files, 1u);
    EXPECT_NE(snapshot->graph.file_node("pkg/mod.py"), INVALID_NODE_ID);
    EXPECT_TRUE(snapshot->graph.has_node(make_node_id("pkg/mod.py", "run")));
    EXPECT_EQ(snapshot->graph.file_node("node_modules/lib/index.js"), INVALID_NODE_ID);
}

TEST_F(EngineTest, IngestMissingDirectory) {
    Engine engine(config);
    EXPECT_THROW(engine.ingest_directory("/nonexistent/devguard/path"), ValidationError);
}

TEST_F(EngineTest, AuditCoversRepositoryFiles) {
    Engine engine(config);
    std::vector<Document> batch = fullstack_batch();
    batch.push_back(document("backend/requirements.txt", "fastapi\npydantic==2.7.0\n"));
    batch.push_back(document("backend/.env", "DEBUG=True\n"));

    SnapshotPtr snapshot = engine.ingest(batch);
    EXPECT_EQ(snapshot->total_files, 3u);
    EXPECT_DOUBLE_EQ(snapshot->coverage(), 1.0);

    std::set<std::string> rules;
    for (const auto &finding : engine.report().findings) {
        if (finding.kind != FindingKind::ProductionRisk)
            continue;
        rules.insert(finding.rule);
        if (finding.rule == "sensitive_file") {
            EXPECT_EQ(finding.path, "backend/.env");
            EXPECT_TRUE(finding.nodes.empty());
        }
    }
    EXPECT_EQ(rules.count("unpinned_dependency"), 1u);
    EXPECT_EQ(rules.count("sensitive_file"), 1u);
    EXPECT_EQ(rules.count("debug_enabled"), 1u);
    EXPECT_EQ(rules.count("missing_readme"), 1u);
}
