// test_graph_builder.cpp - Reference resolution and endpoint binding over synthetic contributions

#include <gtest/gtest.h>

#include "devguard/errors.hpp"
#include "devguard/graph_builder.hpp"
#include "test_fixtures.hpp"

using namespace devguard;
using namespace devguard::fixtures;

class GraphBuilderTest : public ::testing::Test {
protected:
    BuilderConfig config;

    BuildResult build(std::vector<FileContribution> contributions) {
        return GraphBuilder(config).build(std::move(contributions));
    }

    static SymbolDecl &endpoint(FileContribution &c, const std::string &verb,
                                const std::string &route) {
        SymbolDecl &decl = declare(c, NodeKind::Endpoint, verb + " " + route);
        decl.name = verb + " " + route;
        decl.http_verb = verb;
        decl.route = route;
        return decl;
    }

    static void call_endpoint(FileContribution &c, const std::string &source,
                              const std::string &verb, const std::string &url) {
        EndpointCall call;
        call.source = source;
        call.verb = verb;
        call.url = url;
        call.lines = {3, 3};
        c.endpoint_calls.push_back(call);
    }

    static bool has_diagnostic(const BuildResult &result, const std::string &reference,
                               const std::string &reason_prefix) {
        for (const auto &d : result.diagnostics) {
            if (d.reference == reference && d.reason.compare(0, reason_prefix.size(), reason_prefix) == 0)
                return true;
        }
        return false;
    }
};

TEST_F(GraphBuilderTest, SymbolImportAddsFileImport) {
    FileContribution models = contribution("app/models.py", "app.models");
    declare(models, NodeKind::Class, "User");

    FileContribution api = contribution("app/api.py", "app.api");
    declare(api, NodeKind::Function, "list_users");
    refer(api, "", EdgeKind::Imports, "User", "app.models");
    refer(api, "list_users", EdgeKind::Calls, "User", "app.models");

    BuildResult result = build({models, api});
    const Graph &g = result.graph;

    NodeId api_file = make_node_id("app/api.py", "");
    NodeId models_file = make_node_id("app/models.py", "");
    NodeId user = make_node_id("app/models.py", "User");
    NodeId list_users = make_node_id("app/api.py", "list_users");

    EXPECT_TRUE(has_edge(g, api_file, user, EdgeKind::Imports));
    EXPECT_TRUE(has_edge(g, api_file, models_file, EdgeKind::Imports));
    EXPECT_TRUE(has_edge(g, list_users, user, EdgeKind::Calls));
    EXPECT_TRUE(result.diagnostics.empty());

    const Edge *edge = find_edge(g, list_users, user, EdgeKind::Calls);
    ASSERT_NE(edge, nullptr);
    EXPECT_DOUBLE_EQ(edge->confidence, 1.0);
    EXPECT_EQ(edge->provenance.path, "app/api.py");
}

TEST_F(GraphBuilderTest, FileNodeKeepsModuleName) {
    BuildResult result = build({contribution("app/models.py", "app.models")});
    const Node *file = result.graph.find_node(make_node_id("app/models.py", ""));
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->kind, NodeKind::File);
    EXPECT_EQ(file->qualified_name, "app.models");
    EXPECT_EQ(result.graph.file_node("app/models.py"), file->id);
}

TEST_F(GraphBuilderTest, PathProximityBreaksTies) {
    FileContribution near = contribution("app/a/helpers.py", "app.a.helpers");
    declare(near, NodeKind::Function, "format");
    FileContribution far = contribution("lib/helpers.py", "lib.helpers");
    declare(far, NodeKind::Function, "format");

    FileContribution views = contribution("app/a/views.py", "app.a.views");
    declare(views, NodeKind::Function, "render");
    refer(views, "render", EdgeKind::Calls, "format");

    BuildResult result = build({far, views, near});
    EXPECT_TRUE(has_edge(result.graph, make_node_id("app/a/views.py", "render"),
                         make_node_id("app/a/helpers.py", "format"), EdgeKind::Calls));
    EXPECT_FALSE(has_edge(result.graph, make_node_id("app/a/views.py", "render"),
                          make_node_id("lib/helpers.py", "format"), EdgeKind::Calls));
}

TEST_F(GraphBuilderTest, AmbiguousReferenceIsDropped) {
    FileContribution a = contribution("app/helpers.py", "app.helpers");
    declare(a, NodeKind::Function, "format");
    FileContribution b = contribution("lib/helpers.py", "lib.helpers");
    declare(b, NodeKind::Function, "format");

    FileContribution main = contribution("main.py", "main");
    refer(main, "", EdgeKind::Calls, "format");

    BuildResult result = build({a, b, main});
    EXPECT_TRUE(result.graph.out_edges(make_node_id("main.py", "")).empty());
    EXPECT_TRUE(has_diagnostic(result, "format", "ambiguous"));
}

TEST_F(GraphBuilderTest, KindMismatchIsDiagnosed) {
    FileContribution schemas = contribution("app/schemas.py", "app.schemas");
    declare(schemas, NodeKind::Function, "UserOut");

    FileContribution api = contribution("app/api.py", "app.api");
    declare(api, NodeKind::Function, "get_user");
    refer(api, "get_user", EdgeKind::ReferencesSchema, "UserOut").accepts = {NodeKind::Schema};

    BuildResult result = build({schemas, api});
    EXPECT_EQ(result.graph.num_edges(), 0u);
    EXPECT_TRUE(has_diagnostic(result, "UserOut", "kind mismatch"));
}

TEST_F(GraphBuilderTest, UnknownNameIsNoMatch) {
    FileContribution api = contribution("app/api.py", "app.api");
    refer(api, "", EdgeKind::Calls, "does_not_exist");

    BuildResult result = build({api});
    EXPECT_TRUE(has_diagnostic(result, "does_not_exist", "no match"));
}

TEST_F(GraphBuilderTest, RecursionKeepsSelfCall) {
    FileContribution tree = contribution("app/tree.py", "app.tree");
    declare(tree, NodeKind::Function, "walk");
    refer(tree, "walk", EdgeKind::Calls, "walk");

    BuildResult result = build({tree});
    NodeId walk = make_node_id("app/tree.py", "walk");
    EXPECT_TRUE(has_edge(result.graph, walk, walk, EdgeKind::Calls));
}

TEST_F(GraphBuilderTest, RelativeScriptImportResolvesExtension) {
    FileContribution types = contribution("src/types.ts", "src/types");
    declare(types, NodeKind::Schema, "User");

    FileContribution service = contribution("src/service.ts", "src/service");
    declare(service, NodeKind::Function, "rename");
    refer(service, "rename", EdgeKind::ReferencesSchema, "User", "./types").accepts = {
        NodeKind::Schema};
    refer(service, "", EdgeKind::Imports, "", "react");

    BuildResult result = build({types, service});
    EXPECT_TRUE(has_edge(result.graph, make_node_id("src/service.ts", "rename"),
                         make_node_id("src/types.ts", "User"), EdgeKind::ReferencesSchema));
    EXPECT_TRUE(has_diagnostic(result, "react", "unknown module"));
}

TEST_F(GraphBuilderTest, EndpointBindingConfidence) {
    FileContribution routes = contribution("app/routes.py", "app.routes");
    endpoint(routes, "GET", "/api/users/{user_id}");
    endpoint(routes, "GET", "/api/health");

    FileContribution client = contribution("web/api.ts", "web/api");
    declare(client, NodeKind::Function, "loadUser");
    call_endpoint(client, "loadUser", "GET", "/api/users/{}");
    call_endpoint(client, "", "GET", "https://example.com/api/health");
    call_endpoint(client, "", "POST", "/api/health");

    BuildResult result = build({routes, client});
    const Graph &g = result.graph;

    const Edge *user = find_edge(g, make_node_id("web/api.ts", "loadUser"),
                                 make_node_id("app/routes.py", "GET /api/users/{user_id}"),
                                 EdgeKind::BindsEndpoint);
    ASSERT_NE(user, nullptr);
    EXPECT_DOUBLE_EQ(user->confidence, config.endpoint_param_confidence);

    const Edge *health = find_edge(g, make_node_id("web/api.ts", ""),
                                   make_node_id("app/routes.py", "GET /api/health"),
                                   EdgeKind::BindsEndpoint);
    ASSERT_NE(health, nullptr);
    EXPECT_DOUBLE_EQ(health->confidence, config.endpoint_exact_confidence);

    EXPECT_TRUE(has_diagnostic(result, "POST /api/health", "no matching endpoint"));
}

TEST_F(GraphBuilderTest, DynamicBaseBindsBySuffix) {
    FileContribution routes = contribution("app/routes.py", "app.routes");
    endpoint(routes, "ANY", "/v1/orders/<int:pk>/");

    FileContribution client = contribution("web/orders.js", "web/orders");
    call_endpoint(client, "", "GET", "{}/orders/{}");

    BuildResult result = build({routes, client});
    const Edge *edge = find_edge(result.graph, make_node_id("web/orders.js", ""),
                                 make_node_id("app/routes.py", "ANY /v1/orders/<int:pk>/"),
                                 EdgeKind::BindsEndpoint);
    ASSERT_NE(edge, nullptr);
    EXPECT_DOUBLE_EQ(edge->confidence, config.endpoint_suffix_confidence);
}

TEST_F(GraphBuilderTest, OrderIndependent) {
    FileContribution models = contribution("app/models.py", "app.models");
    declare(models, NodeKind::Schema, "User");
    FileContribution api = contribution("app/api.py", "app.api");
    declare(api, NodeKind::Function, "get_user");
    refer(api, "get_user", EdgeKind::ReferencesSchema, "User", "app.models");
    refer(api, "", EdgeKind::Imports, "User", "app.models");
    FileContribution web = contribution("web/client.js", "web/client");
    call_endpoint(web, "", "GET", "/users");

    std::string forward = build({models, api, web}).graph.to_json().dump();
    std::string backward = build({web, api, models}).graph.to_json().dump();
    EXPECT_EQ(forward, backward);
    EXPECT_EQ(forward, build({models, api, web}).graph.to_json().dump());
}

TEST_F(GraphBuilderTest, DuplicateDeclarationKeepsFirst) {
    FileContribution c = contribution("app/x.py", "app.x");
    declare(c, NodeKind::Function, "run").lines = {1, 2};
    declare(c, NodeKind::Function, "run").lines = {5, 9};

    BuildResult result = build({c});
    const Node *run = result.graph.find_node(make_node_id("app/x.py", "run"));
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->lines.first, 1u);
    EXPECT_EQ(result.graph.num_nodes(), 2u);
}

TEST_F(GraphBuilderTest, RejectsBadPaths) {
    EXPECT_THROW(build({contribution("app/x.py", "app.x"), contribution("./app/x.py", "app.x")}),
                 ValidationError);
    EXPECT_THROW(build({contribution("../x.py", "x")}), ValidationError);
    EXPECT_THROW(build({contribution("", "x")}), ValidationError);
}
