// test_simulator.cpp - Blast radius propagation rules

#include <gtest/gtest.h>

#include "devguard/errors.hpp"
#include "devguard/simulator.hpp"
#include "test_fixtures.hpp"

using namespace devguard;
using namespace devguard::fixtures;

namespace {

const Impact *impact_on(const ImpactResult &result, NodeId id) {
    for (const auto &impact : result.impacts) {
        if (impact.node == id)
            return &impact;
    }
    return nullptr;
}

} // namespace

class SimulatorTest : public ::testing::Test {
protected:
    SimulatorConfig config;

    ImpactResult simulate(const Snapshot &snapshot, NodeId target, ChangeKind change) {
        return BlastRadiusSimulator(config).simulate(snapshot, {target, change});
    }
};

// Frontend call -> endpoint -> handler -> response schema -> field
class UserFieldFixture : public SimulatorTest {
protected:
    NodeId field, schema, handler, endpoint, caller, models_file, importer;
    Snapshot snapshot;

    void SetUp() override {
        GraphFixture g;
        models_file = g.add("app/schemas.py", "", NodeKind::File);
        schema = g.add("app/schemas.py", "UserOut", NodeKind::Schema);
        field = g.add("app/schemas.py", "UserOut.user_id", NodeKind::Schema);
        handler = g.add("app/api.py", "get_user");
        endpoint = g.add("app/api.py", "GET /users/{user_id}", NodeKind::Endpoint);
        caller = g.add("web/api.ts", "loadUser");
        importer = g.add("app/api.py", "", NodeKind::File);

        g.link(schema, field, EdgeKind::ReferencesSchema);
        g.link(handler, schema, EdgeKind::ReferencesSchema);
        g.link(endpoint, handler, EdgeKind::Calls);
        g.link(caller, endpoint, EdgeKind::BindsEndpoint, 0.75);
        g.link(importer, schema, EdgeKind::Imports);
        g.link(importer, models_file, EdgeKind::Imports);
        snapshot = g.snapshot();
    }
};

TEST_F(UserFieldFixture, RenameReachesSchemaAndEndpoint) {
    ImpactResult result = simulate(snapshot, field, ChangeKind::Rename);

    const Impact *on_schema = impact_on(result, schema);
    const Impact *on_endpoint = impact_on(result, endpoint);
    ASSERT_NE(on_schema, nullptr);
    ASSERT_NE(on_endpoint, nullptr);
    EXPECT_EQ(on_schema->distance, 1u);
    EXPECT_EQ(on_endpoint->distance, 3u);
    EXPECT_LE(on_endpoint->confidence, on_schema->confidence);

    const Impact *on_caller = impact_on(result, caller);
    ASSERT_NE(on_caller, nullptr);
    EXPECT_EQ(on_caller->distance, 4u);
    EXPECT_DOUBLE_EQ(on_caller->confidence, 0.75);

    EXPECT_EQ(impact_on(result, field), nullptr);
}

TEST_F(UserFieldFixture, RenameFollowsOnlyDirectImports) {
    // The import edge targets the schema itself
    ImpactResult direct = simulate(snapshot, schema, ChangeKind::Rename);
    EXPECT_NE(impact_on(direct, importer), nullptr);

    // Renaming the field does not reach the importer through the schema's import
    ImpactResult indirect = simulate(snapshot, field, ChangeKind::Rename);
    EXPECT_EQ(impact_on(indirect, importer), nullptr);
}

TEST_F(UserFieldFixture, SignatureChangeFollowsCallsAndBindings) {
    ImpactResult result = simulate(snapshot, handler, ChangeKind::SignatureChange);
    ASSERT_EQ(result.impacts.size(), 2u);
    EXPECT_EQ(result.impacts[0].node, endpoint);
    EXPECT_EQ(result.impacts[1].node, caller);

    // Schema references are not signature dependencies
    EXPECT_TRUE(simulate(snapshot, schema, ChangeKind::SignatureChange).impacts.empty());
}

TEST_F(UserFieldFixture, RemoveFollowsEveryEdge) {
    ImpactResult result = simulate(snapshot, models_file, ChangeKind::Remove);
    ASSERT_EQ(result.impacts.size(), 1u);
    EXPECT_EQ(result.impacts[0].node, importer);
    EXPECT_EQ(result.change, ChangeKind::Remove);
    EXPECT_EQ(result.target, models_file);
}

TEST_F(UserFieldFixture, RemoveWithoutDependentsIsEmpty) {
    ImpactResult result = simulate(snapshot, caller, ChangeKind::Remove);
    EXPECT_TRUE(result.impacts.empty());
}

TEST_F(UserFieldFixture, MaxDepthLimitsWalk) {
    config.max_depth = 2;
    ImpactResult result = simulate(snapshot, field, ChangeKind::Rename);
    for (const auto &impact : result.impacts)
        EXPECT_LE(impact.distance, 2u);
    EXPECT_EQ(impact_on(result, endpoint), nullptr);
    EXPECT_NE(impact_on(result, handler), nullptr);
}

TEST_F(SimulatorTest, UnknownTargetIsNotFound) {
    GraphFixture g;
    g.add("app/a.py", "f");
    Snapshot snapshot = g.snapshot();
    EXPECT_THROW(simulate(snapshot, make_node_id("app/a.py", "missing"), ChangeKind::Remove),
                 NotFoundError);
}

TEST_F(SimulatorTest, BestBottleneckAmongShortestPaths) {
    GraphFixture g;
    NodeId target = g.add("app/t.py", "target");
    NodeId weak = g.add("app/w.py", "weak");
    NodeId strong = g.add("app/s.py", "strong");
    NodeId top = g.add("app/top.py", "top");
    g.link(weak, target, EdgeKind::Calls, 0.5);
    g.link(strong, target, EdgeKind::Calls, 0.9);
    g.link(top, weak, EdgeKind::Calls, 1.0);
    g.link(top, strong, EdgeKind::Calls, 1.0);

    ImpactResult result = simulate(g.snapshot(), target, ChangeKind::Remove);
    const Impact *on_top = impact_on(result, top);
    ASSERT_NE(on_top, nullptr);
    EXPECT_EQ(on_top->distance, 2u);
    EXPECT_DOUBLE_EQ(on_top->confidence, 0.9);

    // Distance ascending, then confidence descending
    ASSERT_EQ(result.impacts.size(), 3u);
    EXPECT_EQ(result.impacts[0].node, strong);
    EXPECT_EQ(result.impacts[1].node, weak);
    EXPECT_EQ(result.impacts[2].node, top);
}

TEST_F(SimulatorTest, CyclesVisitEachNodeOnce) {
    GraphFixture g;
    NodeId a = g.add("app/a.py", "a");
    NodeId b = g.add("app/b.py", "b");
    NodeId c = g.add("app/c.py", "c");
    g.link(a, b, EdgeKind::Calls);
    g.link(b, c, EdgeKind::Calls);
    g.link(c, a, EdgeKind::Calls);
    g.link(a, a, EdgeKind::Calls);

    ImpactResult result = simulate(g.snapshot(), a, ChangeKind::Remove);
    ASSERT_EQ(result.impacts.size(), 2u);
    EXPECT_EQ(result.impacts[0].node, c);
    EXPECT_EQ(result.impacts[1].node, b);
}

TEST_F(SimulatorTest, CancelledSimulationThrows) {
    GraphFixture g;
    NodeId a = g.add("app/a.py", "a");
    Snapshot snapshot = g.snapshot();

    CancellationToken token;
    token.cancel();
    EXPECT_THROW(BlastRadiusSimulator(config).simulate(snapshot, {a, ChangeKind::Remove}, token),
                 CancelledError);
}

TEST(ChangeKindTest, Names) {
    EXPECT_EQ(change_kind_from_string("rename"), ChangeKind::Rename);
    EXPECT_EQ(change_kind_from_string("signature"), ChangeKind::SignatureChange);
    EXPECT_STREQ(change_kind_to_string(ChangeKind::Remove), "remove");
    EXPECT_THROW(change_kind_from_string("explode"), ValidationError);
}
