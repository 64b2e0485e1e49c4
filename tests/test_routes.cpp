// test_routes.cpp - Route parsing and endpoint matching

#include <gtest/gtest.h>

#include "devguard/routes.hpp"

using namespace devguard;

TEST(RouteTest, ParamSyntaxesNormalize) {
    EXPECT_EQ(route_to_string(parse_route("/users/:id")), "/users/{}");
    EXPECT_EQ(route_to_string(parse_route("/users/{user_id}")), "/users/{}");
    EXPECT_EQ(route_to_string(parse_route("/users/<int:pk>/")), "/users/{}");
    EXPECT_EQ(route_to_string(parse_route("/")), "/");
}

TEST(RouteTest, StripsHostAndQuery) {
    RoutePattern pattern = parse_route("https://api.example.com/v1/users?page=2#top");
    EXPECT_FALSE(pattern.dynamic_base);
    EXPECT_EQ(route_to_string(pattern), "/v1/users");
}

TEST(RouteTest, InterpolatedBaseIsDynamic) {
    RoutePattern pattern = parse_route("{}/users/{}");
    EXPECT_TRUE(pattern.dynamic_base);
    EXPECT_EQ(route_to_string(pattern), "{}/users/{}");
}

TEST(RouteTest, MatchKinds) {
    RoutePattern endpoint = parse_route("/api/users/{id}");

    EXPECT_EQ(match_route(parse_route("/api/users/{}"), endpoint), RouteMatch::Param);
    EXPECT_EQ(match_route(parse_route("/api/users"), parse_route("/api/users/")),
              RouteMatch::Exact);
    EXPECT_EQ(match_route(parse_route("{}/users/{}"), endpoint), RouteMatch::Suffix);
    EXPECT_EQ(match_route(parse_route("/api/orders/{}"), endpoint), RouteMatch::None);
    EXPECT_EQ(match_route(parse_route("/api/users"), endpoint), RouteMatch::None);
}

TEST(RouteTest, ConfidenceOrdering) {
    BuilderConfig config;
    double exact = match_confidence(RouteMatch::Exact, config);
    double param = match_confidence(RouteMatch::Param, config);
    double suffix = match_confidence(RouteMatch::Suffix, config);

    EXPECT_GT(exact, param);
    EXPECT_GT(param, suffix);
    EXPECT_LT(exact, 1.0);
    EXPECT_EQ(match_confidence(RouteMatch::None, config), 0.0);
}

TEST(RouteTest, VerbMatching) {
    EXPECT_TRUE(verbs_match("GET", "GET"));
    EXPECT_TRUE(verbs_match("POST", "ANY"));
    EXPECT_TRUE(verbs_match("ANY", "DELETE"));
    EXPECT_FALSE(verbs_match("GET", "POST"));
}
