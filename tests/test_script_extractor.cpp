// test_script_extractor.cpp - JavaScript / TypeScript adapter over inline snippets

#include <gtest/gtest.h>

#include "test_fixtures.hpp"

using namespace devguard;
using namespace devguard::fixtures;

class ScriptExtractorTest : public ::testing::Test {
protected:
    ExtractorConfig config;

    FileContribution extract_ok(const std::string &path, const std::string &source) {
        ExtractionResult result = extract(document(path, source), config);
        EXPECT_TRUE(result.ok) << result.failure.detail;
        return result.contribution;
    }
};

TEST_F(ScriptExtractorTest, ModuleNameAndFileNode) {
    FileContribution c = extract_ok("src/api/users.ts", "export const x = 1;\n");
    EXPECT_EQ(c.module_name, "src/api/users");
    EXPECT_EQ(c.decls[0].kind, NodeKind::File);
    EXPECT_EQ(c.language, Language::TypeScript);

    FileContribution index = extract_ok("src/components/index.js", "export {};\n");
    EXPECT_EQ(index.decls[0].kind, NodeKind::Module);
    EXPECT_EQ(index.module_name, "src/components");
}

TEST_F(ScriptExtractorTest, FunctionsAndArrowFunctions) {
    FileContribution c = extract_ok("src/util.js", R"(
function formatName(first, last = "") {
  return normalize(first) + last;
}

const normalize = (s) => s.trim();
)");

    const SymbolDecl *format = find_decl(c, "formatName");
    ASSERT_NE(format, nullptr);
    EXPECT_EQ(format->kind, NodeKind::Function);
    ASSERT_EQ(format->signature.size(), 2u);
    EXPECT_EQ(format->signature[1].name, "last");

    EXPECT_NE(find_decl(c, "normalize"), nullptr);

    const Reference *call = find_reference(c, EdgeKind::Calls, "normalize");
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->source, "formatName");
}

TEST_F(ScriptExtractorTest, ReactComponentsAndJsx) {
    FileContribution c = extract_ok("src/UserList.jsx", R"(
import React from 'react';
import { UserCard } from './UserCard';

export function UserList({ users }) {
  return <ul>{users.map(u => <UserCard key={u.id} user={u} />)}</ul>;
}

function sortUsers(users) {
  return users;
}
)");

    const SymbolDecl *list = find_decl(c, "UserList");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->kind, NodeKind::Component);
    EXPECT_EQ(find_decl(c, "sortUsers")->kind, NodeKind::Function);

    const Reference *card = find_reference(c, EdgeKind::Calls, "UserCard");
    ASSERT_NE(card, nullptr);
    EXPECT_EQ(card->module, "./UserCard");
    EXPECT_EQ(card->source, "UserList");

    // Lower-case tags are DOM elements
    EXPECT_FALSE(has_reference(c, EdgeKind::Calls, "ul"));

    const Reference *import = find_reference(c, EdgeKind::Imports, "UserCard");
    ASSERT_NE(import, nullptr);
    EXPECT_EQ(import->module, "./UserCard");
}

TEST_F(ScriptExtractorTest, ClassComponentAndInheritance) {
    FileContribution c = extract_ok("src/widgets.js", R"(
class Base {}

class Panel extends React.Component {
  render() {
    return this.renderBody();
  }
  renderBody() {
    return null;
  }
}

class Special extends Base {}
)");

    EXPECT_EQ(find_decl(c, "Panel")->kind, NodeKind::Component);
    EXPECT_EQ(find_decl(c, "Base")->kind, NodeKind::Class);
    EXPECT_NE(find_decl(c, "Panel.render"), nullptr);

    const Reference *self_call = find_reference(c, EdgeKind::Calls, "renderBody");
    ASSERT_NE(self_call, nullptr);
    EXPECT_EQ(self_call->scope, "Panel");
    EXPECT_EQ(self_call->source, "Panel.render");

    const Reference *base = find_reference(c, EdgeKind::Implements, "Base");
    ASSERT_NE(base, nullptr);
    EXPECT_EQ(base->source, "Special");
    EXPECT_FALSE(has_reference(c, EdgeKind::Implements, "React.Component"));
}

TEST_F(ScriptExtractorTest, InterfacesBecomeSchemas) {
    FileContribution c = extract_ok("src/types.ts", R"(
export interface Profile {
  bio: string;
}

export interface User {
  user_id: number;
  profile: Profile;
}

export type Admin = {
  level: number;
};

export interface SuperUser extends User {
  root: boolean;
}
)");

    const SymbolDecl *user = find_decl(c, "User");
    ASSERT_NE(user, nullptr);
    EXPECT_EQ(user->kind, NodeKind::Schema);
    ASSERT_EQ(user->signature.size(), 2u);
    EXPECT_EQ(user->signature[0].name, "user_id");
    EXPECT_EQ(user->signature[0].type, "number");

    EXPECT_NE(find_decl(c, "User.user_id"), nullptr);
    EXPECT_EQ(find_decl(c, "Admin")->kind, NodeKind::Schema);

    const Reference *profile = find_reference(c, EdgeKind::ReferencesSchema, "Profile");
    ASSERT_NE(profile, nullptr);
    EXPECT_EQ(profile->source, "User.profile");

    const Reference *extends = find_reference(c, EdgeKind::Implements, "User");
    ASSERT_NE(extends, nullptr);
    EXPECT_EQ(extends->source, "SuperUser");
}

TEST_F(ScriptExtractorTest, FetchAndAxiosCalls) {
    FileContribution c = extract_ok("src/client.js", R"(
import axios from 'axios';

export async function loadUser(id) {
  const res = await fetch(`${API}/users/${id}`);
  await fetch('/api/users', { method: 'post' });
  await axios.delete(`/api/users/${id}`);
  return axios({ url: '/api/orders', method: 'put' });
}
)");

    ASSERT_EQ(c.endpoint_calls.size(), 4u);
    EXPECT_EQ(c.endpoint_calls[0].verb, "GET");
    EXPECT_EQ(c.endpoint_calls[0].url, "{}/users/{}");
    EXPECT_EQ(c.endpoint_calls[0].source, "loadUser");
    EXPECT_EQ(c.endpoint_calls[1].verb, "POST");
    EXPECT_EQ(c.endpoint_calls[1].url, "/api/users");
    EXPECT_EQ(c.endpoint_calls[2].verb, "DELETE");
    EXPECT_EQ(c.endpoint_calls[2].url, "/api/users/{}");
    EXPECT_EQ(c.endpoint_calls[3].verb, "PUT");
    EXPECT_EQ(c.endpoint_calls[3].url, "/api/orders");
}

TEST_F(ScriptExtractorTest, ExpressRoutes) {
    FileContribution c = extract_ok("server/routes.js", R"(
const express = require('express');
const { listUsers } = require('./handlers');
const router = express.Router();

router.get('/users', auth, listUsers);
router.post('/users/:id', (req, res) => {
  saveUser(req.body);
});
)");

    const SymbolDecl *list = find_decl(c, "GET /users");
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->kind, NodeKind::Endpoint);
    EXPECT_EQ(list->route, "/users");

    EXPECT_NE(find_decl(c, "POST /users/:id"), nullptr);

    const Reference *handler = find_reference(c, EdgeKind::Calls, "listUsers");
    ASSERT_NE(handler, nullptr);
    EXPECT_EQ(handler->source, "GET /users");

    const Reference *middleware = find_reference(c, EdgeKind::Calls, "auth");
    ASSERT_NE(middleware, nullptr);
    EXPECT_EQ(middleware->source, "GET /users");

    // Inline handler bodies belong to the endpoint
    const Reference *inner = find_reference(c, EdgeKind::Calls, "saveUser");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->source, "POST /users/:id");

    bool require_express = false;
    for (const auto &ref : c.references) {
        if (ref.kind == EdgeKind::Imports && ref.module == "express")
            require_express = true;
    }
    EXPECT_TRUE(require_express);
    EXPECT_TRUE(c.endpoint_calls.empty());
}

TEST_F(ScriptExtractorTest, TypeAnnotationsReferenceSchemas) {
    FileContribution c = extract_ok("src/service.ts", R"(
import { User } from './types';

export function rename(user: User, name: string): Promise<User> {
  return save(user);
}
)");

    const SymbolDecl *rename = find_decl(c, "rename");
    ASSERT_NE(rename, nullptr);
    ASSERT_EQ(rename->signature.size(), 2u);
    EXPECT_EQ(rename->signature[0].type, "User");

    const Reference *ref = find_reference(c, EdgeKind::ReferencesSchema, "User");
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->source, "rename");
    EXPECT_EQ(ref->module, "./types");
    EXPECT_FALSE(has_reference(c, EdgeKind::ReferencesSchema, "Promise"));
}

TEST_F(ScriptExtractorTest, SyntaxErrorIsUnparsed) {
    ExtractionResult result = extract(document("src/bad.ts", "function (( {"), config);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure.reason, ParseFailure::SyntaxError);
    EXPECT_EQ(result.failure.language, Language::TypeScript);
}

TEST(ScriptModuleNameTest, DerivedFromPath) {
    EXPECT_EQ(script_module_name("src/api/users.ts"), "src/api/users");
    EXPECT_EQ(script_module_name("src/components/index.tsx"), "src/components");
}

TEST(UnquoteLiteralTest, Forms) {
    EXPECT_EQ(unquote_literal("'/users'"), "/users");
    EXPECT_EQ(unquote_literal("\"/users\""), "/users");
    EXPECT_EQ(unquote_literal("`${base}/users/${id}`"), "{}/users/{}");
    EXPECT_EQ(unquote_literal("f\"/users/{user_id}\""), "/users/{}");
    EXPECT_EQ(unquote_literal("r'^api/$'"), "^api/$");
    EXPECT_EQ(unquote_literal("\"\"\"doc\"\"\""), "doc");
}
