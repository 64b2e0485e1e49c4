// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "config.hpp"
#include <string>
#include <vector>

namespace devguard {

struct RouteSegment {
    std::string text;
    bool param = false;
};

// A route or call URL reduced to comparable path segments
struct RoutePattern {
    std::vector<RouteSegment> segments;
    bool dynamic_base = false; // Call URL starts with an interpolated base ("${API}/users")
};

enum class RouteMatch { None, Exact, Param, Suffix };

// Parse a declared route or a call-site URL. Scheme, host, query and
// fragment are stripped; "{id}", "<int:id>", ":id" and "{}" are parameters.
RoutePattern parse_route(const std::string &route);

// "/users/{}/orders" form used in diagnostics and tests
std::string route_to_string(const RoutePattern &pattern);

bool verbs_match(const std::string &call_verb, const std::string &endpoint_verb);

RouteMatch match_route(const RoutePattern &call, const RoutePattern &endpoint);

double match_confidence(RouteMatch match, const BuilderConfig &config);

} // namespace devguard
