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

#include "devguard/routes.hpp"
#include <sstream>

namespace devguard {

namespace {

bool is_param_segment(const std::string &segment) {
    if (segment.empty())
        return false;
    char first = segment.front();
    char last = segment.back();
    if (first == ':' || segment == "*")
        return true;
    if ((first == '{' && last == '}') || (first == '<' && last == '>'))
        return true;
    // "user-{}", Django regex groups
    return segment.find("{}") != std::string::npos || segment.find('(') != std::string::npos;
}

std::string strip_host(const std::string &url) {
    size_t start = std::string::npos;
    if (url.compare(0, 2, "//") == 0) {
        start = 2;
    } else {
        size_t scheme = url.find("://");
        if (scheme != std::string::npos && url.find('/') > scheme)
            start = scheme + 3;
    }
    if (start == std::string::npos)
        return url;

    size_t path = url.find('/', start);
    return path == std::string::npos ? "/" : url.substr(path);
}

} // namespace

RoutePattern parse_route(const std::string &route) {
    RoutePattern pattern;

    std::string path = strip_host(route);
    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos)
        path.erase(cut);

    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty())
            parts.push_back(part);
    }

    // "{}/users" has an unknown base in front of the first slash
    size_t first = 0;
    if (!path.empty() && path[0] != '/' && !parts.empty() &&
        parts[0].find("{}") != std::string::npos) {
        pattern.dynamic_base = true;
        first = 1;
    }

    for (size_t i = first; i < parts.size(); ++i) {
        RouteSegment segment;
        segment.param = is_param_segment(parts[i]);
        segment.text = segment.param ? "{}" : parts[i];
        pattern.segments.push_back(std::move(segment));
    }
    return pattern;
}

std::string route_to_string(const RoutePattern &pattern) {
    std::string out = pattern.dynamic_base ? "{}" : "";
    for (const auto &segment : pattern.segments)
        out += "/" + segment.text;
    return out.empty() ? "/" : out;
}

bool verbs_match(const std::string &call_verb, const std::string &endpoint_verb) {
    return call_verb == "ANY" || endpoint_verb == "ANY" || call_verb == endpoint_verb;
}

RouteMatch match_route(const RoutePattern &call, const RoutePattern &endpoint) {
    const auto &c = call.segments;
    const auto &e = endpoint.segments;

    size_t offset = 0;
    if (call.dynamic_base) {
        if (c.empty() || c.size() > e.size())
            return RouteMatch::None;
        offset = e.size() - c.size();
    } else if (c.size() != e.size()) {
        return RouteMatch::None;
    }

    bool params = false;
    for (size_t i = 0; i < c.size(); ++i) {
        const auto &cs = c[i];
        const auto &es = e[offset + i];
        if (cs.param || es.param) {
            params = true;
            continue;
        }
        if (cs.text != es.text)
            return RouteMatch::None;
    }

    if (call.dynamic_base)
        return RouteMatch::Suffix;
    return params ? RouteMatch::Param : RouteMatch::Exact;
}

double match_confidence(RouteMatch match, const BuilderConfig &config) {
    switch (match) {
    case RouteMatch::Exact:
        return config.endpoint_exact_confidence;
    case RouteMatch::Param:
        return config.endpoint_param_confidence;
    case RouteMatch::Suffix:
        return config.endpoint_suffix_confidence;
    default:
        return 0.0;
    }
}

} // namespace devguard
