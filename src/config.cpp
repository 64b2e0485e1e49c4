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

#include "devguard/config.hpp"
#include "devguard/errors.hpp"
#include <fstream>
#include <regex>

namespace devguard {

std::vector<RiskRule> AnalyzerConfig::default_risk_rules() {
    const std::vector<Language> scripts = {Language::JavaScript, Language::TypeScript};
    const std::vector<Language> python = {Language::Python};

    return {
        {"hardcoded_api_key", R"(API_KEY\s*[:=]\s*['"][a-zA-Z0-9_\-]{20,}['"])", Severity::High,
         true, {}, "Hardcoded API key", true},
        {"aws_access_key", R"(AKIA[0-9A-Z]{16})", Severity::High, false, {},
         "AWS access key id in source", true},
        {"stripe_secret_key", R"(sk_live_[0-9a-zA-Z]{24})", Severity::High, false, {},
         "Stripe live secret key in source", true},
        {"github_token", R"(ghp_[0-9a-zA-Z]{36})", Severity::High, false, {},
         "GitHub personal access token in source", true},
        {"hardcoded_secret", R"((password|passwd|secret|token)\s*[:=]\s*['"][^'"\s]{8,}['"])",
         Severity::Medium, true, {}, "Secret-like string assigned in source", true},
        {"debug_enabled", R"(\bDEBUG\s*[:=]\s*(True|true|1)\b)", Severity::High, false, {},
         "Debug mode left enabled"},
        {"verbose_enabled", R"(\b(verbose|VERBOSE)\s*[:=]\s*(True|true)\b)", Severity::Low, false,
         {}, "Verbose flag left enabled"},
        {"permissive_hosts", R"(ALLOWED_HOSTS\s*=\s*\[\s*['"]\*['"]\s*\])", Severity::High,
         false, python, "ALLOWED_HOSTS accepts any host"},
        {"permissive_cors",
         R"((CORS_ORIGIN_ALLOW_ALL|CORS_ALLOW_ALL_ORIGINS)\s*=\s*True|allow_origins\s*=\s*\[\s*['"]\*['"]\s*\])",
         Severity::High, false, python, "CORS allows every origin"},
        {"console_logging", R"(\bconsole\.log\()", Severity::Low, false, scripts,
         "console.log left in production code"},
        {"print_logging", R"(^\s*print\()", Severity::Low, false, python,
         "print() used instead of a logger"},
        {"unpinned_dependency", R"(^\s*(?!#)(?!.*(==|>=))\S.*$)", Severity::Medium, false, {},
         "Dependency without a pinned version", false, {"requirements*.txt"}},
        {"docker_latest_tag", R"(^\s*FROM\s+[\w\-/.]+:latest\b)", Severity::Medium, true, {},
         "Base image uses the :latest tag", false, {"Dockerfile", "Dockerfile.*", "*.Dockerfile"}},
    };
}

namespace {

template <typename T>
void read_if_present(const json &section, const char *key, T &out) {
    if (!section.contains(key))
        return;
    try {
        out = section.at(key).get<T>();
    } catch (const json::exception &e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

std::vector<Language> languages_from_json(const json &j) {
    std::vector<Language> langs;
    for (const auto &item : j) {
        Language lang = language_from_string(item.get<std::string>());
        if (lang == Language::Unknown)
            throw ConfigError("Unknown language in risk rule: " + item.get<std::string>());
        langs.push_back(lang);
    }
    return langs;
}

RiskRule risk_rule_from_json(const json &j) {
    if (!j.is_object() || !j.contains("name") || !j.contains("pattern"))
        throw ConfigError("Risk rule needs at least 'name' and 'pattern'");

    RiskRule rule;
    try {
        rule.name = j.at("name").get<std::string>();
        rule.pattern = j.at("pattern").get<std::string>();
        rule.severity = severity_from_string(j.value("severity", std::string("medium")));
        rule.ignore_case = j.value("ignore_case", false);
        rule.message = j.value("message", rule.name);
        rule.mask = j.value("mask", false);
        if (j.contains("languages"))
            rule.languages = languages_from_json(j.at("languages"));
        if (j.contains("files"))
            rule.files = j.at("files").get<std::vector<std::string>>();
    } catch (const json::exception &e) {
        throw ConfigError("Invalid risk rule: " + std::string(e.what()));
    } catch (const ValidationError &e) {
        throw ConfigError(e.what());
    }
    return rule;
}

json risk_rule_to_json(const RiskRule &rule) {
    json j;
    j["name"] = rule.name;
    j["pattern"] = rule.pattern;
    j["severity"] = severity_to_string(rule.severity);
    j["ignore_case"] = rule.ignore_case;
    j["message"] = rule.message;
    j["mask"] = rule.mask;
    json langs = json::array();
    for (Language lang : rule.languages)
        langs.push_back(language_to_string(lang));
    j["languages"] = std::move(langs);
    j["files"] = rule.files;
    return j;
}

} // namespace

EngineConfig config_from_json(const json &j) {
    EngineConfig config;
    if (!j.is_object())
        throw ConfigError("Configuration must be a JSON object");

    if (j.contains("indexer")) {
        const auto &s = j["indexer"];
        read_if_present(s, "threads", config.indexer.num_threads);
        read_if_present(s, "verbose", config.indexer.verbose);
        read_if_present(s, "ignore", config.indexer.ignore_patterns);
    }

    if (j.contains("extractor")) {
        const auto &s = j["extractor"];
        read_if_present(s, "schema_bases", config.extractor.schema_bases);
        read_if_present(s, "route_decorators", config.extractor.route_decorators);
        read_if_present(s, "route_objects", config.extractor.route_objects);
        read_if_present(s, "http_clients", config.extractor.http_clients);
    }

    if (j.contains("builder")) {
        const auto &s = j["builder"];
        read_if_present(s, "endpoint_exact_confidence", config.builder.endpoint_exact_confidence);
        read_if_present(s, "endpoint_param_confidence", config.builder.endpoint_param_confidence);
        read_if_present(s, "endpoint_suffix_confidence",
                        config.builder.endpoint_suffix_confidence);
    }

    if (j.contains("analyzer")) {
        const auto &s = j["analyzer"];
        read_if_present(s, "god_multiplier", config.analyzer.god_multiplier);
        read_if_present(s, "god_min_degree", config.analyzer.god_min_degree);
        read_if_present(s, "god_high_ratio", config.analyzer.god_high_ratio);
        read_if_present(s, "god_medium_ratio", config.analyzer.god_medium_ratio);
        read_if_present(s, "entry_points", config.analyzer.entry_point_patterns);
        read_if_present(s, "todo_density_threshold", config.analyzer.todo_density_threshold);
        read_if_present(s, "todo_min_count", config.analyzer.todo_min_count);
        read_if_present(s, "parallel_detectors", config.analyzer.parallel_detectors);
        read_if_present(s, "max_scan_line_length", config.analyzer.max_scan_line_length);
        read_if_present(s, "sensitive_files", config.analyzer.sensitive_files);
        read_if_present(s, "require_readme", config.analyzer.require_readme);

        if (s.contains("orphan_exempt_kinds")) {
            config.analyzer.orphan_exempt_kinds.clear();
            for (const auto &item : s["orphan_exempt_kinds"]) {
                try {
                    config.analyzer.orphan_exempt_kinds.push_back(
                        node_kind_from_string(item.get<std::string>()));
                } catch (const ValidationError &e) {
                    throw ConfigError(e.what());
                }
            }
        }

        // "risk_rules" replaces the defaults, "extra_risk_rules" appends to them
        if (s.contains("risk_rules")) {
            config.analyzer.risk_rules.clear();
            for (const auto &item : s["risk_rules"])
                config.analyzer.risk_rules.push_back(risk_rule_from_json(item));
        }
        if (s.contains("extra_risk_rules")) {
            for (const auto &item : s["extra_risk_rules"])
                config.analyzer.risk_rules.push_back(risk_rule_from_json(item));
        }
    }

    if (j.contains("simulator")) {
        read_if_present(j["simulator"], "max_depth", config.simulator.max_depth);
    }

    validate_config(config);
    return config;
}

EngineConfig load_config(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error &e) {
        throw ConfigError("Malformed config file " + filepath + ": " + e.what());
    }
    return config_from_json(j);
}

json config_to_json(const EngineConfig &config) {
    json j;

    j["indexer"]["threads"] = config.indexer.num_threads;
    j["indexer"]["verbose"] = config.indexer.verbose;
    j["indexer"]["ignore"] = config.indexer.ignore_patterns;

    j["extractor"]["schema_bases"] = config.extractor.schema_bases;
    j["extractor"]["route_decorators"] = config.extractor.route_decorators;
    j["extractor"]["route_objects"] = config.extractor.route_objects;
    j["extractor"]["http_clients"] = config.extractor.http_clients;

    j["builder"]["endpoint_exact_confidence"] = config.builder.endpoint_exact_confidence;
    j["builder"]["endpoint_param_confidence"] = config.builder.endpoint_param_confidence;
    j["builder"]["endpoint_suffix_confidence"] = config.builder.endpoint_suffix_confidence;

    const auto &a = config.analyzer;
    j["analyzer"]["god_multiplier"] = a.god_multiplier;
    j["analyzer"]["god_min_degree"] = a.god_min_degree;
    j["analyzer"]["god_high_ratio"] = a.god_high_ratio;
    j["analyzer"]["god_medium_ratio"] = a.god_medium_ratio;
    j["analyzer"]["entry_points"] = a.entry_point_patterns;
    j["analyzer"]["todo_density_threshold"] = a.todo_density_threshold;
    j["analyzer"]["todo_min_count"] = a.todo_min_count;
    j["analyzer"]["parallel_detectors"] = a.parallel_detectors;
    j["analyzer"]["max_scan_line_length"] = a.max_scan_line_length;
    j["analyzer"]["sensitive_files"] = a.sensitive_files;
    j["analyzer"]["require_readme"] = a.require_readme;

    json kinds = json::array();
    for (NodeKind kind : a.orphan_exempt_kinds)
        kinds.push_back(node_kind_to_string(kind));
    j["analyzer"]["orphan_exempt_kinds"] = std::move(kinds);

    json rules = json::array();
    for (const auto &rule : a.risk_rules)
        rules.push_back(risk_rule_to_json(rule));
    j["analyzer"]["risk_rules"] = std::move(rules);

    j["simulator"]["max_depth"] = config.simulator.max_depth;
    return j;
}

void validate_config(const EngineConfig &config) {
    auto check_confidence = [](double value, const char *name) {
        if (!(value > 0.0 && value < 1.0)) {
            throw ConfigError(std::string(name) + " must be in (0, 1): heuristic bindings " +
                              "never reach syntactic confidence");
        }
    };
    check_confidence(config.builder.endpoint_exact_confidence, "endpoint_exact_confidence");
    check_confidence(config.builder.endpoint_param_confidence, "endpoint_param_confidence");
    check_confidence(config.builder.endpoint_suffix_confidence, "endpoint_suffix_confidence");

    const auto &a = config.analyzer;
    if (a.god_multiplier <= 0.0)
        throw ConfigError("god_multiplier must be positive");
    if (a.god_medium_ratio < 1.0 || a.god_high_ratio < a.god_medium_ratio)
        throw ConfigError("god ratios must satisfy 1 <= god_medium_ratio <= god_high_ratio");
    if (a.todo_density_threshold < 0.0)
        throw ConfigError("todo_density_threshold must not be negative");
    if (a.max_scan_line_length == 0)
        throw ConfigError("max_scan_line_length must be positive");

    for (const auto &rule : a.risk_rules) {
        if (rule.name.empty())
            throw ConfigError("Risk rule with empty name");
        try {
            auto flags = std::regex::ECMAScript;
            if (rule.ignore_case)
                flags |= std::regex::icase;
            std::regex compiled(rule.pattern, flags);
            (void)compiled;
        } catch (const std::regex_error &e) {
            throw ConfigError("Risk rule '" + rule.name + "' has an invalid pattern: " + e.what());
        }
    }
}

} // namespace devguard
