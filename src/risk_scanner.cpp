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

#include "devguard/risk_scanner.hpp"
#include "devguard/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace devguard {

namespace {

bool matches_any(const std::vector<std::string> &patterns, const std::string &name) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string &pattern) { return glob_match(pattern, name); });
}

} // namespace

RiskScanner::RiskScanner(const AnalyzerConfig &config)
    : todo_marker_(R"(\b(TODO|FIXME|HACK)\b)"), max_line_length_(config.max_scan_line_length),
      sensitive_files_(config.sensitive_files), require_readme_(config.require_readme) {
    for (const auto &rule : config.risk_rules) {
        auto flags = std::regex::ECMAScript;
        if (rule.ignore_case)
            flags |= std::regex::icase;
        try {
            rules_.push_back({rule, std::regex(rule.pattern, flags)});
        } catch (const std::regex_error &e) {
            throw ConfigError("Risk rule '" + rule.name + "' has an invalid pattern: " + e.what());
        }
    }
}

bool RiskScanner::is_sensitive(const std::string &name) const {
    return matches_any(sensitive_files_, name);
}

bool RiskScanner::is_asset(const std::string &path) const {
    std::string name = file_name(path);
    if (is_readme(name) || is_sensitive(name))
        return true;
    for (const auto &compiled : rules_) {
        if (matches_any(compiled.rule.files, name))
            return true;
    }
    return false;
}

FileScan RiskScanner::scan(const Document &doc) const {
    FileScan result;
    result.path = doc.path;

    std::string name = file_name(doc.path);
    if (is_sensitive(name)) {
        result.matches.push_back({"sensitive_file", Severity::High, 0,
                                  "Sensitive file committed to the repository", name});
    }

    // Rules restricted to other languages or file names never run here
    std::vector<const CompiledRule *> active;
    for (const auto &compiled : rules_) {
        const auto &langs = compiled.rule.languages;
        if (!langs.empty() && std::find(langs.begin(), langs.end(), doc.language) == langs.end())
            continue;
        if (!compiled.rule.files.empty() && !matches_any(compiled.rule.files, name))
            continue;
        active.push_back(&compiled);
    }

    std::istringstream stream(doc.content);
    std::string line;
    uint32_t line_num = 0;

    while (std::getline(stream, line)) {
        line_num++;

        auto begin = std::sregex_iterator(line.begin(), line.end(), todo_marker_);
        result.todo_count += static_cast<size_t>(std::distance(begin, std::sregex_iterator()));

        // std::regex recursion grows with the input; very long lines
        // (inline blobs, minified bundles) are reported instead of matched
        if (line.size() > max_line_length_) {
            result.matches.push_back({"long_line", Severity::Low, line_num,
                                      "Line too long to scan for risks",
                                      std::to_string(line.size()) + " characters"});
            continue;
        }

        for (const CompiledRule *compiled : active) {
            std::smatch match;
            if (!std::regex_search(line, match, compiled->regex))
                continue;

            RiskMatch hit;
            hit.rule = compiled->rule.name;
            hit.severity = compiled->rule.severity;
            hit.line = line_num;
            hit.message = compiled->rule.message;
            hit.excerpt = compiled->rule.mask ? mask_secret(match.str(0)) : match.str(0);
            result.matches.push_back(std::move(hit));
        }
    }

    result.line_count = line_num;
    return result;
}

FileScan RiskScanner::scan_repository(const std::vector<std::string> &paths) const {
    FileScan result;
    if (!require_readme_ || paths.empty())
        return result;

    bool readme = std::any_of(paths.begin(), paths.end(), [](const std::string &path) {
        return path.find('/') == std::string::npos && is_readme(path);
    });
    if (!readme)
        result.matches.push_back({"missing_readme", Severity::Low, 0,
                                  "No README at the repository root", ""});
    return result;
}

bool is_readme(const std::string &name) {
    std::string lower = name.substr(0, 6);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "readme";
}

std::string mask_secret(const std::string &text) {
    if (text.size() <= 8)
        return std::string(text.size(), '*');
    return text.substr(0, 4) + std::string(std::min<size_t>(text.size() - 4, 12), '*');
}

} // namespace devguard
