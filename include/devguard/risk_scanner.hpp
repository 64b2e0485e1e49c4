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
#include "types.hpp"
#include <regex>
#include <string>
#include <vector>

namespace devguard {

// One rule hit on one line
struct RiskMatch {
    std::string rule;
    Severity severity = Severity::Medium;
    uint32_t line = 0;
    std::string message;
    std::string excerpt; // Matched text with secrets masked
};

// Everything the risk detector needs from a file once its text is gone
struct FileScan {
    std::string path;
    uint32_t line_count = 0;
    size_t todo_count = 0; // TODO / FIXME / HACK markers
    std::vector<RiskMatch> matches;
};

// Compiles the configured rules once; scan() is safe to call from many threads
class RiskScanner {
public:
    // Throws ConfigError when a pattern does not compile
    explicit RiskScanner(const AnalyzerConfig &config);

    FileScan scan(const Document &doc) const;

    // Non-source file the scanner still cares about: a file named by some
    // rule, a sensitive file or a README
    bool is_asset(const std::string &path) const;

    // Repository-wide checks over every ingested path. The result has an
    // empty path and no lines.
    FileScan scan_repository(const std::vector<std::string> &paths) const;

private:
    struct CompiledRule {
        RiskRule rule;
        std::regex regex;
    };

    std::vector<CompiledRule> rules_;
    std::regex todo_marker_;
    size_t max_line_length_;
    std::vector<std::string> sensitive_files_;
    bool require_readme_;

    bool is_sensitive(const std::string &name) const;
};

// README, readme.md, Readme.rst, ...
bool is_readme(const std::string &name);

// "sk_live_abcdef..." -> "sk_l****"
std::string mask_secret(const std::string &text);

} // namespace devguard
