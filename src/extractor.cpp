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

#include "devguard/extractor.hpp"
#include <algorithm>
#include <cctype>

namespace devguard {

namespace {

bool is_blank(const std::string &text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string strip_extension(const std::string &path) {
    size_t slash = path.rfind('/');
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return path;
    return path.substr(0, dot);
}

// Replace every {...} (or ${...}) with "{}"
std::string collapse_interpolations(const std::string &text, bool dollar) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        bool opens = dollar ? (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{')
                            : text[i] == '{';
        if (!opens) {
            out += text[i];
            continue;
        }

        // Python "{{" is a literal brace
        if (!dollar && i + 1 < text.size() && text[i + 1] == '{') {
            out += '{';
            ++i;
            continue;
        }

        size_t j = dollar ? i + 2 : i + 1;
        int depth = 1;
        while (j < text.size() && depth > 0) {
            if (text[j] == '{')
                depth++;
            else if (text[j] == '}')
                depth--;
            ++j;
        }
        out += "{}";
        i = j - 1;
    }
    return out;
}

uint32_t count_lines(const std::string &text) {
    if (text.empty())
        return 0;
    uint32_t lines = static_cast<uint32_t>(std::count(text.begin(), text.end(), '\n'));
    return text.back() == '\n' ? lines : lines + 1;
}

} // namespace

ExtractionResult unparsed_result(const Document &doc, Language lang, ParseFailure reason,
                                 std::string detail) {
    ExtractionResult result;
    result.ok = false;
    result.failure.path = doc.path;
    result.failure.language = lang;
    result.failure.reason = reason;
    result.failure.detail = std::move(detail);
    return result;
}

ExtractionResult extract(const Document &doc, const ExtractorConfig &config) {
    Language lang = doc.language;
    if (lang == Language::Unknown)
        lang = language_from_path(doc.path);

    if (lang == Language::Unknown) {
        return unparsed_result(doc, lang, ParseFailure::UnsupportedLanguage,
                      "no extractor for " + doc.path);
    }

    if (is_blank(doc.content)) {
        return unparsed_result(doc, lang, ParseFailure::EmptyFile, "file has no content");
    }

    Document typed = doc;
    typed.language = lang;
    std::string normalized = normalize_path(doc.path);
    if (!normalized.empty())
        typed.path = normalized;

    ExtractionResult result;
    switch (lang) {
    case Language::Python:
        result = extract_python(typed, config);
        break;
    case Language::JavaScript:
    case Language::TypeScript:
        result = extract_script(typed, config);
        break;
    default:
        return unparsed_result(typed, lang, ParseFailure::UnsupportedLanguage,
                               std::string("no extractor for language ") +
                                   language_to_string(lang));
    }

    if (result.ok)
        result.contribution.line_count = count_lines(doc.content);
    return result;
}

std::string python_module_name(const std::string &path) {
    std::string base = strip_extension(path);

    const std::string init = "__init__";
    if (base == init)
        return init;
    if (base.size() > init.size() + 1 &&
        base.compare(base.size() - init.size() - 1, init.size() + 1, "/" + init) == 0) {
        base.erase(base.size() - init.size() - 1);
    }

    std::replace(base.begin(), base.end(), '/', '.');
    return base;
}

std::string script_module_name(const std::string &path) {
    std::string base = strip_extension(path);

    const std::string index = "/index";
    if (base.size() > index.size() &&
        base.compare(base.size() - index.size(), index.size(), index) == 0) {
        base.erase(base.size() - index.size());
    }
    return base;
}

std::string unquote_literal(const std::string &text) {
    size_t pos = 0;
    bool formatted = false;

    // Python string prefixes (r, b, u, f and combinations)
    while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
        if (text[pos] == 'f' || text[pos] == 'F')
            formatted = true;
        ++pos;
    }
    if (pos >= text.size())
        return text;

    char quote = text[pos];
    if (quote != '"' && quote != '\'' && quote != '`')
        return text;

    size_t quote_len = 1;
    if (quote != '`' && text.compare(pos, 3, std::string(3, quote)) == 0)
        quote_len = 3;

    size_t begin = pos + quote_len;
    if (text.size() < begin + quote_len)
        return "";
    std::string inner = text.substr(begin, text.size() - begin - quote_len);

    if (quote == '`')
        return collapse_interpolations(inner, true);
    if (formatted)
        return collapse_interpolations(inner, false);
    return inner;
}

bool is_http_verb(const std::string &name) {
    static const char *verbs[] = {"get", "post", "put", "patch", "delete", "head", "options"};
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char *verb : verbs) {
        if (lower == verb)
            return true;
    }
    return false;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace devguard
