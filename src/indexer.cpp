#include "devguard/indexer.hpp"
#include "devguard/errors.hpp"
#include "devguard/workers.hpp"
#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace devguard {

Indexer::Indexer(const EngineConfig &config, CancellationToken token)
    : config_(config), token_(std::move(token)), scanner_(config.analyzer),
      num_threads_(config.indexer.num_threads) {
    // Auto-detect thread count if not specified
    if (num_threads_ == 0) {
        num_threads_ = std::thread::hardware_concurrency();
        if (num_threads_ == 0)
            num_threads_ = 4; // Fallback
    }
}

bool Indexer::should_ignore(const fs::path &relative) const {
    for (const auto &component : relative) {
        std::string comp = component.string();

        for (const auto &pattern : config_.indexer.ignore_patterns) {
            if (comp == pattern)
                return true;
        }

        // Ignore hidden files/directories
        if (!comp.empty() && comp[0] == '.' && comp != "." && comp != "..")
            return true;
    }
    return false;
}

std::vector<Document> Indexer::read_directory(const std::string &root_path) const {
    std::vector<Document> documents;

    fs::path root(root_path);
    if (!fs::is_directory(root)) {
        throw ValidationError("Not a directory: " + root_path);
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(current_dir, ec)) {
            const fs::path &path = entry.path();
            fs::path relative = fs::relative(path, root, ec);
            if (ec)
                continue;

            if (entry.is_directory()) {
                if (!should_ignore(relative))
                    dirs_to_visit.push_back(path);
                continue;
            }
            if (!entry.is_regular_file())
                continue;

            // Hidden or unsupported files are kept only when the risk scanner wants them
            Language lang = language_from_extension(path.extension().string());
            bool asset = lang == Language::Unknown && scanner_.is_asset(relative.generic_string());
            if (!asset && (lang == Language::Unknown || should_ignore(relative)))
                continue;

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                std::cerr << "Error: Cannot read " << path.string() << std::endl;
                continue;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();

            documents.push_back({relative.generic_string(), lang, buffer.str()});
        }
        if (ec) {
            std::cerr << "Error: Cannot list " << current_dir.string() << ": " << ec.message()
                      << std::endl;
        }
    }

    std::sort(documents.begin(), documents.end(),
              [](const Document &a, const Document &b) { return a.path < b.path; });
    return documents;
}

std::vector<Document> Indexer::validate(const std::vector<Document> &documents) const {
    std::vector<Document> normalized;
    normalized.reserve(documents.size());
    std::set<std::string> seen;

    for (const auto &doc : documents) {
        if (doc.path.empty()) {
            throw ValidationError("Document with an empty path");
        }
        std::string path = normalize_path(doc.path);
        if (path.empty()) {
            throw ValidationError("Path escapes the analyzed root: " + doc.path);
        }
        if (!seen.insert(path).second) {
            throw ValidationError("Duplicate document path: " + path);
        }
        normalized.push_back({path, doc.language, doc.content});
    }
    return normalized;
}

void Indexer::worker_extract(const std::vector<Document> &documents, size_t start_idx,
                             size_t end_idx, IndexResult &all, std::mutex &result_mutex) {
    // Thread-local storage to minimize lock contention
    IndexResult local;

    for (size_t i = start_idx; i < end_idx; ++i) {
        token_.check();
        const Document &doc = documents[i];
        size_t current = ++processed_;

        ExtractionResult extracted = extract(doc, config_.extractor);

        if (extracted.ok) {
            Document typed = doc;
            typed.language = extracted.contribution.language;
            FileScan scan = scanner_.scan(typed);

            stats_.files_parsed++;
            stats_.symbols_found += extracted.contribution.decls.size();
            stats_.references_found += extracted.contribution.references.size();
            stats_.risk_matches += scan.matches.size();

            if (config_.indexer.verbose) {
                std::lock_guard<std::mutex> lock(output_mutex_);
                std::cout << "[" << current << "/" << documents.size() << "] Parsed: " << doc.path
                          << std::endl;
            }

            local.contributions.push_back(std::move(extracted.contribution));
            local.scans.push_back(std::move(scan));
        } else {
            stats_.files_unparsed++;

            if (config_.indexer.verbose) {
                std::lock_guard<std::mutex> lock(output_mutex_);
                std::cout << "[" << current << "/" << documents.size() << "] Skipped: " << doc.path << " ("
                          << parse_failure_to_string(extracted.failure.reason) << ": "
                          << extracted.failure.detail << ")" << std::endl;
            }

            local.unparsed.push_back(std::move(extracted.failure));
        }

    }

    // Final flush
    std::lock_guard<std::mutex> lock(result_mutex);
    all.contributions.insert(all.contributions.end(),
                             std::make_move_iterator(local.contributions.begin()),
                             std::make_move_iterator(local.contributions.end()));
    all.unparsed.insert(all.unparsed.end(), std::make_move_iterator(local.unparsed.begin()),
                        std::make_move_iterator(local.unparsed.end()));
    all.scans.insert(all.scans.end(), std::make_move_iterator(local.scans.begin()),
                     std::make_move_iterator(local.scans.end()));
}

bool Indexer::is_asset(const Document &doc) const {
    return doc.language == Language::Unknown && language_from_path(doc.path) == Language::Unknown &&
           scanner_.is_asset(doc.path);
}

IndexResult Indexer::index(const std::vector<Document> &input) {
    IndexResult result;
    std::vector<Document> validated = validate(input);
    processed_ = 0;

    // Non-source files are scanned here and never reach the extractors
    std::vector<Document> documents;
    std::vector<std::string> paths;
    for (auto &doc : validated) {
        paths.push_back(doc.path);
        if (!is_asset(doc)) {
            documents.push_back(std::move(doc));
            continue;
        }
        FileScan scan = scanner_.scan(doc);
        stats_.assets_scanned++;
        stats_.risk_matches += scan.matches.size();
        result.scans.push_back(std::move(scan));
    }
    result.total_files = documents.size();

    FileScan repository = scanner_.scan_repository(paths);
    if (!repository.matches.empty()) {
        stats_.risk_matches += repository.matches.size();
        result.scans.push_back(std::move(repository));
    }

    if (config_.indexer.verbose) {
        std::cout << "Found " << documents.size() << " source files to index, "
                  << stats_.assets_scanned << " other files scanned." << std::endl;
        std::cout << "Using " << num_threads_ << " threads." << std::endl;
    }

    if (!documents.empty()) {
        std::mutex result_mutex;

        // Create worker threads; exceptions are carried back to this thread
        std::vector<std::thread> threads;
        ThreadJoiner joiner(threads);
        std::vector<std::exception_ptr> errors(num_threads_);
        size_t files_per_thread = (documents.size() + num_threads_ - 1) / num_threads_;

        for (unsigned int t = 0; t < num_threads_; ++t) {
            size_t start_idx = t * files_per_thread;
            size_t end_idx = std::min(start_idx + files_per_thread, documents.size());

            if (start_idx >= documents.size())
                break;

            threads.emplace_back([&, t, start_idx, end_idx]() {
                try {
                    worker_extract(documents, start_idx, end_idx, result, result_mutex);
                } catch (...) {
                    errors[t] = std::current_exception();
                }
            });
        }

        // Wait for all threads
        joiner.join();

        for (const auto &error : errors) {
            if (error)
                std::rethrow_exception(error);
        }
    }

    // Workers finish in any order
    auto by_path = [](const auto &a, const auto &b) { return a.path < b.path; };
    std::sort(result.contributions.begin(), result.contributions.end(), by_path);
    std::sort(result.unparsed.begin(), result.unparsed.end(), by_path);
    std::sort(result.scans.begin(), result.scans.end(), by_path);

    if (config_.indexer.verbose) {
        std::cout << "\nParsing complete. " << stats_.files_parsed << " parsed, "
                  << stats_.files_unparsed << " unparsed, " << stats_.symbols_found
                  << " symbols, " << stats_.references_found << " references, "
                  << stats_.risk_matches << " risk matches." << std::endl;
    }

    return result;
}

} // namespace devguard
