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

#include "cancellation.hpp"
#include "config.hpp"
#include "extractor.hpp"
#include "risk_scanner.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace devguard {

namespace fs = std::filesystem;

// Output of the parallel extraction phase, ordered by path
struct IndexResult {
    std::vector<FileContribution> contributions;
    std::vector<UnparsedFile> unparsed;
    std::vector<FileScan> scans; // Parsed and other scanned files, "" for repository checks
    size_t total_files = 0; // Source documents; other files are scanned only
};

class Indexer {
public:

    explicit Indexer(const EngineConfig &config, CancellationToken token = CancellationToken{});

    // Extract and scan every source document on the worker pool; scan the
    // other files the risk scanner recognizes. Throws ValidationError for
    // empty, escaping or duplicate paths before any work starts.
    IndexResult index(const std::vector<Document> &documents);

    // Read source files and scanner-relevant files (requirements, Dockerfile,
    // .env, README ...) below root, with root-relative paths
    std::vector<Document> read_directory(const std::string &root) const;

    // Get statistics
    struct Stats {
        std::atomic<size_t> files_parsed{0};
        std::atomic<size_t> files_unparsed{0};
        std::atomic<size_t> symbols_found{0};
        std::atomic<size_t> references_found{0};
        std::atomic<size_t> risk_matches{0};
        std::atomic<size_t> assets_scanned{0};
    };
    const Stats &stats() const { return stats_; }

    unsigned int num_threads() const { return num_threads_; }

private:

    EngineConfig config_;
    CancellationToken token_;
    RiskScanner scanner_;
    unsigned int num_threads_;
    Stats stats_;

    // Thread synchronization
    std::mutex output_mutex_;
    std::atomic<size_t> processed_{0};

    // Check if path should be ignored
    bool should_ignore(const fs::path &relative) const;

    // Unknown-language document the risk scanner recognizes
    bool is_asset(const Document &doc) const;

    // Normalize paths and reject duplicates
    std::vector<Document> validate(const std::vector<Document> &documents) const;

    // Worker function for thread pool
    void worker_extract(const std::vector<Document> &documents, size_t start_idx, size_t end_idx,
                        IndexResult &all, std::mutex &result_mutex);
};

} // namespace devguard
