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

#include "devguard/snapshot.hpp"
#include <algorithm>

namespace devguard {

double Snapshot::coverage() const {
    if (total_files == 0)
        return 1.0;
    size_t parsed = total_files - std::min(total_files, unparsed.size());
    return static_cast<double>(parsed) / static_cast<double>(total_files);
}

SnapshotPtr SnapshotStore::publish(Snapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    snapshot.version = next_version_++;
    auto published = std::make_shared<const Snapshot>(std::move(snapshot));

    current_ = published;
    history_[published->version] = published;
    prune_locked();
    return published;
}

SnapshotPtr SnapshotStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

SnapshotPtr SnapshotStore::get(uint64_t version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(version);
    if (it == history_.end())
        return nullptr;

    SnapshotPtr held = it->second.lock();
    if (!held)
        history_.erase(it);
    return held;
}

std::vector<uint64_t> SnapshotStore::retained_versions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked();

    std::vector<uint64_t> versions;
    for (const auto &[version, weak] : history_)
        versions.push_back(version);
    return versions;
}

uint64_t SnapshotStore::latest_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ ? current_->version : 0;
}

void SnapshotStore::prune_locked() const {
    for (auto it = history_.begin(); it != history_.end();) {
        if (it->second.expired())
            it = history_.erase(it);
        else
            ++it;
    }
}

} // namespace devguard
