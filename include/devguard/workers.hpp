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

#include <thread>
#include <vector>

namespace devguard {

// Joins every started thread on scope exit, also when a later thread in
// the same launch loop fails to start
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread> &threads) : threads_(threads) {}
    ~ThreadJoiner() { join(); }

    ThreadJoiner(const ThreadJoiner &) = delete;
    ThreadJoiner &operator=(const ThreadJoiner &) = delete;

    void join() {
        for (auto &t : threads_) {
            if (t.joinable())
                t.join();
        }
    }

private:
    std::vector<std::thread> &threads_;
};

} // namespace devguard
