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

#include "errors.hpp"
#include <atomic>
#include <memory>

namespace devguard {

// Shared cancellation flag. Copies observe the same flag, so a caller can
// keep one copy and hand another to a long-running query.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_relaxed); }

    bool cancelled() const { return flag_->load(std::memory_order_relaxed); }

    // Called between node visits
    void check() const {
        if (cancelled())
            throw CancelledError();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace devguard
