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

#include <stdexcept>
#include <string>

namespace devguard {

// Base of every error the core raises. Per-file parse failures and
// unresolved references are recorded as data instead.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Malformed ingestion batch; the batch is rejected as a whole
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string &what) : Error(what) {}
};

// Simulation target (or looked-up symbol) is not in the snapshot
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string &what) : Error(what) {}
};

// A traversal or detector pass was aborted by the caller
class CancelledError : public Error {
public:
    CancelledError() : Error("operation cancelled") {}
};

// Bad configuration file or value
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string &what) : Error(what) {}
};

} // namespace devguard
