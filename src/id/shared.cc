// Copyright 2025 Xiaochen Cui
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/shared.h"

namespace longid::id {

// Static members definition (must be outside class)
SharedGenerator* SharedGenerator::instance = nullptr;
std::mutex SharedGenerator::mutex;

SharedGenerator::SharedGenerator() = default;

SharedGenerator::~SharedGenerator() = default;

absl::Status SharedGenerator::Init(int64_t server_id) {
    std::lock_guard<std::mutex> lock(mutex);

    if (instance != nullptr) {
        SPDLOG_ERROR("SharedGenerator instance is already initialized");
        return absl::FailedPreconditionError(
            "SharedGenerator instance is already initialized");
    }

    auto generator = IdGenerator::Create(server_id);
    if (!generator.ok()) {
        return generator.status();
    }

    instance = new SharedGenerator();
    instance->generator = std::move(generator.value());
    return absl::OkStatus();
}

absl::StatusOr<IdGenerator*> SharedGenerator::GetInstance() {
    std::lock_guard<std::mutex> lock(mutex);

    if (!instance) {
        return absl::FailedPreconditionError(
            "SharedGenerator instance is not initialized");
    }
    return instance->generator.get();
}

absl::Status init(int64_t server_id) { return SharedGenerator::Init(server_id); }

absl::StatusOr<uint64_t> next_id() {
    auto generator = SharedGenerator::GetInstance();
    if (!generator.ok()) {
        return generator.status();
    }
    return generator.value()->Next();
}

}  // namespace longid::id
