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

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <memory>
#include <mutex>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/generator.h"

namespace longid::id {

// A generator shared by the whole process, for applications that want every
// caller to draw from one sequence space.
class SharedGenerator {
   private:
    // singleton instance - constructor protector
    SharedGenerator();
    // singleton instance - destructor protector
    ~SharedGenerator();

    static SharedGenerator* instance;

    // guards instance
    static std::mutex mutex;

    std::unique_ptr<IdGenerator> generator;

   public:
    // singleton instance - copy blocker
    SharedGenerator(const SharedGenerator&) = delete;

    // singleton instance - assignment blocker
    void operator=(const SharedGenerator&) = delete;

    // Fails with InvalidArgument for a bad server id and with
    // FailedPrecondition if called more than once.
    static absl::Status Init(int64_t server_id);

    // singleton instance - get the generator
    static absl::StatusOr<IdGenerator*> GetInstance();
};

absl::Status init(int64_t server_id);

absl::StatusOr<uint64_t> next_id();

}  // namespace longid::id
