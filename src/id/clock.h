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

#include <chrono>
#include <cstdint>
#include <memory>

namespace longid::id {

// Source of time for a generator.
class Clock {
   public:
    virtual ~Clock() = default;

    // Milliseconds since the Unix epoch.
    virtual uint64_t NowMillis() = 0;

    // Block the calling thread for about `duration`.
    virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

// Wall clock backed by std::chrono::system_clock.
class SystemClock : public Clock {
   public:
    uint64_t NowMillis() override;

    void SleepFor(std::chrono::milliseconds duration) override;
};

std::shared_ptr<Clock> system_clock();

}  // namespace longid::id
