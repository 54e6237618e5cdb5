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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/clock.h"

namespace longid::test {

// A clock that only moves when told to.
//
// With `advance_after_sleeps` > 0 the clock moves forward by one millisecond
// every `advance_after_sleeps` calls to SleepFor(). With 0 it never moves on
// its own, and SleepFor() only yields the thread for the requested duration.
class FakeClock : public longid::id::Clock {
   public:
    explicit FakeClock(uint64_t now_ms, int advance_after_sleeps = 0)
        : now_ms_(now_ms), advance_after_sleeps_(advance_after_sleeps) {}

    uint64_t NowMillis() override { return now_ms_.load(); }

    void SleepFor(std::chrono::milliseconds duration) override {
        int sleeps = ++sleeps_;
        if (advance_after_sleeps_ > 0 && sleeps % advance_after_sleeps_ == 0) {
            Advance(1);
        }
        std::this_thread::sleep_for(duration);
    }

    void Advance(uint64_t ms) { now_ms_ += ms; }

    void Set(uint64_t now_ms) { now_ms_ = now_ms; }

    int sleeps() const { return sleeps_.load(); }

   private:
    std::atomic<uint64_t> now_ms_;
    std::atomic<int> sleeps_{0};
    const int advance_after_sleeps_;
};

}  // namespace longid::test
