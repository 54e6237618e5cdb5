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
#include <set>
#include <thread>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// gtest
#include "gtest/gtest.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/decoder.h"
#include "src/id/shared.h"

namespace longid::id {
namespace {

// The singleton lives for the whole process, so its lifecycle is checked in a
// single test.
TEST(SharedGeneratorTest, Lifecycle) {
    EXPECT_TRUE(
        absl::IsFailedPrecondition(SharedGenerator::GetInstance().status()));
    EXPECT_TRUE(absl::IsFailedPrecondition(next_id().status()));

    EXPECT_TRUE(absl::IsInvalidArgument(init(4096)));
    EXPECT_TRUE(absl::IsFailedPrecondition(next_id().status()));

    ASSERT_TRUE(init(17).ok());
    EXPECT_TRUE(absl::IsFailedPrecondition(init(18)));

    auto generator = SharedGenerator::GetInstance();
    ASSERT_TRUE(generator.ok());
    EXPECT_EQ(generator.value()->server_id(), 17);
    EXPECT_EQ(SharedGenerator::GetInstance().value(), generator.value());

    // all callers draw from the same sequence space
    std::vector<std::vector<uint64_t>> per_thread(4);
    std::vector<std::thread> threads;
    for (auto& ids : per_thread) {
        threads.emplace_back([&ids] {
            for (int i = 0; i < 500; ++i) {
                auto id = next_id();
                ASSERT_TRUE(id.ok());
                ids.push_back(id.value());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<uint64_t> unique;
    for (const auto& ids : per_thread) {
        unique.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(unique.size(), 2000);
    EXPECT_EQ(extract_server_id(*unique.begin()).value(), 17);
}

}  // namespace
}  // namespace longid::id
