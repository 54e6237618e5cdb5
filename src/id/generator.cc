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

#include <chrono>
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
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/generator.h"

namespace longid::id {

absl::StatusOr<std::unique_ptr<IdGenerator>> IdGenerator::Create(
    int64_t server_id) {
    return Create(server_id, system_clock());
}

absl::StatusOr<std::unique_ptr<IdGenerator>> IdGenerator::Create(
    int64_t server_id, std::shared_ptr<Clock> clock) {
    if (server_id < 0 || server_id > kMaxServerId) {
        SPDLOG_ERROR("invalid server id: {}", server_id);
        return invalid_server_id_error(server_id);
    }
    if (clock == nullptr) {
        return absl::InvalidArgumentError("clock must not be null");
    }

    SPDLOG_INFO("id generator created, server id: {}", server_id);
    return std::unique_ptr<IdGenerator>(
        new IdGenerator(static_cast<uint16_t>(server_id), std::move(clock)));
}

IdGenerator::IdGenerator(uint16_t server_id, std::shared_ptr<Clock> clock)
    : server_id_(server_id), clock_(std::move(clock)) {}

uint64_t IdGenerator::Next() {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_->NowMillis();
    while (true) {
        if (now != last_timestamp_ms_) {
            if (now < last_timestamp_ms_) {
                SPDLOG_WARN(
                    "clock moved backwards from {} to {}, ids may repeat",
                    last_timestamp_ms_, now);
            }
            // new millisecond
            last_timestamp_ms_ = now;
            sequence_ = 0;
            break;
        }

        if (sequence_ >= kMaxSequence) {
            // sequence exhausted, wait for the next millisecond
            SPDLOG_DEBUG("sequence exhausted at {}, server id: {}", now,
                         server_id_);
            clock_->SleepFor(std::chrono::milliseconds(1));
            now = clock_->NowMillis();
            continue;
        }

        ++sequence_;
        break;
    }

    last_timestamp_ms_ = now;

    return ((now & kTimestampMask) << kTimestampShift) |
           (static_cast<uint64_t>(sequence_) << kSequenceShift) |
           static_cast<uint64_t>(server_id_);
}

}  // namespace longid::id
