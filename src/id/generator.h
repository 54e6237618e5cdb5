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

#include "src/id/clock.h"

namespace longid::id {

// Generates 64-bit ids made of the current millisecond, a per-millisecond
// sequence and the server id of the instance.
//
// Ids from one instance never repeat and never decrease as long as the clock
// does not move backwards. Ids from instances with distinct server ids never
// collide. Two instances sharing a server id may issue the same id within a
// millisecond, so keep one instance per server id.
//
// At most 256 ids are issued per millisecond. Once the sequence is exhausted
// Next() sleeps for a millisecond and tries again, holding the instance lock,
// so every caller waits until the clock moves on.
class IdGenerator {
   public:
    // Fails with InvalidArgument if `server_id` is outside [0, 4095].
    static absl::StatusOr<std::unique_ptr<IdGenerator>> Create(
        int64_t server_id = 0);

    static absl::StatusOr<std::unique_ptr<IdGenerator>> Create(
        int64_t server_id, std::shared_ptr<Clock> clock);

    // copy blocker
    IdGenerator(const IdGenerator&) = delete;

    // assignment blocker
    void operator=(const IdGenerator&) = delete;

    uint64_t Next();

    uint16_t server_id() const { return server_id_; }

   private:
    IdGenerator(uint16_t server_id, std::shared_ptr<Clock> clock);

    const uint16_t server_id_;
    std::shared_ptr<Clock> clock_;

    // guards last_timestamp_ms_ and sequence_
    std::mutex mutex_;

    uint64_t last_timestamp_ms_ = 0;

    // number of ids already issued within last_timestamp_ms_, minus one
    uint32_t sequence_ = 0;
};

}  // namespace longid::id
