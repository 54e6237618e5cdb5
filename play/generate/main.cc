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

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/time/time.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/decoder.h"
#include "src/id/generator.h"

int main() {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");

    auto generator = longid::id::IdGenerator::Create(99);
    if (!generator.ok()) {
        SPDLOG_ERROR("failed to create generator: {}",
                     generator.status().ToString());
        return 1;
    }

    for (int i = 0; i < 3; ++i) {
        uint64_t id = generator.value()->Next();

        auto components = longid::id::decompose(id);
        auto time = longid::id::extract_time(id);
        if (!components.ok() || !time.ok()) {
            SPDLOG_ERROR("failed to decode id {}", id);
            return 1;
        }

        SPDLOG_INFO("id: {}, hex: {}, time: {}, sequence: {}, server id: {}",
                    id, longid::id::to_hex(id),
                    absl::FormatTime(time.value(), absl::UTCTimeZone()),
                    components->sequence, components->server_id);
    }

    // values below 2^20 cannot be decoded
    auto malformed = longid::id::extract_timestamp(0);
    SPDLOG_INFO("decoding 0: {}", malformed.status().ToString());

    return 0;
}
