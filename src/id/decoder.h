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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"
#include "absl/time/time.h"

namespace longid::id {

class Components {
   public:
    // milliseconds since the Unix epoch
    uint64_t timestamp_ms;
    uint8_t sequence;
    uint16_t server_id;

    bool operator==(const Components& other) const = default;
};

// Pack the three fields into an id. Fails with InvalidArgument if a field
// does not fit its width.
absl::StatusOr<uint64_t> compose(uint64_t timestamp_ms, uint32_t sequence,
                                 uint32_t server_id);

// The extract functions below work on any id, not only the ones produced by
// this process. They all fail with MalformedId (see is_malformed_id()) if
// `id` is shorter than kMinIdBits.

absl::StatusOr<uint64_t> extract_timestamp(uint64_t id);

absl::StatusOr<absl::Time> extract_time(uint64_t id);

absl::StatusOr<uint8_t> extract_sequence(uint64_t id);

absl::StatusOr<uint16_t> extract_server_id(uint64_t id);

absl::StatusOr<Components> decompose(uint64_t id);

// Hex digits of the three fields separated by '-', e.g.
// "18f1a2b3c4d-01-063". Debugging only, no validation.
std::string to_hex(uint64_t id);

}  // namespace longid::id
