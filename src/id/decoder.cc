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

#include <bit>
#include <cstdint>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/decoder.h"

namespace longid::id {

namespace {

absl::Status check_id(uint64_t id) {
    if (std::bit_width(id) < kMinIdBits) {
        return malformed_id_error(id);
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<uint64_t> compose(uint64_t timestamp_ms, uint32_t sequence,
                                 uint32_t server_id) {
    if (timestamp_ms > kMaxTimestampMs) {
        return absl::InvalidArgumentError(
            absl::StrFormat("timestamp must be in the range 0-%d, got %d",
                            kMaxTimestampMs, timestamp_ms));
    }
    if (sequence > kMaxSequence) {
        return absl::InvalidArgumentError(
            absl::StrFormat("sequence must be in the range 0-%d, got %d",
                            kMaxSequence, sequence));
    }
    if (server_id > kMaxServerId) {
        return invalid_server_id_error(server_id);
    }

    return (timestamp_ms << kTimestampShift) |
           (static_cast<uint64_t>(sequence) << kSequenceShift) |
           static_cast<uint64_t>(server_id);
}

absl::StatusOr<uint64_t> extract_timestamp(uint64_t id) {
    absl::Status status = check_id(id);
    if (!status.ok()) {
        return status;
    }
    return id >> kTimestampShift;
}

absl::StatusOr<absl::Time> extract_time(uint64_t id) {
    auto timestamp_ms = extract_timestamp(id);
    if (!timestamp_ms.ok()) {
        return timestamp_ms.status();
    }
    return absl::FromUnixMillis(static_cast<int64_t>(timestamp_ms.value()));
}

absl::StatusOr<uint8_t> extract_sequence(uint64_t id) {
    absl::Status status = check_id(id);
    if (!status.ok()) {
        return status;
    }
    return static_cast<uint8_t>((id >> kSequenceShift) & kSequenceMask);
}

absl::StatusOr<uint16_t> extract_server_id(uint64_t id) {
    absl::Status status = check_id(id);
    if (!status.ok()) {
        return status;
    }
    return static_cast<uint16_t>(id & kServerIdMask);
}

absl::StatusOr<Components> decompose(uint64_t id) {
    absl::Status status = check_id(id);
    if (!status.ok()) {
        return status;
    }
    return Components{
        .timestamp_ms = id >> kTimestampShift,
        .sequence = static_cast<uint8_t>((id >> kSequenceShift) & kSequenceMask),
        .server_id = static_cast<uint16_t>(id & kServerIdMask),
    };
}

std::string to_hex(uint64_t id) {
    return absl::StrFormat("%011x-%02x-%03x", id >> kTimestampShift,
                           (id >> kSequenceShift) & kSequenceMask,
                           id & kServerIdMask);
}

}  // namespace longid::id
