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

namespace longid::id {

// Layout of an id, most significant field first:
//
//   | timestamp (44 bits) | sequence (8 bits) | server id (12 bits) |
//
// In hex this is 11 digits of milliseconds since the Unix epoch, 2 digits of
// sequence and 3 digits of server id.
constexpr int kTimestampBits = 44;
constexpr int kSequenceBits = 8;
constexpr int kServerIdBits = 12;

constexpr int kSequenceShift = kServerIdBits;
constexpr int kTimestampShift = kSequenceBits + kServerIdBits;

constexpr uint64_t kTimestampMask = (uint64_t{1} << kTimestampBits) - 1;
constexpr uint64_t kSequenceMask = (uint64_t{1} << kSequenceBits) - 1;
constexpr uint64_t kServerIdMask = (uint64_t{1} << kServerIdBits) - 1;

constexpr uint64_t kMaxTimestampMs = kTimestampMask;
constexpr uint32_t kMaxSequence = kSequenceMask;
constexpr uint32_t kMaxServerId = kServerIdMask;

// An id must be at least this many bits long to hold a non-empty timestamp
// above the sequence and server id fields.
constexpr int kMinIdBits = kSequenceBits + kServerIdBits + 1;

}  // namespace longid::id
