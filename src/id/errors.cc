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
#include "absl/strings/str_format.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/errors.h"

namespace longid::id {

absl::Status invalid_server_id_error(int64_t server_id) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "server id must be in the range 0-%d, got %d", kMaxServerId,
        server_id));
}

absl::Status malformed_id_error(uint64_t id) {
    return absl::OutOfRangeError(absl::StrFormat(
        "input is too short to be an id: %#x needs at least %d bits", id,
        kMinIdBits));
}

bool is_malformed_id(const absl::Status& status) {
    return absl::IsOutOfRange(status);
}

}  // namespace longid::id
