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

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

namespace longid::id {

// InvalidArgument: the server id is outside [0, kMaxServerId].
absl::Status invalid_server_id_error(int64_t server_id);

// MalformedId: the value is too short to hold the sequence and server id
// fields, so it was not produced by a generator.
//
// Reported with absl::StatusCode::kOutOfRange to keep it apart from
// InvalidArgument.
absl::Status malformed_id_error(uint64_t id);

bool is_malformed_id(const absl::Status& status);

}  // namespace longid::id
