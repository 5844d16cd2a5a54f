//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pageorg {
enum class OrganizerErrorCode : uint8_t {
  UNKNOWN = 0,
  INVALID_SELECTION,
  SOURCE_OPEN_FAILURE,
  RENDER_FAILURE,
  EXPORT_FAILURE,
  INVALID_CONFIG
};

auto ErrorCodeName(OrganizerErrorCode code) -> const char*;

class OrganizerError : public std::runtime_error {
 public:
  OrganizerError(OrganizerErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto Code() const noexcept -> OrganizerErrorCode { return code_; }

 private:
  OrganizerErrorCode code_;
};
};  // namespace pageorg
