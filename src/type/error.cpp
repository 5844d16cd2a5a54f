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

#include "type/error.hpp"

namespace pageorg {
auto ErrorCodeName(OrganizerErrorCode code) -> const char* {
  switch (code) {
    case OrganizerErrorCode::INVALID_SELECTION:
      return "InvalidSelection";
    case OrganizerErrorCode::SOURCE_OPEN_FAILURE:
      return "SourceOpenFailure";
    case OrganizerErrorCode::RENDER_FAILURE:
      return "RenderFailure";
    case OrganizerErrorCode::EXPORT_FAILURE:
      return "ExportFailure";
    case OrganizerErrorCode::INVALID_CONFIG:
      return "InvalidConfig";
    case OrganizerErrorCode::UNKNOWN:
      break;
  }
  return "Unknown";
}
};  // namespace pageorg
