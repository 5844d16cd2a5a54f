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
#include <filesystem>
#include <functional>
#include <string>

namespace pageorg {

// Path of a user supplied file (source or export destination)
#define file_path_t      std::filesystem::path

// Identity of a page entry, unique for the lifetime of the session
#define page_id_t        uint64_t

// Identity of a registered source document
#define source_id_t      uint32_t

// 0-based page index inside a source document
#define page_index_t     uint32_t

// Key of a resident thumbnail, see RenderKey
#define render_hash_t    uint64_t

// Hands a closure over to the coordinating context
using CallbackDispatcher = std::function<void(std::function<void()>)>;
};  // namespace pageorg
