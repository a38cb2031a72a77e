/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <tierone/unpack/error.hpp>
#include <tierone/unpack/file_system.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>

namespace tierone::unpack {

struct relocate_report {
    size_t moved = 0;
    size_t skipped_segments = 0;
    size_t skipped_archives = 0;
    size_t failed = 0;
};

// Move every payload file found below working_dir directly into
// destination_dir, dropping its relative path. Split segments and core
// archives stay behind. A file that cannot be moved is logged and counted;
// the remaining files are still moved.
[[nodiscard]] std::expected<relocate_report, error> relocate(file_system& storage,
                                                             const std::filesystem::path& working_dir,
                                                             const std::filesystem::path& destination_dir);

} // namespace tierone::unpack
