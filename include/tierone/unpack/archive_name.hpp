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

#include <string>
#include <string_view>

namespace tierone::unpack {

enum class archive_role {
    core,          // Entry point of a (possibly multi-part) archive family
    segment,       // Secondary split part, never extracted or copied
    non_archive    // Payload
};

enum class archive_tool {
    zip,
    rar,
    generic        // 7z, also handles .7z.001 families
};

// All functions below look only at the final path component and compare
// suffixes case-insensitively. None of them touch the filesystem.

// .rar, .zip, .7z and the first part of a split 7z (.7z.001)
[[nodiscard]] bool is_core(std::string_view name) noexcept;

// .rNN, .NNN, .zNN and .7z.NNN
[[nodiscard]] bool is_split_segment(std::string_view name) noexcept;

// core wins over segment, so "x.7z.001" is core
[[nodiscard]] archive_role classify(std::string_view name) noexcept;

// Base name shared by every part of one family ("movie.7z.002" -> "movie")
[[nodiscard]] std::string family_key(std::string_view name);

// Name of the per-archive output folder: the filename minus its last suffix
// ("one.zip" -> "one", "movie.7z.001" -> "movie.7z")
[[nodiscard]] std::string destination_name(std::string_view name);

[[nodiscard]] archive_tool select_tool(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(archive_role role) noexcept;
[[nodiscard]] std::string_view to_string(archive_tool tool) noexcept;

namespace detail {

// Final component of a '/' separated path
[[nodiscard]] constexpr std::string_view filename_of(std::string_view name) noexcept {
    const auto slash = name.find_last_of('/');
    return slash == std::string_view::npos ? name : name.substr(slash + 1);
}

} // namespace detail

} // namespace tierone::unpack
