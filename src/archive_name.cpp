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

#include <tierone/unpack/archive_name.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>

namespace tierone::unpack {

namespace {

constexpr std::array<std::string_view, 3> core_suffixes{".rar", ".zip", ".7z"};

bool is_digit(const char c) noexcept {
    return c >= '0' && c <= '9';
}

bool all_digits(std::string_view text) noexcept {
    return !text.empty() && std::ranges::all_of(text, is_digit);
}

char lower(const char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool ends_with_nocase(std::string_view text, std::string_view suffix) noexcept {
    if (suffix.size() > text.size()) return false;
    return std::ranges::equal(text.substr(text.size() - suffix.size()), suffix,
                              [](char a, char b) { return lower(a) == lower(b); });
}

// Text after the last '.', empty when there is no dot
std::string_view last_extension(std::string_view file) noexcept {
    const auto dot = file.find_last_of('.');
    return dot == std::string_view::npos ? std::string_view{} : file.substr(dot + 1);
}

// ".NNN"
bool is_numbered_part(std::string_view ext) noexcept {
    return ext.size() == 3 && all_digits(ext);
}

// ".rN", ".rNN", ...
bool is_rar_volume(std::string_view ext) noexcept {
    return ext.size() >= 2 && lower(ext.front()) == 'r' && all_digits(ext.substr(1));
}

// ".zNN"
bool is_zip_volume(std::string_view ext) noexcept {
    return ext.size() == 3 && lower(ext.front()) == 'z' && all_digits(ext.substr(1));
}

bool is_archive_format(std::string_view ext) noexcept {
    return std::ranges::any_of(core_suffixes, [ext](std::string_view suffix) {
        return ext.size() + 1 == suffix.size() && ends_with_nocase(suffix, ext);
    });
}

} // anonymous namespace

bool is_core(std::string_view name) noexcept {
    const auto file = detail::filename_of(name);

    if (std::ranges::any_of(core_suffixes, [file](std::string_view suffix) {
            return ends_with_nocase(file, suffix);
        })) {
        return true;
    }

    return ends_with_nocase(file, ".7z.001");
}

bool is_split_segment(std::string_view name) noexcept {
    const auto file = detail::filename_of(name);
    const auto dot = file.find_last_of('.');
    if (dot == std::string_view::npos) return false;

    // .7z.NNN is a special case of .NNN
    const auto ext = file.substr(dot + 1);
    return is_rar_volume(ext) || is_numbered_part(ext) || is_zip_volume(ext);
}

archive_role classify(std::string_view name) noexcept {
    if (is_core(name)) return archive_role::core;
    if (is_split_segment(name)) return archive_role::segment;
    return archive_role::non_archive;
}

std::string family_key(std::string_view name) {
    auto stem = detail::filename_of(name);

    while (true) {
        const auto ext = last_extension(stem);
        if (ext.empty()) break;
        if (!is_numbered_part(ext) && !is_rar_volume(ext) &&
            !is_zip_volume(ext) && !is_archive_format(ext)) {
            break;
        }

        const auto shorter = stem.substr(0, stem.size() - ext.size() - 1);
        if (shorter.empty()) break;  // ".rar" keeps its name
        stem = shorter;
    }

    return std::string{stem};
}

std::string destination_name(std::string_view name) {
    const auto file = detail::filename_of(name);
    const auto dot = file.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::string{file};
    }
    return std::string{file.substr(0, dot)};
}

archive_tool select_tool(std::string_view name) noexcept {
    const auto file = detail::filename_of(name);
    if (ends_with_nocase(file, ".zip")) return archive_tool::zip;
    if (ends_with_nocase(file, ".rar")) return archive_tool::rar;
    return archive_tool::generic;
}

std::string_view to_string(const archive_role role) noexcept {
    switch (role) {
        case archive_role::core: return "core";
        case archive_role::segment: return "segment";
        case archive_role::non_archive: return "non-archive";
    }
    return "unknown";
}

std::string_view to_string(const archive_tool tool) noexcept {
    switch (tool) {
        case archive_tool::zip: return "zip";
        case archive_tool::rar: return "rar";
        case archive_tool::generic: return "7z";
    }
    return "unknown";
}

} // namespace tierone::unpack
