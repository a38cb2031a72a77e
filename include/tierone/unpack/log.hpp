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

#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace tierone::unpack {

enum class log_level : int {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

void set_log_level(log_level level) noexcept;
[[nodiscard]] log_level current_log_level() noexcept;

[[nodiscard]] inline bool log_enabled(const log_level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(current_log_level());
}

// Status lines: debug/info go to stdout, warning/error to stderr
template<typename... Args>
void log_debug(std::format_string<Args...> fmt, Args&&... args) {
    if (!log_enabled(log_level::debug)) return;
    std::println("[DEBUG] {}", std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(std::format_string<Args...> fmt, Args&&... args) {
    if (!log_enabled(log_level::info)) return;
    std::println("[INFO] {}", std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warning(std::format_string<Args...> fmt, Args&&... args) {
    if (!log_enabled(log_level::warning)) return;
    std::println(stderr, "[WARNING] {}", std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(std::format_string<Args...> fmt, Args&&... args) {
    if (!log_enabled(log_level::error)) return;
    std::println(stderr, "[ERROR] {}", std::format(fmt, std::forward<Args>(args)...));
}

} // namespace tierone::unpack
