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
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace tierone::unpack {

struct command_result {
    int exit_code = 0;
    std::string last_line;  // Last non-empty line of combined stdout/stderr

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

// Exit status /bin/sh reports when the program could not be found
inline constexpr int command_not_found = 127;

// Single-quote an argument for /bin/sh
[[nodiscard]] std::string quote_argument(std::string_view argument);

[[nodiscard]] std::string join_command(const std::vector<std::string>& argv);

// Run argv through the shell and block until it exits. Only a failure to
// start or reap the process is an error; a non-zero exit is reported in
// command_result.
[[nodiscard]] std::expected<command_result, error> run_command(const std::vector<std::string>& argv);

} // namespace tierone::unpack
