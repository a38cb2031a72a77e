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

#include <tierone/unpack/batch.hpp>
#include <tierone/unpack/error.hpp>
#include <tierone/unpack/extractor.hpp>
#include <tierone/unpack/log.hpp>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace tierone::unpack {

struct run_options {
    batch_options batch;
    extractor_tools tools;
    log_level verbosity = log_level::info;
    bool show_help = false;
};

// Parse the arguments that follow the program name. Both "--name value"
// and "--name=value" are accepted.
[[nodiscard]] std::expected<run_options, error> parse_command_line(std::span<const std::string_view> args);

[[nodiscard]] std::string usage(std::string_view program);

} // namespace tierone::unpack
