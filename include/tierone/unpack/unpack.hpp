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
#include <tierone/unpack/log.hpp>
#include <tierone/unpack/archive_name.hpp>
#include <tierone/unpack/file_system.hpp>
#include <tierone/unpack/process.hpp>
#include <tierone/unpack/extractor.hpp>
#include <tierone/unpack/resolver.hpp>
#include <tierone/unpack/relocator.hpp>
#include <tierone/unpack/batch.hpp>
#include <tierone/unpack/options.hpp>

namespace tierone::unpack {

// Main convenience API: run a batch on the local disk with external tools
[[nodiscard]] std::expected<batch_report, error> unpack_folder(const batch_options& options,
                                                               const extractor_tools& tools = {});

} // namespace tierone::unpack
