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

#include <tierone/unpack/unpack.hpp>

namespace tierone::unpack {

auto unpack_folder(const batch_options &options, const extractor_tools &tools) -> std::expected<batch_report, error> {
    local_file_system disk;
    command_extractor tool_runner{tools};
    return batch_runner{disk, tool_runner}.run(options);
}

} // namespace tierone::unpack
