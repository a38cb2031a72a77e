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

#include <tierone/unpack/relocator.hpp>
#include <tierone/unpack/archive_name.hpp>
#include <tierone/unpack/log.hpp>

namespace tierone::unpack {

namespace fs = std::filesystem;

auto relocate(file_system &storage, const fs::path &working_dir, const fs::path &destination_dir)
    -> std::expected<relocate_report, error> {
    auto files = storage.list_files(working_dir, true);
    if (!files) {
        return std::unexpected(files.error());
    }

    if (auto created = storage.create_directories(destination_dir); !created) {
        return std::unexpected(created.error());
    }

    relocate_report report;
    for (const auto& file : *files) {
        const std::string name = file.filename().string();

        if (is_split_segment(name)) {
            log_debug("Skipping multi-part segment: {}", file.string());
            ++report.skipped_segments;
            continue;
        }

        if (is_core(name)) {
            log_info("Skipping core archive: {}", file.string());
            ++report.skipped_archives;
            continue;
        }

        const auto target = destination_dir / file.filename();
        log_debug("Moving file: {} to {}", file.string(), target.string());
        if (auto moved = storage.move_file(file, target); !moved) {
            log_error("Could not move {}: {}", file.string(), moved.error().message());
            ++report.failed;
            continue;
        }
        ++report.moved;
    }

    return report;
}

} // namespace tierone::unpack
