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

#include <tierone/unpack/resolver.hpp>
#include <tierone/unpack/archive_name.hpp>
#include <tierone/unpack/log.hpp>
#include <algorithm>
#include <iterator>

namespace tierone::unpack {

namespace fs = std::filesystem;

auto resolver::scan(const fs::path &working_dir, const std::set<fs::path> &residual) const
    -> std::expected<std::deque<fs::path>, error> {
    auto files = fs_.list_files(working_dir, true);
    if (!files) {
        return std::unexpected(files.error());
    }

    std::deque<fs::path> worklist;
    std::ranges::copy_if(*files, std::back_inserter(worklist), [&residual](const fs::path& file) {
        return is_core(file.filename().string()) && !residual.contains(file);
    });
    return worklist;
}

fs::path resolver::target_for(const fs::path &archive, const fs::path &destination_dir) const {
    if (options_.nesting == nesting_mode::to_destination) {
        return destination_dir;
    }
    // A directory of its own so the archive cannot be overwritten by its contents
    return archive.parent_path() / (archive.filename().string() + ".contents");
}

auto resolver::resolve(const fs::path &working_dir, const fs::path &destination_dir)
    -> std::expected<resolve_report, error> {
    resolve_report report;
    std::set<fs::path> residual;

    while (true) {
        if (report.passes >= options_.max_passes) {
            report.pass_limit_hit = true;
            log_warning("Stopped resolving {} after {} passes", working_dir.string(), report.passes);
            break;
        }

        auto worklist = scan(working_dir, residual);
        if (!worklist) {
            return std::unexpected(worklist.error());
        }
        ++report.passes;

        if (worklist->empty()) {
            break;
        }
        log_debug("Pass {}: {} archive(s) to extract", report.passes, worklist->size());

        while (!worklist->empty()) {
            const fs::path archive = std::move(worklist->front());
            worklist->pop_front();

            if (extractor_.extract(archive, target_for(archive, destination_dir))) {
                ++report.extracted;
            } else {
                ++report.failed;
            }

            // Consumed either way; a failed archive is not retried
            if (auto removed = fs_.remove_file(archive); !removed) {
                log_warning("Could not delete archive {}: {}", archive.string(), removed.error().message());
                residual.insert(archive);
                report.residual.push_back(archive);
            }
        }
    }

    return report;
}

} // namespace tierone::unpack
