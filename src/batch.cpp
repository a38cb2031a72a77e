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

#include <tierone/unpack/batch.hpp>
#include <tierone/unpack/archive_name.hpp>
#include <tierone/unpack/log.hpp>
#include <tierone/unpack/relocator.hpp>
#include <map>
#include <set>
#include <string>

namespace tierone::unpack {

namespace fs = std::filesystem;

auto batch_runner::validate(const batch_options &options) -> std::expected<void, error> {
    if (options.source_dir.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "Source folder is required"});
    }
    if (options.destination_root.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "Output folder is required"});
    }
    if (options.workspace_dir.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "Temporary folder is required"});
    }
    if (options.resolve.max_passes == 0) {
        return std::unexpected(error{error_code::invalid_argument, "Resolver pass limit must be positive"});
    }
    if (!fs_.is_directory(options.source_dir)) {
        return std::unexpected(error{error_code::not_found,
            "Source folder does not exist: " + options.source_dir.string()});
    }

    // The workspace is wiped before every archive, so it must not overlap
    // the source or any output folder in either direction
    if (detail::is_within(options.source_dir, options.workspace_dir) ||
        detail::is_within(options.destination_root, options.workspace_dir)) {
        return std::unexpected(error{error_code::invalid_argument,
            "Temporary folder " + options.workspace_dir.string() +
            " must not contain the source or output folder"});
    }
    if (detail::is_within(options.workspace_dir, options.source_dir) ||
        detail::is_within(options.workspace_dir, options.destination_root)) {
        return std::unexpected(error{error_code::invalid_argument,
            "Temporary folder " + options.workspace_dir.string() +
            " must not lie inside the source or output folder"});
    }

    return fs_.create_directories(options.destination_root);
}

auto batch_runner::collect_archives(const fs::path &source_dir) const
    -> std::expected<std::vector<fs::path>, error> {
    auto files = fs_.list_files(source_dir, false);
    if (!files) {
        return std::unexpected(files.error());
    }

    std::vector<fs::path> archives;
    std::set<std::string> families;
    std::map<std::string, size_t> segments;

    for (const auto& file : *files) {
        const auto name = file.filename().string();
        switch (classify(name)) {
            case archive_role::core:
                archives.push_back(file);
                families.insert(family_key(name));
                break;
            case archive_role::segment:
                ++segments[family_key(name)];
                break;
            case archive_role::non_archive:
                break;
        }
    }

    for (const auto& [family, count] : segments) {
        if (families.contains(family)) {
            log_debug("Family {}: {} split segment(s)", family, count);
        } else {
            log_info("Ignoring {} stray segment(s) of {}", count, family);
        }
    }

    return archives;
}

void batch_runner::clear_workspace(const fs::path &workspace_dir) {
    if (auto removed = fs_.remove_all(workspace_dir); !removed) {
        log_debug("Leaving {} behind: {}", workspace_dir.string(), removed.error().message());
    }
}

bool batch_runner::process_archive(const batch_options &options,
                                   const fs::path &archive,
                                   const fs::path &destination) {
    const auto& workspace = options.workspace_dir;

    if (auto removed = fs_.remove_all(workspace); !removed) {
        log_error("Could not clear {}: {}", workspace.string(), removed.error().message());
        return false;
    }
    if (auto created = fs_.create_directories(workspace); !created) {
        log_error("Could not create {}: {}", workspace.string(), created.error().message());
        return false;
    }
    if (auto created = fs_.create_directories(destination); !created) {
        log_error("Could not create {}: {}", destination.string(), created.error().message());
        return false;
    }

    if (!extractor_.extract(archive, workspace)) {
        // Without this a re-run would take the empty folder as done
        if (auto removed = fs_.remove_all(destination); !removed) {
            log_warning("Could not remove {}: {}", destination.string(), removed.error().message());
        }
        clear_workspace(workspace);
        return false;
    }

    resolver nested{fs_, extractor_, options.resolve};
    auto resolved = nested.resolve(workspace, destination);
    if (!resolved) {
        log_error("Could not scan {}: {}", workspace.string(), resolved.error().message());
        log_warning("{} is incomplete and will be skipped on the next run", destination.string());
        clear_workspace(workspace);
        return false;
    }

    log_debug("Resolved {} nested archive(s) in {} pass(es), {} failed",
              resolved->extracted, resolved->passes, resolved->failed);
    for (const auto& leftover : resolved->residual) {
        log_warning("Archive left in workspace: {}", leftover.string());
    }

    if (auto relocated = relocate(fs_, workspace, destination); !relocated) {
        log_error("Could not collect payload of {}: {}", archive.string(), relocated.error().message());
    } else if (relocated->failed > 0) {
        log_warning("{} file(s) of {} were not moved", relocated->failed, archive.string());
    }

    clear_workspace(workspace);
    return true;
}

auto batch_runner::run(const batch_options &options) -> std::expected<batch_report, error> {
    if (auto valid = validate(options); !valid) {
        return std::unexpected(valid.error());
    }

    auto archives = collect_archives(options.source_dir);
    if (!archives) {
        return std::unexpected(archives.error());
    }

    batch_report report;
    for (const auto& archive : *archives) {
        if (options.max_count && report.processed >= options.max_count) {
            log_info("Reached the limit of {} files to process.", options.max_count);
            report.limit_reached = true;
            break;
        }
        if (options.stop_requested && options.stop_requested()) {
            log_info("Interrupted before {}", archive.filename().string());
            report.interrupted = true;
            break;
        }

        const auto destination = options.destination_root / destination_name(archive.filename().string());
        if (fs_.exists(destination)) {
            log_info("Skipping {}, already processed (folder exists).", archive.filename().string());
            ++report.skipped;
            continue;
        }

        log_info("Processing {} ...", archive.filename().string());
        if (process_archive(options, archive, destination)) {
            ++report.processed;
        } else {
            ++report.failed;
        }
    }

    return report;
}

} // namespace tierone::unpack
