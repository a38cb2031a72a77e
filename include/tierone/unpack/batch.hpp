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
#include <tierone/unpack/extractor.hpp>
#include <tierone/unpack/file_system.hpp>
#include <tierone/unpack/resolver.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <vector>

namespace tierone::unpack {

inline constexpr const char* default_workspace_dir = "/tmp/unpack_folder";

struct batch_options {
    std::filesystem::path source_dir;
    std::filesystem::path destination_root;
    std::filesystem::path workspace_dir = default_workspace_dir;
    size_t max_count = 0;  // 0 means no limit
    resolve_options resolve;
    // Polled between top-level archives; returning true ends the run
    std::function<bool()> stop_requested;
};

struct batch_report {
    size_t processed = 0;
    size_t skipped = 0;   // Destination folder already present
    size_t failed = 0;    // Top-level extraction or nested scan failed
    bool limit_reached = false;
    bool interrupted = false;
};

// Unpacks each core archive of a source directory into its own folder
// below the destination root, one archive at a time.
class batch_runner {
private:
    file_system& fs_;
    extractor& extractor_;

    [[nodiscard]] std::expected<void, error> validate(const batch_options& options);

    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, error>
        collect_archives(const std::filesystem::path& source_dir) const;

    // Run the pipeline for one archive; false when it could not be unpacked or its workspace scanned
    [[nodiscard]] bool process_archive(const batch_options& options,
                                       const std::filesystem::path& archive,
                                       const std::filesystem::path& destination);

    void clear_workspace(const std::filesystem::path& workspace_dir);

public:
    batch_runner(file_system& fs, extractor& ex)
        : fs_(fs), extractor_(ex) {}

    // Errors are configuration problems found before anything is extracted
    [[nodiscard]] std::expected<batch_report, error> run(const batch_options& options);
};

} // namespace tierone::unpack
