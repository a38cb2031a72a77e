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
#include <cstddef>
#include <deque>
#include <expected>
#include <filesystem>
#include <set>
#include <vector>

namespace tierone::unpack {

// Where the resolver writes the contents of archives found in the workspace
enum class nesting_mode {
    // Next to the archive inside the workspace, so archives nested at any
    // depth are found by the following scan. Payload reaches the
    // destination through relocate().
    in_workspace,
    // Straight into the destination folder. Archives that land there are
    // left as they are.
    to_destination
};

struct resolve_options {
    nesting_mode nesting = nesting_mode::in_workspace;
    size_t max_passes = 64;
};

struct resolve_report {
    size_t passes = 0;      // Scans of the workspace, the final empty one included
    size_t extracted = 0;
    size_t failed = 0;
    std::vector<std::filesystem::path> residual;  // Core archives that could not be deleted
    bool pass_limit_hit = false;
};

// Extracts core archives found in a workspace until none are left
class resolver {
private:
    file_system& fs_;
    extractor& extractor_;
    resolve_options options_;

    [[nodiscard]] std::expected<std::deque<std::filesystem::path>, error>
        scan(const std::filesystem::path& working_dir,
             const std::set<std::filesystem::path>& residual) const;

    [[nodiscard]] std::filesystem::path target_for(const std::filesystem::path& archive,
                                                   const std::filesystem::path& destination_dir) const;

public:
    resolver(file_system& fs, extractor& ex, resolve_options options = {})
        : fs_(fs), extractor_(ex), options_(options) {}

    // Fails only when working_dir cannot be listed
    [[nodiscard]] std::expected<resolve_report, error> resolve(const std::filesystem::path& working_dir,
                                                               const std::filesystem::path& destination_dir);

    [[nodiscard]] const resolve_options& options() const noexcept { return options_; }
};

} // namespace tierone::unpack
