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

/**
 * classify_files - Shows how file names are treated when unpacking.
 *
 * Usage: ./classify_files <name>...
 *
 * Prints, per name: role (core, segment, non-archive), family key,
 * output folder name and the tool that would extract it.
 */

#include <tierone/unpack/archive_name.hpp>
#include <print>
#include <string_view>

int main(int argc, char* argv[]) {
    using namespace tierone::unpack;

    if (argc < 2) {
        std::println(stderr, "Usage: {} <name>...", argv[0]);
        return 1;
    }

    std::println("{:<40} {:<12} {:<24} {:<24} {}", "name", "role", "family", "folder", "tool");
    for (int i = 1; i < argc; ++i) {
        const std::string_view name = argv[i];
        const auto role = classify(name);

        std::println("{:<40} {:<12} {:<24} {:<24} {}",
                     name,
                     to_string(role),
                     family_key(name),
                     role == archive_role::core ? destination_name(name) : "-",
                     role == archive_role::core ? to_string(select_tool(name)) : "-");
    }

    return 0;
}
