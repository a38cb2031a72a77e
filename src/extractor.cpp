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

#include <tierone/unpack/extractor.hpp>
#include <tierone/unpack/log.hpp>
#include <tierone/unpack/process.hpp>
#include <system_error>

namespace tierone::unpack {

namespace fs = std::filesystem;

auto extractor::extract(const fs::path &archive, const fs::path &target) -> std::expected<void, error> {
    const auto tool = select_tool(archive.filename().string());
    log_info("Extracting {} ...", archive.string());
    log_debug("Using {} into {}", to_string(tool), target.string());

    std::expected<void, error> result;
    switch (tool) {
        case archive_tool::zip:
            result = extract_zip(archive, target);
            break;
        case archive_tool::rar:
            result = extract_rar(archive, target);
            break;
        case archive_tool::generic:
            result = extract_generic(archive, target);
            break;
    }

    if (!result) {
        log_error("Extraction failed for {}: {}", archive.string(), result.error().message());
    }
    return result;
}

std::vector<std::string> build_command(const extractor_tools& tools,
                                       const archive_tool tool,
                                       const fs::path& archive,
                                       const fs::path& target) {
    switch (tool) {
        case archive_tool::zip:
            return {tools.unzip, "-o", archive.string(), "-d", target.string()};
        case archive_tool::rar:
            // unrar treats the destination as a directory only with a trailing separator
            return {tools.unrar, "x", "-o+", archive.string(), (target / "").string()};
        case archive_tool::generic:
            break;
    }
    return {tools.seven_zip, "x", "-y", "-o" + target.string(), archive.string()};
}

auto command_extractor::run(const archive_tool tool, const fs::path &archive, const fs::path &target) const
    -> std::expected<void, error> {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return std::unexpected(io_failure("Failed to create " + target.string(), ec));
    }

    const auto argv = build_command(tools_, tool, archive, target);
    auto result = run_command(argv);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (result->exit_code == command_not_found) {
        return std::unexpected(error{error_code::tool_unavailable,
            "Command not found: " + argv.front()});
    }
    if (!result->succeeded()) {
        std::string message = argv.front() + " exited with status " + std::to_string(result->exit_code);
        if (!result->last_line.empty()) {
            message += " (" + result->last_line + ")";
        }
        return std::unexpected(error{error_code::extraction_failed, std::move(message)});
    }
    return {};
}

auto command_extractor::extract_zip(const fs::path &archive, const fs::path &target) -> std::expected<void, error> {
    return run(archive_tool::zip, archive, target);
}

auto command_extractor::extract_rar(const fs::path &archive, const fs::path &target) -> std::expected<void, error> {
    return run(archive_tool::rar, archive, target);
}

auto command_extractor::extract_generic(const fs::path &archive, const fs::path &target) -> std::expected<void, error> {
    return run(archive_tool::generic, archive, target);
}

} // namespace tierone::unpack
