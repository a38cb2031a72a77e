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

#include <tierone/unpack/archive_name.hpp>
#include <tierone/unpack/error.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace tierone::unpack {

// Executables used for each archive format
struct extractor_tools {
    std::string unzip = "unzip";
    std::string unrar = "unrar";
    std::string seven_zip = "7z";
};

// Decompresses one archive into a directory. Implementations create target
// if it is missing and never remove the archive itself.
class extractor {
public:
    virtual ~extractor() = default;

    [[nodiscard]] virtual std::expected<void, error> extract_zip(const std::filesystem::path& archive,
                                                                 const std::filesystem::path& target) = 0;
    [[nodiscard]] virtual std::expected<void, error> extract_rar(const std::filesystem::path& archive,
                                                                 const std::filesystem::path& target) = 0;

    // 7z and anything else, including the .7z.001 entry of a split 7z
    [[nodiscard]] virtual std::expected<void, error> extract_generic(const std::filesystem::path& archive,
                                                                     const std::filesystem::path& target) = 0;

    // Pick the method from the archive name. Failures are logged here, so
    // callers only decide whether to go on.
    [[nodiscard]] std::expected<void, error> extract(const std::filesystem::path& archive,
                                                     const std::filesystem::path& target);
};

// argv for extracting archive into target with the given tool
[[nodiscard]] std::vector<std::string> build_command(const extractor_tools& tools,
                                                     archive_tool tool,
                                                     const std::filesystem::path& archive,
                                                     const std::filesystem::path& target);

// Runs unzip, unrar or 7z as a child process
class command_extractor : public extractor {
private:
    extractor_tools tools_;

    [[nodiscard]] std::expected<void, error> run(archive_tool tool,
                                                 const std::filesystem::path& archive,
                                                 const std::filesystem::path& target) const;

public:
    explicit command_extractor(extractor_tools tools = {})
        : tools_(std::move(tools)) {}

    [[nodiscard]] std::expected<void, error> extract_zip(const std::filesystem::path& archive,
                                                         const std::filesystem::path& target) override;
    [[nodiscard]] std::expected<void, error> extract_rar(const std::filesystem::path& archive,
                                                         const std::filesystem::path& target) override;
    [[nodiscard]] std::expected<void, error> extract_generic(const std::filesystem::path& archive,
                                                             const std::filesystem::path& target) override;

    [[nodiscard]] const extractor_tools& tools() const noexcept { return tools_; }
};

} // namespace tierone::unpack
