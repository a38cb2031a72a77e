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
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tierone::unpack {

// The directory operations the extraction pipeline needs. Implementations
// report failures through std::expected and never throw.
class file_system {
public:
    virtual ~file_system() = default;

    // Regular files directly under dir (or anywhere below it when recursive),
    // sorted by path
    [[nodiscard]] virtual std::expected<std::vector<std::filesystem::path>, error>
        list_files(const std::filesystem::path& dir, bool recursive) const = 0;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& path) const = 0;
    [[nodiscard]] virtual bool is_directory(const std::filesystem::path& path) const = 0;

    [[nodiscard]] virtual std::expected<void, error> create_directories(const std::filesystem::path& path) = 0;

    // Remove a single regular file
    [[nodiscard]] virtual std::expected<void, error> remove_file(const std::filesystem::path& path) = 0;

    // Remove path and everything below it; a missing path is not an error
    [[nodiscard]] virtual std::expected<void, error> remove_all(const std::filesystem::path& path) = 0;

    // Move a regular file; fails with already_exists when to is taken
    [[nodiscard]] virtual std::expected<void, error> move_file(const std::filesystem::path& from,
                                                               const std::filesystem::path& to) = 0;
};

// std::filesystem backed implementation
class local_file_system : public file_system {
public:
    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, error>
        list_files(const std::filesystem::path& dir, bool recursive) const override;
    [[nodiscard]] bool exists(const std::filesystem::path& path) const override;
    [[nodiscard]] bool is_directory(const std::filesystem::path& path) const override;
    [[nodiscard]] std::expected<void, error> create_directories(const std::filesystem::path& path) override;
    [[nodiscard]] std::expected<void, error> remove_file(const std::filesystem::path& path) override;
    [[nodiscard]] std::expected<void, error> remove_all(const std::filesystem::path& path) override;
    [[nodiscard]] std::expected<void, error> move_file(const std::filesystem::path& from,
                                                       const std::filesystem::path& to) override;
};

// In-memory tree of files with string contents. Paths are compared after
// lexical normalization, so use absolute paths throughout.
class memory_file_system : public file_system {
private:
    std::map<std::filesystem::path, std::string> files_;
    std::set<std::filesystem::path> directories_;
    std::set<std::filesystem::path> locked_;

    void add_directory_chain(const std::filesystem::path& dir);

public:
    memory_file_system();

    // Create or replace a file, creating its parent directories
    void write_file(const std::filesystem::path& path, std::string content);
    [[nodiscard]] std::optional<std::string> read_file(const std::filesystem::path& path) const;

    // remove_file on a locked path fails, like a file without delete permission
    void lock(const std::filesystem::path& path);
    void unlock(const std::filesystem::path& path);

    [[nodiscard]] size_t file_count() const noexcept { return files_.size(); }

    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, error>
        list_files(const std::filesystem::path& dir, bool recursive) const override;
    [[nodiscard]] bool exists(const std::filesystem::path& path) const override;
    [[nodiscard]] bool is_directory(const std::filesystem::path& path) const override;
    [[nodiscard]] std::expected<void, error> create_directories(const std::filesystem::path& path) override;
    [[nodiscard]] std::expected<void, error> remove_file(const std::filesystem::path& path) override;
    [[nodiscard]] std::expected<void, error> remove_all(const std::filesystem::path& path) override;
    [[nodiscard]] std::expected<void, error> move_file(const std::filesystem::path& from,
                                                       const std::filesystem::path& to) override;
};

namespace detail {

// Lexically normal form without a trailing separator
[[nodiscard]] std::filesystem::path normalize(const std::filesystem::path& path);

// True when path equals base or lies below it (lexical check only). An
// empty base contains nothing.
[[nodiscard]] bool is_within(const std::filesystem::path& path, const std::filesystem::path& base);

} // namespace detail

} // namespace tierone::unpack
