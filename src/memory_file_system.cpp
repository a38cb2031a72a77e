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

#include <tierone/unpack/file_system.hpp>
#include <algorithm>
#include <iterator>

namespace tierone::unpack {

namespace fs = std::filesystem;

memory_file_system::memory_file_system() {
    directories_.insert(fs::path{"/"});
}

void memory_file_system::add_directory_chain(const fs::path &dir) {
    for (auto current = detail::normalize(dir); !current.empty(); current = current.parent_path()) {
        if (!directories_.insert(current).second) break;
        if (current == current.root_path()) break;
    }
}

void memory_file_system::write_file(const fs::path &path, std::string content) {
    const auto key = detail::normalize(path);
    add_directory_chain(key.parent_path());
    files_[key] = std::move(content);
}

auto memory_file_system::read_file(const fs::path &path) const -> std::optional<std::string> {
    if (const auto it = files_.find(detail::normalize(path)); it != files_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void memory_file_system::lock(const fs::path &path) {
    locked_.insert(detail::normalize(path));
}

void memory_file_system::unlock(const fs::path &path) {
    locked_.erase(detail::normalize(path));
}

auto memory_file_system::list_files(const fs::path &dir, const bool recursive) const
    -> std::expected<std::vector<fs::path>, error> {
    const auto base = detail::normalize(dir);
    if (!directories_.contains(base)) {
        return std::unexpected(error{error_code::not_found, "Not a directory: " + dir.string()});
    }

    std::vector<fs::path> result;
    for (const auto& [path, content] : files_) {
        const bool direct_child = path.parent_path() == base;
        if (direct_child || (recursive && detail::is_within(path, base))) {
            result.push_back(path);
        }
    }
    return result;
}

bool memory_file_system::exists(const fs::path &path) const {
    const auto key = detail::normalize(path);
    return files_.contains(key) || directories_.contains(key);
}

bool memory_file_system::is_directory(const fs::path &path) const {
    return directories_.contains(detail::normalize(path));
}

auto memory_file_system::create_directories(const fs::path &path) -> std::expected<void, error> {
    const auto key = detail::normalize(path);
    for (auto current = key; !current.empty(); current = current.parent_path()) {
        if (files_.contains(current)) {
            return std::unexpected(error{error_code::io_error,
                "Failed to create directories " + path.string() + ": not a directory"});
        }
        if (current == current.root_path()) break;
    }
    add_directory_chain(key);
    return {};
}

auto memory_file_system::remove_file(const fs::path &path) -> std::expected<void, error> {
    const auto key = detail::normalize(path);
    if (!files_.contains(key)) {
        return std::unexpected(error{error_code::not_found, "No such file: " + path.string()});
    }
    if (locked_.contains(key)) {
        return std::unexpected(error{error_code::io_error,
            "Failed to remove " + path.string() + ": Permission denied"});
    }
    files_.erase(key);
    return {};
}

auto memory_file_system::remove_all(const fs::path &path) -> std::expected<void, error> {
    const auto key = detail::normalize(path);
    std::erase_if(files_, [&key](const auto& item) { return detail::is_within(item.first, key); });
    std::erase_if(directories_, [&key](const auto& dir) {
        return detail::is_within(dir, key) && dir != dir.root_path();
    });
    return {};
}

auto memory_file_system::move_file(const fs::path &from, const fs::path &to) -> std::expected<void, error> {
    const auto source = detail::normalize(from);
    const auto target = detail::normalize(to);

    const auto it = files_.find(source);
    if (it == files_.end()) {
        return std::unexpected(error{error_code::not_found, "No such file: " + from.string()});
    }
    if (exists(target)) {
        return std::unexpected(error{error_code::already_exists,
            "Destination path already exists: " + to.string()});
    }
    if (!directories_.contains(target.parent_path())) {
        return std::unexpected(error{error_code::not_found,
            "No such directory: " + target.parent_path().string()});
    }

    files_.emplace(target, std::move(it->second));
    files_.erase(it);
    return {};
}

} // namespace tierone::unpack
