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
#include <cerrno>
#include <system_error>

namespace tierone::unpack {

namespace fs = std::filesystem;

namespace detail {

fs::path normalize(const fs::path& path) {
    auto normal = path.lexically_normal();
    if (!normal.has_filename() && normal != normal.root_path() && !normal.empty()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool is_within(const fs::path& path, const fs::path& base) {
    const auto p = normalize(path);
    const auto b = normalize(base);
    if (b.empty()) {
        return false;
    }
    const auto [base_it, path_it] = std::mismatch(b.begin(), b.end(), p.begin(), p.end());
    return base_it == b.end();
}

} // namespace detail

namespace {

template<typename Iterator>
auto collect_files(Iterator it, std::error_code& ec) -> std::vector<fs::path> {
    std::vector<fs::path> files;
    for (const Iterator end{}; !ec && it != end; it.increment(ec)) {
        std::error_code status_ec;
        if (it->is_regular_file(status_ec)) {
            files.push_back(it->path());
        }
    }
    return files;
}

} // anonymous namespace

auto local_file_system::list_files(const fs::path &dir, const bool recursive) const
    -> std::expected<std::vector<fs::path>, error> {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(error{error_code::not_found, "Not a directory: " + dir.string()});
    }

    std::vector<fs::path> files;
    if (recursive) {
        files = collect_files(
            fs::recursive_directory_iterator{dir, fs::directory_options::skip_permission_denied, ec}, ec);
    } else {
        files = collect_files(fs::directory_iterator{dir, ec}, ec);
    }

    if (ec) {
        return std::unexpected(io_failure("Failed to list " + dir.string(), ec));
    }

    std::ranges::sort(files);
    return files;
}

bool local_file_system::exists(const fs::path &path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool local_file_system::is_directory(const fs::path &path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

auto local_file_system::create_directories(const fs::path &path) -> std::expected<void, error> {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return std::unexpected(io_failure("Failed to create directories " + path.string(), ec));
    }
    return {};
}

auto local_file_system::remove_file(const fs::path &path) -> std::expected<void, error> {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        if (ec) {
            return std::unexpected(io_failure("Failed to remove " + path.string(), ec));
        }
        return std::unexpected(error{error_code::not_found, "No such file: " + path.string()});
    }
    return {};
}

auto local_file_system::remove_all(const fs::path &path) -> std::expected<void, error> {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return std::unexpected(io_failure("Failed to remove " + path.string(), ec));
    }
    return {};
}

auto local_file_system::move_file(const fs::path &from, const fs::path &to) -> std::expected<void, error> {
    std::error_code ec;
    if (fs::exists(to, ec)) {
        return std::unexpected(error{error_code::already_exists,
            "Destination path already exists: " + to.string()});
    }

    fs::rename(from, to, ec);
    if (!ec) {
        return {};
    }

    // Workspace and output may live on different devices
    if (ec != std::errc::cross_device_link) {
        return std::unexpected(io_failure("Failed to move " + from.string(), ec));
    }

    ec.clear();
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        return std::unexpected(io_failure("Failed to copy " + from.string(), ec));
    }

    fs::remove(from, ec);
    if (ec) {
        return std::unexpected(io_failure("Copied but failed to remove " + from.string(), ec));
    }
    return {};
}

} // namespace tierone::unpack
