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
 * tierone-unpack - Unpacks every archive of a folder into its own output folder.
 *
 * Usage: ./tierone-unpack -f <folder> -o <output> [-t <tmp_dir>] [-n <num_files>]
 *
 * Features:
 * - Multi-part archives: only the core part (.rar, .zip, .7z, .7z.001) is extracted
 * - Nested archives are extracted until none are left
 * - Split segments and archives never reach the output folder
 * - Archives whose output folder exists are skipped, so runs can be resumed
 * - Ctrl-C stops after the archive being processed
 */

#include <tierone/unpack/unpack.hpp>
#include <csignal>
#include <filesystem>
#include <print>
#include <string_view>
#include <vector>

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_interrupt(int) {
    interrupted = 1;
    // A second Ctrl-C terminates immediately
    std::signal(SIGINT, SIG_DFL);
}

std::filesystem::path absolute_or_same(const std::filesystem::path& path) {
    std::error_code ec;
    auto result = std::filesystem::absolute(path, ec);
    return ec ? path : result;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace tierone::unpack;

    const std::vector<std::string_view> args(argv + 1, argv + argc);
    auto options = parse_command_line(args);
    if (!options) {
        std::println(stderr, "{}\n", options.error().message());
        std::print(stderr, "{}", usage(argv[0]));
        return 2;
    }
    if (options->show_help) {
        std::print("{}", usage(argv[0]));
        return 0;
    }

    set_log_level(options->verbosity);

    auto& batch = options->batch;
    batch.source_dir = absolute_or_same(batch.source_dir);
    batch.destination_root = absolute_or_same(batch.destination_root);
    batch.workspace_dir = absolute_or_same(batch.workspace_dir);
    batch.stop_requested = [] { return interrupted != 0; };

    std::signal(SIGINT, on_interrupt);

    auto report = unpack_folder(batch, options->tools);
    if (!report) {
        std::println(stderr, "[ERROR] {}", report.error().message());
        return 1;
    }

    log_info("Done. Processed {} archives.", report->processed);
    std::println("\nExtraction complete:");
    std::println("  Archives processed: {}", report->processed);
    std::println("  Archives skipped: {}", report->skipped);
    std::println("  Archives failed: {}", report->failed);
    if (report->interrupted) {
        std::println("  Stopped by interrupt");
    }

    return 0;
}
