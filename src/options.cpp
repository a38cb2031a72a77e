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

#include <tierone/unpack/options.hpp>
#include <charconv>
#include <format>
#include <optional>

namespace tierone::unpack {

namespace {

enum class option_id {
    folder,
    output,
    tmp_dir,
    num_files,
    max_passes,
    legacy_nesting,
    unzip,
    unrar,
    seven_zip,
    verbose,
    quiet,
    help
};

struct option_spec {
    std::string_view long_name;
    char short_name;
    option_id id;
    bool takes_value;
};

constexpr option_spec option_table[] = {
    {"folder", 'f', option_id::folder, true},
    {"output", 'o', option_id::output, true},
    {"tmp_dir", 't', option_id::tmp_dir, true},
    {"num_files", 'n', option_id::num_files, true},
    {"max-passes", '\0', option_id::max_passes, true},
    {"legacy-nesting", '\0', option_id::legacy_nesting, false},
    {"unzip", '\0', option_id::unzip, true},
    {"unrar", '\0', option_id::unrar, true},
    {"7z", '\0', option_id::seven_zip, true},
    {"verbose", 'v', option_id::verbose, false},
    {"quiet", 'q', option_id::quiet, false},
    {"help", 'h', option_id::help, false},
};

const option_spec* find_option(std::string_view arg) {
    for (const auto& spec : option_table) {
        if (arg.size() == 2 && arg[0] == '-' && spec.short_name != '\0' && arg[1] == spec.short_name) {
            return &spec;
        }
        if (arg.starts_with("--") && arg.substr(2) == spec.long_name) {
            return &spec;
        }
    }
    return nullptr;
}

// "-x" or "--name"; a lone "-" is a value
bool looks_like_option(std::string_view arg) {
    return arg.size() > 1 && arg.front() == '-';
}

std::expected<size_t, error> parse_count(std::string_view name, std::string_view text) {
    size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::unexpected(error{error_code::invalid_argument,
            std::format("--{} expects a non-negative integer, got '{}'", name, text)});
    }
    return value;
}

std::expected<void, error> apply(run_options& options, const option_spec& spec, std::string_view value) {
    switch (spec.id) {
        case option_id::folder:
            options.batch.source_dir = value;
            break;
        case option_id::output:
            options.batch.destination_root = value;
            break;
        case option_id::tmp_dir:
            options.batch.workspace_dir = value;
            break;
        case option_id::num_files: {
            auto count = parse_count(spec.long_name, value);
            if (!count) return std::unexpected(count.error());
            options.batch.max_count = *count;
            break;
        }
        case option_id::max_passes: {
            auto count = parse_count(spec.long_name, value);
            if (!count) return std::unexpected(count.error());
            if (*count == 0) {
                return std::unexpected(error{error_code::invalid_argument, "--max-passes must be at least 1"});
            }
            options.batch.resolve.max_passes = *count;
            break;
        }
        case option_id::legacy_nesting:
            options.batch.resolve.nesting = nesting_mode::to_destination;
            break;
        case option_id::unzip:
            options.tools.unzip = value;
            break;
        case option_id::unrar:
            options.tools.unrar = value;
            break;
        case option_id::seven_zip:
            options.tools.seven_zip = value;
            break;
        case option_id::verbose:
            options.verbosity = log_level::debug;
            break;
        case option_id::quiet:
            options.verbosity = log_level::warning;
            break;
        case option_id::help:
            options.show_help = true;
            break;
    }
    return {};
}

} // anonymous namespace

auto parse_command_line(std::span<const std::string_view> args) -> std::expected<run_options, error> {
    run_options options;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        std::optional<std::string_view> inline_value;

        if (arg.starts_with("--")) {
            if (const auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        const option_spec* spec = find_option(arg);
        if (!spec) {
            return std::unexpected(error{error_code::invalid_argument,
                std::format("Unknown option '{}'", args[i])});
        }

        std::string_view value;
        if (spec->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < args.size() && !looks_like_option(args[i + 1])) {
                value = args[++i];
            } else {
                return std::unexpected(error{error_code::invalid_argument,
                    std::format("Option '{}' requires a value", arg)});
            }
        } else if (inline_value) {
            return std::unexpected(error{error_code::invalid_argument,
                std::format("Option '{}' does not take a value", arg)});
        }

        if (auto applied = apply(options, *spec, value); !applied) {
            return std::unexpected(applied.error());
        }
    }

    if (options.show_help) {
        return options;
    }
    if (options.batch.source_dir.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "Missing required option --folder"});
    }
    if (options.batch.destination_root.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "Missing required option --output"});
    }
    return options;
}

std::string usage(std::string_view program) {
    return std::format(
        "Usage: {} -f <folder> -o <output> [options]\n"
        "\n"
        "Unpack zip/rar/7z (including multi-part) archives, skipping secondary\n"
        "parts (e.g. .r01, .z01, .7z.002). Only the main/core archive is extracted.\n"
        "\n"
        "  -f, --folder <dir>     Folder containing archive files (required)\n"
        "  -o, --output <dir>     Output folder, one subfolder per archive (required)\n"
        "  -t, --tmp_dir <dir>    Temporary extraction folder (default: {})\n"
        "  -n, --num_files <n>    Number of archives to process, 0 means no limit\n"
        "      --max-passes <n>   Limit on nested extraction passes (default: {})\n"
        "      --legacy-nesting   Extract nested archives straight into the output\n"
        "      --unzip <exe>      zip extraction program (default: unzip)\n"
        "      --unrar <exe>      rar extraction program (default: unrar)\n"
        "      --7z <exe>         7z extraction program (default: 7z)\n"
        "  -v, --verbose          Print debug lines\n"
        "  -q, --quiet            Print warnings and errors only\n"
        "  -h, --help             Show this help\n",
        program, default_workspace_dir, resolve_options{}.max_passes);
}

} // namespace tierone::unpack
