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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tierone/unpack/options.hpp>
#include <filesystem>
#include <string_view>
#include <vector>

using namespace tierone::unpack;
namespace fs = std::filesystem;

namespace {

auto parse(std::vector<std::string_view> args) {
    return parse_command_line(args);
}

} // anonymous namespace

TEST_CASE("parse_command_line reads the documented options", "[unit][options]") {
    SECTION("Required options with defaults") {
        auto options = parse({"--folder", "/data/in", "--output", "/data/out"});
        REQUIRE(options.has_value());
        CHECK(options->batch.source_dir == fs::path{"/data/in"});
        CHECK(options->batch.destination_root == fs::path{"/data/out"});
        CHECK(options->batch.workspace_dir == fs::path{"/tmp/unpack_folder"});
        CHECK(options->batch.max_count == 0);
        CHECK(options->batch.resolve.nesting == nesting_mode::in_workspace);
        CHECK(options->batch.resolve.max_passes == 64);
        CHECK(options->tools.unzip == "unzip");
        CHECK(options->tools.unrar == "unrar");
        CHECK(options->tools.seven_zip == "7z");
        CHECK(options->verbosity == log_level::info);
        CHECK_FALSE(options->show_help);
    }

    SECTION("Short forms") {
        auto options = parse({"-f", "in", "-o", "out", "-t", "/scratch", "-n", "5", "-v"});
        REQUIRE(options.has_value());
        CHECK(options->batch.source_dir == fs::path{"in"});
        CHECK(options->batch.destination_root == fs::path{"out"});
        CHECK(options->batch.workspace_dir == fs::path{"/scratch"});
        CHECK(options->batch.max_count == 5);
        CHECK(options->verbosity == log_level::debug);
    }

    SECTION("Inline values and extras") {
        auto options = parse({"--folder=in", "--output=out", "--num_files=12", "--max-passes=3",
                              "--legacy-nesting", "--unzip=/opt/unzip", "--unrar", "/opt/unrar",
                              "--7z=7zz", "-q"});
        REQUIRE(options.has_value());
        CHECK(options->batch.max_count == 12);
        CHECK(options->batch.resolve.max_passes == 3);
        CHECK(options->batch.resolve.nesting == nesting_mode::to_destination);
        CHECK(options->tools.unzip == "/opt/unzip");
        CHECK(options->tools.unrar == "/opt/unrar");
        CHECK(options->tools.seven_zip == "7zz");
        CHECK(options->verbosity == log_level::warning);
    }

    SECTION("Option-like values can be given inline") {
        auto options = parse({"--folder=-incoming", "-o", "-"});
        REQUIRE(options.has_value());
        CHECK(options->batch.source_dir == fs::path{"-incoming"});
        CHECK(options->batch.destination_root == fs::path{"-"});
    }

    SECTION("Help needs nothing else") {
        auto options = parse({"-h"});
        REQUIRE(options.has_value());
        CHECK(options->show_help);
    }
}

TEST_CASE("parse_command_line rejects bad input", "[unit][options]") {
    auto expect_error = [](std::vector<std::string_view> args, std::string_view fragment) {
        auto options = parse(std::move(args));
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code() == error_code::invalid_argument);
        CHECK_THAT(options.error().message(), Catch::Matchers::ContainsSubstring(std::string{fragment}));
    };

    SECTION("Missing folder") {
        expect_error({"--output", "out"}, "--folder");
    }

    SECTION("Missing output") {
        expect_error({"--folder", "in"}, "--output");
    }

    SECTION("Unknown option") {
        expect_error({"-f", "in", "-o", "out", "--fast"}, "--fast");
    }

    SECTION("Positional argument") {
        expect_error({"-f", "in", "-o", "out", "stray"}, "stray");
    }

    SECTION("Missing value") {
        expect_error({"-f", "in", "-o"}, "requires a value");
    }

    SECTION("Another option is not a value") {
        expect_error({"-f", "-o", "out"}, "'-f' requires a value");
        expect_error({"--folder", "--output=out"}, "'--folder' requires a value");
        expect_error({"-f", "in", "-o", "out", "-n", "-1"}, "'-n' requires a value");
    }

    SECTION("Bad counts") {
        expect_error({"-f", "in", "-o", "out", "-n", "many"}, "non-negative integer");
        expect_error({"-f", "in", "-o", "out", "--num_files=-1"}, "non-negative integer");
        expect_error({"-f", "in", "-o", "out", "-n", "3x"}, "non-negative integer");
        expect_error({"-f", "in", "-o", "out", "--max-passes", "0"}, "at least 1");
    }

    SECTION("Flag with a value") {
        expect_error({"-f", "in", "-o", "out", "--verbose=yes"}, "does not take a value");
    }
}

TEST_CASE("usage lists every option", "[unit][options]") {
    const auto text = usage("tierone-unpack");
    for (const auto* option : {"--folder", "--output", "--tmp_dir", "--num_files", "--max-passes",
                               "--legacy-nesting", "--unzip", "--unrar", "--7z", "--verbose",
                               "--quiet", "--help"}) {
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring(option));
    }
    CHECK_THAT(text, Catch::Matchers::StartsWith("Usage: tierone-unpack"));
}
