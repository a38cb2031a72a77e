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
#include <tierone/unpack/batch.hpp>
#include <tierone/unpack/unpack.hpp>
#include <tierone/unpack/file_system.hpp>
#include <tierone/unpack/log.hpp>
#include "fake_extractor.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace tierone::unpack;
using tierone::unpack::testing::fake_extractor;
namespace fs = std::filesystem;

namespace {

class TempDirectory {
    fs::path path_;
public:
    TempDirectory() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);

        auto temp = fs::temp_directory_path();
        path_ = temp / ("tierone_unpack_test_" + std::to_string(dis(gen)));
        fs::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }
};

batch_options memory_options() {
    batch_options options;
    options.source_dir = "/src";
    options.destination_root = "/out";
    options.workspace_dir = "/tmp/ws";
    return options;
}

struct quiet_logs {
    quiet_logs() { set_log_level(log_level::error); }
    ~quiet_logs() { set_log_level(log_level::info); }
};

} // anonymous namespace

TEST_CASE("batch ignores stray segments as entry points", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/one.zip", "zip");
    mem.write_file("/src/one.r01", "segment");
    fake.add_archive("one.zip", {{"one.txt", "payload"}});

    batch_runner runner{mem, fake};
    auto report = runner.run(memory_options());

    REQUIRE(report.has_value());
    CHECK(report->processed == 1);
    CHECK(report->skipped == 0);
    CHECK(report->failed == 0);
    REQUIRE(fake.calls.size() == 1);
    CHECK(fake.calls[0].archive == fs::path{"/src/one.zip"});
    CHECK(fake.calls[0].target == fs::path{"/tmp/ws"});
    CHECK(mem.read_file("/out/one/one.txt") == "payload");
    CHECK(mem.exists("/src/one.r01"));
    CHECK_FALSE(mem.exists("/out/one/one.r01"));
}

TEST_CASE("batch is idempotent across runs", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/a.zip", "zip");
    mem.write_file("/src/b.rar", "rar");
    fake.add_archive("a.zip", {{"a.txt", "a"}});
    fake.add_archive("b.rar", {{"b.txt", "b"}});

    batch_runner runner{mem, fake};
    auto first = runner.run(memory_options());
    REQUIRE(first.has_value());
    CHECK(first->processed == 2);
    CHECK(fake.calls.size() == 2);

    auto second = runner.run(memory_options());
    REQUIRE(second.has_value());
    CHECK(second->processed == 0);
    CHECK(second->skipped == 2);
    CHECK(fake.calls.size() == 2);
}

TEST_CASE("batch extracts a split 7z through its first part", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/movie.7z.001", "part1");
    mem.write_file("/src/movie.7z.002", "part2");
    fake.add_archive("movie.7z.001", {{"movie/movie.mkv", "video"}, {"movie/movie.nfo", "info"}});

    batch_runner runner{mem, fake};
    auto report = runner.run(memory_options());

    REQUIRE(report.has_value());
    CHECK(report->processed == 1);
    REQUIRE(fake.calls.size() == 1);
    CHECK(fake.calls[0].tool == archive_tool::generic);
    CHECK(fake.calls[0].archive == fs::path{"/src/movie.7z.001"});

    CHECK(mem.read_file("/out/movie.7z/movie.mkv") == "video");
    CHECK(mem.read_file("/out/movie.7z/movie.nfo") == "info");
    CHECK_FALSE(mem.exists("/out/movie.7z/movie.7z.002"));
    CHECK_FALSE(mem.exists("/out/movie.7z/movie.7z.001"));
}

TEST_CASE("batch resolves nested archives into one folder", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/a.zip", "zip");
    fake.add_archive("a.zip", {{"b.rar", "rar"}, {"b.r00", "rar part"}, {"notes.txt", "notes"}});
    fake.add_archive("b.rar", {{"disc/c.7z", "7z"}});
    fake.add_archive("c.7z", {{"c.txt", "payload"}});

    batch_runner runner{mem, fake};
    auto report = runner.run(memory_options());

    REQUIRE(report.has_value());
    CHECK(report->processed == 1);
    CHECK(fake.calls.size() == 3);

    auto files = mem.list_files("/out/a", true);
    REQUIRE(files.has_value());
    CHECK(files->size() == 2);
    CHECK(mem.read_file("/out/a/notes.txt") == "notes");
    CHECK(mem.read_file("/out/a/c.txt") == "payload");

    // The workspace is cleared afterwards
    CHECK_FALSE(mem.exists("/tmp/ws"));
}

TEST_CASE("batch clears the workspace between archives", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/first.zip", "zip");
    mem.write_file("/src/second.zip", "zip");
    mem.write_file("/tmp/ws/leftover.txt", "stale");
    fake.add_archive("first.zip", {{"x.txt", "x"}});
    fake.add_archive("second.zip", {{"y.txt", "y"}});

    batch_runner runner{mem, fake};
    auto report = runner.run(memory_options());

    REQUIRE(report.has_value());
    CHECK(report->processed == 2);
    CHECK(mem.exists("/out/first/x.txt"));
    CHECK_FALSE(mem.exists("/out/first/leftover.txt"));
    CHECK(mem.exists("/out/second/y.txt"));
    CHECK_FALSE(mem.exists("/out/second/x.txt"));
}

TEST_CASE("batch honours the processing cap", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/a.zip", "zip");
    mem.write_file("/src/b.zip", "zip");
    mem.write_file("/src/c.zip", "zip");

    auto options = memory_options();

    SECTION("Successes count towards the cap") {
        options.max_count = 2;
        batch_runner runner{mem, fake};
        auto report = runner.run(options);

        REQUIRE(report.has_value());
        CHECK(report->processed == 2);
        CHECK(report->limit_reached);
        CHECK(mem.exists("/out/a"));
        CHECK(mem.exists("/out/b"));
        CHECK_FALSE(mem.exists("/out/c"));
    }

    SECTION("Skipped archives do not") {
        mem.write_file("/out/a/done.txt", "done");
        options.max_count = 1;
        batch_runner runner{mem, fake};
        auto report = runner.run(options);

        REQUIRE(report.has_value());
        CHECK(report->skipped == 1);
        CHECK(report->processed == 1);
        CHECK(mem.exists("/out/b"));
        CHECK_FALSE(mem.exists("/out/c"));
    }

    SECTION("Zero means no limit") {
        options.max_count = 0;
        batch_runner runner{mem, fake};
        auto report = runner.run(options);

        REQUIRE(report.has_value());
        CHECK(report->processed == 3);
        CHECK_FALSE(report->limit_reached);
    }
}

TEST_CASE("batch retries archives whose extraction failed", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/bad.zip", "zip");
    mem.write_file("/src/good.zip", "zip");
    fake.add_archive("good.zip", {{"good.txt", "good"}});
    fake.fail_on("bad.zip");

    batch_runner runner{mem, fake};
    auto first = runner.run(memory_options());

    REQUIRE(first.has_value());
    CHECK(first->failed == 1);
    CHECK(first->processed == 1);
    CHECK_FALSE(mem.exists("/out/bad"));
    CHECK(mem.exists("/out/good/good.txt"));

    auto second = runner.run(memory_options());
    REQUIRE(second.has_value());
    CHECK(second->failed == 1);
    CHECK(second->skipped == 1);
    CHECK(fake.calls.size() == 3);
}

TEST_CASE("batch counts an unscannable workspace as a failure", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/a.zip", "zip");
    mem.write_file("/src/b.zip", "zip");
    fake.add_archive("b.zip", {{"b.txt", "b"}});

    // The workspace disappears right after a.zip is unpacked into it
    fake.after_extract = [&mem](const fs::path& target) {
        if (target == fs::path{"/tmp/ws"} && mem.exists("/tmp/ws/gone.txt")) {
            (void)mem.remove_all(target);
        }
    };
    fake.add_archive("a.zip", {{"gone.txt", "a"}});

    batch_runner runner{mem, fake};
    auto report = runner.run(memory_options());

    REQUIRE(report.has_value());
    CHECK(report->failed == 1);
    CHECK(report->processed == 1);
    CHECK(mem.exists("/out/a"));
    CHECK(mem.read_file("/out/b/b.txt") == "b");
}

TEST_CASE("batch stops when asked to", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/a.zip", "zip");
    mem.write_file("/src/b.zip", "zip");

    auto options = memory_options();
    size_t polls = 0;
    options.stop_requested = [&polls] { return ++polls > 1; };

    batch_runner runner{mem, fake};
    auto report = runner.run(options);

    REQUIRE(report.has_value());
    CHECK(report->processed == 1);
    CHECK(report->interrupted);
    CHECK(mem.exists("/out/a"));
    CHECK_FALSE(mem.exists("/out/b"));
}

TEST_CASE("batch rejects bad configuration before extracting", "[unit][batch]") {
    quiet_logs quiet;
    memory_file_system mem;
    fake_extractor fake{mem};
    mem.write_file("/src/a.zip", "zip");
    batch_runner runner{mem, fake};
    auto options = memory_options();

    SECTION("Missing source folder") {
        options.source_dir = "/absent";
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::not_found);
    }

    SECTION("Workspace containing the output") {
        options.workspace_dir = "/";
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::invalid_argument);
    }

    SECTION("Workspace equal to the source") {
        options.workspace_dir = "/src/";
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::invalid_argument);
    }

    SECTION("Empty output") {
        options.destination_root.clear();
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::invalid_argument);
    }

    SECTION("Workspace inside the output") {
        mem.write_file("/out/one/one.txt", "finished earlier");
        options.workspace_dir = "/out/one";
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::invalid_argument);
        CHECK(mem.read_file("/out/one/one.txt") == "finished earlier");
    }

    SECTION("Workspace inside the source") {
        options.workspace_dir = "/src/tmp";
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::invalid_argument);
    }

    SECTION("Zero pass limit") {
        options.resolve.max_passes = 0;
        auto report = runner.run(options);
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error().code() == error_code::invalid_argument);
    }

    CHECK(fake.calls.empty());
    CHECK(mem.exists("/src/a.zip"));
}

TEST_CASE("unpack_folder runs on the local disk", "[integration][batch]") {
    quiet_logs quiet;
    TempDirectory temp_dir;
    const auto root = temp_dir.path();
    fs::create_directories(root / "src");
    std::ofstream{root / "src" / "one.zip"} << "zip";
    std::ofstream{root / "src" / "one.z01"} << "zip part";
    std::ofstream{root / "src" / "notes.txt"} << "not an archive";

    batch_options options;
    options.source_dir = root / "src";
    options.destination_root = root / "out";
    options.workspace_dir = root / "ws";

    // "true" accepts any arguments and extracts nothing
    auto report = unpack_folder(options, extractor_tools{"true", "true", "true"});

    REQUIRE(report.has_value());
    CHECK(report->processed == 1);
    CHECK(fs::is_directory(root / "out" / "one"));
    CHECK_FALSE(fs::exists(root / "out" / "notes"));
    CHECK_FALSE(fs::exists(root / "ws"));
    CHECK(fs::exists(root / "src" / "one.zip"));

    auto again = unpack_folder(options, extractor_tools{"true", "true", "true"});
    REQUIRE(again.has_value());
    CHECK(again->processed == 0);
    CHECK(again->skipped == 1);
}
