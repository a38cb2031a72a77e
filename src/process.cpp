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

#include <tierone/unpack/process.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

#include <sys/wait.h>

namespace tierone::unpack {

namespace {

struct pipe_closer {
    int* status;
    void operator()(std::FILE* pipe) const {
        if (pipe) *status = ::pclose(pipe);
    }
};

void trim_line_end(std::string& line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
}

} // anonymous namespace

std::string quote_argument(std::string_view argument) {
    std::string quoted;
    quoted.reserve(argument.size() + 2);
    quoted.push_back('\'');
    for (const char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string command;
    for (const auto& argument : argv) {
        if (!command.empty()) command.push_back(' ');
        command += quote_argument(argument);
    }
    return command;
}

auto run_command(const std::vector<std::string>& argv) -> std::expected<command_result, error> {
    if (argv.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "Empty command"});
    }

    const std::string command = join_command(argv) + " 2>&1";
    int status = -1;
    command_result result;

    {
        std::unique_ptr<std::FILE, pipe_closer> pipe{::popen(command.c_str(), "r"), pipe_closer{&status}};
        if (!pipe) {
            return std::unexpected(error{error_code::tool_unavailable,
                "Failed to start " + argv.front() + ": " + std::string{std::strerror(errno)}});
        }

        char buffer[512];
        std::string line;
        while (std::fgets(buffer, sizeof(buffer), pipe.get())) {
            line += buffer;
            if (line.empty() || line.back() != '\n') continue;  // Partial line
            trim_line_end(line);
            if (!line.empty()) result.last_line = line;
            line.clear();
        }
        trim_line_end(line);
        if (!line.empty()) result.last_line = line;
    }

    if (status == -1) {
        return std::unexpected(error{error_code::io_error,
            "Failed to wait for " + argv.front() + ": " + std::string{std::strerror(errno)}});
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace tierone::unpack
