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

#include <tierone/unpack/log.hpp>
#include <atomic>

namespace tierone::unpack {

namespace {

std::atomic<log_level> threshold{log_level::info};

} // anonymous namespace

void set_log_level(const log_level level) noexcept {
    threshold.store(level, std::memory_order_relaxed);
}

log_level current_log_level() noexcept {
    return threshold.load(std::memory_order_relaxed);
}

} // namespace tierone::unpack
