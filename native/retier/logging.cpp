/*
 * Copyright 2025 AxonOps
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

#include "logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <stdexcept>
#include <string_view>

namespace retier {
namespace log {

namespace {

constexpr std::array<std::string_view, 7> kLevelNames = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get("retier");
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt("retier");
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return created;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

bool isValidLevel(const std::string& level) {
    for (std::string_view name : kLevelNames) {
        if (name == level) {
            return true;
        }
    }
    return false;
}

void setLevel(const std::string& level) {
    if (!isValidLevel(level)) {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    logger()->set_level(spdlog::level::from_str(level));
}

}  // namespace log
}  // namespace retier
