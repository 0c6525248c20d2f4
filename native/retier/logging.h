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

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace retier {
namespace log {

/**
 * Library logger ("retier"), writing to stderr. Created on first use.
 * Default level: warn.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Set logger level by name ("trace", "debug", "info", "warn", "error",
 * "critical", "off").
 *
 * @throws std::invalid_argument if level name unknown
 */
void setLevel(const std::string& level);

/**
 * Check a level name without applying it.
 */
bool isValidLevel(const std::string& level);

}  // namespace log
}  // namespace retier
