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

#include "config.h"
#include "engine/engine.h"
#include "engine_tier.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retier {

/**
 * A pattern compiled by exactly one engine tier.
 *
 * Immutable after construction and shared across threads through
 * std::shared_ptr<const CompiledPattern>. Only ever constructed from a
 * successful compile, so tier() is always a tier that accepted the pattern.
 */
class CompiledPattern {
public:
    CompiledPattern(
        std::string pattern,
        Config config,
        EngineTier tier,
        std::string engine_name,
        std::unique_ptr<engine::EngineHandle> handle);

    CompiledPattern(const CompiledPattern&) = delete;
    CompiledPattern& operator=(const CompiledPattern&) = delete;

    const std::string& pattern() const { return pattern_; }
    const Config& config() const { return config_; }
    EngineTier tier() const { return tier_; }
    const std::string& engineName() const { return engine_name_; }
    const engine::EngineHandle& handle() const { return *handle_; }

    /**
     * Number of capturing groups (excluding group 0).
     */
    int groupCount() const { return group_count_; }

    /**
     * Named groups: name -> index.
     */
    const std::map<std::string, int>& namedGroups() const { return named_groups_; }

    /**
     * Names of the named groups, ordered by group index.
     */
    const std::vector<std::string>& groupNames() const { return group_names_; }

    /**
     * @return index of named group, or empty optional if undefined
     */
    std::optional<int> groupIndex(std::string_view name) const;

    size_t approxSizeBytes() const { return approx_size_bytes_; }

    /**
     * "<tier> (<engine>)", e.g. "LinearAutomaton (re2)".
     */
    std::string engineInfo() const;

private:
    std::string pattern_;
    Config config_;
    EngineTier tier_;
    std::string engine_name_;
    std::unique_ptr<engine::EngineHandle> handle_;

    int group_count_ = 0;
    std::map<std::string, int> named_groups_;
    std::vector<std::string> group_names_;
    size_t approx_size_bytes_ = 0;
};

}  // namespace retier
