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

#include "compiled_pattern.h"
#include <algorithm>
#include <utility>

namespace retier {

CompiledPattern::CompiledPattern(
    std::string pattern,
    Config config,
    EngineTier tier,
    std::string engine_name,
    std::unique_ptr<engine::EngineHandle> handle)
    : pattern_(std::move(pattern)),
      config_(std::move(config)),
      tier_(tier),
      engine_name_(std::move(engine_name)),
      handle_(std::move(handle)) {

    group_count_ = handle_->numberOfCapturingGroups();
    named_groups_ = handle_->namedGroups();

    std::vector<std::pair<int, std::string>> by_index;
    for (const auto& [name, index] : named_groups_) {
        by_index.emplace_back(index, name);
    }
    std::sort(by_index.begin(), by_index.end());
    for (auto& [index, name] : by_index) {
        group_names_.push_back(std::move(name));
    }

    approx_size_bytes_ = sizeof(CompiledPattern) + pattern_.size() + handle_->approxSizeBytes();
}

std::optional<int> CompiledPattern::groupIndex(std::string_view name) const {
    auto it = named_groups_.find(std::string(name));
    if (it == named_groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string CompiledPattern::engineInfo() const {
    std::string info(tierName(tier_));
    info += " (";
    info += engine_name_;
    info += ")";
    return info;
}

}  // namespace retier
