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

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace retier {

/**
 * Matching engine tiers, declared in priority order (linear first).
 */
enum class EngineTier {
    LinearAutomaton = 0,       // RE2
    JitBacktracking = 1,       // PCRE2 + JIT
    FallbackBacktracking = 2,  // Boost.Regex (look-around, backreferences)
};

constexpr size_t kTierCount = 3;

constexpr std::array<EngineTier, kTierCount> kTierPriority = {
    EngineTier::LinearAutomaton,
    EngineTier::JitBacktracking,
    EngineTier::FallbackBacktracking,
};

constexpr size_t tierIndex(EngineTier tier) {
    return static_cast<size_t>(tier);
}

/**
 * Stable tier name ("LinearAutomaton", "JitBacktracking", "FallbackBacktracking").
 */
std::string_view tierName(EngineTier tier);

/**
 * Parse a tier name as produced by tierName().
 *
 * @return tier, or empty optional if the name is unknown
 */
std::optional<EngineTier> tierFromName(std::string_view name);

}  // namespace retier
