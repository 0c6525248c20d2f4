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

#include "engine_tier.h"

namespace retier {

std::string_view tierName(EngineTier tier) {
    switch (tier) {
        case EngineTier::LinearAutomaton:
            return "LinearAutomaton";
        case EngineTier::JitBacktracking:
            return "JitBacktracking";
        case EngineTier::FallbackBacktracking:
            return "FallbackBacktracking";
    }
    return "Unknown";
}

std::optional<EngineTier> tierFromName(std::string_view name) {
    for (EngineTier tier : kTierPriority) {
        if (tierName(tier) == name) {
            return tier;
        }
    }
    return std::nullopt;
}

}  // namespace retier
