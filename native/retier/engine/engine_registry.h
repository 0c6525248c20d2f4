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

#include "engine/engine.h"
#include "engine_tier.h"
#include <array>
#include <memory>

namespace retier {
namespace engine {

/**
 * Maps each tier to at most one engine. A tier with no engine is
 * "not built" and reports Unavailable when attempted.
 *
 * Populated before use and then only read, so it is shared without locking.
 */
class EngineRegistry {
public:
    /**
     * Registry with every engine compiled into this binary: re2, pcre2-jit
     * (when built with PCRE2) and boost.regex.
     */
    static EngineRegistry defaults();

    void install(EngineTier tier, std::shared_ptr<const Engine> engine);
    void remove(EngineTier tier);

    /**
     * @return engine for tier, or nullptr if none installed
     */
    const Engine* find(EngineTier tier) const;

    bool has(EngineTier tier) const { return find(tier) != nullptr; }

private:
    std::array<std::shared_ptr<const Engine>, kTierCount> engines_;
};

}  // namespace engine
}  // namespace retier
