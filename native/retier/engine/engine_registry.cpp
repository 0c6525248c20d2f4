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

#include "engine/engine_registry.h"
#include "engine/boost_engine.h"
#include "engine/re2_engine.h"
#ifdef RETIER_HAVE_PCRE2
#include "engine/pcre2_engine.h"
#endif

namespace retier {
namespace engine {

EngineRegistry EngineRegistry::defaults() {
    EngineRegistry registry;
    registry.install(EngineTier::LinearAutomaton, std::make_shared<Re2Engine>());
#ifdef RETIER_HAVE_PCRE2
    registry.install(EngineTier::JitBacktracking, std::make_shared<Pcre2Engine>());
#endif
    registry.install(EngineTier::FallbackBacktracking, std::make_shared<BoostEngine>());
    return registry;
}

void EngineRegistry::install(EngineTier tier, std::shared_ptr<const Engine> engine) {
    engines_[tierIndex(tier)] = std::move(engine);
}

void EngineRegistry::remove(EngineTier tier) {
    engines_[tierIndex(tier)].reset();
}

const Engine* EngineRegistry::find(EngineTier tier) const {
    return engines_[tierIndex(tier)].get();
}

}  // namespace engine
}  // namespace retier
