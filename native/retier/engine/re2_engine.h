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
#include <re2/re2.h>
#include <memory>

namespace retier {
namespace engine {

/**
 * LinearAutomaton tier: RE2.
 *
 * Rejects ignore_whitespace (RE2 has no extended syntax) as Unsupported.
 * size_limit / dfa_size_limit map onto RE2's max_mem budget; exceeding it
 * is reported as ResourceLimit.
 */
class Re2Engine : public Engine {
public:
    std::string_view name() const override { return "re2"; }

    std::unique_ptr<EngineHandle> tryCompile(
        const std::string& pattern,
        const Config& config,
        EngineError& error) const override;

    /**
     * RE2 options for a config (exposed for tests).
     */
    static RE2::Options toRE2Options(const Config& config);
};

class Re2Handle : public EngineHandle {
public:
    explicit Re2Handle(std::unique_ptr<RE2> regex);

    bool findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const override;
    int numberOfCapturingGroups() const override;
    std::map<std::string, int> namedGroups() const override;
    size_t approxSizeBytes() const override;

    const RE2& regex() const { return *regex_; }

private:
    std::unique_ptr<RE2> regex_;
};

}  // namespace engine
}  // namespace retier
