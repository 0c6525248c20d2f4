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

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif

#include "engine/engine.h"
#include <pcre2.h>
#include <memory>
#include <optional>

namespace retier {
namespace engine {

/**
 * JitBacktracking tier: PCRE2 with JIT compilation.
 *
 * JIT failure (unsupported CPU, or JIT disabled in the PCRE2 build) is
 * reported as Unavailable so the compiler moves on to the fallback tier.
 * backtrack_limit maps onto the PCRE2 match limit (clamped to its 32-bit
 * range). JIT code runs on a per-thread stack that grows up to
 * kJitStackMaxBytes.
 */
class Pcre2Engine : public Engine {
public:
    static constexpr size_t kJitStackStartBytes = 32 * 1024;
    static constexpr size_t kJitStackMaxBytes = 8 * 1024 * 1024;

    std::string_view name() const override { return "pcre2-jit"; }

    std::unique_ptr<EngineHandle> tryCompile(
        const std::string& pattern,
        const Config& config,
        EngineError& error) const override;

    static uint32_t toCompileOptions(const Config& config);
};

class Pcre2Handle : public EngineHandle {
public:
    struct CodeDeleter {
        void operator()(pcre2_code* code) const { pcre2_code_free(code); }
    };
    struct MatchContextDeleter {
        void operator()(pcre2_match_context* ctx) const { pcre2_match_context_free(ctx); }
    };

    using CodePtr = std::unique_ptr<pcre2_code, CodeDeleter>;
    using MatchContextPtr = std::unique_ptr<pcre2_match_context, MatchContextDeleter>;

    Pcre2Handle(CodePtr code, MatchContextPtr match_context, std::optional<size_t> backtrack_limit);

    bool findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const override;
    int numberOfCapturingGroups() const override;
    std::map<std::string, int> namedGroups() const override;
    size_t approxSizeBytes() const override;

private:
    CodePtr code_;
    MatchContextPtr match_context_;  // never modified after construction
    std::optional<size_t> backtrack_limit_;
    int capture_count_ = 0;
    size_t size_bytes_ = 0;
};

}  // namespace engine
}  // namespace retier
