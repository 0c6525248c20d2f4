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

#include "engine_tier.h"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace retier {

/**
 * Why a single engine refused a pattern.
 */
enum class EngineErrorKind {
    Syntax,         // engine parser rejected the pattern
    Unsupported,    // pattern or option valid but not supported by this engine
    ResourceLimit,  // size_limit / dfa_size_limit overflow during compilation
    Unavailable,    // tier not built into this binary (or JIT unavailable)
};

std::string_view errorKindName(EngineErrorKind kind);

/**
 * Failure of one compile attempt. Plain data: tier failures drive fallback
 * inside the compiler and are never thrown across component boundaries.
 */
struct EngineError {
    EngineErrorKind kind = EngineErrorKind::Syntax;
    std::string message;
};

struct TierAttempt {
    EngineTier tier;
    EngineError error;
};

/**
 * Outcome of a compilation in which no attempted tier succeeded.
 *
 * tier/cause describe the last attempt; attempts lists every tier tried,
 * in order.
 */
struct CompileFailure {
    EngineTier tier = EngineTier::LinearAutomaton;
    EngineError cause;
    std::vector<TierAttempt> attempts;

    /**
     * Human readable summary, e.g.
     * "FallbackBacktracking: Syntax: missing ) (after LinearAutomaton, JitBacktracking)"
     */
    std::string describe() const;
};

/**
 * Thrown by the public API when no tier accepts a pattern, or when an
 * explicitly forced tier fails.
 */
class CompileError : public std::runtime_error {
public:
    CompileError(EngineTier tier, EngineError cause, const std::string& what);

    EngineTier tier() const { return tier_; }
    const EngineError& cause() const { return cause_; }

private:
    EngineTier tier_;
    EngineError cause_;
};

/**
 * Compile-time size_limit / dfa_size_limit overflow on the last attempted tier.
 */
class ResourceLimitExceeded : public CompileError {
public:
    using CompileError::CompileError;
};

/**
 * Throw CompileError (or ResourceLimitExceeded) describing a failure.
 */
[[noreturn]] void throwCompileError(const CompileFailure& failure);

/**
 * Engine failure while matching.
 */
class MatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Backtracking search exceeded its step bound. Never reported as "no match".
 */
class BacktrackLimitExceeded : public MatchError {
public:
    using MatchError::MatchError;
};

/**
 * Invalid group index or undefined group name.
 */
class GroupLookupError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

}  // namespace retier
