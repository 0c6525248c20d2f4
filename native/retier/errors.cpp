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

#include "errors.h"
#include <sstream>
#include <utility>

namespace retier {

std::string_view errorKindName(EngineErrorKind kind) {
    switch (kind) {
        case EngineErrorKind::Syntax:
            return "Syntax";
        case EngineErrorKind::Unsupported:
            return "Unsupported";
        case EngineErrorKind::ResourceLimit:
            return "ResourceLimit";
        case EngineErrorKind::Unavailable:
            return "Unavailable";
    }
    return "Unknown";
}

std::string CompileFailure::describe() const {
    std::ostringstream msg;
    msg << tierName(tier) << ": " << errorKindName(cause.kind) << ": " << cause.message;

    if (attempts.size() > 1) {
        msg << " (after ";
        for (size_t i = 0; i + 1 < attempts.size(); i++) {
            if (i > 0) msg << ", ";
            msg << tierName(attempts[i].tier);
        }
        msg << ")";
    }
    return msg.str();
}

CompileError::CompileError(EngineTier tier, EngineError cause, const std::string& what)
    : std::runtime_error(what),
      tier_(tier),
      cause_(std::move(cause)) {}

void throwCompileError(const CompileFailure& failure) {
    std::string what = "Failed to compile pattern: " + failure.describe();

    if (failure.cause.kind == EngineErrorKind::ResourceLimit) {
        throw ResourceLimitExceeded(failure.tier, failure.cause, what);
    }
    throw CompileError(failure.tier, failure.cause, what);
}

}  // namespace retier
