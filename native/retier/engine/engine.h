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
#include "errors.h"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retier {
namespace engine {

/**
 * Byte offsets [start, end) into the searched text.
 */
struct Span {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const Span& other) const = default;
};

/**
 * Spans of one match. groups[0] is the whole match; groups[i] is capturing
 * group i, empty if the group did not participate.
 */
struct MatchSpans {
    std::vector<std::optional<Span>> groups;
};

enum class Anchor {
    Unanchored,   // match may begin anywhere at or after offset
    AnchorStart,  // match must begin exactly at offset
};

/**
 * A compiled pattern owned by one engine. Read-only during matching and safe
 * to use from many threads; per-call scratch is allocated per call.
 */
class EngineHandle {
public:
    virtual ~EngineHandle() = default;

    /**
     * Search text starting at offset. Look-behind and \b may inspect bytes
     * before offset.
     *
     * @param text full subject text
     * @param offset byte offset to start at (<= text.size())
     * @param anchor whether the match must begin at offset
     * @param out receives group spans on success (may be nullptr when only
     *        existence is needed)
     * @return true if a match was found
     * @throws BacktrackLimitExceeded if the engine hit its step bound
     * @throws MatchError on any other engine failure
     */
    virtual bool findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const = 0;

    virtual int numberOfCapturingGroups() const = 0;

    /**
     * Named groups: name -> group index.
     */
    virtual std::map<std::string, int> namedGroups() const = 0;

    virtual size_t approxSizeBytes() const = 0;
};

/**
 * One engine library behind a tier. Stateless; compile failures are
 * returned as data.
 */
class Engine {
public:
    virtual ~Engine() = default;

    /**
     * Library name, e.g. "re2".
     */
    virtual std::string_view name() const = 0;

    /**
     * Compile pattern with config.
     *
     * @return handle, or nullptr with error filled in
     */
    virtual std::unique_ptr<EngineHandle> tryCompile(
        const std::string& pattern,
        const Config& config,
        EngineError& error) const = 0;
};

}  // namespace engine
}  // namespace retier
