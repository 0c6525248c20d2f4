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

#include "compiled_pattern.h"
#include "engine/engine.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retier {

/**
 * One match, normalized across engines.
 *
 * Offsets are byte offsets into the searched text. The match owns a copy of
 * the text region its groups cover, so it never refers to caller memory
 * after construction.
 */
class Match {
public:
    Match(std::shared_ptr<const CompiledPattern> pattern,
          std::string_view text,
          engine::MatchSpans spans);

    size_t start() const { return spans_[0]->start; }
    size_t end() const { return spans_[0]->end; }

    /**
     * Span of group index (0 = whole match); empty if it did not participate.
     *
     * @throws GroupLookupError if index < 0 or index > groupCount()
     */
    std::optional<engine::Span> span(int index = 0) const;

    /**
     * Text of group index (0 = whole match). A participating empty group
     * yields "", a non-participating group yields an empty optional.
     *
     * @throws GroupLookupError if index < 0 or index > groupCount()
     */
    std::optional<std::string> group(int index = 0) const;

    /**
     * Text of named group.
     *
     * @throws GroupLookupError if name is not defined by the pattern
     */
    std::optional<std::string> group(std::string_view name) const;

    /**
     * Groups 1..n.
     */
    std::vector<std::optional<std::string>> groups() const;

    /**
     * Named groups: name -> text.
     */
    std::map<std::string, std::optional<std::string>> groupDict() const;

    /**
     * Highest-numbered participating group.
     *
     * @throws GroupLookupError if no group participated
     */
    int lastindex() const;

    int groupCount() const { return static_cast<int>(spans_.size()) - 1; }

    const CompiledPattern& pattern() const { return *pattern_; }

private:
    std::shared_ptr<const CompiledPattern> pattern_;
    std::vector<std::optional<engine::Span>> spans_;

    // Copy of text[region_start_, region_start_ + region_.size())
    size_t region_start_ = 0;
    std::string region_;

    void checkIndex(int index) const;
    std::optional<std::string> textOf(size_t index) const;
};

}  // namespace retier
