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
#include "match.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retier {

/**
 * Query handle over a shared CompiledPattern. Cheap to copy; safe to use
 * from many threads.
 *
 * Every query propagates BacktrackLimitExceeded from the engine; a limit is
 * never reported as "no match".
 */
class Pattern {
public:
    explicit Pattern(std::shared_ptr<const CompiledPattern> compiled);

    /**
     * True if the pattern matches anywhere in text. No Match allocation.
     * Use match() for a match anchored at the first byte.
     */
    bool isMatch(std::string_view text) const;

    /**
     * Same as isMatch.
     */
    bool isSearch(std::string_view text) const;

    std::optional<Match> match(std::string_view text) const;
    std::optional<Match> search(std::string_view text) const;
    std::optional<Match> find(std::string_view text) const { return search(text); }

    /**
     * [start, end) of the first match.
     */
    std::optional<std::pair<size_t, size_t>> findIndices(std::string_view text) const;

    /**
     * Whole-match text of every non-overlapping match, left to right.
     *
     * Scanning resumes at each match end; after an empty match it resumes one
     * character later (one UTF-8 code point in unicode mode, otherwise one
     * byte). An empty match adjacent to the previous match is skipped.
     */
    std::vector<std::string> findall(std::string_view text) const;

    /**
     * Text between matches (same iteration as findall).
     */
    std::vector<std::string> split(std::string_view text) const;

    /**
     * Replace every match with repl expanded against it ($N, ${N}, ${name}, $$).
     */
    std::string sub(std::string_view repl, std::string_view text) const;

    std::string engineInfo() const { return compiled_->engineInfo(); }
    EngineTier tier() const { return compiled_->tier(); }
    std::vector<std::string> groupNames() const { return compiled_->groupNames(); }
    int groupCount() const { return compiled_->groupCount(); }
    const std::string& pattern() const { return compiled_->pattern(); }
    const Config& config() const { return compiled_->config(); }

    const std::shared_ptr<const CompiledPattern>& compiled() const { return compiled_; }

private:
    std::shared_ptr<const CompiledPattern> compiled_;

    // Calls fn(spans) for every match in iteration order.
    template <typename Fn>
    void forEachMatch(std::string_view text, Fn&& fn) const;

    size_t nextPosition(std::string_view text, size_t pos) const;
};

}  // namespace retier
