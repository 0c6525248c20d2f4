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
#include <boost/regex.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace retier {
namespace engine {

/**
 * FallbackBacktracking tier: Boost.Regex, Perl syntax.
 *
 * Supports look-around, backreferences, atomic groups and possessive
 * quantifiers. Matching is byte-oriented regardless of unicode_mode.
 *
 * backtrack_limit bounds the subject reads of one search (every attempted
 * step reads the subject, backtracked ones included). Boost's own
 * state-count bound still applies; either one is reported as
 * BacktrackLimitExceeded.
 */
class BoostEngine : public Engine {
public:
    std::string_view name() const override { return "boost.regex"; }

    std::unique_ptr<EngineHandle> tryCompile(
        const std::string& pattern,
        const Config& config,
        EngineError& error) const override;

    static boost::regex::flag_type toBoostFlags(const Config& config);
};

class BoostHandle : public EngineHandle {
public:
    BoostHandle(boost::regex regex,
                std::vector<std::string> capture_names,
                size_t pattern_size,
                std::optional<size_t> backtrack_limit);

    bool findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const override;
    int numberOfCapturingGroups() const override;
    std::map<std::string, int> namedGroups() const override;
    size_t approxSizeBytes() const override;

private:
    boost::regex regex_;
    std::vector<std::string> capture_names_;  // index i -> group i+1
    size_t pattern_size_;
    std::optional<size_t> backtrack_limit_;
};

}  // namespace engine
}  // namespace retier
