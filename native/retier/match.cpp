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

#include "match.h"
#include "errors.h"
#include <algorithm>
#include <utility>

namespace retier {

Match::Match(std::shared_ptr<const CompiledPattern> pattern,
             std::string_view text,
             engine::MatchSpans spans)
    : pattern_(std::move(pattern)),
      spans_(std::move(spans.groups)) {

    // Engines may report fewer slots than groups when trailing groups are unset
    spans_.resize(static_cast<size_t>(pattern_->groupCount()) + 1);

    // Look-around captures can fall outside the whole match
    size_t lo = spans_[0]->start;
    size_t hi = spans_[0]->end;
    for (const auto& s : spans_) {
        if (s) {
            lo = std::min(lo, s->start);
            hi = std::max(hi, s->end);
        }
    }

    region_start_ = lo;
    region_ = std::string(text.substr(lo, hi - lo));
}

void Match::checkIndex(int index) const {
    if (index < 0 || index > groupCount()) {
        throw GroupLookupError("No such group: " + std::to_string(index));
    }
}

std::optional<std::string> Match::textOf(size_t index) const {
    const auto& s = spans_[index];
    if (!s) {
        return std::nullopt;
    }
    return region_.substr(s->start - region_start_, s->end - s->start);
}

std::optional<engine::Span> Match::span(int index) const {
    checkIndex(index);
    return spans_[static_cast<size_t>(index)];
}

std::optional<std::string> Match::group(int index) const {
    checkIndex(index);
    return textOf(static_cast<size_t>(index));
}

std::optional<std::string> Match::group(std::string_view name) const {
    std::optional<int> index = pattern_->groupIndex(name);
    if (!index) {
        throw GroupLookupError("No such group: " + std::string(name));
    }
    return textOf(static_cast<size_t>(*index));
}

std::vector<std::optional<std::string>> Match::groups() const {
    std::vector<std::optional<std::string>> result;
    result.reserve(spans_.size() - 1);
    for (size_t i = 1; i < spans_.size(); i++) {
        result.push_back(textOf(i));
    }
    return result;
}

std::map<std::string, std::optional<std::string>> Match::groupDict() const {
    std::map<std::string, std::optional<std::string>> result;
    for (const auto& [name, index] : pattern_->namedGroups()) {
        result.emplace(name, textOf(static_cast<size_t>(index)));
    }
    return result;
}

int Match::lastindex() const {
    for (size_t i = spans_.size() - 1; i >= 1; i--) {
        if (spans_[i]) {
            return static_cast<int>(i);
        }
    }
    throw GroupLookupError("No capturing group participated in the match");
}

}  // namespace retier
