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

#include "engine/boost_engine.h"
#include "feature_classifier.h"
#include <boost/iterator/iterator_adaptor.hpp>
#include <string>

namespace retier {
namespace engine {

namespace {

// Thrown out of the matcher once a search exhausts its step budget
struct StepLimitReached {};

/**
 * Subject iterator that charges every read against a per-search budget.
 *
 * All copies made by the matcher share one counter, so the count covers
 * every attempted step of the search, backtracked ones included.
 */
class StepCountingIterator
    : public boost::iterator_adaptor<StepCountingIterator, const char*> {
public:
    StepCountingIterator() = default;
    StepCountingIterator(const char* position, size_t* steps, size_t limit)
        : iterator_adaptor_(position), steps_(steps), limit_(limit) {}

private:
    friend class boost::iterator_core_access;

    const char& dereference() const {
        if (++*steps_ > limit_) {
            throw StepLimitReached{};
        }
        return *base_reference();
    }

    size_t* steps_ = nullptr;
    size_t limit_ = 0;
};

const char* rawPointer(const char* it) { return it; }
const char* rawPointer(const StepCountingIterator& it) { return it.base(); }

template <typename Iterator>
bool searchSubject(Iterator first, Iterator last, Iterator base, const boost::regex& regex,
                   boost::match_flag_type flags, MatchSpans* out) {
    boost::match_results<Iterator> m;
    if (!boost::regex_search(first, last, m, regex, flags, base)) {
        return false;
    }

    if (out) {
        const char* origin = rawPointer(base);
        out->groups.assign(m.size(), std::nullopt);
        for (size_t i = 0; i < m.size(); i++) {
            if (m[i].matched) {
                out->groups[i] = Span{
                    static_cast<size_t>(rawPointer(m[i].first) - origin),
                    static_cast<size_t>(rawPointer(m[i].second) - origin)};
            }
        }
    }
    return true;
}

}  // namespace

boost::regex::flag_type BoostEngine::toBoostFlags(const Config& config) {
    boost::regex::flag_type flags = boost::regex::perl | boost::regex::no_mod_s;

    if (!config.multiline)        flags |= boost::regex::no_mod_m;
    if (config.case_insensitive)  flags |= boost::regex::icase;
    if (config.ignore_whitespace) flags |= boost::regex::mod_x;

    return flags;
}

std::unique_ptr<EngineHandle> BoostEngine::tryCompile(
    const std::string& pattern,
    const Config& config,
    EngineError& error) const {

    boost::regex regex;
    try {
        regex.assign(pattern, toBoostFlags(config));
    } catch (const boost::regex_error& e) {
        if (e.code() == boost::regex_constants::error_size ||
            e.code() == boost::regex_constants::error_complexity) {
            error = {EngineErrorKind::ResourceLimit, e.what()};
        } else {
            error = {EngineErrorKind::Syntax, e.what()};
        }
        return nullptr;
    }

    // Boost does not enumerate group names; take them from the scanner and
    // refuse the pattern if the two disagree on the group table.
    Classification scan = classify(pattern, config.ignore_whitespace);
    if (static_cast<size_t>(scan.capture_count) != regex.mark_count()) {
        error = {EngineErrorKind::Unsupported, "capture table mismatch"};
        return nullptr;
    }

    return std::make_unique<BoostHandle>(
        std::move(regex), std::move(scan.capture_names), pattern.size(), config.backtrack_limit);
}

BoostHandle::BoostHandle(boost::regex regex,
                         std::vector<std::string> capture_names,
                         size_t pattern_size,
                         std::optional<size_t> backtrack_limit)
    : regex_(std::move(regex)),
      capture_names_(std::move(capture_names)),
      pattern_size_(pattern_size),
      backtrack_limit_(backtrack_limit) {}

bool BoostHandle::findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const {
    if (offset > text.size()) {
        return false;
    }

    const char* base = text.data();
    const char* first = base + offset;
    const char* last = base + text.size();

    boost::match_flag_type flags = boost::match_default;
    if (offset > 0)                    flags |= boost::match_prev_avail;
    if (anchor == Anchor::AnchorStart) flags |= boost::match_continuous;

    try {
        if (!backtrack_limit_) {
            return searchSubject(first, last, base, regex_, flags, out);
        }
        size_t steps = 0;
        return searchSubject(StepCountingIterator(first, &steps, *backtrack_limit_),
                             StepCountingIterator(last, &steps, *backtrack_limit_),
                             StepCountingIterator(base, &steps, *backtrack_limit_),
                             regex_, flags, out);
    } catch (const StepLimitReached&) {
        throw BacktrackLimitExceeded(
            "Backtrack limit exceeded: more than " + std::to_string(*backtrack_limit_) + " steps");
    } catch (const boost::regex_error& e) {
        if (e.code() == boost::regex_constants::error_complexity ||
            e.code() == boost::regex_constants::error_stack) {
            throw BacktrackLimitExceeded(std::string("Backtrack limit exceeded: ") + e.what());
        }
        throw MatchError(std::string("Match failed: ") + e.what());
    } catch (const std::runtime_error& e) {
        // Boost raises its state-count and stack bounds as plain runtime_error
        throw BacktrackLimitExceeded(std::string("Backtrack limit exceeded: ") + e.what());
    }
}

int BoostHandle::numberOfCapturingGroups() const {
    return static_cast<int>(regex_.mark_count());
}

std::map<std::string, int> BoostHandle::namedGroups() const {
    std::map<std::string, int> named;
    for (size_t i = 0; i < capture_names_.size(); i++) {
        if (!capture_names_[i].empty()) {
            named.emplace(capture_names_[i], static_cast<int>(i + 1));
        }
    }
    return named;
}

size_t BoostHandle::approxSizeBytes() const {
    // Boost does not expose its state machine size; estimate from the source
    return sizeof(boost::regex) + pattern_size_ * 32;
}

}  // namespace engine
}  // namespace retier
