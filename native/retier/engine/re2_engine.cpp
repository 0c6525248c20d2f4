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

#include "engine/re2_engine.h"
#include <cstdint>
#include <vector>

namespace retier {
namespace engine {

namespace {

// RE2 reserves two thirds of max_mem for the compiled program and the rest
// for the DFA caches.
int64_t maxMemFor(const Config& config) {
    if (config.size_limit) {
        return static_cast<int64_t>(*config.size_limit) * 3 / 2;
    }
    return static_cast<int64_t>(config.dfa_size_limit) * 3;
}

}  // namespace

RE2::Options Re2Engine::toRE2Options(const Config& config) {
    RE2::Options opts;

    opts.set_log_errors(false);  // Errors are returned, never logged by RE2
    opts.set_case_sensitive(!config.case_insensitive);
    opts.set_encoding(config.unicode_mode ? RE2::Options::EncodingUTF8 : RE2::Options::EncodingLatin1);
    opts.set_max_mem(maxMemFor(config));

    return opts;
}

std::unique_ptr<EngineHandle> Re2Engine::tryCompile(
    const std::string& pattern,
    const Config& config,
    EngineError& error) const {

    if (config.ignore_whitespace) {
        error = {EngineErrorKind::Unsupported, "ignore_whitespace is not supported by re2"};
        return nullptr;
    }

    std::string source = config.multiline ? "(?m)" + pattern : pattern;
    auto regex = std::make_unique<RE2>(source, toRE2Options(config));

    if (!regex->ok()) {
        if (regex->error_code() == RE2::ErrorPatternTooLarge) {
            error = {EngineErrorKind::ResourceLimit, regex->error()};
        } else {
            error = {EngineErrorKind::Syntax, regex->error()};
        }
        return nullptr;
    }

    return std::make_unique<Re2Handle>(std::move(regex));
}

Re2Handle::Re2Handle(std::unique_ptr<RE2> regex)
    : regex_(std::move(regex)) {}

bool Re2Handle::findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const {
    if (offset > text.size()) {
        return false;
    }

    re2::StringPiece input(text.data(), text.size());
    RE2::Anchor re2_anchor = (anchor == Anchor::AnchorStart) ? RE2::ANCHOR_START : RE2::UNANCHORED;

    if (!out) {
        return regex_->Match(input, offset, text.size(), re2_anchor, nullptr, 0);
    }

    int n = 1 + regex_->NumberOfCapturingGroups();
    std::vector<re2::StringPiece> submatch(n);

    if (!regex_->Match(input, offset, text.size(), re2_anchor, submatch.data(), n)) {
        return false;
    }

    out->groups.assign(n, std::nullopt);
    for (int i = 0; i < n; i++) {
        // null data() = group did not participate
        if (submatch[i].data() != nullptr) {
            size_t start = static_cast<size_t>(submatch[i].data() - text.data());
            out->groups[i] = Span{start, start + submatch[i].size()};
        }
    }
    return true;
}

int Re2Handle::numberOfCapturingGroups() const {
    return regex_->NumberOfCapturingGroups();
}

std::map<std::string, int> Re2Handle::namedGroups() const {
    return regex_->NamedCapturingGroups();
}

size_t Re2Handle::approxSizeBytes() const {
    // ProgramSize() counts instructions; use a rough per-instruction estimate
    return sizeof(RE2) + regex_->pattern().size() + static_cast<size_t>(regex_->ProgramSize()) * 16;
}

}  // namespace engine
}  // namespace retier
