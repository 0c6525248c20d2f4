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

#include "pattern.h"
#include "substitution.h"
#include <utility>

namespace retier {

using engine::Anchor;
using engine::MatchSpans;
using engine::Span;

Pattern::Pattern(std::shared_ptr<const CompiledPattern> compiled)
    : compiled_(std::move(compiled)) {}

bool Pattern::isMatch(std::string_view text) const {
    return compiled_->handle().findAt(text, 0, Anchor::Unanchored, nullptr);
}

bool Pattern::isSearch(std::string_view text) const {
    return compiled_->handle().findAt(text, 0, Anchor::Unanchored, nullptr);
}

std::optional<Match> Pattern::match(std::string_view text) const {
    MatchSpans spans;
    if (!compiled_->handle().findAt(text, 0, Anchor::AnchorStart, &spans)) {
        return std::nullopt;
    }
    return Match(compiled_, text, std::move(spans));
}

std::optional<Match> Pattern::search(std::string_view text) const {
    MatchSpans spans;
    if (!compiled_->handle().findAt(text, 0, Anchor::Unanchored, &spans)) {
        return std::nullopt;
    }
    return Match(compiled_, text, std::move(spans));
}

std::optional<std::pair<size_t, size_t>> Pattern::findIndices(std::string_view text) const {
    MatchSpans spans;
    if (!compiled_->handle().findAt(text, 0, Anchor::Unanchored, &spans)) {
        return std::nullopt;
    }
    return std::make_pair(spans.groups[0]->start, spans.groups[0]->end);
}

size_t Pattern::nextPosition(std::string_view text, size_t pos) const {
    if (pos >= text.size()) {
        return text.size() + 1;
    }
    pos++;
    if (compiled_->config().unicode_mode) {
        // Skip UTF-8 continuation bytes
        while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
            pos++;
        }
    }
    return pos;
}

template <typename Fn>
void Pattern::forEachMatch(std::string_view text, Fn&& fn) const {
    const engine::EngineHandle& handle = compiled_->handle();
    size_t pos = 0;
    std::optional<size_t> last_end;

    while (pos <= text.size()) {
        MatchSpans spans;
        if (!handle.findAt(text, pos, Anchor::Unanchored, &spans)) {
            break;
        }
        Span m = *spans.groups[0];

        if (m.start == m.end && last_end && m.start == *last_end) {
            pos = nextPosition(text, m.start);
            continue;
        }

        last_end = m.end;
        pos = (m.start == m.end) ? nextPosition(text, m.end) : m.end;
        fn(std::move(spans));
    }
}

std::vector<std::string> Pattern::findall(std::string_view text) const {
    std::vector<std::string> result;
    forEachMatch(text, [&](MatchSpans spans) {
        const Span& m = *spans.groups[0];
        result.emplace_back(text.substr(m.start, m.end - m.start));
    });
    return result;
}

std::vector<std::string> Pattern::split(std::string_view text) const {
    std::vector<std::string> result;
    size_t last = 0;
    forEachMatch(text, [&](MatchSpans spans) {
        const Span& m = *spans.groups[0];
        result.emplace_back(text.substr(last, m.start - last));
        last = m.end;
    });
    result.emplace_back(text.substr(last));
    return result;
}

std::string Pattern::sub(std::string_view repl, std::string_view text) const {
    ReplacementTemplate tmpl = ReplacementTemplate::parse(repl);

    std::string out;
    out.reserve(text.size());
    size_t last = 0;

    forEachMatch(text, [&](MatchSpans spans) {
        const Span m = *spans.groups[0];
        out.append(text.substr(last, m.start - last));
        tmpl.appendTo(out, Match(compiled_, text, std::move(spans)));
        last = m.end;
    });

    out.append(text.substr(last));
    return out;
}

}  // namespace retier
