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

#include "substitution.h"
#include <limits>

namespace retier {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isNameStart(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

// Saturates, so an absurd index simply refers to an undefined group
size_t parseIndex(std::string_view digits) {
    constexpr size_t kMax = std::numeric_limits<size_t>::max() / 10 - 1;
    size_t value = 0;
    for (char c : digits) {
        if (value > kMax) {
            return std::numeric_limits<size_t>::max();
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

}  // namespace

void ReplacementTemplate::appendLiteral(std::string_view text) {
    if (!pieces_.empty() && pieces_.back().kind == Piece::Kind::Literal) {
        pieces_.back().text.append(text);
        return;
    }
    Piece piece;
    piece.text = std::string(text);
    pieces_.push_back(std::move(piece));
}

ReplacementTemplate ReplacementTemplate::parse(std::string_view repl) {
    ReplacementTemplate tmpl;
    size_t i = 0;

    while (i < repl.size()) {
        size_t dollar = repl.find('$', i);
        if (dollar == std::string_view::npos) {
            tmpl.appendLiteral(repl.substr(i));
            break;
        }
        tmpl.appendLiteral(repl.substr(i, dollar - i));
        i = dollar + 1;

        if (i >= repl.size()) {
            tmpl.appendLiteral("$");
            break;
        }

        char c = repl[i];

        if (c == '$') {
            tmpl.appendLiteral("$");
            i++;
            continue;
        }

        if (isDigit(c)) {
            size_t j = i;
            while (j < repl.size() && isDigit(repl[j])) j++;
            Piece piece;
            piece.kind = Piece::Kind::Index;
            piece.index = parseIndex(repl.substr(i, j - i));
            tmpl.pieces_.push_back(std::move(piece));
            i = j;
            continue;
        }

        if (c == '{') {
            size_t close = repl.find('}', i + 1);
            if (close != std::string_view::npos) {
                std::string_view ref = repl.substr(i + 1, close - i - 1);
                bool all_digits = !ref.empty();
                bool valid_name = !ref.empty() && isNameStart(ref[0]);
                for (char r : ref) {
                    all_digits = all_digits && isDigit(r);
                    valid_name = valid_name && (isNameStart(r) || isDigit(r));
                }

                if (all_digits || valid_name) {
                    Piece piece;
                    if (all_digits) {
                        piece.kind = Piece::Kind::Index;
                        piece.index = parseIndex(ref);
                    } else {
                        piece.kind = Piece::Kind::Name;
                        piece.text = std::string(ref);
                    }
                    tmpl.pieces_.push_back(std::move(piece));
                    i = close + 1;
                    continue;
                }
            }
        }

        // Not a reference: the '$' is literal, the rest is rescanned
        tmpl.appendLiteral("$");
    }

    return tmpl;
}

void ReplacementTemplate::appendTo(std::string& out, const Match& m) const {
    for (const Piece& piece : pieces_) {
        switch (piece.kind) {
            case Piece::Kind::Literal:
                out += piece.text;
                break;
            case Piece::Kind::Index:
                if (piece.index <= static_cast<size_t>(m.groupCount())) {
                    if (auto text = m.group(static_cast<int>(piece.index))) {
                        out += *text;
                    }
                }
                break;
            case Piece::Kind::Name:
                if (auto index = m.pattern().groupIndex(piece.text)) {
                    if (auto text = m.group(*index)) {
                        out += *text;
                    }
                }
                break;
        }
    }
}

std::string ReplacementTemplate::expand(const Match& m) const {
    std::string out;
    appendTo(out, m);
    return out;
}

bool ReplacementTemplate::isLiteral() const {
    for (const Piece& piece : pieces_) {
        if (piece.kind != Piece::Kind::Literal) {
            return false;
        }
    }
    return true;
}

std::string escapeReplacement(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '$') {
            out += '$';
        }
        out += c;
    }
    return out;
}

}  // namespace retier
