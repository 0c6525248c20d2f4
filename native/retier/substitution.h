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

#include "match.h"
#include <string>
#include <string_view>
#include <vector>

namespace retier {

/**
 * Parsed replacement template.
 *
 * Grammar:
 *   $$        literal '$'
 *   $N        group N, N = maximal run of ASCII digits (0 = whole match)
 *   ${N}      group N
 *   ${name}   named group, name = [A-Za-z_][A-Za-z0-9_]*
 * Any other '$' is literal. Backslash has no special meaning.
 *
 * A reference to an undefined or non-participating group expands to "".
 */
class ReplacementTemplate {
public:
    static ReplacementTemplate parse(std::string_view repl);

    /**
     * Append the expansion for m to out.
     */
    void appendTo(std::string& out, const Match& m) const;

    std::string expand(const Match& m) const;

    /**
     * True if the template contains no group references.
     */
    bool isLiteral() const;

private:
    struct Piece {
        enum class Kind { Literal, Index, Name };
        Kind kind = Kind::Literal;
        std::string text;  // literal text or group name
        size_t index = 0;
    };

    std::vector<Piece> pieces_;

    void appendLiteral(std::string_view text);
};

/**
 * Escape s so that it expands to itself (doubles every '$').
 */
std::string escapeReplacement(std::string_view s);

}  // namespace retier
