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

#include "feature_classifier.h"

namespace retier {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isNameStart(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool isNameChar(char c) {
    return isNameStart(c) || isDigit(c);
}

class Scanner {
public:
    Scanner(std::string_view pattern, bool extended)
        : p_(pattern), extended_(extended) {}

    Classification run() {
        while (i_ < p_.size()) {
            char c = p_[i_];

            if (extended_ && (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v')) {
                i_++;
                continue;
            }
            if (extended_ && c == '#') {
                skipComment();
                continue;
            }

            switch (c) {
                case '\\':
                    scanEscape();
                    break;
                case '[':
                    skipClass();
                    break;
                case '(':
                    scanGroupOpen();
                    break;
                case '*':
                case '+':
                case '?':
                    i_++;
                    checkPossessive();
                    break;
                case '{':
                    scanBraces();
                    break;
                default:
                    i_++;
                    break;
            }
        }
        return std::move(result_);
    }

private:
    std::string_view p_;
    bool extended_;
    size_t i_ = 0;
    Classification result_;

    char at(size_t pos) const {
        return pos < p_.size() ? p_[pos] : '\0';
    }

    bool startsWith(size_t pos, std::string_view prefix) const {
        return p_.substr(pos < p_.size() ? pos : p_.size(), prefix.size()) == prefix;
    }

    void mark(FeatureFlag flag) {
        result_.features |= flag;
    }

    void addCapture(std::string name) {
        result_.capture_count++;
        result_.capture_names.push_back(std::move(name));
    }

    void skipComment() {
        while (i_ < p_.size() && p_[i_] != '\n') {
            i_++;
        }
    }

    // A quantifier followed by '+' is possessive.
    void checkPossessive() {
        if (at(i_) == '+') {
            mark(kOtherUnsupported);
            i_++;
        }
    }

    // {n}, {n,}, {n,m} - anything else is a literal brace.
    void scanBraces() {
        size_t j = i_ + 1;
        size_t digits = 0;
        while (isDigit(at(j))) { j++; digits++; }
        if (digits > 0 && at(j) == ',') {
            j++;
            while (isDigit(at(j))) j++;
        }
        if (digits > 0 && at(j) == '}') {
            i_ = j + 1;
            checkPossessive();
        } else {
            i_++;
        }
    }

    // \Q...\E: everything up to \E (or end of pattern) is literal.
    void skipQuoted() {
        size_t end = p_.find("\\E", i_);
        i_ = (end == std::string_view::npos) ? p_.size() : end + 2;
    }

    void scanEscape() {
        char next = at(i_ + 1);
        if (next == '\0') {
            i_++;
            return;
        }

        switch (next) {
            case '1': case '2': case '3': case '4': case '5':
            case '6': case '7': case '8': case '9':
                mark(kBackreference);
                break;
            case 'k':
                if (at(i_ + 2) == '<' || at(i_ + 2) == '{' || at(i_ + 2) == '\'') {
                    mark(kBackreference);
                }
                break;
            case 'g': {
                char after = at(i_ + 2);
                if (after == '<' || after == '\'') {
                    mark(kOtherUnsupported);  // subroutine call
                } else if (after == '{' || after == '-' || isDigit(after)) {
                    mark(kBackreference);
                }
                break;
            }
            case 'G':
            case 'K':
            case 'Z':
                mark(kOtherUnsupported);
                break;
            case 'Q':
                i_ += 2;
                skipQuoted();
                return;
            default:
                break;
        }
        i_ += 2;
    }

    void skipClass() {
        size_t j = i_ + 1;
        if (at(j) == '^') j++;
        if (at(j) == ']') j++;  // leading ']' is literal

        while (j < p_.size()) {
            char c = p_[j];
            if (c == '\\') {
                if (at(j + 1) == 'Q') {
                    size_t end = p_.find("\\E", j + 2);
                    j = (end == std::string_view::npos) ? p_.size() : end + 2;
                    continue;
                }
                j += 2;
                continue;
            }
            if (c == '[' && at(j + 1) == ':') {
                size_t end = p_.find(":]", j + 2);
                if (end != std::string_view::npos) {
                    j = end + 2;
                    continue;
                }
            }
            if (c == ']') {
                i_ = j + 1;
                return;
            }
            j++;
        }
        i_ = p_.size();  // unterminated, engines report it
    }

    // Reads [A-Za-z_][A-Za-z0-9_]* at pos followed by terminator.
    bool readName(size_t pos, char terminator, std::string& name, size_t& end) const {
        if (!isNameStart(at(pos))) {
            return false;
        }
        size_t j = pos;
        while (isNameChar(at(j))) j++;
        if (at(j) != terminator) {
            return false;
        }
        name = std::string(p_.substr(pos, j - pos));
        end = j + 1;
        return true;
    }

    void scanGroupOpen() {
        if (at(i_ + 1) == '*') {
            mark(kOtherUnsupported);  // (*VERB)
            i_ += 2;
            return;
        }
        if (at(i_ + 1) != '?') {
            addCapture("");
            i_++;
            return;
        }

        size_t q = i_ + 2;  // first char after "(?"
        char c = at(q);
        std::string name;
        size_t end = 0;

        switch (c) {
            case '=':
            case '!':
                mark(kLookAhead);
                i_ = q + 1;
                return;
            case '<':
                if (at(q + 1) == '=' || at(q + 1) == '!') {
                    mark(kLookBehind);
                    i_ = q + 2;
                    return;
                }
                if (readName(q + 1, '>', name, end)) {
                    addCapture(std::move(name));
                    i_ = end;
                    return;
                }
                break;
            case '\'':
                if (readName(q + 1, '\'', name, end)) {
                    addCapture(std::move(name));
                    i_ = end;
                    return;
                }
                break;
            case 'P':
                if (at(q + 1) == '<' && readName(q + 2, '>', name, end)) {
                    addCapture(std::move(name));
                    i_ = end;
                    return;
                }
                if (at(q + 1) == '=') {
                    mark(kBackreference);
                } else if (at(q + 1) == '>') {
                    mark(kOtherUnsupported);
                }
                break;
            case '>':  // atomic group
            case '|':  // branch reset
            case '#':  // inline comment
            case '(':  // conditional
            case '&':  // named subroutine
            case 'R':  // recursion
            case '+':
                mark(kOtherUnsupported);
                break;
            case '-':
                if (isDigit(at(q + 1))) {
                    mark(kOtherUnsupported);
                } else {
                    scanInlineFlags(q);
                }
                break;
            default:
                if (isDigit(c)) {
                    mark(kOtherUnsupported);
                } else {
                    scanInlineFlags(q);
                }
                break;
        }
        i_ = q + 1;
    }

    // (?imsx-imsx) or (?imsx-imsx: ... ) - track x so comments are skipped.
    void scanInlineFlags(size_t q) {
        bool negate = false;
        for (size_t j = q; j < p_.size(); j++) {
            char f = p_[j];
            if (f == ')' || f == ':') {
                return;
            }
            if (f == '-') {
                negate = true;
            } else if (f == 'x') {
                extended_ = !negate;
            } else if (!isNameChar(f)) {
                return;
            }
        }
    }
};

}  // namespace

Classification classify(std::string_view pattern, bool extended) {
    return Scanner(pattern, extended).run();
}

std::string describeFeatures(FeatureSet features) {
    if (features == kNoFeatures) {
        return "none";
    }

    std::string out;
    auto append = [&out](const char* name) {
        if (!out.empty()) out += ", ";
        out += name;
    };

    if (features & kLookAhead) append("look-ahead");
    if (features & kLookBehind) append("look-behind");
    if (features & kBackreference) append("backreference");
    if (features & kOtherUnsupported) append("other-unsupported");
    return out;
}

}  // namespace retier
