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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace retier {

/**
 * Constructs the linear tier cannot execute.
 */
enum FeatureFlag : uint32_t {
    kNoFeatures = 0,
    kLookAhead = 1u << 0,         // (?=  (?!
    kLookBehind = 1u << 1,        // (?<=  (?<!
    kBackreference = 1u << 2,     // \1  \k<name>  \g{N}  (?P=name)
    kOtherUnsupported = 1u << 3,  // atomic groups, possessive quantifiers, recursion, verbs...
};

using FeatureSet = uint32_t;

/**
 * Result of a static scan of a pattern.
 *
 * capture_names[i] is the name of capturing group i+1, or "" if unnamed.
 */
struct Classification {
    FeatureSet features = kNoFeatures;
    int capture_count = 0;
    std::vector<std::string> capture_names;

    bool has(FeatureFlag flag) const { return (features & flag) != 0; }
    bool linearCompatible() const { return features == kNoFeatures; }
};

/**
 * Scan pattern text for features that rule out the linear tier.
 *
 * Single pass; honors escapes, character classes (including POSIX
 * [:name:]), \Q...\E quoting and, when extended (or after an inline (?x)),
 * '#' comments and insignificant whitespace. Never invokes an engine and
 * never fails: malformed input is classified on a best-effort basis and left
 * for the engines to reject.
 *
 * @param pattern regex source
 * @param extended true if ignore_whitespace is set
 */
Classification classify(std::string_view pattern, bool extended);

/**
 * Comma separated feature names, e.g. "look-behind, backreference".
 * Returns "none" for an empty set.
 */
std::string describeFeatures(FeatureSet features);

}  // namespace retier
