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

#include "config.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace retier {

namespace {

// 64-bit finalizer (MurmurHash3 fmix64) used to spread limit values.
uint64_t mix(uint64_t h) {
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= h >> 33;
    return h;
}

std::optional<size_t> optionalLimit(const nlohmann::json& j, const char* field) {
    if (!j.contains(field) || j[field].is_null()) {
        return std::nullopt;
    }
    return j[field].get<size_t>();
}

}  // namespace

Config Config::defaults() {
    Config config;
    // All fields already initialized with defaults in struct definition
    return config;
}

Config Config::fromJson(const std::string& json) {
    if (json.empty()) {
        return defaults();
    }

    Config config = defaults();

    try {
        nlohmann::json j = nlohmann::json::parse(json);

        config.case_insensitive = j.value("case_insensitive", config.case_insensitive);
        config.ignore_whitespace = j.value("ignore_whitespace", config.ignore_whitespace);
        config.multiline = j.value("multiline", config.multiline);
        config.unicode_mode = j.value("unicode_mode", config.unicode_mode);
        config.dfa_size_limit = j.value("dfa_size_limit", config.dfa_size_limit);
        config.size_limit = optionalLimit(j, "size_limit");
        config.backtrack_limit = optionalLimit(j, "backtrack_limit");

    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }

    config.validate();
    return config;
}

std::string Config::toJson() const {
    nlohmann::json j;

    j["case_insensitive"] = case_insensitive;
    j["ignore_whitespace"] = ignore_whitespace;
    j["multiline"] = multiline;
    j["unicode_mode"] = unicode_mode;
    j["size_limit"] = size_limit ? nlohmann::json(*size_limit) : nlohmann::json(nullptr);
    j["dfa_size_limit"] = dfa_size_limit;
    j["backtrack_limit"] = backtrack_limit ? nlohmann::json(*backtrack_limit) : nlohmann::json(nullptr);

    return j.dump();
}

void Config::validate() const {
    if (dfa_size_limit == 0) {
        throw std::invalid_argument("dfa_size_limit must be > 0");
    }
    if (size_limit && *size_limit == 0) {
        throw std::invalid_argument("size_limit must be > 0 when set");
    }
    if (backtrack_limit && *backtrack_limit == 0) {
        throw std::invalid_argument("backtrack_limit must be > 0 when set");
    }
}

uint64_t Config::hash() const {
    uint64_t h = 0;

    // Boolean flags (bits 0-3)
    if (case_insensitive)   h |= (1ULL << 0);
    if (ignore_whitespace)  h |= (1ULL << 1);
    if (multiline)          h |= (1ULL << 2);
    if (unicode_mode)       h |= (1ULL << 3);

    // Presence of optional limits (bits 4-5)
    if (size_limit)         h |= (1ULL << 4);
    if (backtrack_limit)    h |= (1ULL << 5);

    h = mix(h ^ mix(dfa_size_limit));
    if (size_limit) {
        h = mix(h ^ (*size_limit + 0x9e3779b97f4a7c15ULL));
    }
    if (backtrack_limit) {
        h = mix(h ^ (*backtrack_limit + 0x632be59bd9b4e019ULL));
    }
    return h;
}

}  // namespace retier
