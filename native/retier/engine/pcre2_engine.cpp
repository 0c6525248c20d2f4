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

#include "engine/pcre2_engine.h"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace retier {
namespace engine {

namespace {

std::string errorMessage(int code) {
    PCRE2_UCHAR buffer[256];
    int len = pcre2_get_error_message(code, buffer, sizeof(buffer));
    if (len < 0) {
        return "PCRE2 error " + std::to_string(code);
    }
    return std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(len));
}

struct MatchDataDeleter {
    void operator()(pcre2_match_data* data) const { pcre2_match_data_free(data); }
};

struct JitStackDeleter {
    void operator()(pcre2_jit_stack* stack) const { pcre2_jit_stack_free(stack); }
};

// A JIT stack serves one match at a time, so each thread gets its own.
// Returning nullptr makes PCRE2 fall back to the machine stack.
pcre2_jit_stack* threadJitStack(void*) {
    thread_local std::unique_ptr<pcre2_jit_stack, JitStackDeleter> stack(
        pcre2_jit_stack_create(Pcre2Engine::kJitStackStartBytes, Pcre2Engine::kJitStackMaxBytes, nullptr));
    return stack.get();
}

}  // namespace

uint32_t Pcre2Engine::toCompileOptions(const Config& config) {
    uint32_t options = 0;

    if (config.case_insensitive)  options |= PCRE2_CASELESS;
    if (config.ignore_whitespace) options |= PCRE2_EXTENDED;
    if (config.multiline)         options |= PCRE2_MULTILINE;
    if (config.unicode_mode)      options |= PCRE2_UTF | PCRE2_UCP;

    return options;
}

std::unique_ptr<EngineHandle> Pcre2Engine::tryCompile(
    const std::string& pattern,
    const Config& config,
    EngineError& error) const {

    int error_code = 0;
    PCRE2_SIZE error_offset = 0;

    Pcre2Handle::CodePtr code(pcre2_compile(
        reinterpret_cast<PCRE2_SPTR>(pattern.data()),
        pattern.size(),
        toCompileOptions(config),
        &error_code,
        &error_offset,
        nullptr));

    if (!code) {
        error = {EngineErrorKind::Syntax,
                 errorMessage(error_code) + " at offset " + std::to_string(error_offset)};
        return nullptr;
    }

    if (config.size_limit) {
        size_t size = 0;
        if (pcre2_pattern_info(code.get(), PCRE2_INFO_SIZE, &size) == 0 && size > *config.size_limit) {
            error = {EngineErrorKind::ResourceLimit,
                     "compiled pattern size " + std::to_string(size) +
                     " exceeds size_limit " + std::to_string(*config.size_limit)};
            return nullptr;
        }
    }

    int jit_rc = pcre2_jit_compile(code.get(), PCRE2_JIT_COMPLETE);
    if (jit_rc != 0) {
        error = {EngineErrorKind::Unavailable, "JIT compilation failed: " + errorMessage(jit_rc)};
        return nullptr;
    }

    Pcre2Handle::MatchContextPtr match_context(pcre2_match_context_create(nullptr));
    if (!match_context) {
        error = {EngineErrorKind::ResourceLimit, "failed to allocate match context"};
        return nullptr;
    }
    pcre2_jit_stack_assign(match_context.get(), threadJitStack, nullptr);
    if (config.backtrack_limit) {
        size_t limit = std::min<size_t>(*config.backtrack_limit, std::numeric_limits<uint32_t>::max());
        pcre2_set_match_limit(match_context.get(), static_cast<uint32_t>(limit));
    }

    return std::make_unique<Pcre2Handle>(std::move(code), std::move(match_context), config.backtrack_limit);
}

Pcre2Handle::Pcre2Handle(CodePtr code, MatchContextPtr match_context, std::optional<size_t> backtrack_limit)
    : code_(std::move(code)),
      match_context_(std::move(match_context)),
      backtrack_limit_(backtrack_limit) {

    uint32_t count = 0;
    pcre2_pattern_info(code_.get(), PCRE2_INFO_CAPTURECOUNT, &count);
    capture_count_ = static_cast<int>(count);

    pcre2_pattern_info(code_.get(), PCRE2_INFO_SIZE, &size_bytes_);
    size_t jit_size = 0;
    pcre2_pattern_info(code_.get(), PCRE2_INFO_JITSIZE, &jit_size);
    size_bytes_ += jit_size;
}

bool Pcre2Handle::findAt(std::string_view text, size_t offset, Anchor anchor, MatchSpans* out) const {
    if (offset > text.size()) {
        return false;
    }

    std::unique_ptr<pcre2_match_data, MatchDataDeleter> match_data(
        pcre2_match_data_create_from_pattern(code_.get(), nullptr));
    if (!match_data) {
        throw MatchError("Failed to allocate PCRE2 match data");
    }

    // PCRE2_ANCHORED at match time runs the interpreter rather than JIT code
    uint32_t options = (anchor == Anchor::AnchorStart) ? PCRE2_ANCHORED : 0;

    int rc = pcre2_match(
        code_.get(),
        reinterpret_cast<PCRE2_SPTR>(text.data()),
        text.size(),
        offset,
        options,
        match_data.get(),
        match_context_.get());

    if (rc == PCRE2_ERROR_NOMATCH) {
        return false;
    }
    if (rc == PCRE2_ERROR_MATCHLIMIT || rc == PCRE2_ERROR_DEPTHLIMIT ||
        rc == PCRE2_ERROR_HEAPLIMIT) {
        throw BacktrackLimitExceeded("Backtrack limit exceeded: " + errorMessage(rc));
    }
    if (rc == PCRE2_ERROR_JIT_STACKLIMIT) {
        // Only a bounded search reports stack exhaustion as a limit
        if (backtrack_limit_) {
            throw BacktrackLimitExceeded("Backtrack limit exceeded: " + errorMessage(rc));
        }
        throw MatchError("Match failed: " + errorMessage(rc));
    }
    if (rc < 0) {
        throw MatchError("Match failed: " + errorMessage(rc));
    }

    if (out) {
        PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data.get());
        int n = 1 + capture_count_;
        out->groups.assign(n, std::nullopt);
        for (int i = 0; i < n && i < rc; i++) {
            if (ovector[2 * i] != PCRE2_UNSET) {
                out->groups[i] = Span{ovector[2 * i], ovector[2 * i + 1]};
            }
        }
    }
    return true;
}

int Pcre2Handle::numberOfCapturingGroups() const {
    return capture_count_;
}

std::map<std::string, int> Pcre2Handle::namedGroups() const {
    std::map<std::string, int> named;

    uint32_t name_count = 0;
    uint32_t entry_size = 0;
    PCRE2_SPTR table = nullptr;
    pcre2_pattern_info(code_.get(), PCRE2_INFO_NAMECOUNT, &name_count);
    pcre2_pattern_info(code_.get(), PCRE2_INFO_NAMEENTRYSIZE, &entry_size);
    pcre2_pattern_info(code_.get(), PCRE2_INFO_NAMETABLE, &table);

    // Entry layout: 2-byte big-endian group number, then NUL-terminated name
    for (uint32_t i = 0; i < name_count; i++) {
        PCRE2_SPTR entry = table + i * entry_size;
        int group = (entry[0] << 8) | entry[1];
        named.emplace(std::string(reinterpret_cast<const char*>(entry + 2)), group);
    }
    return named;
}

size_t Pcre2Handle::approxSizeBytes() const {
    return size_bytes_;
}

}  // namespace engine
}  // namespace retier
