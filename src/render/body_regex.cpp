#include "render/body_regex.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <format>

namespace quill {

namespace {

// Upper bound on the memory RE2 may use per compiled pattern
constexpr int64_t kRegexMaxMem = 16 << 20;

// Emitted input bytes a stage keeps as lookbehind
constexpr size_t kLookbehindBytes = 8;

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t code_point_length(char lead) {
    const auto b = static_cast<unsigned char>(lead);
    if (b >= 0xF0) return 4;
    if (b >= 0xE0) return 3;
    if (b >= 0xC0) return 2;
    return 1;
}

/// Append `replacement` with $&, $n, $nn and $$ expanded
void expand_replacement(std::string_view replacement, const std::vector<re2::StringPiece>& groups,
                        std::string& out) {
    const auto append_group = [&](size_t index) {
        const auto& g = groups[index];
        if (g.data() != nullptr) out.append(g.data(), g.size());
    };

    for (size_t i = 0; i < replacement.size(); ++i) {
        const char c = replacement[i];
        if (c != '$' || i + 1 >= replacement.size()) {
            out += c;
            continue;
        }
        const char next = replacement[i + 1];
        if (next == '$') {
            out += '$';
            ++i;
        } else if (next == '&') {
            append_group(0);
            ++i;
        } else if (next >= '0' && next <= '9') {
            size_t index = static_cast<size_t>(next - '0');
            size_t used = 1;
            if (i + 2 < replacement.size() && replacement[i + 2] >= '0' && replacement[i + 2] <= '9') {
                const size_t two = index * 10 + static_cast<size_t>(replacement[i + 2] - '0');
                if (two > 0 && two < groups.size()) {
                    index = two;
                    used = 2;
                }
            }
            if (index == 0 || index >= groups.size()) {
                out += c;   // not a group reference: keep the literal
                continue;
            }
            append_group(index);
            i += used;
        } else {
            out += c;
        }
    }
}

/**
 * @brief Replace matches in text[begin, ...) and append the result to out
 *
 * Bytes before `begin` are context only. Unless `final`, a match that
 * starts at or past `limit`, or that runs to the end of `text` while the
 * held span is within `max_held`, is left for the next round.
 *
 * @return End of the input consumed into `out`
 */
size_t replace_matches(const re2::RE2& re, std::string_view replacement, std::string_view text,
                       size_t begin, size_t limit, bool final, size_t max_held, std::string& out) {
    const re2::StringPiece input(text.data(), text.size());
    std::vector<re2::StringPiece> groups(static_cast<size_t>(1 + re.NumberOfCapturingGroups()));

    size_t copied = begin;
    size_t pos = begin;
    while (pos <= text.size()) {
        if (!re.Match(input, pos, text.size(), re2::RE2::UNANCHORED,
                      groups.data(), static_cast<int>(groups.size()))) {
            break;
        }
        const auto start = static_cast<size_t>(groups[0].data() - text.data());
        const auto stop = start + groups[0].size();

        if (!final && (start >= limit || (stop == text.size() && text.size() - start <= max_held))) {
            const size_t emit_end = std::max(copied, std::min(start, limit));
            out.append(text.substr(copied, emit_end - copied));
            return emit_end;
        }

        out.append(text.substr(copied, start - copied));
        expand_replacement(replacement, groups, out);
        copied = stop;
        if (stop == start) {
            if (start == text.size()) break;
            pos = start + code_point_length(text[start]);
        } else {
            pos = stop;
        }
    }

    const size_t emit_end = final ? text.size() : std::max(copied, limit);
    out.append(text.substr(copied, emit_end - copied));
    return emit_end;
}

} // anonymous namespace

RegexPatchSet::RegexPatchSet() = default;
RegexPatchSet::~RegexPatchSet() = default;
RegexPatchSet::RegexPatchSet(RegexPatchSet&&) noexcept = default;
RegexPatchSet& RegexPatchSet::operator=(RegexPatchSet&&) noexcept = default;

Result<RegexPatchSet> RegexPatchSet::compile(const std::vector<RegexPatch>& patches) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_max_mem(kRegexMaxMem);

    RegexPatchSet set;
    set.patches_.reserve(patches.size());
    for (const auto& patch : patches) {
        auto re = std::make_unique<re2::RE2>(patch.pattern, options);
        if (!re->ok()) {
            return Result<RegexPatchSet>::error(ErrorCategory::INVALID_REGEX,
                std::format("invalid pattern '{}': {}", patch.pattern, re->error()));
        }
        set.patches_.push_back(Compiled{std::move(re), patch.replacement});
    }
    return Result<RegexPatchSet>::ok(std::move(set));
}

std::string RegexPatchSet::apply(std::string_view text) const {
    std::string current(text);
    for (const auto& patch : patches_) {
        std::string out;
        out.reserve(current.size());
        (void)replace_matches(*patch.re, patch.replacement, current, 0, current.size(), true, 0, out);
        current = std::move(out);
    }
    return current;
}

Result<std::string> apply_regex_patches(std::string_view text, const std::vector<RegexPatch>& patches) {
    if (patches.empty()) return Result<std::string>::ok(std::string(text));
    auto compiled = RegexPatchSet::compile(patches);
    if (compiled.is_error()) return Result<std::string>::error_from(compiled);
    return Result<std::string>::ok(compiled.value().apply(text));
}

std::optional<size_t> utf8_valid_prefix(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        uint32_t min_cp = 0;
        uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2; min_cp = 0x80; cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; min_cp = 0x800; cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; min_cp = 0x10000; cp = lead & 0x07;
        } else {
            return std::nullopt;
        }

        for (size_t k = 1; k < len; ++k) {
            if (i + k >= bytes.size()) return i;   // truncated: valid so far
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) return std::nullopt;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return std::nullopt;
        i += len;
    }
    return i;
}

StreamingRegexWriter::StreamingRegexWriter(RegexPatchSet patches, size_t tail_window, Sink sink)
    : patches_(std::move(patches)), tail_window_(std::max<size_t>(tail_window, 1)), sink_(std::move(sink)) {
    stages_.reserve(patches_.patches_.size());
    for (const auto& patch : patches_.patches_) {
        stages_.push_back(Stage{patch.re.get(), &patch.replacement, {}, 0});
    }
}

size_t StreamingRegexWriter::buffered() const {
    size_t total = pending_.size();
    for (const auto& stage : stages_) total += stage.buffer.size() - stage.context;
    return total;
}

Result<void> StreamingRegexWriter::write(std::string_view chunk) {
    if (finished_) {
        return Result<void>::error(ErrorCategory::IO_ERROR, "write after finish");
    }
    pending_.append(chunk);

    const auto valid = utf8_valid_prefix(pending_);
    if (!valid) {
        return Result<void>::error(ErrorCategory::IO_ERROR, "body is not valid UTF-8");
    }
    if (*valid > 0) {
        const std::string complete = pending_.substr(0, *valid);
        pending_.erase(0, *valid);
        feed(0, complete);
    }
    return Result<void>::ok();
}

Result<void> StreamingRegexWriter::finish() {
    if (finished_) return Result<void>::ok();
    finished_ = true;
    if (!pending_.empty()) {
        return Result<void>::error(ErrorCategory::IO_ERROR, "body ends inside a UTF-8 sequence");
    }
    for (size_t i = 0; i < stages_.size(); ++i) flush(i, true);
    return Result<void>::ok();
}

void StreamingRegexWriter::feed(size_t stage, std::string_view text) {
    if (text.empty()) return;
    if (stage == stages_.size()) {
        sink_(text);
        return;
    }
    stages_[stage].buffer.append(text);
    flush(stage, false);
}

void StreamingRegexWriter::flush(size_t stage, bool final) {
    auto& st = stages_[stage];
    const std::string& buf = st.buffer;
    if (!final && buf.size() - st.context <= tail_window_) return;

    size_t limit = final ? buf.size() : buf.size() - tail_window_;
    while (limit > st.context && limit < buf.size() && is_continuation(buf[limit])) {
        --limit;
    }

    std::string out;
    const size_t emit_end = replace_matches(*st.re, *st.replacement, buf, st.context, limit, final,
                                            tail_window_ + kMaxPendingMatch, out);

    if (final) {
        st.buffer.clear();
        st.context = 0;
    } else {
        size_t keep_from = emit_end > kLookbehindBytes ? emit_end - kLookbehindBytes : 0;
        while (keep_from > 0 && is_continuation(buf[keep_from])) --keep_from;
        st.buffer.erase(0, keep_from);
        st.context = emit_end - keep_from;
    }
    feed(stage + 1, out);
}

} // namespace quill
