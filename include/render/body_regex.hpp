#pragma once

#include "core/error.hpp"
#include "core/recommendation.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward-declare RE2 (keeps <re2/re2.h> out of every includer)
namespace re2 {
class RE2;
}

namespace quill {

/**
 * @brief Compiled regex body patches, applied in order
 *
 * Patterns use RE2 syntax (the ECMAScript subset without lookaround or
 * backreferences); matching runs in linear time, so no pattern can
 * exhaust the stack. Replacements may reference groups with $1..$99
 * and the whole match with $&; $$ is a literal dollar. Every match is
 * replaced; an empty match advances by one code point.
 */
class RegexPatchSet {
public:
    RegexPatchSet();
    ~RegexPatchSet();
    RegexPatchSet(RegexPatchSet&&) noexcept;
    RegexPatchSet& operator=(RegexPatchSet&&) noexcept;

    /// INVALID_REGEX naming the first pattern that does not compile
    [[nodiscard]] static Result<RegexPatchSet> compile(const std::vector<RegexPatch>& patches);

    [[nodiscard]] std::string apply(std::string_view text) const;

    [[nodiscard]] bool empty() const { return patches_.empty(); }

private:
    friend class StreamingRegexWriter;

    struct Compiled {
        std::unique_ptr<re2::RE2> re;
        std::string replacement;
    };

    std::vector<Compiled> patches_;
};

/// Compile and apply in one step
[[nodiscard]] Result<std::string> apply_regex_patches(std::string_view text,
                                                      const std::vector<RegexPatch>& patches);

/**
 * @brief Regex patching over a chunked UTF-8 stream
 *
 * Each pattern is a stage feeding the next. A stage keeps the last
 * `tail_window` bytes of its input buffered and emits everything before
 * that, except that a match straddling the emit point stays buffered
 * whole. The last few emitted input bytes stay behind as lookbehind, so
 * `^`, `\b` and `\B` see the real preceding text. Matches no longer
 * than the window come out the same as a whole-buffer replacement.
 *
 * A pending match is settled as found once a stage holds more than
 * `tail_window + kMaxPendingMatch` bytes, which bounds memory for
 * patterns that keep matching to the end of the input.
 *
 * Chunks may split a code point; invalid UTF-8 fails the stream.
 */
class StreamingRegexWriter {
public:
    using Sink = std::function<void(std::string_view)>;

    static constexpr size_t kMaxPendingMatch = 16 * 1024;

    StreamingRegexWriter(RegexPatchSet patches, size_t tail_window, Sink sink);

    // Stages point into patches_
    StreamingRegexWriter(const StreamingRegexWriter&) = delete;
    StreamingRegexWriter& operator=(const StreamingRegexWriter&) = delete;

    /// IO_ERROR on invalid UTF-8 or after finish()
    [[nodiscard]] Result<void> write(std::string_view chunk);

    /// Transform and emit what is left; IO_ERROR on a truncated code point
    [[nodiscard]] Result<void> finish();

    /// Bytes held back across all stages (lookbehind excluded)
    [[nodiscard]] size_t buffered() const;

private:
    struct Stage {
        const re2::RE2* re;
        const std::string* replacement;
        std::string buffer;    // [0, context) was already emitted
        size_t context = 0;
    };

    void feed(size_t stage, std::string_view text);
    void flush(size_t stage, bool final);

    RegexPatchSet patches_;
    size_t tail_window_;
    Sink sink_;
    std::vector<Stage> stages_;
    std::string pending_;      // trailing bytes of an incomplete code point
    bool finished_ = false;
};

/**
 * @brief Length of the longest prefix made of complete, valid UTF-8 sequences
 * @return nullopt if an invalid byte sequence occurs (a truncated final sequence is not invalid)
 */
[[nodiscard]] std::optional<size_t> utf8_valid_prefix(std::string_view bytes);

} // namespace quill
