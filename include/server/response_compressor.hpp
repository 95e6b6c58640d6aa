#pragma once

#include "server/response_builder.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace quill {

/**
 * @brief gzip content-encoding for rendered responses
 *
 * A response is encoded when compression is enabled, its body is at
 * least min_size_bytes, it carries no Content-Encoding of its own, the
 * client accepts gzip and the encoded body is actually smaller.
 */
class ResponseCompressor {
public:
    struct Config {
        bool enabled = false;
        size_t min_size_bytes = 1024;  // Only compress at or above this size
        int level = 6;                 // zlib level 1..9
    };

    ResponseCompressor();
    explicit ResponseCompressor(const Config& config);

    /// gzip member for `data`; nullopt when below the threshold, disabled or not smaller
    [[nodiscard]] std::optional<std::string> try_compress(std::string_view data) const;

    /**
     * @brief Negotiate and encode a response in place
     * @param accept_encoding The request's Accept-Encoding value (may be empty)
     * @return true when the body was replaced and Content-Encoding/Vary were set
     */
    bool encode(HttpResponse& response, std::string_view accept_encoding) const;

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    [[nodiscard]] bool should_compress(size_t body_size) const {
        return config_.enabled && body_size >= config_.min_size_bytes;
    }

    /**
     * @brief True when an Accept-Encoding value allows gzip
     *
     * An explicit gzip entry decides; otherwise a `*` entry does. A q
     * value of zero refuses the coding.
     */
    [[nodiscard]] static bool accepts_gzip(std::string_view accept_encoding);

private:
    Config config_;
};

} // namespace quill
