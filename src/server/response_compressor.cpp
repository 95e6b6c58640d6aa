#include "server/response_compressor.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#include <zlib.h>

#include <algorithm>
#include <format>

namespace quill {

namespace {

constexpr int kGzipWindowBits = 15 + 16;        // 32 KiB window, gzip wrapper
constexpr int kMemLevel = 8;
constexpr size_t kOutputBlock = 16 * 1024;
constexpr size_t kInputBlock = 1024 * 1024;     // keeps avail_in within uInt

/// Deflate stream writing a gzip member; ended on destruction
class GzipEncoder {
public:
    explicit GzipEncoder(int level) {
        initialised_ = deflateInit2(&zs_, level, Z_DEFLATED, kGzipWindowBits,
                                    kMemLevel, Z_DEFAULT_STRATEGY) == Z_OK;
    }
    ~GzipEncoder() {
        if (initialised_) deflateEnd(&zs_);
    }

    GzipEncoder(const GzipEncoder&) = delete;
    GzipEncoder& operator=(const GzipEncoder&) = delete;

    /// Encode all of `data`; nullopt on a zlib failure
    [[nodiscard]] std::optional<std::string> encode(std::string_view data) {
        if (!initialised_) return std::nullopt;

        std::string out;
        out.reserve(data.size() / 2 + kOutputBlock);
        size_t offset = 0;
        int flush = Z_NO_FLUSH;
        int ret = Z_OK;
        do {
            const size_t take = std::min(data.size() - offset, kInputBlock);
            zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + offset));
            zs_.avail_in = static_cast<uInt>(take);
            offset += take;
            flush = (offset == data.size()) ? Z_FINISH : Z_NO_FLUSH;

            do {
                const size_t used = out.size();
                out.resize(used + kOutputBlock);
                zs_.next_out = reinterpret_cast<Bytef*>(out.data() + used);
                zs_.avail_out = static_cast<uInt>(kOutputBlock);
                ret = deflate(&zs_, flush);
                out.resize(used + kOutputBlock - zs_.avail_out);
                if (ret == Z_STREAM_ERROR) return std::nullopt;
            } while (zs_.avail_out == 0);
        } while (flush != Z_FINISH);

        if (ret != Z_STREAM_END) return std::nullopt;
        return out;
    }

private:
    z_stream zs_{};
    bool initialised_ = false;
};

/// "q=0", "q=0.", "q=0.000" and friends
bool is_zero_quality(std::string_view param) {
    if (param.size() < 3 || (param[0] != 'q' && param[0] != 'Q') || param[1] != '=') return false;
    const auto value = param.substr(2);
    if (value.empty() || value[0] != '0') return false;
    if (value.size() == 1) return true;
    if (value[1] != '.') return false;
    return std::all_of(value.begin() + 2, value.end(), [](char c) { return c == '0'; });
}

} // anonymous namespace

ResponseCompressor::ResponseCompressor() = default;

ResponseCompressor::ResponseCompressor(const Config& config)
    : config_(config) {}

std::optional<std::string> ResponseCompressor::try_compress(std::string_view data) const {
    if (!should_compress(data.size())) {
        return std::nullopt;
    }

    GzipEncoder encoder(std::clamp(config_.level, 1, 9));
    auto encoded = encoder.encode(data);
    if (!encoded) {
        utils::log::warn(std::format("gzip of a {}-byte body failed; sending it uncompressed", data.size()));
        return std::nullopt;
    }

    // Rendered pages that don't shrink go out as-is
    if (encoded->size() >= data.size()) {
        return std::nullopt;
    }
    return encoded;
}

bool ResponseCompressor::encode(HttpResponse& response, std::string_view accept_encoding) const {
    if (!should_compress(response.body.size()) ||
        response.headers.contains(http::kContentEncodingHeader) ||
        !accepts_gzip(accept_encoding)) {
        return false;
    }

    auto compressed = try_compress(response.body);
    if (!compressed) return false;

    response.body = std::move(*compressed);
    response.headers.set(http::kContentEncodingHeader, "gzip");
    response.headers.append(http::kVaryHeader, http::kAcceptEncodingHeader);
    return true;
}

bool ResponseCompressor::accepts_gzip(std::string_view accept_encoding) {
    std::optional<bool> gzip;
    std::optional<bool> wildcard;

    for (const auto& item : utils::split(std::string(accept_encoding), ',')) {
        const auto parts = utils::split(item, ';');
        if (parts.empty()) continue;

        const auto coding = utils::trim(parts[0]);
        const bool is_gzip = utils::iequals(coding, "gzip");
        if (!is_gzip && coding != "*") continue;

        bool allowed = true;
        for (size_t i = 1; i < parts.size(); ++i) {
            if (is_zero_quality(utils::trim(parts[i]))) allowed = false;
        }
        (is_gzip ? gzip : wildcard) = allowed;
    }

    if (gzip) return *gzip;
    return wildcard.value_or(false);
}

} // namespace quill
