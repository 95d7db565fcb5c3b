#include "content_codec.hpp"
#include "../utils/logger.h"

#include <brotli/decode.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <memory>

namespace {

std::string trim_lower(std::string_view p_value) {
    auto begin = p_value.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = p_value.find_last_not_of(" \t");
    std::string out(p_value.substr(begin, end - begin + 1));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::size_t kChunkSize = 16384;

} // namespace

ContentEncoding ContentCodec::parse_encoding(std::string_view p_value) {
    const std::string value = trim_lower(p_value);
    if (value.empty() || value == "identity") return ContentEncoding::Identity;
    if (value == "gzip" || value == "x-gzip") return ContentEncoding::Gzip;
    if (value == "deflate") return ContentEncoding::Deflate;
    if (value == "br") return ContentEncoding::Brotli;
    return ContentEncoding::Unknown;
}

DecodeResult ContentCodec::decompress(const std::string& p_body, std::string_view p_encoding) {
    DecodeResult result;
    const ContentEncoding encoding = parse_encoding(p_encoding);
    LOG_DEBUG("Attempting to decompress body with encoding: " << p_encoding);

    bool ok = true;
    switch (encoding) {
        case ContentEncoding::Gzip:
            ok = inflate_all(p_body, 16 + MAX_WBITS, result.body, result.error);
            break;
        case ContentEncoding::Deflate:
            ok = inflate_all(p_body, MAX_WBITS, result.body, result.error);
            break;
        case ContentEncoding::Brotli:
            ok = brotli_all(p_body, result.body, result.error);
            break;
        case ContentEncoding::Identity:
        case ContentEncoding::Unknown:
            LOG_DEBUG("No decompression needed for encoding: " << p_encoding);
            result.body = p_body;
            return result;
    }

    if (!ok) {
        LOG_ERROR("Failed to decompress " << p_encoding << " body: " << result.error);
        result.body = p_body;
        return result;
    }

    result.decoded = true;
    LOG_DEBUG("Decompressed " << p_encoding << " " << p_body.size() << " bytes -> " << result.body.size() << " bytes");
    return result;
}

bool ContentCodec::inflate_all(const std::string& p_in, int p_window_bits, std::string& p_out, std::string& p_error) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(p_in.data()));
    zs.avail_in = static_cast<uInt>(p_in.size());

    if (inflateInit2(&zs, p_window_bits) != Z_OK) {
        p_error = "inflateInit2 failed";
        return false;
    }

    std::array<char, kChunkSize> buf;
    int ret = Z_OK;
    p_out.clear();
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            p_error = zs.msg ? zs.msg : "inflate failed with code " + std::to_string(ret);
            inflateEnd(&zs);
            return false;
        }
        const std::size_t produced = buf.size() - zs.avail_out;
        p_out.append(buf.data(), produced);
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0) {
            p_error = "unexpected end of compressed stream";
            inflateEnd(&zs);
            return false;
        }
    }
    inflateEnd(&zs);
    return true;
}

bool ContentCodec::brotli_all(const std::string& p_in, std::string& p_out, std::string& p_error) {
    std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state(
        BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
    if (!state) {
        p_error = "failed to create brotli decoder";
        return false;
    }

    const uint8_t* next_in = reinterpret_cast<const uint8_t*>(p_in.data());
    std::size_t avail_in = p_in.size();
    std::array<uint8_t, kChunkSize> buf;
    p_out.clear();

    for (;;) {
        uint8_t* next_out = buf.data();
        std::size_t avail_out = buf.size();
        BrotliDecoderResult res = BrotliDecoderDecompressStream(
            state.get(), &avail_in, &next_in, &avail_out, &next_out, nullptr);
        p_out.append(reinterpret_cast<const char*>(buf.data()), buf.size() - avail_out);

        switch (res) {
            case BROTLI_DECODER_RESULT_SUCCESS:
                return true;
            case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
                continue;
            case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
                p_error = "unexpected end of brotli stream";
                return false;
            case BROTLI_DECODER_RESULT_ERROR:
            default:
                p_error = BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get()));
                return false;
        }
    }
}
