#include "codec/content_codec.hpp"
#include "utils/logger.h"

#include <brotli/encode.h>
#include <zlib.h>

#include <cassert>
#include <cstring>
#include <string>
#include <vector>

namespace {

const std::string kPayload =
    "{\"id\":\"chatcmpl-1\",\"object\":\"chat.completion\",\"choices\":[{\"message\":"
    "{\"role\":\"assistant\",\"content\":\"hello hello hello hello hello\"}}]}";

std::string zlib_encode(const std::string& p_in, int p_window_bits) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    int rc = deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, p_window_bits, 8, Z_DEFAULT_STRATEGY);
    assert(rc == Z_OK);
    (void)rc;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(p_in.data()));
    zs.avail_in = static_cast<uInt>(p_in.size());

    std::string out;
    char buffer[4096];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = deflate(&zs, Z_FINISH);
        assert(ret == Z_OK || ret == Z_STREAM_END);
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    }
    deflateEnd(&zs);
    return out;
}

std::string brotli_encode(const std::string& p_in) {
    std::vector<uint8_t> out(BrotliEncoderMaxCompressedSize(p_in.size()) + 64);
    size_t encoded_size = out.size();
    BROTLI_BOOL ok = BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_TEXT,
                                           p_in.size(), reinterpret_cast<const uint8_t*>(p_in.data()),
                                           &encoded_size, out.data());
    assert(ok == BROTLI_TRUE);
    (void)ok;
    return std::string(reinterpret_cast<const char*>(out.data()), encoded_size);
}

} // namespace

static void test_parse_encoding() {
    assert(ContentCodec::parse_encoding("") == ContentEncoding::Identity);
    assert(ContentCodec::parse_encoding("identity") == ContentEncoding::Identity);
    assert(ContentCodec::parse_encoding("gzip") == ContentEncoding::Gzip);
    assert(ContentCodec::parse_encoding(" GZIP ") == ContentEncoding::Gzip);
    assert(ContentCodec::parse_encoding("deflate") == ContentEncoding::Deflate);
    assert(ContentCodec::parse_encoding("br") == ContentEncoding::Brotli);
    assert(ContentCodec::parse_encoding("zstd") == ContentEncoding::Unknown);
}

static void test_gzip() {
    DecodeResult result = ContentCodec::decompress(zlib_encode(kPayload, 16 + MAX_WBITS), "gzip");
    assert(result.ok());
    assert(result.decoded);
    assert(result.body == kPayload);
}

static void test_deflate() {
    DecodeResult result = ContentCodec::decompress(zlib_encode(kPayload, MAX_WBITS), "deflate");
    assert(result.ok());
    assert(result.decoded);
    assert(result.body == kPayload);
}

static void test_brotli() {
    DecodeResult result = ContentCodec::decompress(brotli_encode(kPayload), "br");
    assert(result.ok());
    assert(result.decoded);
    assert(result.body == kPayload);
}

static void test_identity_and_unknown_pass_through() {
    DecodeResult identity = ContentCodec::decompress(kPayload, "identity");
    assert(identity.ok());
    assert(!identity.decoded);
    assert(identity.body == kPayload);

    DecodeResult none = ContentCodec::decompress(kPayload, "");
    assert(none.ok());
    assert(none.body == kPayload);

    DecodeResult unknown = ContentCodec::decompress(kPayload, "compress");
    assert(unknown.ok());
    assert(!unknown.decoded);
    assert(unknown.body == kPayload);
}

static void test_corrupt_input_keeps_original() {
    const std::string garbage = "this is not gzip data at all";
    DecodeResult gz = ContentCodec::decompress(garbage, "gzip");
    assert(!gz.ok());
    assert(gz.body == garbage);

    DecodeResult br = ContentCodec::decompress(garbage, "br");
    assert(!br.ok());
    assert(br.body == garbage);
}

static void test_truncated_stream_is_an_error() {
    std::string compressed = zlib_encode(kPayload, 16 + MAX_WBITS);
    std::string truncated = compressed.substr(0, compressed.size() / 2);
    DecodeResult result = ContentCodec::decompress(truncated, "gzip");
    assert(!result.ok());
    assert(result.body == truncated);
}

int main() {
    Logger::instance().set_level(LogLevel::Off);
    test_parse_encoding();
    test_gzip();
    test_deflate();
    test_brotli();
    test_identity_and_unknown_pass_through();
    test_corrupt_input_keeps_original();
    test_truncated_stream_is_an_error();
    return 0;
}
