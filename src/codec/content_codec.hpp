#pragma once

#include <string>
#include <string_view>

enum class ContentEncoding {
    Identity,
    Gzip,
    Deflate,
    Brotli,
    Unknown
};

struct DecodeResult {
    std::string body;
    std::string error;
    bool decoded = false; // true when the body was actually transformed

    bool ok() const { return error.empty(); }
};

class ContentCodec {
public:
    static ContentEncoding parse_encoding(std::string_view p_value);

    // Returns the plain bytes. On failure the result carries the original
    // bytes and a non-empty error. Identity, empty and unrecognized encodings
    // pass through untouched with no error.
    static DecodeResult decompress(const std::string& p_body, std::string_view p_encoding);

private:
    static bool inflate_all(const std::string& p_in, int p_window_bits, std::string& p_out, std::string& p_error);
    static bool brotli_all(const std::string& p_in, std::string& p_out, std::string& p_error);
};
