#ifndef SHAMIR256_SHARE_CODEC_H
#define SHAMIR256_SHARE_CODEC_H

#include "../common/types.h"
#include "../common/errors.h"
#include <string>
#include <vector>
#include <sodium.h>

namespace shamir256 {
namespace cli {

enum class Encoding {
    BASE64,
    HEX
};

/**
 * Text transport for shares
 *
 * The sharing core only deals in raw bytes; this is what the command-line
 * tool prints and parses. Base64 is the standard RFC 4648 alphabet with padding.
 */
class ShareCodec {
public:
    static Encoding parseEncoding(const std::string& name) {
        if (name == "base64") return Encoding::BASE64;
        if (name == "hex") return Encoding::HEX;
        throw InvalidArgumentError("Unknown encoding: " + name);
    }

    static std::string encode(const Bytes& data, Encoding encoding) {
        if (encoding == Encoding::HEX) {
            std::string out(data.size() * 2 + 1, '\0');
            sodium_bin2hex(&out[0], out.size(), data.data(), data.size());
            out.resize(data.size() * 2);
            return out;
        }

        const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string out(encoded_len, '\0');
        sodium_bin2base64(&out[0], out.size(), data.data(), data.size(),
                          sodium_base64_VARIANT_ORIGINAL);
        out.resize(encoded_len - 1);  // drop the terminating NUL
        return out;
    }

    /**
     * @throws InvalidArgumentError if the text is not valid in the given encoding
     */
    static Bytes decode(const std::string& text, Encoding encoding) {
        Bytes out(text.size());  // decoded data is never longer than the text
        size_t bin_len = 0;
        const char* end = nullptr;
        int ret = 0;

        if (encoding == Encoding::HEX) {
            ret = sodium_hex2bin(out.data(), out.size(), text.data(), text.size(),
                                 nullptr, &bin_len, &end);
        } else {
            ret = sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                                    nullptr, &bin_len, &end,
                                    sodium_base64_VARIANT_ORIGINAL);
        }

        if (ret != 0 || end != text.data() + text.size()) {
            throw InvalidArgumentError("Malformed share encoding");
        }

        out.resize(bin_len);
        return out;
    }
};

} // namespace cli
} // namespace shamir256

#endif // SHAMIR256_SHARE_CODEC_H
