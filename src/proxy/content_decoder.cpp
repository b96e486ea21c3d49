#include "content_decoder.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <zlib.h>

namespace {

class ZlibInflater {
public:
    explicit ZlibInflater(int p_window_bits) {
        int err = inflateInit2(&z_, p_window_bits);
        if (err != Z_OK) {
            throw RewriteError(std::string("inflateInit2() failed: ") + zError(err));
        }
    }

    ~ZlibInflater() {
        inflateEnd(&z_);
    }

    ZlibInflater(const ZlibInflater&) = delete;
    ZlibInflater& operator=(const ZlibInflater&) = delete;

    // Returns false on Z_DATA_ERROR so the caller can try another framing.
    // With p_members set, gzip members that follow the first one are
    // inflated too (RFC 1952 2.2).
    bool inflate_all(std::string_view p_input, size_t p_max_size, std::string& p_output,
                     bool p_members = false) {
        z_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(p_input.data()));
        z_.avail_in = static_cast<uInt>(p_input.size());

        char buffer[16384];
        while (true) {
            z_.next_out = reinterpret_cast<Bytef*>(buffer);
            z_.avail_out = sizeof(buffer);

            int err = inflate(&z_, Z_NO_FLUSH);
            p_output.append(buffer, sizeof(buffer) - z_.avail_out);

            if (p_output.size() > p_max_size) {
                throw RewriteError("Decoded body exceeds " + std::to_string(p_max_size) + " bytes");
            }

            if (err == Z_STREAM_END) {
                if (!p_members || !next_member_follows()) {
                    return true;
                }
                err = inflateReset(&z_);
                if (err != Z_OK) {
                    throw RewriteError(std::string("inflateReset() failed: ") + zError(err));
                }
                continue;
            }
            if (err == Z_DATA_ERROR) {
                return false;
            }
            if (err == Z_BUF_ERROR && z_.avail_in == 0) {
                throw RewriteError("Truncated compressed body");
            }
            if (err != Z_OK && err != Z_BUF_ERROR) {
                throw RewriteError(std::string("inflate() failed: ") + zError(err));
            }
        }
    }

private:
    // Anything after a member that lacks the gzip magic is trailing
    // padding and ignored
    bool next_member_follows() const {
        return z_.avail_in >= 2 && z_.next_in[0] == 0x1f && z_.next_in[1] == 0x8b;
    }

    z_stream z_{};
};

std::string inflate_body(std::string_view p_body, int p_window_bits, size_t p_max_size,
                         bool p_members = false) {
    std::string output;
    ZlibInflater inflater(p_window_bits);
    if (!inflater.inflate_all(p_body, p_max_size, output, p_members)) {
        throw RewriteError("Corrupt compressed body");
    }
    return output;
}

} // namespace

bool is_identity_encoding(std::string_view p_content_encoding) {
    auto encoding = trim(p_content_encoding);
    return encoding.empty() || iequals(encoding, "identity");
}

bool is_decodable_encoding(std::string_view p_content_encoding) {
    auto encoding = trim(p_content_encoding);
    return is_identity_encoding(encoding) || iequals(encoding, "gzip") || iequals(encoding, "x-gzip") ||
           iequals(encoding, "deflate");
}

std::string decode_content(std::string_view p_body, std::string_view p_content_encoding, size_t p_max_size) {
    auto encoding = trim(p_content_encoding);
    if (is_identity_encoding(encoding)) {
        return std::string(p_body);
    }

    if (iequals(encoding, "gzip") || iequals(encoding, "x-gzip")) {
        return inflate_body(p_body, MAX_WBITS + 16, p_max_size, true);
    }

    if (iequals(encoding, "deflate")) {
        // "deflate" is meant to be zlib-wrapped, but some servers send
        // raw deflate data
        std::string output;
        {
            ZlibInflater inflater(MAX_WBITS);
            if (inflater.inflate_all(p_body, p_max_size, output)) {
                return output;
            }
        }
        return inflate_body(p_body, -MAX_WBITS, p_max_size);
    }

    throw RewriteError("Unsupported content encoding: " + std::string(encoding));
}
