#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Content codings the decoder understands: identity, gzip, x-gzip, deflate
bool is_decodable_encoding(std::string_view p_content_encoding);

bool is_identity_encoding(std::string_view p_content_encoding);

// Removes the content coding named by a Content-Encoding header value.
// Throws RewriteError on unsupported codings, corrupt data or output
// larger than p_max_size.
std::string decode_content(std::string_view p_body, std::string_view p_content_encoding, size_t p_max_size);
