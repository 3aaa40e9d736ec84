#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace courier::url {

enum class EncodeSet {
    C0Control,
    Fragment,
    Query,
    Path,
    Userinfo,
};

// Existing %XX sequences are preserved.
std::string percent_encode(std::string_view input, EncodeSet set);
std::string percent_decode(std::string_view input);
std::vector<uint8_t> percent_decode_bytes(std::string_view input);

} // namespace courier::url
