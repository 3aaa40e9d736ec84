#include <courier/url/percent_encoding.h>

namespace courier::url {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool in_c0_control_set(unsigned char c) {
    return c < 0x20 || c > 0x7E;
}

bool in_encode_set(unsigned char c, EncodeSet set) {
    if (in_c0_control_set(c)) {
        return true;
    }
    switch (set) {
        case EncodeSet::C0Control:
            return false;
        case EncodeSet::Fragment:
            return c == ' ' || c == '"' || c == '<' || c == '>' || c == '`';
        case EncodeSet::Query:
            return c == ' ' || c == '"' || c == '#' || c == '<' || c == '>';
        case EncodeSet::Path:
            return c == ' ' || c == '"' || c == '#' || c == '<' || c == '>' ||
                   c == '?' || c == '`' || c == '{' || c == '}';
        case EncodeSet::Userinfo:
            return c == ' ' || c == '"' || c == '#' || c == '<' || c == '>' ||
                   c == '?' || c == '`' || c == '{' || c == '}' || c == '/' ||
                   c == ':' || c == ';' || c == '=' || c == '@' || c == '[' ||
                   c == '\\' || c == ']' || c == '^' || c == '|';
    }
    return false;
}

} // anonymous namespace

std::string percent_encode(std::string_view input, EncodeSet set) {
    std::string result;
    result.reserve(input.size());

    for (unsigned char c : input) {
        if (in_encode_set(c, set)) {
            result += '%';
            result += hex_digits[(c >> 4) & 0xF];
            result += hex_digits[c & 0xF];
        } else {
            result += static_cast<char>(c);
        }
    }

    return result;
}

std::vector<uint8_t> percent_decode_bytes(std::string_view input) {
    std::vector<uint8_t> result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back(static_cast<uint8_t>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        result.push_back(static_cast<uint8_t>(input[i]));
    }

    return result;
}

std::string percent_decode(std::string_view input) {
    auto bytes = percent_decode_bytes(input);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace courier::url
