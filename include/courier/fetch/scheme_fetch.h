#pragma once
#include <courier/fetch/request.h>
#include <courier/fetch/response.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courier::fetch {

// about, blob and data: schemes that never leave the process.
bool is_local_scheme(std::string_view scheme);
// Schemes resolved without a transport (about, data, file).
bool is_scheme_fetched_locally(std::string_view scheme);

struct DataUrl {
    std::string media_type;
    std::vector<uint8_t> body;
};

// nullopt when the URL has no ',' or a base64 payload does not decode.
std::optional<DataUrl> process_data_url(const url::URL& url);

// Whitespace is ignored and padding is optional.
std::optional<std::vector<uint8_t>> forgiving_base64_decode(std::string_view input);

// Content-Type for a local file: by extension, then by the leading bytes.
std::string sniff_mime_type(std::string_view path, const std::vector<uint8_t>& bytes);

// Resolves about:, data: and file: URLs. The result is unfiltered with a
// finished body, or a network error.
Response scheme_fetch(const Request& request);

} // namespace courier::fetch
