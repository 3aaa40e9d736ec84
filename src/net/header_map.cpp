#include <courier/net/header_map.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace courier::net {

std::string HeaderMap::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool HeaderMap::names_equal(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    // Replace the first occurrence in place, drop the rest
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [&](const Entry& e) { return names_equal(e.first, name); });
    if (it == headers_.end()) {
        headers_.emplace_back(name, value);
        return;
    }
    it->second = value;
    auto first = std::next(it);
    headers_.erase(std::remove_if(first, headers_.end(),
                                  [&](const Entry& e) { return names_equal(e.first, name); }),
                   headers_.end());
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    headers_.emplace_back(name, value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    for (const auto& [key, value] : headers_) {
        if (names_equal(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    std::vector<std::string> result;
    for (const auto& [key, value] : headers_) {
        if (names_equal(key, name)) {
            result.push_back(value);
        }
    }
    return result;
}

std::optional<std::string> HeaderMap::get_combined(const std::string& name) const {
    auto values = get_all(name);
    if (values.empty()) {
        return std::nullopt;
    }
    std::string combined = values.front();
    for (size_t i = 1; i < values.size(); ++i) {
        combined += ", ";
        combined += values[i];
    }
    return combined;
}

bool HeaderMap::has(const std::string& name) const {
    return std::any_of(headers_.begin(), headers_.end(),
                       [&](const Entry& e) { return names_equal(e.first, name); });
}

void HeaderMap::remove(const std::string& name) {
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&](const Entry& e) { return names_equal(e.first, name); }),
                   headers_.end());
}

size_t HeaderMap::size() const {
    return headers_.size();
}

bool HeaderMap::empty() const {
    return headers_.empty();
}

void HeaderMap::clear() {
    headers_.clear();
}

std::vector<std::string> HeaderMap::names() const {
    std::vector<std::string> result;
    for (const auto& entry : headers_) {
        auto lower = normalize_name(entry.first);
        if (std::find(result.begin(), result.end(), lower) == result.end()) {
            result.push_back(std::move(lower));
        }
    }
    return result;
}

HeaderMap::iterator HeaderMap::begin() const {
    return headers_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return headers_.end();
}

bool HeaderMap::operator==(const HeaderMap& other) const {
    if (headers_.size() != other.headers_.size()) {
        return false;
    }
    for (size_t i = 0; i < headers_.size(); ++i) {
        if (!names_equal(headers_[i].first, other.headers_[i].first) ||
            headers_[i].second != other.headers_[i].second) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split_header_list(const std::string& value) {
    std::vector<std::string> tokens;
    std::istringstream stream(value);
    std::string token;
    while (std::getline(stream, token, ',')) {
        auto not_space = [](unsigned char c) { return !std::isspace(c); };
        token.erase(token.begin(), std::find_if(token.begin(), token.end(), not_space));
        token.erase(std::find_if(token.rbegin(), token.rend(), not_space).base(), token.end());
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

} // namespace courier::net
