#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace courier::net {

// Ordered header list. Names keep the case they were first given with;
// every lookup is case-insensitive.
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    // All values for name joined with ", ".
    std::optional<std::string> get_combined(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const;
    bool empty() const;
    void clear();

    // Distinct lowercase names in first-seen order.
    std::vector<std::string> names() const;

    // Iteration
    using iterator = std::vector<Entry>::const_iterator;
    iterator begin() const;
    iterator end() const;

    bool operator==(const HeaderMap& other) const;
    bool operator!=(const HeaderMap& other) const { return !(*this == other); }

    static std::string normalize_name(const std::string& name);
    static bool names_equal(const std::string& a, const std::string& b);

private:
    std::vector<Entry> headers_;
};

// Splits a comma-separated header value into trimmed, non-empty tokens.
std::vector<std::string> split_header_list(const std::string& value);

} // namespace courier::net
