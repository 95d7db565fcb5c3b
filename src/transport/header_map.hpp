#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// Case-insensitive header multimap. Names are stored lower-cased, values keep
// their insertion order.
class HeaderMap {
public:
    using Values = std::vector<std::string>;
    using Storage = std::map<std::string, Values>;
    using const_iterator = Storage::const_iterator;

    void add(std::string_view p_name, std::string p_value);
    void set(std::string_view p_name, std::string p_value);
    void set_values(std::string_view p_name, Values p_values);
    void erase(std::string_view p_name);

    bool contains(std::string_view p_name) const;
    // First value, or an empty string when absent.
    std::string get(std::string_view p_name) const;
    const Values* values(std::string_view p_name) const;

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const HeaderMap& p_other) const { return entries_ == p_other.entries_; }
    bool operator!=(const HeaderMap& p_other) const { return !(*this == p_other); }

    static std::string normalize(std::string_view p_name);

private:
    Storage entries_;
};

void to_json(nlohmann::json& p_json, const HeaderMap& p_headers);

// Hop-by-hop and framing headers that never cross the proxy unchanged.
bool is_hop_by_hop_header(std::string_view p_name);
