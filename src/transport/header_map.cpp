#include "header_map.hpp"

#include <algorithm>
#include <cctype>

std::string HeaderMap::normalize(std::string_view p_name) {
    std::string out(p_name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void HeaderMap::add(std::string_view p_name, std::string p_value) {
    entries_[normalize(p_name)].push_back(std::move(p_value));
}

void HeaderMap::set(std::string_view p_name, std::string p_value) {
    entries_[normalize(p_name)] = Values{std::move(p_value)};
}

void HeaderMap::set_values(std::string_view p_name, Values p_values) {
    entries_[normalize(p_name)] = std::move(p_values);
}

void HeaderMap::erase(std::string_view p_name) {
    entries_.erase(normalize(p_name));
}

bool HeaderMap::contains(std::string_view p_name) const {
    return entries_.count(normalize(p_name)) != 0;
}

std::string HeaderMap::get(std::string_view p_name) const {
    auto it = entries_.find(normalize(p_name));
    if (it == entries_.end() || it->second.empty()) {
        return {};
    }
    return it->second.front();
}

const HeaderMap::Values* HeaderMap::values(std::string_view p_name) const {
    auto it = entries_.find(normalize(p_name));
    return it != entries_.end() ? &it->second : nullptr;
}

void to_json(nlohmann::json& p_json, const HeaderMap& p_headers) {
    p_json = nlohmann::json::object();
    for (const auto& [name, values] : p_headers) {
        p_json[name] = values;
    }
}

bool is_hop_by_hop_header(std::string_view p_name) {
    static const char* const kHopByHop[] = {
        "connection", "keep-alive", "proxy-connection", "proxy-authenticate",
        "proxy-authorization", "te", "trailer", "transfer-encoding", "upgrade",
        "content-length",
    };
    const std::string name = HeaderMap::normalize(p_name);
    for (const char* candidate : kHopByHop) {
        if (name == candidate) {
            return true;
        }
    }
    return false;
}
