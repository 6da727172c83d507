#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace DomDecode {
namespace key_case {

namespace detail {
constexpr char to_lower(char c) { return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c; }
constexpr char to_upper(char c) { return (c >= 'a' && c <= 'z') ? char(c - 'a' + 'A') : c; }
}

// "snake_case_key" -> "snakeCaseKey". Leading and trailing underscores are
// kept; a key without inner underscores is returned unchanged.
inline std::string snake_to_camel(std::string_view key) {
    const auto first = key.find_first_not_of('_');
    if(first == std::string_view::npos) {
        return std::string(key);
    }
    const auto last = key.find_last_not_of('_');
    const std::string_view body = key.substr(first, last - first + 1);

    std::vector<std::string_view> components;
    std::size_t pos = 0;
    while(pos <= body.size()) {
        const auto next = body.find('_', pos);
        const auto end = next == std::string_view::npos ? body.size() : next;
        if(end > pos) {
            components.push_back(body.substr(pos, end - pos));
        }
        if(next == std::string_view::npos) break;
        pos = next + 1;
    }

    std::string out(key.substr(0, first));
    if(components.size() == 1) {
        out += body;
    } else {
        for(std::size_t i = 0; i < components.size(); i ++) {
            const auto c = components[i];
            for(std::size_t j = 0; j < c.size(); j ++) {
                out += (i > 0 && j == 0) ? detail::to_upper(c[j]) : detail::to_lower(c[j]);
            }
        }
    }
    out += key.substr(last + 1);
    return out;
}

} // namespace key_case
} // namespace DomDecode
