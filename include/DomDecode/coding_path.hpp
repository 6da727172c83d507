#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace DomDecode {
namespace coding_path {


struct PathElement {
    static constexpr std::size_t NOT_AN_INDEX = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NOT_AN_INDEX;   // index into an array, or NOT_AN_INDEX for keys
    std::string field_name;                    // owned: the tree that produced it is gone after the call

    PathElement() = default;

    // For `{index}`
    PathElement(std::size_t index)
        : array_index(index)
    {}

    // For `{key}`
    PathElement(std::string_view key)
        : array_index(NOT_AN_INDEX)
        , field_name(key)
    {}
    PathElement(const char * key)
        : PathElement(std::string_view(key))
    {}

    bool is_key() const { return array_index == NOT_AN_INDEX; }
    bool is_index() const { return array_index != NOT_AN_INDEX; }

    // Integer keys are rendered the way a generic key would carry them.
    std::string string_value() const {
        if(is_key()) return field_name;
        return "Index " + std::to_string(array_index);
    }

    bool operator==(const PathElement & other) const {
        return array_index == other.array_index && field_name == other.field_name;
    }
};

} // namespace coding_path

using CodingPathSegment = coding_path::PathElement;
using CodingPath = std::vector<CodingPathSegment>;

// "$" for the root, then ".key" or "[i]" per segment.
inline std::string CodingPathToString(const CodingPath & path) {
    std::string out = "$";
    for(const auto & el: path) {
        if(el.is_key()) {
            out += "." + el.field_name;
        } else {
            out += "[" + std::to_string(el.array_index) + "]";
        }
    }
    return out;
}

} // namespace DomDecode
