#pragma once

#include <string>

#include "coding_path.hpp"
#include "decode_result.hpp"
#include "errors.hpp"

namespace DomDecode {

// "When decoding $.users[2], error 'KEY_MISSING' (key 'id'): No value associated with key "id"."
inline std::string DecodeErrorToString(const DecodeError & err) {
    std::string out = "When decoding " + CodingPathToString(err.coding_path())
                    + ", error '" + std::string(error_to_string(err.kind())) + "'";
    if(err.key()) {
        out += " (key '" + *err.key() + "')";
    }
    if(!err.description().empty()) {
        out += ": " + err.description();
    }
    return out;
}

} // namespace DomDecode
