#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "coding_path.hpp"
#include "decode_result.hpp"
#include "errors.hpp"

namespace DomDecode {

// Whether `node` is the offending value itself or the scope (dictionary or
// array) in which the failure happened.
enum class FailureAnchor {
    value,
    scope
};

template <class Tree>
struct TreeFailure {
    TreeFailureKind kind;
    std::string description;
    typename Tree::node_type node{};
    std::optional<std::string> key = std::nullopt;
    std::optional<std::size_t> index = std::nullopt;   // element position appended to a scope path
    FailureAnchor anchor = FailureAnchor::value;
};

template <class Tree>
DecodeError TranslateFailure(const TreeFailure<Tree> & f, const Tree & tree) {
    const DecodeErrorKind kind = translate_failure_kind(f.kind);
    if(f.kind == TreeFailureKind::json_parsing_failed) {
        return DecodeError(kind, {}, "The given data was not valid JSON. Error: " + f.description);
    }

    CodingPath path = f.node ? tree.coding_path(f.node) : CodingPath{};
    if(f.key && f.anchor == FailureAnchor::value && !path.empty()) {
        // the value path already ends with the key, which the error carries separately
        path.pop_back();
    }
    if(f.index) {
        path.emplace_back(*f.index);
    }
    return DecodeError(kind, std::move(path), f.description, f.key);
}

} // namespace DomDecode
