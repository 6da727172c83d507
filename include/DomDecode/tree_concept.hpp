#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "coding_path.hpp"

namespace DomDecode {

namespace tree {

enum class ParseStatus {
    ok,             // document is available through root()
    failed,         // malformed input, reason in failure_reason()
    retry_advised   // parsed, but the fast path declines this document
};

/// TreeLike defines the read-only view over a parsed document that the
/// containers and the dispatcher are written against. Two trees satisfy it:
/// the borrowed yyjson document of the fast engine and the owned value tree
/// of the reference engine.
template<typename T>
concept TreeLike = requires(T & mutable_tree,
                            const T & tree,
                            typename T::node_type node,
                            typename T::ArrayCursor & cursor,
                            std::string_view key
                           ) {

    // ========== Type Requirements ==========
    typename T::node_type;
    typename T::ArrayCursor;

    { tree.root() } -> std::same_as<typename T::node_type>;

    // ========== Structural queries ==========
    { tree.is_null(node) } -> std::same_as<bool>;
    { tree.is_bool(node) } -> std::same_as<bool>;
    { tree.is_number(node) } -> std::same_as<bool>;
    { tree.is_string(node) } -> std::same_as<bool>;
    { tree.is_array(node) } -> std::same_as<bool>;
    { tree.is_object(node) } -> std::same_as<bool>;
    { tree.kind_name(node) } -> std::same_as<std::string_view>;

    // ========== Arrays ==========
    { tree.array_size(node) } -> std::same_as<std::size_t>;
    // Positions a cursor at the first element; `remaining` is 0 for an empty array.
    { tree.enter_first_child(node) } -> std::same_as<typename T::ArrayCursor>;
    // Moves to the next element, returns true once past the last one.
    { tree.advance(cursor) } -> std::same_as<bool>;

    // ========== Dictionaries ==========
    { tree.member_count(node) } -> std::same_as<std::size_t>;
    { tree.fetch(node, key) } -> std::same_as<typename T::node_type>;
    { tree.all_keys(node) } -> std::same_as<std::vector<std::string_view>>;
    { tree.raw_members(node) } -> std::same_as<std::vector<std::pair<std::string_view, typename T::node_type>>>;
    { mutable_tree.convert_keys_to_camel_case(node) };
    { tree.empty_dictionary() } -> std::same_as<typename T::node_type>;

    // ========== Scalars ==========
    { tree.read_bool(node) } -> std::same_as<bool>;
    { tree.read_string(node) } -> std::same_as<std::string_view>;
    { tree.number_literal(node) } -> std::same_as<std::string_view>;

    // ========== Paths ==========
    { tree.coding_path(node) } -> std::same_as<CodingPath>;
};

} // namespace tree
} // namespace DomDecode
