#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "builtins.hpp"
#include "containers.hpp"
#include "single_value.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace DomDecode {
namespace detail {

using static_schema::TypeCategory;

// Bulk path: the destination is pre-sized and filled in index order without
// a sequential container per element.
template <class T, tree::TreeLike Tree>
bool decode_array(T & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    const Tree & tree = ctx.tree();
    if(!tree.is_array(node)) {
        return ctx.fail({TreeFailureKind::wrong_type, "Tried to unbox array, but it wasn't an array", node});
    }
    out.clear();
    if constexpr (requires { out.reserve(std::size_t{}); }) {
        out.reserve(tree.array_size(node));
    }
    auto cursor = tree.enter_first_child(node);
    bool at_end = cursor.remaining == 0;
    while(!at_end) {
        typename T::value_type element{};
        if(!unbox(element, cursor.current, ctx)) {
            return false;
        }
        out.push_back(std::move(element));
        at_end = tree.advance(cursor);
    }
    return true;
}

// Dictionaries keep the keys exactly as written in the document.
template <class T, tree::TreeLike Tree>
bool decode_dictionary(T & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    const Tree & tree = ctx.tree();
    if(!tree.is_object(node)) {
        return ctx.fail({TreeFailureKind::wrong_type, "Tried to unbox dictionary, but it wasn't a dictionary", node});
    }
    out.clear();
    for(const auto & [key, child]: tree.raw_members(node)) {
        typename T::mapped_type v{};
        if(!unbox(v, child, ctx)) {
            return false;
        }
        out.insert_or_assign(std::string(key), std::move(v));
    }
    return true;
}

template <std::size_t I, class T, tree::TreeLike Tree>
bool decode_field(T & obj, KeyedContainer<Tree> & c) {
    auto & field = introspection::getStructElementByIndex<I>(obj);
    constexpr std::string_view key = introspection::structureElementNameByIndex<I, T>;
    using FieldT = std::remove_cvref_t<decltype(field)>;
    if constexpr (static_schema::is_specialization_of_v<FieldT, std::optional>) {
        return c.decode_if_present(field, key);
    } else {
        return c.decode(field, key);
    }
}

// Reflected aggregates: one keyed container keyed by the aggregate type itself.
template <class T, tree::TreeLike Tree>
bool decode_aggregate(T & obj, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    Decoder<Tree> d(ctx, node);
    auto c = d.template keyed_container<T>();
    if(!c) {
        return false;
    }
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (decode_field<I>(obj, *c) && ...);
    }(std::make_index_sequence<introspection::structureElementsCount<T>>{});
}

template <class T, tree::TreeLike Tree>
bool decode_value(T & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    constexpr TypeCategory cat = static_schema::category_of<T, Tree>();

    if constexpr (cat == TypeCategory::boolean) {
        return decode_bool(out, node, ctx);
    } else if constexpr (cat == TypeCategory::signed_integer || cat == TypeCategory::unsigned_integer
                         || cat == TypeCategory::floating_point) {
        return decode_number(out, node, ctx);
    } else if constexpr (cat == TypeCategory::string) {
        return decode_string(out, node, ctx);
    } else if constexpr (cat == TypeCategory::date) {
        return decode_date(out, node, ctx);
    } else if constexpr (cat == TypeCategory::data) {
        return decode_data(out, node, ctx);
    } else if constexpr (cat == TypeCategory::decimal) {
        return decode_decimal(out, node, ctx);
    } else if constexpr (cat == TypeCategory::url) {
        return decode_url(out, node, ctx);
    } else if constexpr (cat == TypeCategory::optional) {
        if(ctx.tree().is_null(node)) {
            out.reset();
            return true;
        }
        typename T::value_type v{};
        if(!decode_value(v, node, ctx)) {
            return false;
        }
        out = std::move(v);
        return true;
    } else if constexpr (cat == TypeCategory::dictionary) {
        return decode_dictionary(out, node, ctx);
    } else if constexpr (cat == TypeCategory::array) {
        return decode_array(out, node, ctx);
    } else if constexpr (cat == TypeCategory::custom) {
        Decoder<Tree> d(ctx, node);
        if constexpr (static_schema::HasDecodeFrom<T, Tree>) {
            return T::decode_from(out, d);
        } else {
            return Decodable<T>::decode(out, d);
        }
    } else {
        return decode_aggregate(out, node, ctx);
    }
}

template <class T, tree::TreeLike Tree>
bool unbox(T & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    constexpr TypeCategory cat = static_schema::category_of<T, Tree>();
    if constexpr (cat == TypeCategory::unsupported) {
        static_assert(static_schema::detail::always_false<T>::value,
                      "[[[ DomDecode ]]] T is not a decodable type: expected a scalar, string, Date, Data, "
                      "Decimal, Url, optional, string-keyed map, dynamic sequence, a type with a static "
                      "decode_from(T&, Decoder&), a Decodable<T> specialization or a reflectable aggregate.");
        return false;
    } else {
        auto guard = ctx.enter(node);
        if(!guard) {
            return false;
        }
        if constexpr (cat != TypeCategory::optional && cat != TypeCategory::custom) {
            if(ctx.tree().is_null(node)) {
                return ctx.fail({TreeFailureKind::value_does_not_exist,
                                 "Expected " + static_schema::type_name<T, Tree>() + " value but found null instead.",
                                 node});
            }
        }
        return decode_value(out, node, ctx);
    }
}

} // namespace detail
} // namespace DomDecode
