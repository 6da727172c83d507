#pragma once

#include <string>
#include <string_view>

#include "context.hpp"
#include "number_conversion.hpp"
#include "static_schema.hpp"

namespace DomDecode {
namespace detail {

template <class T, tree::TreeLike Tree>
bool type_mismatch(typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    return ctx.fail({TreeFailureKind::wrong_type,
                     "Expected to decode " + static_schema::type_name<T, Tree>() + " but found "
                         + std::string(ctx.tree().kind_name(node)) + " instead.",
                     node});
}

template <tree::TreeLike Tree>
bool decode_bool(bool & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    if(!ctx.tree().is_bool(node)) {
        return type_mismatch<bool>(node, ctx);
    }
    out = ctx.tree().read_bool(node);
    return true;
}

template <class NumberT, tree::TreeLike Tree>
bool decode_number(NumberT & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    const Tree & tree = ctx.tree();
    if constexpr (std::is_floating_point_v<NumberT>) {
        const DecodePolicy & p = ctx.policy();
        if(tree.is_string(node) && p.non_conforming_floats == strategies::NonConformingFloatDecoding::convert_from_string) {
            const std::string_view s = tree.read_string(node);
            if(s == p.positive_infinity) {
                out = std::numeric_limits<NumberT>::infinity();
                return true;
            } else if(s == p.negative_infinity) {
                out = -std::numeric_limits<NumberT>::infinity();
                return true;
            } else if(s == p.nan) {
                out = std::numeric_limits<NumberT>::quiet_NaN();
                return true;
            }
        }
    }
    if(!tree.is_number(node)) {
        return type_mismatch<NumberT>(node, ctx);
    }
    const std::string_view literal = tree.number_literal(node);
    if(numbers::convert_literal(literal, out, ctx.policy().full_precision_floats) != numbers::ConversionStatus::ok) {
        return ctx.fail({TreeFailureKind::number_does_not_fit,
                         "Parsed JSON number " + std::string(literal) + " does not fit in "
                             + numbers::number_type_name<NumberT>() + ".",
                         node});
    }
    return true;
}

template <tree::TreeLike Tree>
bool decode_string(std::string & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    if(!ctx.tree().is_string(node)) {
        return type_mismatch<std::string>(node, ctx);
    }
    out.assign(ctx.tree().read_string(node));
    return true;
}

} // namespace detail
} // namespace DomDecode
