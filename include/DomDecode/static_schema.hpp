#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "decimal.hpp"
#include "number_conversion.hpp"
#include "tree_concept.hpp"
#include "value_types.hpp"

namespace DomDecode {

template <tree::TreeLike Tree>
class Decoder;

// Specialize for types that cannot carry a static `decode_from`:
//   template<> struct Decodable<Ext> {
//       template <class D> static bool decode(Ext & v, D & decoder);
//   };
template <class T>
struct Decodable;

namespace static_schema {


template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v = is_specialization_of<std::remove_cvref_t<T>, Template>::value;


template <class T>
concept DecodableInteger = std::is_integral_v<T> && !std::is_same_v<T, bool>
                            && !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t>
                            && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

template <class T>
concept DecodableFloat = std::is_same_v<T, float> || std::is_same_v<T, double>;

template <class T>
concept StringKeyedMap = (is_specialization_of_v<T, std::map> || is_specialization_of_v<T, std::unordered_map>)
                          && std::is_same_v<typename T::key_type, std::string>;

template <class T, class Tree>
concept HasDecodeFrom = requires (T & obj, Decoder<Tree> & d) {
    { T::decode_from(obj, d) } -> std::same_as<bool>;
};

template <class T, class Tree>
concept HasDecodableSpecialization = requires (T & obj, Decoder<Tree> & d) {
    { Decodable<T>::decode(obj, d) } -> std::same_as<bool>;
};

template <class T>
concept ReflectableAggregate = std::is_class_v<T> && std::is_aggregate_v<T> && std::is_default_constructible_v<T>;


enum class TypeCategory {
    signed_integer,
    unsigned_integer,
    floating_point,
    boolean,
    string,
    date,
    data,
    decimal,
    url,
    optional,
    dictionary,
    array,
    custom,
    aggregate,
    unsupported
};

// Resolved once per type at compile time; built-ins take precedence over
// containers, which take precedence over user-provided routines.
template <class T, class Tree>
consteval TypeCategory category_of() {
    using D = std::remove_cv_t<T>;
    if constexpr (std::is_same_v<D, bool>) {
        return TypeCategory::boolean;
    } else if constexpr (DecodableInteger<D>) {
        return std::is_signed_v<D> ? TypeCategory::signed_integer : TypeCategory::unsigned_integer;
    } else if constexpr (DecodableFloat<D>) {
        return TypeCategory::floating_point;
    } else if constexpr (std::is_same_v<D, std::string>) {
        return TypeCategory::string;
    } else if constexpr (std::is_same_v<D, Date>) {
        return TypeCategory::date;
    } else if constexpr (std::is_same_v<D, Data>) {
        return TypeCategory::data;
    } else if constexpr (std::is_same_v<D, Decimal>) {
        return TypeCategory::decimal;
    } else if constexpr (std::is_same_v<D, Url>) {
        return TypeCategory::url;
    } else if constexpr (is_specialization_of_v<D, std::optional>) {
        return TypeCategory::optional;
    } else if constexpr (StringKeyedMap<D>) {
        return TypeCategory::dictionary;
    } else if constexpr (DynamicContainerTypeConcept<D>) {
        return TypeCategory::array;
    } else if constexpr (HasDecodeFrom<D, Tree> || HasDecodableSpecialization<D, Tree>) {
        return TypeCategory::custom;
    } else if constexpr (ReflectableAggregate<D>) {
        return TypeCategory::aggregate;
    } else {
        return TypeCategory::unsupported;
    }
}

// Name used in diagnostics.
template <class T, class Tree>
std::string type_name() {
    constexpr TypeCategory c = category_of<T, Tree>();
    if constexpr (c == TypeCategory::boolean) return "Bool";
    else if constexpr (c == TypeCategory::string) return "String";
    else if constexpr (c == TypeCategory::date) return "Date";
    else if constexpr (c == TypeCategory::data) return "Data";
    else if constexpr (c == TypeCategory::decimal) return "Decimal";
    else if constexpr (c == TypeCategory::url) return "URL";
    else if constexpr (c == TypeCategory::dictionary) return "Dictionary";
    else if constexpr (c == TypeCategory::array) return "Array";
    else if constexpr (c == TypeCategory::optional) return "Optional<" + type_name<typename T::value_type, Tree>() + ">";
    else if constexpr (c == TypeCategory::signed_integer || c == TypeCategory::unsigned_integer ||
                       c == TypeCategory::floating_point) return numbers::number_type_name<T>();
    else return "value";
}

namespace detail {
template <class T>
struct always_false : std::false_type {};
}

} // namespace static_schema
} // namespace DomDecode
