#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

namespace DomDecode {

// Compile-time key literal usable as a template argument.
template <std::size_t N>
struct FieldKey {
    char m_data[N + 1];

    constexpr FieldKey(const char (&s)[N + 1]) {
        for(std::size_t i = 0; i < N + 1; i ++) {
            m_data[i] = s[i];
        }
    }
    constexpr std::string_view view() const {
        return {&m_data[0], N};
    }
};
template <std::size_t N>
FieldKey(const char (&)[N]) -> FieldKey<N - 1>;


// Specialize to choose the keys an aggregate is decoded from, and which
// members take part at all:
//   template<> struct StructMeta<User> {
//       using Fields = StructFields<Field<&User::id, "user_id">, Field<&User::name, "name">>;
//   };
template <class T>
struct StructMeta {};

template <auto MPtr, FieldKey key>
struct Field {
    static constexpr auto MemberP = MPtr;
    static constexpr std::string_view Name = key.view();
};

template <class ... F>
struct StructFields {
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template <class T>
concept HasStructMeta = requires {
    typename StructMeta<T>::Fields::FieldsTuple;
};

// Members as pfr sees them: declaration order, member names as keys.
template <class T>
struct Members {
    static constexpr std::size_t count = pfr::tuple_size_v<T>;

    template <std::size_t I>
    static constexpr decltype(auto) get(T & s) {
        return (pfr::get<I>(s));
    }

    template <std::size_t I>
    static constexpr std::string_view key = pfr::get_name<I, T>();
};

// Members listed by a StructMeta specialization.
template <HasStructMeta T>
struct Members<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;

    static constexpr std::size_t count = std::tuple_size_v<Fields>;

    template <std::size_t I>
    static constexpr decltype(auto) get(T & s) {
        return (s.*(std::tuple_element_t<I, Fields>::MemberP));
    }

    template <std::size_t I>
    static constexpr std::string_view key = std::tuple_element_t<I, Fields>::Name;
};

} // namespace detail

template <std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    return (detail::Members<std::remove_cv_t<StructT>>::template get<Index>(s));
}

template <class StructT>
inline constexpr std::size_t structureElementsCount = detail::Members<std::remove_cv_t<StructT>>::count;

template <std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::Members<std::remove_cv_t<StructT>>::template key<Index>;

} // namespace introspection
} // namespace DomDecode
