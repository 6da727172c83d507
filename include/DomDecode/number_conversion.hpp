#pragma once

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace DomDecode {
namespace numbers {

enum class ConversionStatus {
    ok,
    does_not_fit
};

template <class T>
std::string number_type_name() {
    if constexpr (std::is_same_v<T, float>) {
        return "float";
    } else if constexpr (std::is_same_v<T, double>) {
        return "double";
    } else if constexpr (std::is_same_v<T, long double>) {
        return "long double";
    } else {
        static_assert(std::is_integral_v<T>);
        return std::string(std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8) + "_t";
    }
}

namespace detail {

struct LiteralParts {
    bool negative = false;
    std::string_view int_digits;
    std::string_view frac_digits;
    long long exponent = 0;
};

inline bool split_literal(std::string_view literal, LiteralParts & parts) {
    std::size_t i = 0;
    if(i < literal.size() && literal[i] == '-') {
        parts.negative = true;
        i ++;
    }
    const std::size_t int_begin = i;
    while(i < literal.size() && literal[i] >= '0' && literal[i] <= '9') i ++;
    parts.int_digits = literal.substr(int_begin, i - int_begin);
    if(i < literal.size() && literal[i] == '.') {
        const std::size_t frac_begin = ++ i;
        while(i < literal.size() && literal[i] >= '0' && literal[i] <= '9') i ++;
        parts.frac_digits = literal.substr(frac_begin, i - frac_begin);
    }
    if(parts.int_digits.empty() && parts.frac_digits.empty()) return false;
    if(i < literal.size() && (literal[i] == 'e' || literal[i] == 'E')) {
        i ++;
        if(i < literal.size() && literal[i] == '+') i ++;
        auto [p, ec] = std::from_chars(literal.data() + i, literal.data() + literal.size(), parts.exponent);
        if(ec != std::errc()) return false;
        i = std::size_t(p - literal.data());
        // Anything beyond this is zero or infinite for every supported type.
        parts.exponent = std::clamp(parts.exponent, -100000ll, 100000ll);
    }
    return i == literal.size();
}

// Integral-valued literals written with a fraction or exponent ("1.0", "1e2",
// "1e19"). The decimal point is shifted textually, so the result is exact.
template <class T>
ConversionStatus integer_from_real(std::string_view literal, T & out) {
    LiteralParts parts;
    if(!split_literal(literal, parts)) return ConversionStatus::does_not_fit;

    std::string digits(parts.int_digits);
    digits.append(parts.frac_digits);
    const std::size_t first = digits.find_first_not_of('0');
    if(first == std::string::npos) {
        out = 0;
        return ConversionStatus::ok;
    }
    // Position of the decimal point relative to the first significant digit.
    const long long point = (long long)parts.int_digits.size() + parts.exponent - (long long)first;
    digits.erase(0, first);
    if(point <= 0 || point > std::numeric_limits<T>::digits10 + 2) {
        return ConversionStatus::does_not_fit;
    }
    const std::size_t whole = std::size_t(point);
    if(whole < digits.size()) {
        if(digits.find_first_not_of('0', whole) != std::string::npos) {
            return ConversionStatus::does_not_fit;
        }
        digits.resize(whole);
    } else {
        digits.append(whole - digits.size(), '0');
    }
    if(parts.negative) {
        if constexpr (std::is_unsigned_v<T>) {
            return ConversionStatus::does_not_fit;
        }
        digits.insert(digits.begin(), '-');
    }
    T v{};
    auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if(ec != std::errc() || p != digits.data() + digits.size()) {
        return ConversionStatus::does_not_fit;
    }
    out = v;
    return ConversionStatus::ok;
}

// Approximate parse used when full precision is off: the leading 19
// significant digits scaled by powers of ten. May be off by a few ulps.
inline ConversionStatus fast_real(std::string_view literal, double & out) {
    LiteralParts parts;
    if(!split_literal(literal, parts)) return ConversionStatus::does_not_fit;

    constexpr std::uint64_t mantissa_limit = 1000000000000000000ull; // 1e18
    std::uint64_t mantissa = 0;
    long long scale = parts.exponent;
    for(char c: parts.int_digits) {
        if(mantissa < mantissa_limit) {
            mantissa = mantissa * 10 + std::uint64_t(c - '0');
        } else {
            scale ++;
        }
    }
    for(char c: parts.frac_digits) {
        if(mantissa < mantissa_limit) {
            mantissa = mantissa * 10 + std::uint64_t(c - '0');
            scale --;
        }
    }

    static constexpr double powers[] = {
        1e0, 1e1, 1e2, 1e3, 1e4, 1e5, 1e6, 1e7, 1e8, 1e9, 1e10, 1e11,
        1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22
    };
    double v = double(mantissa);
    while(v != 0 && scale > 22 && !std::isinf(v)) {
        v *= 1e22;
        scale -= 22;
    }
    while(v != 0 && scale < -22) {
        v /= 1e22;
        scale += 22;
    }
    if(v != 0 && !std::isinf(v)) {
        v = scale >= 0 ? v * powers[scale] : v / powers[-scale];
    }
    if(std::isinf(v)) return ConversionStatus::does_not_fit;
    out = parts.negative ? -v : v;
    return ConversionStatus::ok;
}

template <class T>
ConversionStatus real_from_literal(std::string_view literal, T & out) {
    const char * b = literal.data();
    const char * e = literal.data() + literal.size();
    T v{};
    auto [p, ec] = std::from_chars(b, e, v);
    if(ec == std::errc::result_out_of_range) {
        // Underflow rounds toward zero, overflow does not fit.
        const std::string text(literal);
        const long double approx = std::strtold(text.c_str(), nullptr);
        if(std::isinf(approx) || std::fabs(approx) > std::numeric_limits<T>::max()) {
            return ConversionStatus::does_not_fit;
        }
        out = static_cast<T>(approx);
        return ConversionStatus::ok;
    }
    if(ec != std::errc() || p != e) {
        return ConversionStatus::does_not_fit;
    }
    out = v;
    return ConversionStatus::ok;
}

} // namespace detail

// `literal` is the number exactly as written in the document.
template <class T>
ConversionStatus convert_literal(std::string_view literal, T & out, bool full_precision_floats = true) {
    if constexpr (std::is_integral_v<T>) {
        const char * b = literal.data();
        const char * e = literal.data() + literal.size();
        T v{};
        auto [p, ec] = std::from_chars(b, e, v);
        if(ec == std::errc::result_out_of_range) {
            return ConversionStatus::does_not_fit;
        }
        if(ec == std::errc() && p == e) {
            out = v;
            return ConversionStatus::ok;
        }
        return detail::integer_from_real(literal, out);
    } else if constexpr (std::is_same_v<T, float>) {
        if(full_precision_floats) {
            return detail::real_from_literal(literal, out);
        }
        double d = 0;
        if(detail::fast_real(literal, d) != ConversionStatus::ok) {
            return ConversionStatus::does_not_fit;
        }
        const float f = static_cast<float>(d);
        if(std::isinf(f)) return ConversionStatus::does_not_fit;
        out = f;
        return ConversionStatus::ok;
    } else if constexpr (std::is_same_v<T, double>) {
        if(full_precision_floats) {
            return detail::real_from_literal(literal, out);
        }
        return detail::fast_real(literal, out);
    } else {
        static_assert(std::is_floating_point_v<T>, "convert_literal only supports integral or floating types");
        return detail::real_from_literal(literal, out);
    }
}

} // namespace numbers
} // namespace DomDecode
