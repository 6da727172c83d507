#pragma once

#include <chrono>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "containers.hpp"
#include "decimal.hpp"
#include "single_value.hpp"
#include "value_types.hpp"

namespace DomDecode {

// Deferred representation: seconds since 2001-01-01T00:00:00Z.
template <>
struct Decodable<Date> {
    template <class D>
    static bool decode(Date & d, D & decoder) {
        double seconds = 0;
        if(!decoder.single_value_container().decode(seconds)) return false;
        d = DateFromSecondsSinceReferenceDate(seconds);
        return true;
    }
};

// Deferred representation: an array of byte values.
template <>
struct Decodable<Data> {
    template <class D>
    static bool decode(Data & d, D & decoder) {
        return decoder.single_value_container().decode(d.bytes);
    }
};


namespace builtins {

inline bool decode_base64(std::string_view text, std::vector<std::uint8_t> & out) {
    if(text.size() % 4 != 0) return false;
    out.clear();
    out.reserve(text.size() / 4 * 3);

    for(std::size_t pos = 0; pos < text.size(); pos += 4) {
        const bool last_group = pos + 4 == text.size();
        std::uint32_t value = 0;
        std::uint32_t out_bytes = 3;
        for(int k = 0; k != 4; ++k) {
            value <<= 6;
            const char c = text[pos + k];
            if(c >= 'A' && c <= 'Z')
                value |= std::uint32_t(c - 'A');
            else if(c >= 'a' && c <= 'z')
                value |= std::uint32_t(c - 'a' + 26);
            else if(c >= '0' && c <= '9')
                value |= std::uint32_t(c - '0' + 52);
            else if(c == '+')
                value |= 62;
            else if(c == '/')
                value |= 63;
            else if(c == '=' && last_group && k >= 2 && (k == 3 || text[pos + 3] == '='))
                out_bytes --;
            else
                return false;
        }
        out.push_back(std::uint8_t(value >> 16));
        if(out_bytes > 1) out.push_back(std::uint8_t(value >> 8));
        if(out_bytes > 2) out.push_back(std::uint8_t(value));
    }
    return true;
}

namespace detail {

inline bool take_digits(std::string_view & s, std::size_t n, int & out) {
    if(s.size() < n) return false;
    for(std::size_t i = 0; i < n; i ++) {
        if(s[i] < '0' || s[i] > '9') return false;
    }
    std::from_chars(s.data(), s.data() + n, out);
    s.remove_prefix(n);
    return true;
}

inline bool take_char(std::string_view & s, char c) {
    if(s.empty() || s.front() != c) return false;
    s.remove_prefix(1);
    return true;
}

inline bool civil_to_date(int y, int mo, int d, int h, int mi, double sec, Date & out) {
    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{unsigned(mo)}, day{unsigned(d)}};
    if(!ymd.ok() || h > 23 || mi > 59 || sec < 0 || sec >= 61) return false;
    const sys_seconds base = sys_days{ymd} + hours{h} + minutes{mi};
    out = Date(duration<double>(base.time_since_epoch().count() + sec));
    return true;
}

} // namespace detail

// Internet date-time: YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)
inline bool parse_iso8601(std::string_view s, Date & out) {
    int y, mo, d, h, mi, sec;
    if(!(detail::take_digits(s, 4, y) && detail::take_char(s, '-') &&
          detail::take_digits(s, 2, mo) && detail::take_char(s, '-') &&
          detail::take_digits(s, 2, d) && detail::take_char(s, 'T') &&
          detail::take_digits(s, 2, h) && detail::take_char(s, ':') &&
          detail::take_digits(s, 2, mi) && detail::take_char(s, ':') &&
          detail::take_digits(s, 2, sec))) {
        return false;
    }
    double fraction = 0;
    if(detail::take_char(s, '.')) {
        std::size_t n = 0;
        while(n < s.size() && s[n] >= '0' && s[n] <= '9') n ++;
        if(n == 0) return false;
        const std::string digits = "0." + std::string(s.substr(0, n));
        std::from_chars(digits.data(), digits.data() + digits.size(), fraction);
        s.remove_prefix(n);
    }
    int offset_seconds = 0;
    if(!detail::take_char(s, 'Z')) {
        if(s.empty() || (s.front() != '+' && s.front() != '-')) return false;
        const int sign = s.front() == '-' ? -1 : 1;
        s.remove_prefix(1);
        int oh, om;
        if(!detail::take_digits(s, 2, oh)) return false;
        detail::take_char(s, ':');
        if(!detail::take_digits(s, 2, om) || oh > 23 || om > 59) return false;
        offset_seconds = sign * (oh * 3600 + om * 60);
    }
    if(!s.empty()) return false;
    if(!detail::civil_to_date(y, mo, d, h, mi, sec + fraction, out)) return false;
    out -= std::chrono::seconds(offset_seconds);
    return true;
}

// `pattern` uses std::get_time conversion specifiers; the text is read as UTC.
inline bool parse_formatted_date(std::string_view text, const std::string & pattern, Date & out) {
    std::tm tm{};
    std::istringstream in{std::string(text)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, pattern.c_str());
    if(in.fail() || in.peek() != std::char_traits<char>::eof()) {
        return false;
    }
    return detail::civil_to_date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, out);
}

inline bool is_url_char(char c) {
    if((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
    constexpr std::string_view allowed = "-._~:/?#[]@!$&'()*+,;=%";
    return allowed.find(c) != std::string_view::npos;
}

inline bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// URI reference check: RFC 3986 characters only, well-formed percent escapes.
inline bool is_valid_url(std::string_view s) {
    if(s.empty()) return false;
    for(std::size_t i = 0; i < s.size(); i ++) {
        if(!is_url_char(s[i])) return false;
        if(s[i] == '%') {
            if(i + 2 >= s.size() || !is_hex(s[i + 1]) || !is_hex(s[i + 2])) return false;
        }
    }
    return true;
}

} // namespace builtins


namespace detail {

template <tree::TreeLike Tree>
bool data_corrupted(typename Tree::node_type node, DecodingContext<Tree> & ctx, std::string description) {
    return ctx.fail({TreeFailureKind::data_corrupted, std::move(description), node});
}

template <tree::TreeLike Tree>
bool decode_date(Date & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    const DecodePolicy & p = ctx.policy();
    switch(p.dates) {
    case strategies::DateDecoding::deferred_to_date: {
        Decoder<Tree> d(ctx, node);
        return Decodable<Date>::decode(out, d);
    }
    case strategies::DateDecoding::seconds_since_1970: {
        double seconds = 0;
        if(!decode_number(seconds, node, ctx)) return false;
        out = DateFromSecondsSince1970(seconds);
        return true;
    }
    case strategies::DateDecoding::milliseconds_since_1970: {
        double millis = 0;
        if(!decode_number(millis, node, ctx)) return false;
        out = DateFromSecondsSince1970(millis / 1000.0);
        return true;
    }
    case strategies::DateDecoding::iso8601: {
        std::string text;
        if(!decode_string(text, node, ctx)) return false;
        if(!builtins::parse_iso8601(text, out)) {
            return data_corrupted(node, ctx, "date string not ISO-8601");
        }
        return true;
    }
    case strategies::DateDecoding::formatted: {
        std::string text;
        if(!decode_string(text, node, ctx)) return false;
        if(!builtins::parse_formatted_date(text, p.date_format, out)) {
            return data_corrupted(node, ctx, "Date string does not match format expected by formatter.");
        }
        return true;
    }
    case strategies::DateDecoding::custom: {
        if(!p.custom_date) {
            return data_corrupted(node, ctx, "custom date strategy has no callback");
        }
        Decoder<Tree> d(ctx, node);
        return p.custom_date(out, d);
    }
    }
    return data_corrupted(node, ctx, "unknown date strategy");
}

template <tree::TreeLike Tree>
bool decode_data(Data & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    const DecodePolicy & p = ctx.policy();
    switch(p.data) {
    case strategies::DataDecoding::base64: {
        std::string text;
        if(!decode_string(text, node, ctx)) return false;
        if(!builtins::decode_base64(text, out.bytes)) {
            return data_corrupted(node, ctx, "invalid base64");
        }
        return true;
    }
    case strategies::DataDecoding::deferred_to_data: {
        Decoder<Tree> d(ctx, node);
        return Decodable<Data>::decode(out, d);
    }
    case strategies::DataDecoding::custom: {
        if(!p.custom_data) {
            return data_corrupted(node, ctx, "custom data strategy has no callback");
        }
        Decoder<Tree> d(ctx, node);
        return p.custom_data(out, d);
    }
    }
    return data_corrupted(node, ctx, "unknown data strategy");
}

template <tree::TreeLike Tree>
bool decode_decimal(Decimal & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    if(!ctx.tree().is_number(node)) {
        return type_mismatch<Decimal>(node, ctx);
    }
    if(!Decimal::parse(ctx.tree().number_literal(node), out)) {
        return data_corrupted(node, ctx, "invalid decimal");
    }
    return true;
}

template <tree::TreeLike Tree>
bool decode_url(Url & out, typename Tree::node_type node, DecodingContext<Tree> & ctx) {
    std::string text;
    if(!decode_string(text, node, ctx)) return false;
    if(!builtins::is_valid_url(text)) {
        return data_corrupted(node, ctx, "invalid URL string");
    }
    out.text = std::move(text);
    return true;
}

} // namespace detail
} // namespace DomDecode
