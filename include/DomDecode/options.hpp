#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

#include "coding_path.hpp"
#include "value_types.hpp"

#ifndef DOMDECODE_DEFAULT_MAX_DEPTH
#define DOMDECODE_DEFAULT_MAX_DEPTH 2048
#endif

#ifndef DOMDECODE_DEFAULT_FAST_PATH_DEPTH
#define DOMDECODE_DEFAULT_FAST_PATH_DEPTH 512
#endif

namespace DomDecode {

class AnyDecoder;

using UserInfo = std::unordered_map<std::string, std::any>;

namespace strategies {

enum class KeyDecoding {
    use_default_keys,
    convert_from_snake_case,
    custom
};

enum class DateDecoding {
    deferred_to_date,
    seconds_since_1970,
    milliseconds_since_1970,
    iso8601,
    formatted,
    custom
};

enum class DataDecoding {
    base64,
    deferred_to_data,
    custom
};

enum class NonConformingFloatDecoding {
    reject,
    convert_from_string
};

} // namespace strategies

// Receives the coding path of the key being read; the last element is the
// key as it appears in the document.
using KeyTransform = std::function<std::string(const CodingPath &)>;
using DateDecodeCallback = std::function<bool(Date &, AnyDecoder &)>;
using DataDecodeCallback = std::function<bool(Data &, AnyDecoder &)>;

// Immutable for the duration of a decode call.
struct DecodePolicy {
    strategies::KeyDecoding keys = strategies::KeyDecoding::use_default_keys;
    KeyTransform custom_keys;

    strategies::DateDecoding dates = strategies::DateDecoding::deferred_to_date;
    std::string date_format;            // std::get_time pattern, used by `formatted`
    DateDecodeCallback custom_date;

    strategies::DataDecoding data = strategies::DataDecoding::base64;
    DataDecodeCallback custom_data;

    strategies::NonConformingFloatDecoding non_conforming_floats = strategies::NonConformingFloatDecoding::reject;
    std::string positive_infinity;
    std::string negative_infinity;
    std::string nan;

    bool full_precision_floats = true;

    std::size_t max_depth = DOMDECODE_DEFAULT_MAX_DEPTH;
    std::size_t max_fast_path_depth = DOMDECODE_DEFAULT_FAST_PATH_DEPTH;

    UserInfo user_info;

    DecodePolicy & convert_from_snake_case() {
        keys = strategies::KeyDecoding::convert_from_snake_case;
        return *this;
    }
    DecodePolicy & use_custom_keys(KeyTransform transform) {
        keys = strategies::KeyDecoding::custom;
        custom_keys = std::move(transform);
        return *this;
    }
    DecodePolicy & use_dates(strategies::DateDecoding s) {
        dates = s;
        return *this;
    }
    DecodePolicy & use_formatted_dates(std::string pattern) {
        dates = strategies::DateDecoding::formatted;
        date_format = std::move(pattern);
        return *this;
    }
    DecodePolicy & use_custom_dates(DateDecodeCallback cb) {
        dates = strategies::DateDecoding::custom;
        custom_date = std::move(cb);
        return *this;
    }
    DecodePolicy & use_data(strategies::DataDecoding s) {
        data = s;
        return *this;
    }
    DecodePolicy & use_custom_data(DataDecodeCallback cb) {
        data = strategies::DataDecoding::custom;
        custom_data = std::move(cb);
        return *this;
    }
    DecodePolicy & convert_non_conforming_floats(std::string pos, std::string neg, std::string not_a_number) {
        non_conforming_floats = strategies::NonConformingFloatDecoding::convert_from_string;
        positive_infinity = std::move(pos);
        negative_infinity = std::move(neg);
        nan = std::move(not_a_number);
        return *this;
    }
};

} // namespace DomDecode
