#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "coding_path.hpp"
#include "options.hpp"

namespace DomDecode {

class AnyKeyedView;
class AnySequentialView;

/// Type-erased view of a decoder positioned at one node, handed to the
/// user callbacks configured in DecodePolicy. Every `decode` reads the node
/// as a single value and returns false with the error recorded on failure.
class AnyDecoder {
public:
    virtual ~AnyDecoder() = default;

    virtual CodingPath coding_path() const = 0;
    virtual const DecodePolicy & policy() const = 0;
    virtual const UserInfo & user_info() const = 0;

    virtual bool decode_nil() = 0;
    virtual bool decode(bool & v) = 0;
    virtual bool decode(std::int64_t & v) = 0;
    virtual bool decode(std::uint64_t & v) = 0;
    virtual bool decode(double & v) = 0;
    virtual bool decode(std::string & v) = 0;

    // Null when the node is not a dictionary (or array); the error is recorded.
    virtual std::unique_ptr<AnyKeyedView> keyed_view() = 0;
    virtual std::unique_ptr<AnySequentialView> sequential_view() = 0;

    // Records a malformed-input failure at this node; always returns false.
    virtual bool fail(std::string description) = 0;
};


class AnyKeyedView {
public:
    virtual ~AnyKeyedView() = default;

    virtual CodingPath coding_path() const = 0;
    virtual const std::vector<std::string_view> & all_keys() = 0;
    virtual bool contains(std::string_view key) const = 0;

    virtual bool decode_nil(std::string_view key, bool & is_nil) = 0;
    virtual bool decode(bool & v, std::string_view key) = 0;
    virtual bool decode(std::int64_t & v, std::string_view key) = 0;
    virtual bool decode(std::uint64_t & v, std::string_view key) = 0;
    virtual bool decode(double & v, std::string_view key) = 0;
    virtual bool decode(std::string & v, std::string_view key) = 0;

    // Decoder re-entered at the value under `key`; null if the key is missing.
    virtual std::unique_ptr<AnyDecoder> nested(std::string_view key) = 0;
};


class AnySequentialView {
public:
    virtual ~AnySequentialView() = default;

    virtual CodingPath coding_path() const = 0;
    virtual std::size_t count() const = 0;
    virtual bool is_at_end() const = 0;
    virtual std::size_t current_index() const = 0;

    virtual bool decode_nil(bool & is_nil) = 0;
    virtual bool decode(bool & v) = 0;
    virtual bool decode(std::int64_t & v) = 0;
    virtual bool decode(std::uint64_t & v) = 0;
    virtual bool decode(double & v) = 0;
    virtual bool decode(std::string & v) = 0;

    // Decoder for the current element, which is consumed; null past the end.
    virtual std::unique_ptr<AnyDecoder> next() = 0;
};

} // namespace DomDecode
