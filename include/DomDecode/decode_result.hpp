#pragma once

#include <optional>
#include <string>
#include <utility>

#include "coding_path.hpp"
#include "errors.hpp"

namespace DomDecode {


class DecodeError {
    DecodeErrorKind m_kind = DecodeErrorKind::NO_ERROR;
    CodingPath m_path;
    std::optional<std::string> m_key;
    std::string m_description;

public:
    DecodeError() = default;
    DecodeError(DecodeErrorKind kind, CodingPath path, std::string description, std::optional<std::string> key = std::nullopt):
        m_kind(kind), m_path(std::move(path)), m_key(std::move(key)), m_description(std::move(description))
    {}

    DecodeErrorKind kind() const {
        return m_kind;
    }
    // Path of the scope the failure was attributed to; empty means the document root.
    const CodingPath & coding_path() const {
        return m_path;
    }
    // Set for key-missing and value-missing failures raised on a keyed container.
    const std::optional<std::string> & key() const {
        return m_key;
    }
    const std::string & description() const {
        return m_description;
    }
};


template <class T>
class DecodeResult {
    std::optional<T> m_value;
    DecodeError m_error;

public:
    DecodeResult(T value): m_value(std::move(value)) {}
    DecodeResult(DecodeError err): m_error(std::move(err)) {}

    operator bool() const {
        return m_value.has_value();
    }

    T & value() & { return *m_value; }
    const T & value() const & { return *m_value; }
    T && value() && { return std::move(*m_value); }

    const DecodeError & error() const {
        return m_error;
    }
};

} // namespace DomDecode
