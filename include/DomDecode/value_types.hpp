#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace DomDecode {

// Point in time with sub-second precision; epoch is the Unix epoch.
using Date = std::chrono::time_point<std::chrono::system_clock, std::chrono::duration<double>>;

// 2001-01-01T00:00:00Z, the epoch used by the deferred date representation.
inline constexpr std::chrono::seconds kReferenceDateOffset{978307200};

inline Date DateFromSecondsSince1970(double seconds) {
    return Date(std::chrono::duration<double>(seconds));
}

inline Date DateFromSecondsSinceReferenceDate(double seconds) {
    return Date(std::chrono::duration<double>(seconds) + kReferenceDateOffset);
}

inline double SecondsSince1970(const Date & d) {
    return d.time_since_epoch().count();
}

struct Data {
    std::vector<std::uint8_t> bytes;

    bool operator==(const Data &) const = default;
};

struct Url {
    std::string text;

    bool operator==(const Url &) const = default;
};

} // namespace DomDecode
