#pragma once

#include <DomDecode/decoder.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TestModel {

struct Point {
    int x;
    int y;
    bool operator==(const Point &) const = default;
};

struct Person {
    std::string name;
    std::uint8_t age;
    std::optional<std::string> email;
    std::vector<std::string> tags;
    bool operator==(const Person &) const = default;
};

struct NeedsA {
    int a;
    bool operator==(const NeedsA &) const = default;
};

struct WrapsNeedsA {
    NeedsA value;
    bool operator==(const WrapsNeedsA &) const = default;
};

struct Account {
    int userId;
    std::string firstName;
    std::optional<std::string> lastLogin;
    bool operator==(const Account &) const = default;
};

// Decoded from key "b" instead of its member name.
struct Renamed {
    int a;
    bool operator==(const Renamed &) const = default;
};

struct TreeNode {
    int value;
    std::vector<TreeNode> children;
    bool operator==(const TreeNode &) const = default;
};

struct Inventory {
    std::map<std::string, int> counts;
    std::vector<Point> points;
    std::optional<std::vector<int>> extra;
    bool operator==(const Inventory &) const = default;
};

// Single-value composite.
struct Celsius {
    double degrees = 0;

    template <class D>
    static bool decode_from(Celsius & c, D & decoder) {
        return decoder.single_value_container().decode(c.degrees);
    }
    bool operator==(const Celsius &) const = default;
};

// Sequential composite: [lat, lng].
struct LatLng {
    double lat = 0;
    double lng = 0;

    template <class D>
    static bool decode_from(LatLng & v, D & decoder) {
        auto c = decoder.sequential_container();
        return c && c->decode(v.lat) && c->decode(v.lng);
    }
    bool operator==(const LatLng &) const = default;
};

struct ShapeKeys {};

// Keyed composite reading optional and nested members by hand.
struct Shape {
    std::string kind;
    std::vector<LatLng> outline;
    std::optional<Celsius> temperature;

    template <class D>
    static bool decode_from(Shape & s, D & decoder) {
        auto c = decoder.template keyed_container<ShapeKeys>();
        return c
            && c->decode(s.kind, "kind")
            && c->decode(s.outline, "outline")
            && c->decode_if_present(s.temperature, "temperature");
    }
    bool operator==(const Shape &) const = default;
};

} // namespace TestModel

namespace DomDecode {
template <>
struct StructMeta<TestModel::Renamed> {
    using Fields = StructFields<Field<&TestModel::Renamed::a, "b">>;
};
}
