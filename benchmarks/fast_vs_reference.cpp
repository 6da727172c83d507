#include <DomDecode/decoder.hpp>
#include <DomDecode/error_formatting.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Geo {
    double lat;
    double lng;
};

struct User {
    std::uint64_t id;
    std::string screenName;
    std::optional<std::string> location;
    std::vector<std::string> tags;
    Geo geo;
    bool verified;
};

struct Feed {
    std::vector<User> users;
    std::uint32_t nextCursor;
};

std::string make_feed(int users) {
    std::string doc = R"({"next_cursor": 42, "users": [)";
    for(int i = 0; i < users; i ++) {
        if(i) doc += ",";
        const std::string n = std::to_string(i);
        doc += R"({"id": )" + n + R"(, "screen_name": "user_)" + n + R"(", )";
        doc += (i % 3 == 0) ? R"("location": null, )" : R"("location": "city )" + n + R"(", )";
        doc += R"("tags": ["a", "b", "c"], "geo": {"lat": 1.5, "lng": -)" + n + R"(.25}, "verified": )";
        doc += (i % 2) ? "true}" : "false}";
    }
    doc += "]}";
    return doc;
}

// One untimed decode checks the document, then `iterations` timed ones.
template <class Decode>
void run(const std::string & label, int iterations, const std::string & doc, Decode && decode) {
    if(auto first = decode(doc); !first) {
        std::cerr << label << ": " << DomDecode::DecodeErrorToString(first.error()) << std::endl;
        return;
    }
    std::size_t decoded = 0;
    const auto started = std::chrono::steady_clock::now();
    for(int i = 0; i < iterations; i ++) {
        if(decode(doc)) decoded ++;
    }
    const std::chrono::duration<double, std::micro> spent = std::chrono::steady_clock::now() - started;

    const double per_doc = spent.count() / iterations;
    const double mb_per_s = double(doc.size()) / per_doc;
    std::cout << std::left << std::setw(48) << label << std::right << std::fixed << std::setprecision(1)
              << std::setw(10) << per_doc << " us/doc" << std::setw(10) << mb_per_s << " MB/s"
              << "  (" << decoded << "/" << iterations << " ok)\n";
}

} // namespace

int main(int argc, char ** argv) {
    const int users = argc > 1 ? std::stoi(argv[1]) : 2000;
    const int iterations = argc > 2 ? std::stoi(argv[2]) : 50;
    const std::string doc = make_feed(users);
    std::cout << "document: " << doc.size() << " bytes, " << users << " users\n";

    const auto snake = DomDecode::DecodePolicy{}.convert_from_snake_case();

    run("fast engine, snake_case keys", iterations, doc, [&](const std::string & d) {
        return std::move(*DomDecode::FastEngine{}.decode<Feed>(d, snake));
    });
    run("reference engine, snake_case keys", iterations, doc, [&](const std::string & d) {
        return DomDecode::reference::Decode<Feed>(d, snake);
    });

    DomDecode::AdvisoryChannel quiet([](std::string_view) {});
    const DomDecode::JsonDecoder custom(
        DomDecode::DecodePolicy{}.use_custom_keys([](const DomDecode::CodingPath & path) {
            return DomDecode::key_case::snake_to_camel(path.back().string_value());
        }),
        quiet);
    run("decoder with custom keys (reference path)", iterations, doc, [&](const std::string & d) {
        return custom.decode<Feed>(d);
    });

    return 0;
}
