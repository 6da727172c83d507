#include "test_helpers.hpp"
#include "test_model.hpp"
using namespace TestHelpers;
using namespace TestModel;
#include <cassert>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

using namespace DomDecode;

using Nested4 = std::vector<std::vector<std::vector<std::vector<int>>>>;
using Nested5 = std::vector<Nested4>;

static bool cpu_ok() { return true; }
static bool cpu_missing() { return false; }

static bool mentions(const std::string & text, std::string_view part) {
    return text.find(part) != std::string::npos;
}

int main() {
    // ===== preflight =====
    {
        AdvisoryChannel channel([](std::string_view) {});
        const FallbackGate ok(&cpu_ok, channel);
        assert(ok.preflight(DecodePolicy{}).state == GateState::fast_path);
        assert(ok.preflight(DecodePolicy{}.convert_from_snake_case()).state == GateState::fast_path);

        const GateDecision custom = ok.preflight(DecodePolicy{}.use_custom_keys([](const CodingPath & p) { return p.back().string_value(); }));
        assert(custom.state == GateState::fallback);
        assert(custom.reason == "custom key decoding strategy");

        const FallbackGate no_cpu(&cpu_missing, channel);
        const GateDecision d = no_cpu.preflight(DecodePolicy{});
        assert(d.state == GateState::fallback && d.reason == "required CPU features are not available");
        assert(channel.fallbacks() == 0);
    }

    // ===== the advisory is emitted once =====
    {
        std::vector<std::string> messages;
        AdvisoryChannel channel([&messages](std::string_view msg) { messages.emplace_back(msg); });
        const JsonDecoder decoder(DecodePolicy{}.use_custom_keys([](const CodingPath & p) { return p.back().string_value(); }),
                                  channel, &cpu_ok);

        auto first = decoder.decode<Point>(R"({"x": 1, "y": 2})");
        auto second = decoder.decode<Point>(R"({"x": 3, "y": 4})");
        assert(first && second);
        assert((second.value() == Point{3, 4}));
        assert(channel.fallbacks() == 2 && channel.emitted() == 1);
        assert(messages.size() == 1);
        assert(mentions(messages[0], "[DomDecode] Warning: fell back to the reference decoder."));
        assert(mentions(messages[0], "Reason: custom key decoding strategy."));
        assert(mentions(messages[0], "This message will only be printed the first time."));

        channel.rearm();
        assert(decoder.decode<Point>(R"({"x": 5, "y": 6})"));
        assert(channel.emitted() == 2 && messages.size() == 2);

        channel.suppress();
        channel.rearm();
        assert(decoder.decode<Point>(R"({"x": 7, "y": 8})"));
        assert(channel.fallbacks() == 4 && channel.emitted() == 2);

        // failures on the reference path are still reported normally
        const auto failed = decoder.decode<Point>(R"({"x": 1})");
        assert(!failed && failed.error().kind() == DecodeErrorKind::KEY_MISSING && failed.error().key() == "y");
    }

    // ===== the sink may call back into its channel =====
    {
        AdvisoryChannel * self = nullptr;
        std::size_t seen = 0;
        AdvisoryChannel channel([&](std::string_view) {
            seen = self->fallbacks();
            self->rearm();
        });
        self = &channel;

        channel.advise("first");
        assert(seen == 1 && channel.emitted() == 1);
        channel.advise("second");
        assert(seen == 2 && channel.emitted() == 2);
        channel.suppress();
        channel.advise("third");
        assert(seen == 2 && channel.fallbacks() == 3);
    }

    // ===== missing CPU features =====
    {
        std::vector<std::string> messages;
        AdvisoryChannel channel([&messages](std::string_view msg) { messages.emplace_back(msg); });
        const JsonDecoder decoder(DecodePolicy{}, channel, &cpu_missing);
        auto p = decoder.decode<Person>(R"({"name": "n", "age": 4, "tags": []})");
        assert(p && p.value().age == 4);
        assert(messages.size() == 1 && mentions(messages[0], "required CPU features are not available"));
    }

    // ===== deep documents retry on the reference engine =====
    {
        std::vector<std::string> messages;
        AdvisoryChannel channel([&messages](std::string_view msg) { messages.emplace_back(msg); });
        DecodePolicy policy;
        policy.max_fast_path_depth = 4;

        assert(!FastEngine{}.decode<Nested5>("[[[[[1]]]]]", policy));
        assert(FastEngine{}.decode<Nested4>("[[[[1]]]]", policy));

        const JsonDecoder decoder(policy, channel, &cpu_ok);
        auto shallow = decoder.decode<Nested4>("[[[[1]]]]");
        assert(shallow && channel.fallbacks() == 0);

        auto deep = decoder.decode<Nested5>("[[[[[1, 2]]]]]");
        assert(deep && deep.value()[0][0][0][0].size() == 2);
        assert(channel.fallbacks() == 1);
        assert(mentions(messages.at(0), "document nesting exceeds the fast path limit"));

        // errors found after the retry keep their paths
        auto bad = decoder.decode<Nested5>(R"([[[[[1, "2"]]]]])");
        assert(!bad && bad.error().kind() == DecodeErrorKind::TYPE_MISMATCH);
        assert((bad.error().coding_path() == CodingPath{At(0), At(0), At(0), At(0), At(1)}));
    }

    // ===== the reference engine has its own limit =====
    {
        AdvisoryChannel channel([](std::string_view) {});
        DecodePolicy policy;
        policy.max_fast_path_depth = 2;
        policy.max_depth = 3;
        const JsonDecoder decoder(policy, channel, &cpu_ok);
        auto res = decoder.decode<Nested4>("[[[[1]]]]");
        assert(!res && res.error().kind() == DecodeErrorKind::NESTING_TOO_DEEP);
        assert(res.error().description() == "Exceeded the maximum nesting depth of 3.");
        assert(res.error().coding_path().empty());
    }

    return 0;
}
