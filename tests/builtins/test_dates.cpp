#include "test_helpers.hpp"
using namespace TestHelpers;
#include <any>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

using DomDecode::Date;
using DomDecode::DecodeErrorKind;
using DomDecode::DecodePolicy;
using DomDecode::SecondsSince1970;
namespace strategies = DomDecode::strategies;

struct Event {
    std::string name;
    Date at;
};

int main() {
    // ===== deferred: seconds since 2001-01-01 =====
    {
        Date d;
        assert(DecodeSucceeds(d, "0") && SecondsSince1970(d) == 978307200.0);
        assert(DecodeSucceeds(d, "-978307200") && SecondsSince1970(d) == 0.0);
        assert(DecodeSucceeds(d, "0.5") && SecondsSince1970(d) == 978307200.5);
    }
    assert(DecodeFailsAt<Date>(R"("2001-01-01")", DecodeErrorKind::TYPE_MISMATCH, {}));
    assert(DecodeFailsAt<Date>("null", DecodeErrorKind::VALUE_MISSING, {}));

    // ===== Unix epoch =====
    {
        Date d;
        const DecodePolicy secs = DecodePolicy{}.use_dates(strategies::DateDecoding::seconds_since_1970);
        assert(DecodeSucceeds(d, "1.5", secs) && SecondsSince1970(d) == 1.5);

        const DecodePolicy millis = DecodePolicy{}.use_dates(strategies::DateDecoding::milliseconds_since_1970);
        assert(DecodeSucceeds(d, "1500", millis) && SecondsSince1970(d) == 1.5);
        assert(DecodeFailsWith<Date>(R"("1500")", DecodeErrorKind::TYPE_MISMATCH, millis));
    }

    // ===== ISO-8601 =====
    {
        const DecodePolicy iso = DecodePolicy{}.use_dates(strategies::DateDecoding::iso8601);
        Date d;
        assert(DecodeSucceeds(d, R"("2001-01-01T00:00:00Z")", iso) && SecondsSince1970(d) == 978307200.0);
        assert(DecodeSucceeds(d, R"("1970-01-01T01:00:00+01:00")", iso) && SecondsSince1970(d) == 0.0);
        assert(DecodeSucceeds(d, R"("1969-12-31T23:00:00-0100")", iso) && SecondsSince1970(d) == 0.0);
        assert(DecodeSucceeds(d, R"("1970-01-01T00:00:00.25Z")", iso) && SecondsSince1970(d) == 0.25);

        assert(DecodeFailsAt<Date>(R"("2020-02-30T00:00:00Z")", DecodeErrorKind::MALFORMED_INPUT, {}, iso));
        assert(ErrorOf<Date>(R"("2020-02-30T00:00:00Z")", iso).description() == "date string not ISO-8601");
        assert(DecodeFailsWith<Date>(R"("2020-01-01")", DecodeErrorKind::MALFORMED_INPUT, iso));
        assert(DecodeFailsWith<Date>(R"("2020-01-01T00:00:00")", DecodeErrorKind::MALFORMED_INPUT, iso));
        assert(DecodeFailsWith<Date>(R"("2020-01-01T00:00:00Zjunk")", DecodeErrorKind::MALFORMED_INPUT, iso));
        assert(DecodeFailsWith<Date>("0", DecodeErrorKind::TYPE_MISMATCH, iso));

        std::vector<Event> events;
        assert(DecodeSucceeds(events, R"([{"name": "launch", "at": "1970-01-02T00:00:00Z"}])", iso));
        assert(events.size() == 1 && SecondsSince1970(events[0].at) == 86400.0);
        assert(DecodeFailsAt<std::vector<Event>>(R"([{"name": "x", "at": "soon"}])", DecodeErrorKind::MALFORMED_INPUT, {At(0), "at"}, iso));
    }

    // ===== formatter =====
    {
        Date d;
        const DecodePolicy day = DecodePolicy{}.use_formatted_dates("%Y-%m-%d");
        assert(DecodeSucceeds(d, R"("2001-01-01")", day) && SecondsSince1970(d) == 978307200.0);
        assert(DecodeFailsAt<Date>(R"("01/01/2001")", DecodeErrorKind::MALFORMED_INPUT, {}, day));
        assert(ErrorOf<Date>(R"("01/01/2001")", day).description() == "Date string does not match format expected by formatter.");
        // the whole string has to match
        assert(DecodeFailsWith<Date>(R"("2001-01-01 extra")", DecodeErrorKind::MALFORMED_INPUT, day));

        const DecodePolicy stamp = DecodePolicy{}.use_formatted_dates("%Y-%m-%d %H:%M:%S");
        assert(DecodeSucceeds(d, R"("1970-01-02 00:00:10")", stamp) && SecondsSince1970(d) == 86410.0);
    }

    // ===== custom callback =====
    {
        DecodePolicy custom;
        custom.user_info["epoch"] = 1000.0;
        custom.use_custom_dates([](Date & out, DomDecode::AnyDecoder & decoder) {
            std::string text;
            if(!decoder.decode(text)) return false;
            if(text != "epoch") return decoder.fail("unknown date keyword");
            out = DomDecode::DateFromSecondsSince1970(std::any_cast<double>(decoder.user_info().at("epoch")));
            return true;
        });

        Date d;
        assert(DecodeSucceeds(d, R"("epoch")", custom) && SecondsSince1970(d) == 1000.0);
        assert(DecodeFailsAt<std::vector<Date>>(R"(["epoch", "later"])", DecodeErrorKind::MALFORMED_INPUT, {At(1)}, custom));
        assert(ErrorOf<std::vector<Date>>(R"(["later"])", custom).description() == "unknown date keyword");
        assert(DecodeFailsAt<std::vector<Date>>(R"(["epoch", 1])", DecodeErrorKind::TYPE_MISMATCH, {At(1)}, custom));
    }

    // ===== custom callback over a dictionary or an array =====
    {
        DecodePolicy split;
        split.use_custom_dates([](Date & out, DomDecode::AnyDecoder & decoder) {
            std::int64_t sec = 0;
            std::int64_t nsec = 0;
            if(auto parts = decoder.sequential_view()) {
                if(!parts->decode(sec)) return false;
                if(!parts->is_at_end() && !parts->decode(nsec)) return false;
            } else {
                auto fields = decoder.keyed_view();
                if(!fields || !fields->decode(sec, "sec")) return false;
                if(fields->contains("nsec") && !fields->decode(nsec, "nsec")) return false;
            }
            out = DomDecode::DateFromSecondsSince1970(double(sec) + double(nsec) / 1e9);
            return true;
        });

        Date d;
        assert(DecodeSucceeds(d, R"({"sec": 1, "nsec": 500000000})", split) && SecondsSince1970(d) == 1.5);
        assert(DecodeSucceeds(d, R"({"sec": 7})", split) && SecondsSince1970(d) == 7.0);
        assert(DecodeSucceeds(d, "[2, 250000000]", split) && SecondsSince1970(d) == 2.25);

        Event e;
        assert(DecodeSucceeds(e, R"({"name": "launch", "at": {"sec": 3}})", split));
        assert(e.name == "launch" && SecondsSince1970(e.at) == 3.0);

        auto missing = ErrorOf<std::vector<Event>>(R"([{"name": "x", "at": {"nsec": 1}}])", split);
        assert(missing.kind() == DecodeErrorKind::KEY_MISSING && missing.key() == "sec");
        assert(DecodeFailsAt<std::vector<Date>>(R"([[1, "two"]])", DecodeErrorKind::TYPE_MISMATCH, {At(0), At(1)}, split));
        assert(DecodeFailsAt<Date>("[]", DecodeErrorKind::SEQUENCE_EXHAUSTED, {At(0)}, split));
    }

    // ===== nested decoder handed out by a view =====
    {
        DecodePolicy wrapped;
        wrapped.use_custom_dates([](Date & out, DomDecode::AnyDecoder & decoder) {
            auto fields = decoder.keyed_view();
            if(!fields) return false;
            auto inner = fields->nested("unix");
            double seconds = 0;
            if(!inner || !inner->decode(seconds)) return false;
            out = DomDecode::DateFromSecondsSince1970(seconds);
            return true;
        });

        Date d;
        assert(DecodeSucceeds(d, R"({"unix": 60})", wrapped) && SecondsSince1970(d) == 60.0);
        assert(DecodeFailsWith<Date>(R"({"epoch": 60})", DecodeErrorKind::KEY_MISSING, wrapped));
        assert(DecodeFailsAt<Date>(R"("60")", DecodeErrorKind::TYPE_MISMATCH, {}, wrapped));
    }

    return 0;
}
