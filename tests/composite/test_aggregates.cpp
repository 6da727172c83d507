#include "test_helpers.hpp"
#include "test_model.hpp"
using namespace TestHelpers;
using namespace TestModel;
#include <cassert>
#include <string>
#include <vector>

using DomDecode::DecodeErrorKind;
using DomDecode::DecodePolicy;

int main() {
    // ===== reflected fields =====
    {
        Person p;
        assert(DecodeSucceeds(p, R"({"name": "Ada", "age": 36, "email": "ada@example.com", "tags": ["math"]})"));
        assert(p.name == "Ada" && p.age == 36 && p.email == "ada@example.com");
        assert((p.tags == std::vector<std::string>{"math"}));

        // optional members may be absent or null; unknown keys are ignored
        assert(DecodeSucceeds(p, R"({"tags": [], "age": 1, "name": "B", "unused": {"deep": [1]}})"));
        assert(!p.email && p.tags.empty());
        assert(DecodeSucceeds(p, R"({"name": "C", "age": 2, "email": null, "tags": []})"));
        assert(!p.email);
    }
    assert(DecodeFailsAt<Person>(R"({"age": 1, "tags": []})", DecodeErrorKind::KEY_MISSING, {}));
    assert(ErrorOf<Person>(R"({"age": 1, "tags": []})").key() == "name");
    assert(ErrorOf<Person>(R"({"age": 1, "tags": []})").description() == "No value associated with key \"name\".");
    assert(DecodeFailsAt<Person>(R"({"name": "A", "age": 300, "tags": []})", DecodeErrorKind::NUMBER_OUT_OF_RANGE, {"age"}));
    assert(DecodeFailsAt<Person>(R"({"name": "A", "age": 3, "tags": [1]})", DecodeErrorKind::TYPE_MISMATCH, {"tags", At(0)}));
    {
        // null for a required member reports the container and the key
        auto err = ErrorOf<Person>(R"({"name": null, "age": 3, "tags": []})");
        assert(err.kind() == DecodeErrorKind::VALUE_MISSING);
        assert(err.coding_path().empty());
        assert(err.key() == "name");
        assert(err.description() == "Expected String value but found null instead.");
    }

    // ===== explicit field names =====
    {
        Renamed r;
        assert(DecodeSucceeds(r, R"({"b": 5})") && r.a == 5);
    }
    assert(DecodeFailsAt<Renamed>(R"({"a": 5})", DecodeErrorKind::KEY_MISSING, {}));
    assert(ErrorOf<Renamed>(R"({"a": 5})").key() == "b");

    // ===== snake_case documents =====
    {
        const auto snake = DecodePolicy{}.convert_from_snake_case();
        Account a;
        assert(DecodeSucceeds(a, R"({"user_id": 7, "first_name": "Lin", "last_login": "yesterday"})", snake));
        assert(a.userId == 7 && a.firstName == "Lin" && a.lastLogin == "yesterday");

        // camel-case keys pass through unchanged
        assert(DecodeSucceeds(a, R"({"userId": 8, "firstName": "Kai"})", snake));
        assert(a.userId == 8 && !a.lastLogin);

        assert(DecodeFailsAt<Account>(R"({"user_id": "7", "first_name": "Lin"})", DecodeErrorKind::TYPE_MISMATCH, {"userId"}, snake));
        assert(ErrorOf<Account>(R"({"user_id": 7})", snake).key() == "firstName");
    }
    assert(DecodeFailsAt<Account>(R"({"user_id": 7, "first_name": "Lin"})", DecodeErrorKind::KEY_MISSING, {}));

    // ===== recursion through containers =====
    {
        TreeNode t;
        assert(DecodeSucceeds(t, R"({"value": 1, "children": [{"value": 2, "children": []}, {"value": 3, "children": [{"value": 4, "children": []}]}]})"));
        assert(t.value == 1 && t.children.size() == 2);
        assert(t.children[1].children[0].value == 4);
    }
    assert(DecodeFailsAt<TreeNode>(R"({"value": 1, "children": [{"value": 2, "children": [{"children": []}]}]})",
                                   DecodeErrorKind::KEY_MISSING, {"children", At(0), "children", At(0)}));

    // ===== nested aggregates =====
    {
        WrapsNeedsA w;
        assert(DecodeSucceeds(w, R"({"value": {"a": 3}})") && w.value.a == 3);
    }
    assert(DecodeFailsAt<WrapsNeedsA>(R"({"value": []})", DecodeErrorKind::TYPE_MISMATCH, {"value"}));

    return 0;
}
