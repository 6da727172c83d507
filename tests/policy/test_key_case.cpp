#include "test_helpers.hpp"
#include "test_model.hpp"
using namespace TestHelpers;
using namespace TestModel;
#include <cassert>
#include <string>
#include <vector>

#include <DomDecode/yyjson_tree.hpp>

using DomDecode::key_case::snake_to_camel;
using DomDecode::DecodeErrorKind;
using DomDecode::DecodePolicy;
using DomDecode::YyjsonTree;

int main() {
    // ===== conversion rules =====
    assert(snake_to_camel("snake_case_key") == "snakeCaseKey");
    assert(snake_to_camel("ALL_CAPS") == "allCaps");
    assert(snake_to_camel("a__b") == "aB");
    assert(snake_to_camel("__a_b__") == "__aB__");
    assert(snake_to_camel("_leading") == "_leading");
    assert(snake_to_camel("trailing_") == "trailing_");
    assert(snake_to_camel("already") == "already");
    assert(snake_to_camel("camelCase") == "camelCase");
    assert(snake_to_camel("URL") == "URL");
    assert(snake_to_camel("___") == "___");
    assert(snake_to_camel("") == "");
    assert(snake_to_camel("version_2_name") == "version2Name");

    // ===== converting a dictionary twice is a no-op =====
    {
        YyjsonTree tree;
        assert(tree.parse(R"({"first_name": {"last_name": 1}, "id": 2})", 512) == DomDecode::tree::ParseStatus::ok);
        const auto root = tree.root();
        tree.convert_keys_to_camel_case(root);
        tree.convert_keys_to_camel_case(root);

        const auto keys = tree.all_keys(root);
        assert(keys.size() == 2 && keys[0] == "firstName" && keys[1] == "id");
        assert(tree.fetch(root, "firstName") != nullptr);
        assert(tree.fetch(root, "first_name") == nullptr);
        assert(tree.raw_members(root)[0].first == "first_name");

        // nested dictionaries are converted only when asked
        const auto inner = tree.fetch(root, "firstName");
        assert(tree.fetch(inner, "last_name") != nullptr);
        const auto value = tree.fetch(inner, "last_name");
        assert((tree.coding_path(value) == DomDecode::CodingPath{"firstName", "last_name"}));

        tree.convert_keys_to_camel_case(tree.empty_dictionary());
        assert(tree.member_count(tree.empty_dictionary()) == 0);
    }

    // ===== repeated decodes under the snake_case strategy =====
    {
        const auto snake = DecodePolicy{}.convert_from_snake_case();
        std::vector<Account> accounts;
        assert(DecodeSucceeds(accounts, R"([{"user_id": 1, "first_name": "a"}, {"user_id": 2, "first_name": "b", "last_login": "now"}])", snake));
        assert(accounts.size() == 2 && accounts[1].lastLogin == "now");
        assert(DecodesSameAsReference<std::vector<Account>>(R"([{"user_id": 1, "first_name": "a"}])", snake));
        assert(DecodesSameAsReference<std::vector<Account>>(R"([{"user_id": 1}])", snake));
    }

    // ===== user transforms =====
    {
        std::vector<std::string> seen;
        const auto lower = DecodePolicy{}.use_custom_keys([&seen](const DomDecode::CodingPath & path) {
            seen.push_back(DomDecode::CodingPathToString(path));
            std::string key = path.back().string_value();
            for(char & c: key) {
                if(c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');
            }
            return key;
        });

        std::vector<Point> points;
        assert(DecodeSucceeds(points, R"([{"X": 1, "Y": 2}])", lower));
        assert(points.size() == 1 && (points[0] == Point{1, 2}));
        // the callback sees the path down to the raw key
        assert((seen == std::vector<std::string>{"$[0].X", "$[0].Y"}));

        assert(DecodeFailsAt<std::vector<Point>>(R"([{"X": 1, "Z": 2}])", DecodeErrorKind::KEY_MISSING, {At(0)}, lower));
        // error paths use the transformed keys
        assert(DecodeFailsAt<Point>(R"({"X": "1", "Y": 2})", DecodeErrorKind::TYPE_MISMATCH, {"x"}, lower));
    }

    return 0;
}
