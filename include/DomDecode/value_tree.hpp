#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "coding_path.hpp"
#include "key_case.hpp"
#include "options.hpp"
#include "tree_concept.hpp"
#include "yyjson_tree.hpp"

namespace DomDecode {
namespace reference {

struct Member;

// Owned generic document value. Children keep a link to their parent so a
// coding path can be rebuilt from any node.
struct Value {
    enum class Type { null, boolean, number, string, array, object };

    Type type = Type::null;
    bool boolean = false;
    std::string text;               // string contents, or the number literal
    std::vector<Value> elements;
    std::vector<Member> members;

    const Value * parent = nullptr;
    std::size_t slot = 0;           // element index or member index within parent
};

struct Member {
    std::string raw_key;            // as written in the document
    std::string key;                // after the key strategy
    Value value;
};


/// Reference view: materialises the whole document up front, applying the
/// key strategy (including user transforms) while doing so.
class ValueTree {
public:
    using node_type = const Value*;

    struct ArrayCursor {
        const Value * current   = nullptr;
        std::size_t   remaining = 0;
    };

    ValueTree() = default;
    ValueTree(const ValueTree &) = delete;
    ValueTree & operator=(const ValueTree &) = delete;

    tree::ParseStatus parse(std::string_view bytes, const DecodePolicy & policy) {
        auto doc = yyjson_detail::read_document(bytes, reason_);
        if(!doc) {
            return tree::ParseStatus::failed;
        }
        policy_ = &policy;
        CodingPath path;
        const bool ok = build(yyjson_doc_get_root(doc.get()), root_, path, 0);
        policy_ = nullptr;
        if(!ok) {
            reason_ = "nesting exceeds " + std::to_string(policy.max_depth) + " levels";
            nesting_exceeded_ = true;
            return tree::ParseStatus::failed;
        }
        return tree::ParseStatus::ok;
    }

    const std::string & failure_reason() const { return reason_; }
    bool nesting_exceeded() const { return nesting_exceeded_; }

    node_type root() const { return &root_; }

    bool is_null(node_type n) const { return n->type == Value::Type::null; }
    bool is_bool(node_type n) const { return n->type == Value::Type::boolean; }
    bool is_number(node_type n) const { return n->type == Value::Type::number; }
    bool is_string(node_type n) const { return n->type == Value::Type::string; }
    bool is_array(node_type n) const { return n->type == Value::Type::array; }
    bool is_object(node_type n) const { return n->type == Value::Type::object; }

    std::string_view kind_name(node_type n) const {
        switch(n->type) {
        case Value::Type::null: return "null";
        case Value::Type::boolean: return "a boolean";
        case Value::Type::number: return "a number";
        case Value::Type::string: return "a string";
        case Value::Type::array: return "an array";
        case Value::Type::object: return "a dictionary";
        }
        return "an unknown value";
    }

    std::size_t array_size(node_type n) const { return n->elements.size(); }

    ArrayCursor enter_first_child(node_type n) const {
        ArrayCursor c;
        c.remaining = n->elements.size();
        c.current = c.remaining ? &n->elements.front() : nullptr;
        return c;
    }

    bool advance(ArrayCursor & c) const {
        if(c.remaining == 0) return true;
        if(--c.remaining == 0) {
            c.current = nullptr;
            return true;
        }
        c.current ++;
        return false;
    }

    std::size_t member_count(node_type n) const { return n->members.size(); }

    node_type fetch(node_type obj, std::string_view key) const {
        for(const auto & m: obj->members) {
            if(m.key == key) return &m.value;
        }
        return nullptr;
    }

    std::vector<std::string_view> all_keys(node_type obj) const {
        std::vector<std::string_view> keys;
        keys.reserve(obj->members.size());
        for(const auto & m: obj->members) keys.push_back(m.key);
        return keys;
    }

    std::vector<std::pair<std::string_view, node_type>> raw_members(node_type obj) const {
        std::vector<std::pair<std::string_view, node_type>> out;
        out.reserve(obj->members.size());
        for(const auto & m: obj->members) out.emplace_back(m.raw_key, &m.value);
        return out;
    }

    // Keys were rewritten while the tree was built.
    void convert_keys_to_camel_case(node_type) {}

    node_type empty_dictionary() const {
        static const Value sentinel = [] {
            Value v;
            v.type = Value::Type::object;
            return v;
        }();
        return &sentinel;
    }

    bool read_bool(node_type n) const { return n->boolean; }
    std::string_view read_string(node_type n) const { return n->text; }
    std::string_view number_literal(node_type n) const { return n->text; }

    CodingPath coding_path(node_type n) const {
        CodingPath path;
        for(const Value * cur = n; cur && cur->parent; cur = cur->parent) {
            if(cur->parent->type == Value::Type::array) {
                path.emplace_back(cur->slot);
            } else {
                path.emplace_back(std::string_view(cur->parent->members[cur->slot].key));
            }
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

private:
    Value root_;
    std::string reason_;
    bool nesting_exceeded_ = false;
    const DecodePolicy * policy_ = nullptr;

    std::string transform_key(std::string_view raw, CodingPath & path) const {
        switch(policy_->keys) {
        case strategies::KeyDecoding::use_default_keys:
            return std::string(raw);
        case strategies::KeyDecoding::convert_from_snake_case:
            return key_case::snake_to_camel(raw);
        case strategies::KeyDecoding::custom: {
            path.emplace_back(raw);
            std::string key = policy_->custom_keys ? policy_->custom_keys(path) : std::string(raw);
            path.pop_back();
            return key;
        }
        }
        return std::string(raw);
    }

    bool build(yyjson_val * src, Value & dst, CodingPath & path, std::size_t depth) {
        switch(yyjson_get_type(src)) {
        case YYJSON_TYPE_NULL:
            dst.type = Value::Type::null;
            return true;
        case YYJSON_TYPE_BOOL:
            dst.type = Value::Type::boolean;
            dst.boolean = yyjson_get_bool(src);
            return true;
        case YYJSON_TYPE_RAW:
            dst.type = Value::Type::number;
            dst.text.assign(yyjson_get_raw(src), yyjson_get_len(src));
            return true;
        case YYJSON_TYPE_STR:
            dst.type = Value::Type::string;
            dst.text = std::string(yyjson_detail::string_of(src));
            return true;
        case YYJSON_TYPE_ARR: {
            if(depth >= policy_->max_depth) return false;
            dst.type = Value::Type::array;
            dst.elements.resize(yyjson_arr_size(src));
            std::size_t idx = 0;
            yyjson_arr_iter it;
            yyjson_arr_iter_init(src, &it);
            while(yyjson_val * child = yyjson_arr_iter_next(&it)) {
                Value & el = dst.elements[idx];
                el.parent = &dst;
                el.slot = idx;
                path.emplace_back(idx);
                const bool ok = build(child, el, path, depth + 1);
                path.pop_back();
                if(!ok) return false;
                idx ++;
            }
            return true;
        }
        case YYJSON_TYPE_OBJ: {
            if(depth >= policy_->max_depth) return false;
            dst.type = Value::Type::object;
            dst.members.resize(yyjson_obj_size(src));
            std::size_t idx = 0;
            yyjson_obj_iter it;
            yyjson_obj_iter_init(src, &it);
            while(yyjson_val * k = yyjson_obj_iter_next(&it)) {
                Member & m = dst.members[idx];
                m.raw_key = std::string(yyjson_detail::string_of(k));
                m.key = transform_key(m.raw_key, path);
                m.value.parent = &dst;
                m.value.slot = idx;
                path.emplace_back(std::string_view(m.key));
                const bool ok = build(yyjson_obj_iter_get_val(k), m.value, path, depth + 1);
                path.pop_back();
                if(!ok) return false;
                idx ++;
            }
            return true;
        }
        default:
            dst.type = Value::Type::number;
            return true;
        }
    }
};

static_assert(tree::TreeLike<ValueTree>);

} // namespace reference
} // namespace DomDecode
