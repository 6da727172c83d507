#pragma once

#include <yyjson.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "coding_path.hpp"
#include "key_case.hpp"
#include "tree_concept.hpp"

namespace DomDecode {

namespace yyjson_detail {

struct DocDeleter {
    void operator()(yyjson_doc * doc) const noexcept { yyjson_doc_free(doc); }
};
using DocPtr = std::unique_ptr<yyjson_doc, DocDeleter>;

// Numbers are kept as raw literals so that width checks, fraction detection
// and decimals all work from the text as written.
inline DocPtr read_document(std::string_view bytes, std::string & reason) {
    if(bytes.empty()) {
        reason = "Empty";
        return nullptr;
    }
    yyjson_read_err err;
    yyjson_doc * doc = yyjson_read_opts(const_cast<char*>(bytes.data()), bytes.size(),
                                        YYJSON_READ_NUMBER_AS_RAW, nullptr, &err);
    if(!doc) {
        reason = err.msg ? err.msg : "unknown error";
        reason += " at offset " + std::to_string(err.pos);
    }
    return DocPtr(doc);
}

inline std::string_view string_of(yyjson_val * v) {
    return {yyjson_get_str(v), yyjson_get_len(v)};
}

} // namespace yyjson_detail


/// Fast-path view over an immutable yyjson document. Owns the document and
/// the side table of converted keys for the duration of one decode call.
class YyjsonTree {
public:
    using node_type = yyjson_val*;

    struct ArrayCursor {
        yyjson_val*  current   = nullptr; // current element, or nullptr once done
        std::size_t  remaining = 0;       // elements left including current
    };

    YyjsonTree() = default;
    YyjsonTree(const YyjsonTree &) = delete;
    YyjsonTree & operator=(const YyjsonTree &) = delete;

    tree::ParseStatus parse(std::string_view bytes, std::size_t max_depth) {
        doc_ = yyjson_detail::read_document(bytes, reason_);
        if(!doc_) {
            return tree::ParseStatus::failed;
        }
        if(depth_exceeds(max_depth)) {
            return tree::ParseStatus::retry_advised;
        }
        return tree::ParseStatus::ok;
    }

    const std::string & failure_reason() const { return reason_; }

    node_type root() const { return doc_ ? yyjson_doc_get_root(doc_.get()) : nullptr; }

    // ---- Structure ----

    bool is_null(node_type n) const { return yyjson_is_null(n); }
    bool is_bool(node_type n) const { return yyjson_is_bool(n); }
    bool is_number(node_type n) const { return yyjson_is_raw(n) || yyjson_is_num(n); }
    bool is_string(node_type n) const { return yyjson_is_str(n); }
    bool is_array(node_type n) const { return yyjson_is_arr(n); }
    bool is_object(node_type n) const { return yyjson_is_obj(n); }

    std::string_view kind_name(node_type n) const {
        if(is_null(n)) return "null";
        if(is_bool(n)) return "a boolean";
        if(is_number(n)) return "a number";
        if(is_string(n)) return "a string";
        if(is_array(n)) return "an array";
        if(is_object(n)) return "a dictionary";
        return "an unknown value";
    }

    // ---- Arrays ----

    std::size_t array_size(node_type n) const { return yyjson_arr_size(n); }

    ArrayCursor enter_first_child(node_type n) const {
        ArrayCursor c;
        c.remaining = yyjson_arr_size(n);
        c.current = c.remaining ? yyjson_arr_get_first(n) : nullptr;
        return c;
    }

    bool advance(ArrayCursor & c) const {
        if(c.remaining == 0) return true;
        if(--c.remaining == 0) {
            c.current = nullptr;
            return true;
        }
        c.current = unsafe_yyjson_get_next(c.current);
        return false;
    }

    // ---- Dictionaries ----

    std::size_t member_count(node_type n) const { return yyjson_obj_size(n); }

    node_type fetch(node_type obj, std::string_view key) const {
        const auto * converted = converted_keys(obj);
        yyjson_obj_iter it;
        yyjson_obj_iter_init(obj, &it);
        std::size_t i = 0;
        while(yyjson_val * k = yyjson_obj_iter_next(&it)) {
            const std::string_view name = converted ? std::string_view((*converted)[i]) : yyjson_detail::string_of(k);
            if(name == key) {
                return yyjson_obj_iter_get_val(k);
            }
            i ++;
        }
        return nullptr;
    }

    std::vector<std::string_view> all_keys(node_type obj) const {
        std::vector<std::string_view> keys;
        keys.reserve(yyjson_obj_size(obj));
        const auto * converted = converted_keys(obj);
        yyjson_obj_iter it;
        yyjson_obj_iter_init(obj, &it);
        std::size_t i = 0;
        while(yyjson_val * k = yyjson_obj_iter_next(&it)) {
            keys.push_back(converted ? std::string_view((*converted)[i]) : yyjson_detail::string_of(k));
            i ++;
        }
        return keys;
    }

    // Keys exactly as they appear in the document, ignoring any conversion.
    std::vector<std::pair<std::string_view, node_type>> raw_members(node_type obj) const {
        std::vector<std::pair<std::string_view, node_type>> members;
        members.reserve(yyjson_obj_size(obj));
        yyjson_obj_iter it;
        yyjson_obj_iter_init(obj, &it);
        while(yyjson_val * k = yyjson_obj_iter_next(&it)) {
            members.emplace_back(yyjson_detail::string_of(k), yyjson_obj_iter_get_val(k));
        }
        return members;
    }

    // Records the camel-case spelling of every key of `obj`. Repeated calls
    // for the same dictionary are no-ops.
    void convert_keys_to_camel_case(node_type obj) {
        if(obj == empty_dictionary() || converted_.count(obj)) return;
        std::vector<std::string> keys;
        keys.reserve(yyjson_obj_size(obj));
        yyjson_obj_iter it;
        yyjson_obj_iter_init(obj, &it);
        while(yyjson_val * k = yyjson_obj_iter_next(&it)) {
            keys.push_back(key_case::snake_to_camel(yyjson_detail::string_of(k)));
        }
        converted_.emplace(obj, std::move(keys));
    }

    // Shared zero-entry dictionary standing in for every `{}`.
    node_type empty_dictionary() const {
        static yyjson_val sentinel = [] {
            yyjson_val v{};
            v.tag = YYJSON_TYPE_OBJ;
            v.uni.ofs = sizeof(yyjson_val);
            return v;
        }();
        return &sentinel;
    }

    // ---- Scalars ----

    bool read_bool(node_type n) const { return yyjson_get_bool(n); }
    std::string_view read_string(node_type n) const { return yyjson_detail::string_of(n); }
    std::string_view number_literal(node_type n) const {
        return {yyjson_get_raw(n), yyjson_get_len(n)};
    }

    // ---- Paths ----

    // Values are laid out in document order, so the child containing
    // `target` is the one whose [child, next(child)) range covers it.
    CodingPath coding_path(node_type target) const {
        CodingPath path;
        yyjson_val * cur = root();
        if(!cur || !target) return path;
        while(cur != target) {
            yyjson_val * descend = nullptr;
            if(yyjson_is_arr(cur)) {
                std::size_t idx = 0;
                yyjson_arr_iter it;
                yyjson_arr_iter_init(cur, &it);
                while(yyjson_val * child = yyjson_arr_iter_next(&it)) {
                    if(contains(child, target)) {
                        path.emplace_back(idx);
                        descend = child;
                        break;
                    }
                    idx ++;
                }
            } else if(yyjson_is_obj(cur)) {
                const auto * converted = converted_keys(cur);
                std::size_t i = 0;
                yyjson_obj_iter it;
                yyjson_obj_iter_init(cur, &it);
                while(yyjson_val * k = yyjson_obj_iter_next(&it)) {
                    yyjson_val * v = yyjson_obj_iter_get_val(k);
                    if(contains(v, target)) {
                        path.emplace_back(converted ? std::string_view((*converted)[i]) : yyjson_detail::string_of(k));
                        descend = v;
                        break;
                    }
                    i ++;
                }
            }
            if(!descend) break; // not inside this document
            cur = descend;
        }
        return path;
    }

private:
    yyjson_detail::DocPtr doc_;
    std::string reason_;
    std::unordered_map<const yyjson_val*, std::vector<std::string>> converted_;

    const std::vector<std::string> * converted_keys(node_type obj) const {
        if(converted_.empty()) return nullptr;
        auto it = converted_.find(obj);
        return it == converted_.end() ? nullptr : &it->second;
    }

    static bool contains(yyjson_val * child, yyjson_val * target) {
        return child <= target && target < unsafe_yyjson_get_next(child);
    }

    // Single linear pass over the value pool; a stack of container ends
    // tracks the current nesting.
    bool depth_exceeds(std::size_t limit) const {
        yyjson_val * cur = yyjson_doc_get_root(doc_.get());
        yyjson_val * const end = cur + yyjson_doc_get_val_count(doc_.get());
        std::vector<yyjson_val*> open;
        for(; cur < end; ++cur) {
            while(!open.empty() && cur >= open.back()) open.pop_back();
            if(yyjson_is_ctn(cur)) {
                open.push_back(unsafe_yyjson_get_next(cur));
                if(open.size() > limit) return true;
            }
        }
        return false;
    }
};

static_assert(tree::TreeLike<YyjsonTree>);

} // namespace DomDecode
