#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "any_decoder.hpp"
#include "context.hpp"
#include "static_schema.hpp"

namespace DomDecode {

template <tree::TreeLike Tree> class KeyedContainer;
template <tree::TreeLike Tree> class SequentialContainer;
template <tree::TreeLike Tree> class SingleValueContainer;

namespace detail {

template <tree::TreeLike Tree> class ErasedKeyedView;
template <tree::TreeLike Tree> class ErasedSequentialView;

// Pool token for keyed containers opened through AnyDecoder.
struct ErasedKeys {};

// Decodes `node` as T: pushes it on the container stack for the duration of
// the call and dispatches on the type category.
template <class T, tree::TreeLike Tree>
bool unbox(T & out, typename Tree::node_type node, DecodingContext<Tree> & ctx);

template <class Keys, tree::TreeLike Tree>
std::optional<KeyedContainer<Tree>> open_keyed(DecodingContext<Tree> & ctx, typename Tree::node_type node) {
    auto & tree = ctx.tree();
    if(tree.is_null(node)) {
        ctx.fail({TreeFailureKind::value_does_not_exist, "Cannot get keyed decoding container -- found null value instead.", node});
        return std::nullopt;
    }
    if(!tree.is_object(node)) {
        ctx.fail({TreeFailureKind::wrong_type,
                  "Expected to decode Dictionary but found " + std::string(tree.kind_name(node)) + " instead.", node});
        return std::nullopt;
    }
    auto storage = tree.member_count(node) == 0 ? tree.empty_dictionary() : node;
    if(storage != tree.empty_dictionary() && ctx.policy().keys == strategies::KeyDecoding::convert_from_snake_case) {
        tree.convert_keys_to_camel_case(storage);
    }
    return KeyedContainer<Tree>(ctx, ctx.template reserve_keyed<Keys>(storage, node));
}

template <tree::TreeLike Tree>
std::optional<SequentialContainer<Tree>> open_sequential(DecodingContext<Tree> & ctx, typename Tree::node_type node) {
    auto & tree = ctx.tree();
    if(tree.is_null(node)) {
        ctx.fail({TreeFailureKind::value_does_not_exist, "Cannot get unkeyed decoding container -- found null value instead.", node});
        return std::nullopt;
    }
    if(!tree.is_array(node)) {
        ctx.fail({TreeFailureKind::wrong_type,
                  "Expected to decode Array but found " + std::string(tree.kind_name(node)) + " instead.", node});
        return std::nullopt;
    }
    return SequentialContainer<Tree>(ctx, node);
}

} // namespace detail


/// A decoder positioned at one node. Composite types receive one in their
/// `decode_from` routine and ask it for the shape they expect.
template <tree::TreeLike Tree>
class Decoder : public AnyDecoder {
public:
    using node_type = typename Tree::node_type;

private:
    DecodingContext<Tree> * m_ctx;
    node_type m_node;

public:
    Decoder(DecodingContext<Tree> & ctx, node_type node): m_ctx(&ctx), m_node(node) {}

    // `Keys` identifies the key set; containers of the same key set are pooled.
    template <class Keys>
    std::optional<KeyedContainer<Tree>> keyed_container() {
        return detail::open_keyed<Keys>(*m_ctx, m_node);
    }

    std::optional<SequentialContainer<Tree>> sequential_container() {
        return detail::open_sequential(*m_ctx, m_node);
    }

    SingleValueContainer<Tree> single_value_container() {
        return SingleValueContainer<Tree>(*m_ctx, m_node);
    }

    template <class T>
    bool decode(T & v) {
        return detail::unbox(v, m_node, *m_ctx);
    }

    CodingPath coding_path() const override { return m_ctx->tree().coding_path(m_node); }
    const DecodePolicy & policy() const override { return m_ctx->policy(); }
    const UserInfo & user_info() const override { return m_ctx->policy().user_info; }

    bool decode_nil() override { return m_ctx->tree().is_null(m_node); }
    bool decode(bool & v) override { return detail::unbox(v, m_node, *m_ctx); }
    bool decode(std::int64_t & v) override { return detail::unbox(v, m_node, *m_ctx); }
    bool decode(std::uint64_t & v) override { return detail::unbox(v, m_node, *m_ctx); }
    bool decode(double & v) override { return detail::unbox(v, m_node, *m_ctx); }
    bool decode(std::string & v) override { return detail::unbox(v, m_node, *m_ctx); }

    std::unique_ptr<AnyKeyedView> keyed_view() override {
        auto c = keyed_container<detail::ErasedKeys>();
        if(!c) return nullptr;
        return std::make_unique<detail::ErasedKeyedView<Tree>>(std::move(*c));
    }

    std::unique_ptr<AnySequentialView> sequential_view() override {
        auto c = sequential_container();
        if(!c) return nullptr;
        return std::make_unique<detail::ErasedSequentialView<Tree>>(std::move(*c));
    }

    bool fail(std::string description) override {
        return m_ctx->fail({TreeFailureKind::data_corrupted, std::move(description), m_node});
    }
    bool fail(TreeFailureKind kind, std::string description) {
        return m_ctx->fail({kind, std::move(description), m_node});
    }

    DecodingContext<Tree> & context() { return *m_ctx; }
    node_type node() const { return m_node; }
};


template <tree::TreeLike Tree>
class KeyedContainer {
public:
    using node_type = typename Tree::node_type;

private:
    DecodingContext<Tree> * m_ctx;
    std::shared_ptr<detail::KeyedState<Tree>> m_state;

    node_type fetch(std::string_view key) const {
        return m_ctx->tree().fetch(m_state->storage, key);
    }

    bool key_missing(std::string_view key) const {
        return m_ctx->fail({TreeFailureKind::key_does_not_exist,
                            "No value associated with key \"" + std::string(key) + "\".",
                            m_state->origin, std::string(key), std::nullopt, FailureAnchor::scope});
    }

public:
    KeyedContainer(DecodingContext<Tree> & ctx, std::shared_ptr<detail::KeyedState<Tree>> state):
        m_ctx(&ctx), m_state(std::move(state))
    {}

    CodingPath coding_path() const { return m_ctx->tree().coding_path(m_state->origin); }

    // Keys present in the dictionary, in document order, without duplicates.
    const std::vector<std::string_view> & all_keys() {
        if(!m_state->keys_listed) {
            m_state->keys.clear();
            for(std::string_view k: m_ctx->tree().all_keys(m_state->storage)) {
                if(std::find(m_state->keys.begin(), m_state->keys.end(), k) == m_state->keys.end()) {
                    m_state->keys.push_back(k);
                }
            }
            m_state->keys_listed = true;
        }
        return m_state->keys;
    }

    bool contains(std::string_view key) const {
        return fetch(key) != node_type{};
    }

    bool decode_nil(std::string_view key, bool & is_nil) {
        node_type child = fetch(key);
        if(!child) return key_missing(key);
        is_nil = m_ctx->tree().is_null(child);
        return true;
    }

    template <class T>
    bool decode(T & out, std::string_view key) {
        node_type child = fetch(key);
        if(!child) return key_missing(key);
        constexpr auto cat = static_schema::category_of<T, Tree>();
        if constexpr (cat != static_schema::TypeCategory::optional && cat != static_schema::TypeCategory::custom) {
            if(m_ctx->tree().is_null(child)) {
                return m_ctx->fail({TreeFailureKind::value_does_not_exist,
                                    "Expected " + static_schema::type_name<T, Tree>() + " value but found null instead.",
                                    child, std::string(key)});
            }
        }
        return detail::unbox(out, child, *m_ctx);
    }

    // A missing key or a null value leaves `out` empty.
    template <class T>
    bool decode_if_present(std::optional<T> & out, std::string_view key) {
        node_type child = fetch(key);
        if(!child || m_ctx->tree().is_null(child)) {
            out.reset();
            return true;
        }
        T v{};
        if(!detail::unbox(v, child, *m_ctx)) return false;
        out = std::move(v);
        return true;
    }

    template <class Keys>
    std::optional<KeyedContainer> nested_keyed(std::string_view key) {
        node_type child = fetch(key);
        if(!child) {
            key_missing(key);
            return std::nullopt;
        }
        return detail::open_keyed<Keys>(*m_ctx, child);
    }

    std::optional<SequentialContainer<Tree>> nested_sequential(std::string_view key) {
        node_type child = fetch(key);
        if(!child) {
            key_missing(key);
            return std::nullopt;
        }
        return detail::open_sequential(*m_ctx, child);
    }

    std::optional<Decoder<Tree>> super_decoder() {
        return super_decoder("super");
    }

    std::optional<Decoder<Tree>> super_decoder(std::string_view key) {
        node_type child = fetch(key);
        if(!child) {
            key_missing(key);
            return std::nullopt;
        }
        return Decoder<Tree>(*m_ctx, child);
    }
};


template <tree::TreeLike Tree>
class SequentialContainer {
public:
    using node_type = typename Tree::node_type;

private:
    DecodingContext<Tree> * m_ctx;
    node_type m_array;
    typename Tree::ArrayCursor m_cursor;
    std::size_t m_index = 0;
    bool m_at_end;

    bool exhausted() {
        return m_ctx->fail({TreeFailureKind::sequence_at_end,
                            "Cannot get next value -- unkeyed container is at end.",
                            m_array, std::nullopt, m_index, FailureAnchor::scope});
    }

    void advance() {
        m_at_end = m_ctx->tree().advance(m_cursor);
        m_index ++;
    }

public:
    SequentialContainer(DecodingContext<Tree> & ctx, node_type array):
        m_ctx(&ctx), m_array(array), m_cursor(ctx.tree().enter_first_child(array)), m_at_end(m_cursor.remaining == 0)
    {}

    std::size_t count() const { return m_ctx->tree().array_size(m_array); }
    bool is_at_end() const { return m_at_end; }
    std::size_t current_index() const { return m_index; }
    CodingPath coding_path() const { return m_ctx->tree().coding_path(m_array); }

    // Consumes the element only when it is null.
    bool decode_nil(bool & is_nil) {
        if(m_at_end) return exhausted();
        is_nil = m_ctx->tree().is_null(m_cursor.current);
        if(is_nil) advance();
        return true;
    }

    template <class T>
    bool decode(T & out) {
        if(m_at_end) return exhausted();
        if(!detail::unbox(out, m_cursor.current, *m_ctx)) return false;
        advance();
        return true;
    }

    // At the end, or on a null element, `out` is left empty.
    template <class T>
    bool decode_if_present(std::optional<T> & out) {
        if(m_at_end || m_ctx->tree().is_null(m_cursor.current)) {
            out.reset();
            if(!m_at_end) advance();
            return true;
        }
        T v{};
        if(!detail::unbox(v, m_cursor.current, *m_ctx)) return false;
        out = std::move(v);
        advance();
        return true;
    }

    template <class Keys>
    std::optional<KeyedContainer<Tree>> nested_keyed() {
        if(m_at_end) {
            exhausted();
            return std::nullopt;
        }
        auto c = detail::open_keyed<Keys>(*m_ctx, m_cursor.current);
        if(c) advance();
        return c;
    }

    std::optional<SequentialContainer> nested_sequential() {
        if(m_at_end) {
            exhausted();
            return std::nullopt;
        }
        auto c = detail::open_sequential(*m_ctx, m_cursor.current);
        if(c) advance();
        return c;
    }

    std::optional<Decoder<Tree>> super_decoder() {
        if(m_at_end) {
            exhausted();
            return std::nullopt;
        }
        Decoder<Tree> d(*m_ctx, m_cursor.current);
        advance();
        return d;
    }
};


template <tree::TreeLike Tree>
class SingleValueContainer {
public:
    using node_type = typename Tree::node_type;

private:
    DecodingContext<Tree> * m_ctx;
    node_type m_node;

public:
    SingleValueContainer(DecodingContext<Tree> & ctx, node_type node): m_ctx(&ctx), m_node(node) {}

    bool decode_nil() const { return m_ctx->tree().is_null(m_node); }

    template <class T>
    bool decode(T & out) {
        return detail::unbox(out, m_node, *m_ctx);
    }

    CodingPath coding_path() const { return m_ctx->tree().coding_path(m_node); }
};

namespace detail {

template <tree::TreeLike Tree>
class ErasedKeyedView final : public AnyKeyedView {
    KeyedContainer<Tree> m_c;

public:
    explicit ErasedKeyedView(KeyedContainer<Tree> c): m_c(std::move(c)) {}

    CodingPath coding_path() const override { return m_c.coding_path(); }
    const std::vector<std::string_view> & all_keys() override { return m_c.all_keys(); }
    bool contains(std::string_view key) const override { return m_c.contains(key); }

    bool decode_nil(std::string_view key, bool & is_nil) override { return m_c.decode_nil(key, is_nil); }
    bool decode(bool & v, std::string_view key) override { return m_c.decode(v, key); }
    bool decode(std::int64_t & v, std::string_view key) override { return m_c.decode(v, key); }
    bool decode(std::uint64_t & v, std::string_view key) override { return m_c.decode(v, key); }
    bool decode(double & v, std::string_view key) override { return m_c.decode(v, key); }
    bool decode(std::string & v, std::string_view key) override { return m_c.decode(v, key); }

    std::unique_ptr<AnyDecoder> nested(std::string_view key) override {
        auto d = m_c.super_decoder(key);
        if(!d) return nullptr;
        return std::make_unique<Decoder<Tree>>(*d);
    }
};

template <tree::TreeLike Tree>
class ErasedSequentialView final : public AnySequentialView {
    SequentialContainer<Tree> m_c;

public:
    explicit ErasedSequentialView(SequentialContainer<Tree> c): m_c(std::move(c)) {}

    CodingPath coding_path() const override { return m_c.coding_path(); }
    std::size_t count() const override { return m_c.count(); }
    bool is_at_end() const override { return m_c.is_at_end(); }
    std::size_t current_index() const override { return m_c.current_index(); }

    bool decode_nil(bool & is_nil) override { return m_c.decode_nil(is_nil); }
    bool decode(bool & v) override { return m_c.decode(v); }
    bool decode(std::int64_t & v) override { return m_c.decode(v); }
    bool decode(std::uint64_t & v) override { return m_c.decode(v); }
    bool decode(double & v) override { return m_c.decode(v); }
    bool decode(std::string & v) override { return m_c.decode(v); }

    std::unique_ptr<AnyDecoder> next() override {
        auto d = m_c.super_decoder();
        if(!d) return nullptr;
        return std::make_unique<Decoder<Tree>>(*d);
    }
};

} // namespace detail

} // namespace DomDecode
