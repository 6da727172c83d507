#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "container_cache.hpp"
#include "decode_result.hpp"
#include "error_translator.hpp"
#include "options.hpp"
#include "tree_concept.hpp"

namespace DomDecode {


/// Per-call mutable state: the container stack, the policy, the tree being
/// walked, the keyed container pool and the error slot.
template <tree::TreeLike Tree>
class DecodingContext {
public:
    using node_type = typename Tree::node_type;

private:
    const DecodePolicy & m_policy;
    Tree & m_tree;
    ContainerCache<Tree> * m_cache;
    std::vector<node_type> m_stack;
    std::optional<DecodeError> m_error;

public:
    struct ScopeGuard {
        DecodingContext * ctx;

        ScopeGuard(DecodingContext * c): ctx(c) {}
        ScopeGuard(const ScopeGuard &) = delete;
        ScopeGuard & operator=(const ScopeGuard &) = delete;
        ~ScopeGuard() {
            if(ctx) ctx->m_stack.pop_back();
        }
        explicit operator bool() const { return ctx != nullptr; }
    };

    // `cache` may be null, in which case every keyed container is fresh.
    DecodingContext(const DecodePolicy & policy, Tree & tree, ContainerCache<Tree> * cache):
        m_policy(policy), m_tree(tree), m_cache(cache)
    {}

    const DecodePolicy & policy() const { return m_policy; }
    Tree & tree() { return m_tree; }
    const Tree & tree() const { return m_tree; }

    std::size_t depth() const { return m_stack.size(); }
    node_type top() const { return m_stack.empty() ? node_type{} : m_stack.back(); }

    // Pushes `node` for the lifetime of the returned guard. A false guard
    // means the nesting limit was hit and the error is already recorded.
    [[nodiscard]] ScopeGuard enter(node_type node) {
        if(m_stack.size() >= m_policy.max_depth) {
            fail({TreeFailureKind::too_deep,
                  "Exceeded the maximum nesting depth of " + std::to_string(m_policy.max_depth) + ".",
                  node});
            return ScopeGuard{nullptr};
        }
        m_stack.push_back(node);
        return ScopeGuard{this};
    }

    template <class Keys>
    std::shared_ptr<detail::KeyedState<Tree>> reserve_keyed(node_type storage, node_type origin) {
        if(m_cache) {
            return m_cache->template reserve<Keys>(storage, origin);
        }
        return std::make_shared<detail::KeyedState<Tree>>(storage, origin);
    }

    bool fail(const TreeFailure<Tree> & failure) {
        m_error = TranslateFailure(failure, m_tree);
        return false;
    }

    bool has_error() const { return m_error.has_value(); }

    DecodeError take_error() {
        if(!m_error) {
            return DecodeError(DecodeErrorKind::MALFORMED_INPUT, {}, "A decoding routine reported failure without an error.");
        }
        DecodeError e = std::move(*m_error);
        m_error.reset();
        return e;
    }
};

} // namespace DomDecode
