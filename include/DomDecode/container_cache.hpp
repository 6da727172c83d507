#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace DomDecode {

// One distinct address per key enumeration type.
template <class Keys>
inline constexpr char key_type_token = 0;

namespace detail {

template <class Tree>
struct KeyedState {
    using node_type = typename Tree::node_type;

    node_type storage{};    // dictionary read from; the shared sentinel for `{}`
    node_type origin{};     // dictionary as found in the document, for paths
    std::vector<std::string_view> keys;
    bool keys_listed = false;

    KeyedState(node_type s, node_type o): storage(s), origin(o) {}

    void refurbish(node_type s, node_type o) {
        storage = s;
        origin = o;
        keys.clear();
        keys_listed = false;
    }
};

} // namespace detail


/// Keyed container states pooled per key enumeration type. A pooled state is
/// handed out again only while nothing else references it; otherwise a fresh
/// one is allocated and the pooled one is left to its current holder.
template <class Tree>
class ContainerCache {
    using StateT = detail::KeyedState<Tree>;
    std::unordered_map<const void*, std::shared_ptr<StateT>> m_pool;
    std::size_t m_allocations = 0;

public:
    template <class Keys>
    std::shared_ptr<StateT> reserve(typename Tree::node_type storage, typename Tree::node_type origin) {
        std::shared_ptr<StateT> & slot = m_pool[&key_type_token<Keys>];
        if(slot && slot.use_count() == 1) {
            slot->refurbish(storage, origin);
            return slot;
        }
        auto fresh = std::make_shared<StateT>(storage, origin);
        m_allocations ++;
        if(!slot) {
            slot = fresh;
        }
        return fresh;
    }

    std::size_t allocations() const { return m_allocations; }
    std::size_t pooled() const { return m_pool.size(); }
};

} // namespace DomDecode
