#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "container_cache.hpp"
#include "context.hpp"
#include "decode_result.hpp"
#include "dispatch.hpp"
#include "fallback_gate.hpp"
#include "options.hpp"
#include "value_tree.hpp"
#include "yyjson_tree.hpp"

namespace DomDecode {

namespace engine_detail {

template <class T, tree::TreeLike Tree>
DecodeResult<T> decode_tree(Tree & tree, const DecodePolicy & policy, ContainerCache<Tree> * cache) {
    DecodingContext<Tree> ctx(policy, tree, cache);
    T value{};
    if(!detail::unbox(value, tree.root(), ctx)) {
        return DecodeResult<T>(ctx.take_error());
    }
    return DecodeResult<T>(std::move(value));
}

inline DecodeError parse_failure(const std::string & reason) {
    return DecodeError(DecodeErrorKind::MALFORMED_INPUT, {}, "The given data was not valid JSON. Error: " + reason);
}

} // namespace engine_detail


/// Borrowed yyjson tree, keyed container pooling, no support for user key
/// transforms. Declines documents nested deeper than max_fast_path_depth.
struct FastEngine {
    template <class T>
    std::optional<DecodeResult<T>> decode(std::string_view bytes, const DecodePolicy & policy) const {
        YyjsonTree tree;
        switch(tree.parse(bytes, policy.max_fast_path_depth)) {
        case tree::ParseStatus::failed:
            return DecodeResult<T>(engine_detail::parse_failure(tree.failure_reason()));
        case tree::ParseStatus::retry_advised:
            return std::nullopt;
        case tree::ParseStatus::ok:
            break;
        }
        ContainerCache<YyjsonTree> cache;
        return engine_detail::decode_tree<T>(tree, policy, &cache);
    }
};

/// Owned value tree, every policy supported, containers never reused.
struct ReferenceEngine {
    template <class T>
    DecodeResult<T> decode(std::string_view bytes, const DecodePolicy & policy) const {
        reference::ValueTree tree;
        if(tree.parse(bytes, policy) != tree::ParseStatus::ok) {
            if(tree.nesting_exceeded()) {
                return DecodeResult<T>(DecodeError(DecodeErrorKind::NESTING_TOO_DEEP, {},
                                                   "Exceeded the maximum nesting depth of " + std::to_string(policy.max_depth) + "."));
            }
            return DecodeResult<T>(engine_detail::parse_failure(tree.failure_reason()));
        }
        return engine_detail::decode_tree<T>(tree, policy, nullptr);
    }
};


/// Entry point. Holds configuration only, so one instance can serve any
/// number of concurrent calls; each call builds its own context and pool.
class JsonDecoder {
public:
    DecodePolicy policy;

    JsonDecoder() = default;
    explicit JsonDecoder(DecodePolicy p,
                         AdvisoryChannel & channel = AdvisoryChannel::process_wide(),
                         CpuProbe probe = &has_required_cpu_features)
        : policy(std::move(p)), m_channel(&channel), m_probe(probe)
    {}

    template <class T>
    DecodeResult<T> decode(std::string_view bytes) const {
        const FallbackGate gate(m_probe, *m_channel);
        const GateDecision decision = gate.preflight(policy);
        if(decision.state == GateState::fallback) {
            gate.record_fallback(decision.reason);
            return ReferenceEngine{}.decode<T>(bytes, policy);
        }
        if(auto result = FastEngine{}.decode<T>(bytes, policy)) {
            return std::move(*result);
        }
        gate.record_fallback("document nesting exceeds the fast path limit");
        return ReferenceEngine{}.decode<T>(bytes, policy);
    }

private:
    AdvisoryChannel * m_channel = &AdvisoryChannel::process_wide();
    CpuProbe m_probe = &has_required_cpu_features;
};


template <class T>
DecodeResult<T> Decode(std::string_view json, const DecodePolicy & policy = {}) {
    return JsonDecoder(policy).decode<T>(json);
}

// `obj` is only written on success; on failure the error goes to `error` when given.
template <class T>
bool Decode(T & obj, std::string_view json, DecodeError * error = nullptr, const DecodePolicy & policy = {}) {
    auto res = Decode<T>(json, policy);
    if(!res) {
        if(error) *error = res.error();
        return false;
    }
    obj = std::move(res).value();
    return true;
}

namespace reference {

// Runs the reference engine directly, bypassing the gate.
template <class T>
DecodeResult<T> Decode(std::string_view json, const DecodePolicy & policy = {}) {
    return ReferenceEngine{}.decode<T>(json, policy);
}

} // namespace reference

} // namespace DomDecode
