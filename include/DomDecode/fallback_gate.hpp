#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

#include "options.hpp"

namespace DomDecode {

using CpuProbe = bool (*)();

// The fast engine relies on SSE4.2 on x86; other targets need nothing extra.
inline bool has_required_cpu_features() {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_cpu_init();
    return __builtin_cpu_supports("sse4.2");
#else
    return true;
#endif
}


/// Process-wide "tell the user once" switch for fallbacks. Every fallback is
/// counted; only the first one after construction (or rearm()) reaches the
/// sink.
class AdvisoryChannel {
public:
    using Sink = std::function<void(std::string_view)>;

    AdvisoryChannel()
        : m_sink([](std::string_view msg) { std::cerr << msg << std::endl; })
    {}
    explicit AdvisoryChannel(Sink sink): m_sink(std::move(sink)) {}

    // The sink runs outside the lock, so it may call back into the channel.
    void advise(std::string_view reason) {
        Sink sink;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_fallbacks ++;
            if(m_advised || m_suppressed) return;
            m_advised = true;
            m_emitted ++;
            sink = m_sink;
        }
        if(sink) {
            sink("[DomDecode] Warning: fell back to the reference decoder. Reason: " + std::string(reason)
                 + ". Decoding still works, but is slower. This message will only be printed the first time.");
        }
    }

    void rearm() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_advised = false;
    }

    void suppress(bool on = true) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_suppressed = on;
    }

    std::size_t fallbacks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fallbacks;
    }

    std::size_t emitted() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_emitted;
    }

    static AdvisoryChannel & process_wide() {
        static AdvisoryChannel channel;
        return channel;
    }

private:
    mutable std::mutex m_mutex;
    Sink m_sink;
    bool m_advised = false;
    bool m_suppressed = false;
    std::size_t m_fallbacks = 0;
    std::size_t m_emitted = 0;
};


enum class GateState {
    fast_path,
    fallback
};

struct GateDecision {
    GateState state = GateState::fast_path;
    std::string_view reason;
};

/// Decides, before anything is parsed, whether a call can run on the fast
/// engine. A call routed to the reference engine stays there until it returns.
class FallbackGate {
    CpuProbe m_probe;
    AdvisoryChannel * m_channel;

public:
    FallbackGate(CpuProbe probe, AdvisoryChannel & channel): m_probe(probe), m_channel(&channel) {}

    GateDecision preflight(const DecodePolicy & policy) const {
        if(m_probe && !m_probe()) {
            return {GateState::fallback, "required CPU features are not available"};
        }
        if(policy.keys == strategies::KeyDecoding::custom) {
            return {GateState::fallback, "custom key decoding strategy"};
        }
        return {};
    }

    void record_fallback(std::string_view reason) const {
        m_channel->advise(reason);
    }
};

} // namespace DomDecode
