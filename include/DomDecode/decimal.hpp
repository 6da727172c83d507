#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <mpdecimal.h>

namespace DomDecode {

// Arbitrary-precision decimal number backed by libmpdec.
class Decimal {
    mpd_t * m_value = nullptr;

    static const mpd_context_t & context() {
        static const mpd_context_t ctx = [] {
            mpd_context_t c;
            mpd_maxcontext(&c);
            return c;
        }();
        return ctx;
    }

public:
    Decimal() {
        m_value = mpd_qnew();
        std::uint32_t status = 0;
        mpd_qset_string(m_value, "0", &context(), &status);
    }
    ~Decimal() {
        if(m_value) mpd_del(m_value);
    }
    Decimal(const Decimal & other) : Decimal() {
        std::uint32_t status = 0;
        if(other.m_value) mpd_qcopy(m_value, other.m_value, &status);
    }
    Decimal(Decimal && other) noexcept : m_value(std::exchange(other.m_value, nullptr)) {}
    Decimal & operator=(Decimal other) noexcept {
        std::swap(m_value, other.m_value);
        return *this;
    }

    // Accepts any finite decimal literal; rejects NaN, infinities and syntax errors.
    static bool parse(std::string_view literal, Decimal & out) {
        const std::string text(literal);
        Decimal parsed;
        std::uint32_t status = 0;
        mpd_qset_string(parsed.m_value, text.c_str(), &context(), &status);
        if((status & (MPD_Conversion_syntax | MPD_Overflow | MPD_Malloc_error)) != 0 ||
            mpd_isnan(parsed.m_value) || mpd_isinfinite(parsed.m_value)) {
            return false;
        }
        out = std::move(parsed);
        return true;
    }

    std::string to_string() const {
        if(!m_value) return {};
        char * s = mpd_to_sci(m_value, 1);
        if(!s) return {};
        std::string out(s);
        mpd_free(s);
        return out;
    }

    bool operator==(const Decimal & other) const {
        std::uint32_t status = 0;
        return mpd_qcmp(m_value, other.m_value, &status) == 0;
    }
};

} // namespace DomDecode
