// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_NANOID_UTF_CODEC_H_INCLUDED
#define HEADER_MODERN_NANOID_UTF_CODEC_H_INCLUDED

#include <modern-nanoid/common.h>

#include <iterator>
#include <type_traits>
#include <vector>

namespace mnid::impl {

    inline constexpr char32_t replacement_char = 0xFFFD;

    enum class utf_encoding {
        utf8,
        utf16,
        utf32
    };

    // wchar_t is UTF-16 where it is 2 bytes wide and UTF-32 elsewhere
    template<char_like C>
    inline constexpr utf_encoding encoding_of = sizeof(C) == 1 ? utf_encoding::utf8 :
                                                (sizeof(C) == 2 ? utf_encoding::utf16 : utf_encoding::utf32);

    template<class T>
    constexpr uint32_t to_unit(T c) noexcept {
        return uint32_t(std::make_unsigned_t<T>(c));
    }

    constexpr bool is_surrogate(uint32_t val) noexcept {
        return val >= 0xD800 && val <= 0xDFFF;
    }

    /**
     * Decodes a single character at `first` and advances `first` past it.
     *
     * Ill-formed input decodes to U+FFFD and consumes one maximal ill-formed subpart
     * so that a bad sequence is never swallowed together with the well-formed text after it.
     */
    template<utf_encoding Enc, class T>
    constexpr char32_t decode_one(const T * & first, const T * last) noexcept {
        uint32_t lead = to_unit(*first++);
        if constexpr (Enc == utf_encoding::utf8) {
            if (lead < 0x80)
                return char32_t(lead);

            unsigned trail_count;
            uint32_t ret;
            uint32_t lo = 0x80, hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                trail_count = 1;
                ret = lead & 0x1F;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                trail_count = 2;
                ret = lead & 0x0F;
                if (lead == 0xE0)
                    lo = 0xA0;
                else if (lead == 0xED)
                    hi = 0x9F;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                trail_count = 3;
                ret = lead & 0x07;
                if (lead == 0xF0)
                    lo = 0x90;
                else if (lead == 0xF4)
                    hi = 0x8F;
            } else {
                return replacement_char;
            }

            for (unsigned i = 0; i < trail_count; ++i) {
                if (first == last)
                    return replacement_char;
                uint32_t trail = to_unit(*first);
                if (trail < lo || trail > hi)
                    return replacement_char;
                ret = (ret << 6) | (trail & 0x3F);
                ++first;
                lo = 0x80;
                hi = 0xBF;
            }
            return char32_t(ret);

        } else if constexpr (Enc == utf_encoding::utf16) {
            if (!is_surrogate(lead))
                return char32_t(lead);
            if (lead >= 0xDC00 || first == last)
                return replacement_char;
            uint32_t trail = to_unit(*first);
            if (trail < 0xDC00 || trail > 0xDFFF)
                return replacement_char;
            ++first;
            return char32_t(0x10000 + ((lead - 0xD800) << 10) + (trail - 0xDC00));

        } else {
            if (lead > 0x10FFFF || is_surrogate(lead))
                return replacement_char;
            return char32_t(lead);
        }
    }

    /// Encodes a Unicode scalar value as code units of type T
    template<utf_encoding Enc, class T, class OutIt>
    constexpr OutIt encode_one(char32_t c, OutIt out) {
        uint32_t val = uint32_t(c);
        if constexpr (Enc == utf_encoding::utf8) {
            if (val < 0x80) {
                *out++ = T(val);
            } else if (val < 0x800) {
                *out++ = T(0xC0 | (val >> 6));
                *out++ = T(0x80 | (val & 0x3F));
            } else if (val < 0x10000) {
                *out++ = T(0xE0 | (val >> 12));
                *out++ = T(0x80 | ((val >> 6) & 0x3F));
                *out++ = T(0x80 | (val & 0x3F));
            } else {
                *out++ = T(0xF0 | (val >> 18));
                *out++ = T(0x80 | ((val >> 12) & 0x3F));
                *out++ = T(0x80 | ((val >> 6) & 0x3F));
                *out++ = T(0x80 | (val & 0x3F));
            }
        } else if constexpr (Enc == utf_encoding::utf16) {
            if (val < 0x10000) {
                *out++ = T(val);
            } else {
                val -= 0x10000;
                *out++ = T(0xD800 | (val >> 10));
                *out++ = T(0xDC00 | (val & 0x3FF));
            }
        } else {
            *out++ = T(val);
        }
        return out;
    }

    /**
     * Whether a code unit is a complete character on its own.
     *
     * Only such units can serve as nanoid alphabet symbols.
     */
    template<char_like C>
    constexpr bool is_complete_char(C c) noexcept {
        uint32_t val = to_unit(c);
        if constexpr (encoding_of<C> == utf_encoding::utf8)
            return val < 0x80;
        else if constexpr (encoding_of<C> == utf_encoding::utf16)
            return !is_surrogate(val);
        else
            return val <= 0x10FFFF && !is_surrogate(val);
    }

    template<char_like C>
    auto to_utf8_bytes(std::basic_string_view<C> src) -> std::vector<uint8_t> {
        std::vector<uint8_t> ret;
        if constexpr (encoding_of<C> == utf_encoding::utf8) {
            ret.reserve(src.size());
            for (C c: src)
                ret.push_back(uint8_t(c));
        } else {
            ret.reserve(src.size() * 3);
            auto out = std::back_inserter(ret);
            const C * first = src.data();
            const C * last = first + src.size();
            while (first != last) {
                char32_t c = decode_one<encoding_of<C>>(first, last);
                out = encode_one<utf_encoding::utf8, uint8_t>(c, out);
            }
        }
        return ret;
    }

    template<char_like C>
    auto from_utf8_bytes(std::span<const uint8_t> src) -> std::basic_string<C> {
        std::basic_string<C> ret;
        ret.reserve(src.size());
        auto out = std::back_inserter(ret);
        const uint8_t * first = src.data();
        const uint8_t * last = first + src.size();
        while (first != last) {
            char32_t c = decode_one<utf_encoding::utf8>(first, last);
            out = encode_one<encoding_of<C>, C>(c, out);
        }
        return ret;
    }
}

#endif
