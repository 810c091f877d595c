// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_NANOID_COMMON_H_INCLUDED
#define HEADER_MODERN_NANOID_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// MNID_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// MNID_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// MNID_BUILDING_MNID - set 1 if building the library itself.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cstdio>

#include <concepts>
#include <compare>
#include <span>
#include <string>
#include <string_view>
#include <limits>
#include <istream>
#include <ostream>

#if !defined(MNID_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define MNID_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define MNID_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define MNID_USE_EXCEPTIONS 0
    #else
        #define MNID_USE_EXCEPTIONS 1
    #endif
#endif

#if MNID_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if MNID_BUILDING_MNID
            #define MNID_EXPORTED __declspec(dllexport)
        #else
            #define MNID_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define MNID_EXPORTED [[gnu::visibility("default")]]
    #else
        #define MNID_EXPORTED
    #endif
#else
    #define MNID_EXPORTED
#endif


//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define MNID_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define MNID_SUPPORTS_FMT_FORMAT 1

#endif

#if MNID_USE_FMT && !MNID_SUPPORTS_FMT_FORMAT

    #error "MNID_USE_FMT is requested but fmt library (of version >= 6.0) is not detected. Did you forget to include <fmt/format.h> before this header?"

#endif

#if MNID_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace mnid
{
    namespace impl {
        template<class T, size_t Extent>
        std::true_type is_span_helper(std::span<T, Extent> * x);

        std::false_type is_span_helper(...);

        template<class T>
        constexpr bool is_span = decltype(is_span_helper((T *)nullptr))::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        // Maps anything a string view of char_like characters can be made from to its character type
        template<class T> struct string_like_char {};
        template<char_like C> struct string_like_char<C *> { using type = C; };
        template<char_like C> struct string_like_char<const C *> { using type = C; };
        template<char_like C, size_t N> struct string_like_char<C[N]> { using type = C; };
        template<char_like C, class Traits, class Alloc>
        struct string_like_char<std::basic_string<C, Traits, Alloc>> { using type = C; };
        template<char_like C, class Traits>
        struct string_like_char<std::basic_string_view<C, Traits>> { using type = C; };

        template<class T>
        using string_like_char_t = typename string_like_char<std::remove_cvref_t<T>>::type;

        template<class T>
        concept string_like = requires { typename string_like_char_t<T>; };

        static_assert(string_like<const char (&)[3]>);
        static_assert(string_like<std::u32string>);
        static_assert(string_like<const wchar_t *>);
        static_assert(!string_like<int>);

        #if MNID_USE_EXCEPTIONS
            #define MNID_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "modern-nanoid: fatal error: %s\n", message);
                abort();
            }
            #define MNID_THROW(x) ::mnid::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }
    }
}

#endif
