// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_NANOID_NANOID_H_INCLUDED
#define HEADER_MODERN_NANOID_NANOID_H_INCLUDED

#include <modern-nanoid/common.h>
#include <modern-nanoid/utf_codec.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <iterator>
#include <random>
#include <stdexcept>
#include <vector>

namespace mnid {

    /**
     * A source of uniformly distributed random bytes.
     *
     * Any uniform random bit generator whose range is [0, 2^(8*k) - 1] qualifies,
     * e.g. std::mt19937, std::mt19937_64, std::random_device or secure_random.
     * Each result supplies k bytes, least significant first.
     */
    template<class G>
    concept random_byte_generator = std::uniform_random_bit_generator<G> &&
                                    G::min() == 0 &&
                                    int(std::bit_width(G::max())) % 8 == 0 &&
                                    int(std::popcount(G::max())) == int(std::bit_width(G::max()));

    /**
     * Process-wide cryptographically secure random source.
     *
     * Objects of this class are stateless handles that can be freely created and copied.
     * Each thread draws from its own ChaCha20 engine which is seeded once, on first use, from
     * system entropy. A forked child process gets freshly seeded engines.
     * Safe to use from multiple threads concurrently.
     */
    class secure_random {
    public:
        using result_type = uint32_t;

        static constexpr result_type min() noexcept { return 0; }
        static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

        MNID_EXPORTED result_type operator()();
    };

    static_assert(random_byte_generator<secure_random>);
    static_assert(random_byte_generator<std::mt19937>);
    static_assert(random_byte_generator<std::mt19937_64>);
    static_assert(!random_byte_generator<std::minstd_rand>);

    namespace impl {

        inline constexpr size_t max_alphabet_size = 256;

        template<random_byte_generator G>
        void fill_random_bytes(G & gen, std::span<uint8_t> dest) {
            using result_type = typename G::result_type;
            constexpr size_t bytes_per_result = size_t(std::bit_width(G::max())) / 8;

            for (size_t i = 0; i < dest.size(); ) {
                result_type val = gen();
                for (size_t j = 0; j < bytes_per_result && i < dest.size(); ++j, ++i) {
                    dest[i] = uint8_t(val);
                    if constexpr (bytes_per_result > 1)
                        val >>= 8;
                }
            }
        }

        template<char_like C>
        void validate_generation_args(size_t size, std::basic_string_view<C> alphabet) {
            if (size > size_t(std::numeric_limits<ptrdiff_t>::max()))
                MNID_THROW(std::invalid_argument("nanoid size must be a non-negative number"));

            if (alphabet.size() < 2)
                MNID_THROW(std::invalid_argument("nanoid alphabet must contain at least 2 symbols"));
            if (alphabet.size() > max_alphabet_size)
                MNID_THROW(std::invalid_argument("nanoid alphabet must contain at most 256 symbols"));

            if (!std::all_of(alphabet.begin(), alphabet.end(), [](C c) { return is_complete_char(c); }))
                MNID_THROW(std::invalid_argument("nanoid alphabet symbols must each be a complete character"));

            std::basic_string<C> sorted(alphabet);
            std::sort(sorted.begin(), sorted.end());
            if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
                MNID_THROW(std::invalid_argument("nanoid alphabet symbols must be distinct"));
        }
    }

    /**
     * Generates a string of `size` symbols drawn independently and uniformly from `alphabet`.
     *
     * Uses masked rejection sampling: each random byte is masked down to the smallest
     * all-ones value covering the alphabet indices and out of range values are discarded.
     * Random bytes are requested in batches sized so that one batch is usually enough.
     *
     * @param random source of random bytes
     * @param size number of symbols to produce. Zero yields an empty string without touching `random`
     * @param alphabet between 2 and 256 distinct symbols, each a complete character in one code unit
     *
     * @throws std::invalid_argument if the alphabet or size are invalid
     */
    template<random_byte_generator G, impl::string_like S>
    auto generate_string(G & random, size_t size, const S & alphabet) -> std::basic_string<impl::string_like_char_t<S>> {
        using char_type = impl::string_like_char_t<S>;

        std::basic_string_view<char_type> symbols(alphabet);
        impl::validate_generation_args(size, symbols);

        std::basic_string<char_type> ret;
        if (size == 0)
            return ret;
        ret.reserve(size);

        const size_t alphabet_size = symbols.size();
        const size_t mask = (size_t(1) << std::bit_width(alphabet_size - 1)) - 1;
        const auto step = size_t(std::ceil(1.6 * double(mask) * double(size) / double(alphabet_size)));

        std::vector<uint8_t> buf(step);
        for ( ; ; ) {
            impl::fill_random_bytes(random, std::span(buf));
            for (uint8_t b: buf) {
                size_t idx = b & mask;
                if (idx >= alphabet_size)
                    continue;
                ret.push_back(symbols[idx]);
                if (ret.size() == size)
                    return ret;
            }
        }
    }

    /// Generates a string of `size` symbols from `alphabet` using secure_random
    template<impl::string_like S>
    auto generate_string(size_t size, const S & alphabet) -> std::basic_string<impl::string_like_char_t<S>> {
        secure_random random;
        return generate_string(random, size, alphabet);
    }


    /**
     * An immutable NanoID value.
     *
     * Holds the UTF-8 encoding of a generated identifier or any byte sequence it was
     * constructed from. Equality, ordering and hashing are all based on the bytes alone.
     */
    class nanoid {
    public:
        static constexpr size_t default_size = 21;
        static constexpr std::string_view default_alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz-";

    public:
        ///Constructs an empty nanoid
        nanoid() noexcept = default;

        ///Wraps the given bytes verbatim
        explicit nanoid(std::vector<uint8_t> bytes) noexcept:
            m_bytes(std::move(bytes))
        {}

        /// Generates a nanoid of default size from the default alphabet using secure_random
        MNID_EXPORTED static auto generate() -> nanoid;

        /// Generates a nanoid of a given size from the default alphabet using secure_random
        MNID_EXPORTED static auto generate(size_t size) -> nanoid;

        /// Generates a nanoid of a given size from a given alphabet using secure_random
        template<impl::string_like S>
        static auto generate(size_t size, const S & alphabet) -> nanoid {
            secure_random random;
            return nanoid::generate(random, size, alphabet);
        }

        /**
         * Generates a nanoid using the given random source.
         *
         * The result contains UTF-8 encoding of the generated symbols so its size() equals
         * the requested symbol count only for ASCII alphabets.
         */
        template<random_byte_generator G, impl::string_like S>
        static auto generate(G & random, size_t size, const S & alphabet) -> nanoid {
            return nanoid::from_chars(generate_string(random, size, alphabet));
        }

        /// Constructs nanoid from a span of byte-like objects
        template<impl::byte_like Byte, size_t Extent>
        static auto from_bytes(std::span<Byte, Extent> src) -> nanoid {
            std::vector<uint8_t> bytes(src.size());
            std::transform(src.begin(), src.end(), bytes.begin(), [](Byte b) {
                return static_cast<uint8_t>(b);
            });
            return nanoid(std::move(bytes));
        }

        /// Constructs nanoid from anything convertible to a span of byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        static auto from_bytes(const T & src) -> nanoid {
            return nanoid::from_bytes(std::span{src});
        }

        /**
         * Constructs nanoid from UTF-8 encoding of a string
         *
         * Narrow strings are taken to be UTF-8 already and are stored as is. Other
         * strings are transcoded with ill-formed code units replaced by U+FFFD.
         */
        template<impl::string_like S>
        static auto from_chars(const S & src) -> nanoid {
            std::basic_string_view<impl::string_like_char_t<S>> view(src);
            return nanoid(impl::to_utf8_bytes(view));
        }

        /// Returns the stored bytes
        auto bytes() const noexcept -> std::span<const uint8_t>
            { return m_bytes; }

        /// Returns number of stored bytes
        auto size() const noexcept -> size_t
            { return m_bytes.size(); }

        auto empty() const noexcept -> bool
            { return m_bytes.empty(); }

        /**
         * Returns a string decoded from the stored bytes
         *
         * Each ill-formed UTF-8 subsequence, only possible in nanoids constructed from
         * arbitrary bytes, is replaced by U+FFFD.
         */
        template<impl::char_like T = char>
        auto to_string() const -> std::basic_string<T> {
            return impl::from_utf8_bytes<T>(m_bytes);
        }

        friend auto operator==(const nanoid & lhs, const nanoid & rhs) -> bool = default;
        friend auto operator<=>(const nanoid & lhs, const nanoid & rhs) -> std::strong_ordering = default;

        /// Prints nanoid into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const nanoid & val) {
            auto text = val.to_string<T>();
            std::copy(text.begin(), text.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads a whitespace delimited nanoid from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, nanoid & val) {
            std::basic_string<T> buf;
            if (str >> buf)
                val = nanoid::from_chars(buf);
            return str;
        }

        /// Returns hash code for the nanoid
        friend size_t hash_value(const nanoid & val) noexcept {
            const uint8_t * data = val.m_bytes.data();
            size_t remaining = val.m_bytes.size();
            size_t temp;
            size_t ret = impl::hash_combine(size_t(0), remaining);

            if (auto remainder = remaining % sizeof(size_t)) {
                temp = 0;
                memcpy(&temp, data, remainder);
                ret = impl::hash_combine(ret, temp);
                data += remainder;
                remaining -= remainder;
            }
            for ( ; remaining != 0; remaining -= sizeof(size_t)) {
                memcpy(&temp, data, sizeof(size_t));
                ret = impl::hash_combine(ret, temp);
                data += sizeof(size_t);
            }
            return ret;
        }

    private:
        std::vector<uint8_t> m_bytes;
    };

    namespace impl {
        template<class T> struct nanoid_char_traits {
            static constexpr T fmt_cl_br = T(u8'}');
        };
        template<> struct nanoid_char_traits<char> {
            static constexpr char fmt_cl_br = '}';
        };
        template<> struct nanoid_char_traits<wchar_t> {
            static constexpr wchar_t fmt_cl_br = L'}';
        };

        template<class Derived, class CharT>
        struct nanoid_formatter_base {
            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                auto it = ctx.begin();
                if (it != ctx.end() && *it != nanoid_char_traits<CharT>::fmt_cl_br)
                    static_cast<Derived *>(this)->raise_exception("Invalid format args");
                return it;
            }

            template <typename FormatContext>
            auto format(const nanoid & val, FormatContext & ctx) const -> decltype(ctx.out())  {
                auto text = val.to_string<CharT>();
                return std::copy(text.begin(), text.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for nanoid
template<>
struct std::hash<mnid::nanoid> {

    size_t operator()(const mnid::nanoid & val) const noexcept {
        return hash_value(val);
    }
};


#if MNID_SUPPORTS_STD_FORMAT

/// nanoid formatter for std::format
template<class CharT>
struct std::formatter<::mnid::nanoid, CharT> :
    public ::mnid::impl::nanoid_formatter_base<std::formatter<::mnid::nanoid, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MNID_THROW(std::format_error(message));
    }
};

#endif

#if MNID_SUPPORTS_FMT_FORMAT

/// nanoid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mnid::nanoid, CharT> :
    public ::mnid::impl::nanoid_formatter_base<fmt::formatter<::mnid::nanoid, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif


#endif
