// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_TEST_UTIL_H_INCLUDED
#define HEADER_TEST_UTIL_H_INCLUDED

#include <doctest/doctest.h>

#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

template<class T>
auto get_ends(const T & seq) {
    return std::make_pair(std::begin(seq), std::end(seq));
}

#define CHECK_EQUAL_SEQ(seq1, seq2) {\
    const auto & s1 = seq1; \
    const auto & s2 = seq2; \
    auto [c1, e1] = get_ends(s1); \
    auto [c2, e2] = get_ends(s2); \
    \
    for (size_t i = 0; ; ++i, ++c1, ++c2) {\
        if (c1 == e1) { \
            if (c2 == e2) \
                break; \
            \
            FAIL_CHECK("First sequence is shorter (length: ", i, ") than second"); \
            break; \
        } \
        if (c2 == e2) { \
            FAIL_CHECK("Second sequence is shorter (length: ", i, ") than first"); \
            break; \
        } \
        \
        if (*c1 != *c2) { \
            FAIL_CHECK("Discrepancy at index ", i);\
            break;\
        }\
    }\
    CHECK(true); \
}

// Random source that replays a fixed list of values and counts how many were drawn
class sequence_generator {
public:
    using result_type = uint32_t;

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    sequence_generator(std::initializer_list<result_type> values):
        m_values(values)
    {}

    result_type operator()() {
        REQUIRE(m_pos < m_values.size());
        return m_values[m_pos++];
    }

    size_t calls() const
        { return m_pos; }

private:
    std::vector<result_type> m_values;
    size_t m_pos = 0;
};

#endif
