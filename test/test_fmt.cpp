// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <fmt/format.h>
#include <fmt/xchar.h>
#include <modern-nanoid/nanoid.h>

#include <random>

using namespace mnid;
using namespace std::literals;

static_assert(MNID_SUPPORTS_FMT_FORMAT);

TEST_SUITE("fmt") {

TEST_CASE("format nanoid") {

    CHECK(fmt::format("{}", nanoid()) == "");
    CHECK(fmt::format("{}", nanoid::from_chars("Uakgb_J5m9g-0JDMbcJqL")) == "Uakgb_J5m9g-0JDMbcJqL");
    CHECK(fmt::format("id={};", nanoid::from_chars(U"é")) == "id=\xC3\xA9;");
    CHECK(fmt::format(L"{}", nanoid::from_chars("Uakgb_J5m9g-0JDMbcJqL")) == L"Uakgb_J5m9g-0JDMbcJqL");
}

TEST_CASE("format generated") {
    std::mt19937 gen(42);
    auto u = nanoid::generate(gen, 21, nanoid::default_alphabet);

    CHECK(fmt::format("{}", u) == "bSXVoyfBS3YoELqjfpZw7");
    CHECK(fmt::format("{}", u) == u.to_string());
}

TEST_CASE("invalid format spec") {
    auto u = nanoid::from_chars("abc");

    CHECK_THROWS_AS((void)fmt::format(fmt::runtime("{:x}"), u), fmt::format_error);
}

}
