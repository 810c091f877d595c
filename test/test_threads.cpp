// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <modern-nanoid/nanoid.h>

#include <thread>
#include <unordered_set>
#include <vector>

using namespace mnid;

TEST_SUITE("threads") {

TEST_CASE("concurrent generation") {
    constexpr size_t thread_count = 8;
    constexpr size_t per_thread = 5000;

    std::vector<std::vector<nanoid>> results(thread_count);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back([&results, i]() {
            auto & dest = results[i];
            dest.reserve(per_thread);
            for (size_t j = 0; j < per_thread; ++j)
                dest.push_back(nanoid::generate());
        });
    }
    for (auto & thread: threads)
        thread.join();

    std::unordered_set<nanoid> all;
    for (const auto & ids: results) {
        for (const auto & id: ids) {
            CHECK(id.size() == nanoid::default_size);
            all.insert(id);
        }
    }
    CHECK(all.size() == thread_count * per_thread);
}

TEST_CASE("secure_random is shared safely") {
    constexpr size_t thread_count = 4;

    std::vector<std::string> first_ids(thread_count);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back([&first_ids, i]() {
            secure_random random;
            first_ids[i] = generate_string(random, 32, "0123456789abcdef");
        });
    }
    for (auto & thread: threads)
        thread.join();

    std::unordered_set<std::string> distinct(first_ids.begin(), first_ids.end());
    CHECK(distinct.size() == thread_count);
}

}
