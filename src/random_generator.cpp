// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-nanoid/nanoid.h>

#include "random_generator.h"
#include "fork_handler.h"

#include <randutils.hpp>

namespace mnid::impl {

    prng & get_random_generator() {

        struct generator : prng {
            generator():
                prng(randutils::auto_seed_128{}.base())
            {}
        };

        return reset_on_fork_thread_local<generator>::instance();
    }

}

auto mnid::secure_random::operator()() -> result_type {
    auto & gen = impl::get_random_generator();
    std::uniform_int_distribution<result_type> distrib;
    return distrib(gen);
}
