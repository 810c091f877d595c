// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_NANOID_RANDOM_GENERATOR_H_INCLUDED
#define HEADER_MODERN_NANOID_RANDOM_GENERATOR_H_INCLUDED

#include <random>
#include <chacha20.hpp>


namespace mnid::impl {

    using prng = chacha20_12;

    // Engine owned by the calling thread
    prng & get_random_generator();
}

#endif
