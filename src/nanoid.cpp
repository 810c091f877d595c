// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-nanoid/nanoid.h>

using namespace mnid;

auto nanoid::generate() -> nanoid {
    return nanoid::generate(nanoid::default_size);
}

auto nanoid::generate(size_t size) -> nanoid {
    secure_random random;
    return nanoid::generate(random, size, nanoid::default_alphabet);
}
