/*
 * RapidHash
 * Copyright (C) 2021-2025  Frank J. T. Wojcik
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see
 * <https://www.gnu.org/licenses/>.
 */
#pragma once

//-----------------------------------------------------------------------------
// Wall-clock timing, used for reporting how long tests take

#define NSEC_PER_SEC 1000000000ULL

#if defined(_MSC_VER)

#include <windows.h>

static FORCE_INLINE uint64_t monotonic_clock( void ) {
    LARGE_INTEGER t, f;
    uint64_t      result;

    if (QueryPerformanceCounter(&t) == 0) {
        return 0;
    }
    QueryPerformanceFrequency(&f);
    result = t.QuadPart / f.QuadPart * NSEC_PER_SEC;
    if (f.QuadPart > NSEC_PER_SEC) {
        result += (t.QuadPart % f.QuadPart) / (f.QuadPart / NSEC_PER_SEC);
    } else {
        result += (t.QuadPart % f.QuadPart) * (NSEC_PER_SEC / f.QuadPart);
    }
    return result;
}

#else //  !defined(_MSC_VER)

#include <time.h>

static FORCE_INLINE uint64_t monotonic_clock( void ) {
    struct timespec ts;

    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return 0;
    }
    return (uint64_t)ts.tv_sec * NSEC_PER_SEC + (uint64_t)ts.tv_nsec;
}

#endif //  !defined(_MSC_VER)
