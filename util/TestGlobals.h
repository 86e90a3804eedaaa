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

//-----------------------------------------------------------------------------
// Basic infrastructure that all test suites use
#pragma once

#include <vector>
#include <utility>
#include <cstdio>
#include <cstring>
#include <cinttypes>

#include "Timing.h"

//-----------------------------------------------------------------------------
// Global variables from main.cpp

// The seed used in each test where a seed is not explicitly part of that
// test.
extern uint64_t g_seed;

// What each test suite prints upon failure
extern const char * g_failstr;

#if defined(HAVE_THREADS)
extern unsigned g_NCPU;
#else
extern const unsigned g_NCPU;
#endif

void DisableThreads( void );

//-----------------------------------------------------------------------------
// Verbosity flags

typedef uint32_t flags_t;

#define REPORT(flagname, var) (!!(var & FLAG_REPORT_ ## flagname))

#define FLAG_REPORT_QUIET        (1 << 0)
#define FLAG_REPORT_VERBOSE      (1 << 1)
#define FLAG_REPORT_PROGRESS     (1 << 2)

#define maybeprintf(...) if (REPORT(VERBOSE, flags)) { printf(__VA_ARGS__); }

//-----------------------------------------------------------------------------
// Recording test results for final summary printout

extern uint32_t g_testPass, g_testFail;
extern std::vector<std::pair<const char *, char *>> g_testFailures;
extern uint64_t g_prevtime;
extern bool     g_showTestTimes;

static inline void recordTestResult( bool pass, const char * suitename, const char * testname ) {
    if (testname != NULL) {
        // Skip any leading spaces in the testname
        testname += strspn(testname, " ");
    }

    if (g_showTestTimes) {
        uint64_t curtime = monotonic_clock();
        if (testname != NULL) {
            printf("Elapsed: %f seconds\t[%s\t%s]\n\n", (double)(curtime - g_prevtime) / (double)NSEC_PER_SEC,
                    suitename, testname);
        } else {
            printf("Elapsed: %f seconds\t[%s]\n\n", (double)(curtime - g_prevtime) / (double)NSEC_PER_SEC, suitename);
        }
        g_prevtime = curtime;
    }

    if (pass) {
        g_testPass++;
    } else {
        g_testFail++;

        char * ntestname = NULL;
        if (testname != NULL) {
            ntestname = strdup(testname);
            if (!ntestname) {
                printf("OOM\n");
                exit(1);
            }
        }
        g_testFailures.push_back(std::pair<const char *, char *>(suitename, ntestname));
    }
}

static inline void recordTestResult( bool pass, const char * suitename, uint64_t testnum ) {
    const uint64_t maxlen = sizeof("18446744073709551615"); // UINT64_MAX
    char           testname[maxlen];

    snprintf(testname, maxlen, "%" PRIu64, testnum);
    recordTestResult(pass, suitename, testname);
}

// Prints the standard result marker for one test line
static inline void reportResult( bool pass, flags_t flags ) {
    if (REPORT(QUIET, flags)) {
        return;
    }
    if (pass) {
        printf("%s", REPORT(VERBOSE, flags) ? " PASS\n"        : " pass\n");
    } else {
        printf("%s", REPORT(VERBOSE, flags) ? " FAIL  !!!!!\n" : " FAIL\n");
    }
}

//----------------------------------------------------------------------------
// Helper for printing out the right number of progress dots

static inline void progressdots( int cur, int min, int max, int totaldots ) {
    // cur goes from [min, max]. When cur is max, totaldots should have
    // been printed. Print out enough dots, assuming either we were called
    // for cur-1, or that we are being called for the first time with
    // cur==min.
    int count = 0;
    int span  = max - min + 1;

    if (span > totaldots) {
        // Possibly zero dots per call. Always print out one dot the first
        // time through, and treat the range as one smaller.
        if (cur == min) {
            count = 1;
        } else {
            totaldots--;
            min++;
            span--;
        }
    }
    if (count == 0) {
        int expect = (cur - min + 1) * totaldots / span;
        int sofar  = (cur - min    ) * totaldots / span;
        count = expect - sofar;
    }

    for (int i = 0; i < count; i++) {
        printf(".");
    }
}
