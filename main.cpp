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
#include "Platform.h"
#include "Timing.h"
#include "Hashlib.h"
#include "TestGlobals.h"
#include "Random.h"
#include "Mathmult.h"
#include "RapidHash.h"
#include "version.h"

#include "SanityTest.h"
#include "KnownValuesTest.h"
#include "StreamingTest.h"
#include "AvalancheTest.h"
#include "SeedTest.h"
#include "RngTest.h"
#include "ThreadingTest.h"

#include <cstdio>
#include <cstdint>
#include <cinttypes>
#include <cerrno>
#include <clocale>
#include <vector>
#include <strings.h>

//-----------------------------------------------------------------------------
// Locally-visible configuration
static bool g_exitOnFailure  = false;
static bool g_exitCodeResult = false;
static bool g_testMode       = false;

static bool g_testAll;
static bool g_testVerifyAll;
static bool g_testMathmult;
static bool g_testKnownValues;
static bool g_testSanity;
static bool g_testStreaming;
static bool g_testAvalanche;
static bool g_testSeed;
static bool g_testRng;
static bool g_testThreads;

struct TestOpts {
    bool &       var;
    bool         defaultvalue;  // What "All" sets the test to
    const char * name;
};
// The first one overrides all other selections
static TestOpts g_testopts[] = {
    { g_testVerifyAll,       false,    "VerifyAll" },
    { g_testAll,              true,    "All" },
    { g_testMathmult,         true,    "Mathmult" },
    { g_testKnownValues,      true,    "KnownValues" },
    { g_testSanity,           true,    "Sanity" },
    { g_testStreaming,        true,    "Streaming" },
    { g_testAvalanche,        true,    "Avalanche" },
    { g_testSeed,             true,    "Seed" },
    { g_testRng,              true,    "Rng" },
    { g_testThreads,          true,    "Threads" },
};

static void set_default_tests( bool enable ) {
    for (size_t i = 0; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
        if (enable) {
            g_testopts[i].var = g_testopts[i].defaultvalue;
        } else if (g_testopts[i].defaultvalue) {
            g_testopts[i].var = false;
        }
    }
}

static void parse_tests( const char * str, bool enable_tests ) {
    while (*str != '\0') {
        size_t       len;
        const char * p = strchr(str, ',');
        if (p == NULL) {
            len = strlen(str);
        } else {
            len = p - str;
        }

        struct TestOpts * found = NULL;
        bool foundmultiple      = false;
        for (size_t i = 0; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
            const char * testname = g_testopts[i].name;
            // Allow the user to specify test names by case-agnostic
            // unique prefix.
            if (strncasecmp(str, testname, len) == 0) {
                if (found != NULL) {
                    foundmultiple = true;
                }
                found = &g_testopts[i];
                if (testname[len] == '\0') {
                    // Exact match found, don't bother looking further, and
                    // don't error out.
                    foundmultiple = false;
                    break;
                }
            }
        }
        if (foundmultiple) {
            printf("Ambiguous test name: --%stest=%.*s\n", enable_tests ? "" : "no", (int)len, str);
            goto error;
        }
        if (found == NULL) {
            printf("Invalid option: --%stest=%.*s\n", enable_tests ? "" : "no", (int)len, str);
            goto error;
        }

        found->var = enable_tests;

        // If "All" tests are being enabled or disabled, then adjust the
        // individual test variables to match. Otherwise, if one of the
        // "All" tests is being specifically disabled, then don't consider
        // "All" tests as being run.
        if (&found->var == &g_testAll) {
            set_default_tests(enable_tests);
        } else if (!enable_tests && found->defaultvalue) {
            g_testAll = false;
        }

        if (p == NULL) {
            break;
        }
        str += len + 1;
    }

    return;

  error:
    printf("Valid tests: --test=%s", g_testopts[0].name);
    for (size_t i = 1; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
        printf(",%s", g_testopts[i].name);
    }
    printf(" \n");
    exit(1);
}

static bool parse_u64( const char * str, uint64_t & out ) {
    char * endptr;

    errno = 0;
    out   = strtoull(str, &endptr, 0);
    return (errno == 0) && (str[0] != '\0') && (str[0] != '-') && (*endptr == '\0');
}

//-----------------------------------------------------------------------------
// Self-tests - verify that every variant computes the same function

static void HashSelfTestAll( flags_t flags ) {
    bool verbose = REPORT(VERBOSE, flags);
    bool pass    = true;

    printf("[[[ VerifyAll Tests ]]]\n\n");

    pass &= verifyAllHashes(verbose);

    if (!pass) {
        printf("Self-test FAILED!\n");
        if (!verbose) {
            verifyAllHashes(true);
        }
        exit(1);
    }

    printf("PASS\n\n");
}

static bool MathmultTest( void ) {
    printf("[[[ Mathmult Tests ]]]\n\n");

    bool result = Mathmult_selftest(true);

    recordTestResult(result, "Mathmult", (const char *)NULL);

    printf("\n%s", result ? "" : g_failstr);

    return result;
}

//-----------------------------------------------------------------------------

static bool test( const HashInfo * hInfo, const flags_t flags ) {
    bool result = true;

    printf("-------------------------------------------------------------------------------\n");
    fprintf(stderr, "--- Testing %s \"%s\" [%s]", hInfo->name, hInfo->desc, hInfo->impl);
    if (g_seed != 0) {
        fprintf(stderr, " seed 0x%016" PRIx64 "\n\n", g_seed);
    } else {
        fprintf(stderr, "\n\n");
    }

    //-----------------------------------------------------------------------------
    // Tests of the library pieces that every variant is built from

    if (g_testMathmult) {
        result &= MathmultTest();
        if (!result && g_exitOnFailure) { goto out; }
    }

    //-----------------------------------------------------------------------------
    // Sanity tests

    if (g_testSanity) {
        result &= SanityTest(hInfo, flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

    if (g_testKnownValues) {
        result &= KnownValuesTest(hInfo, flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

    //-----------------------------------------------------------------------------
    // Incremental hashing

    if (g_testStreaming) {
        result &= StreamingTest(flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

    //-----------------------------------------------------------------------------
    // Output quality

    if (g_testAvalanche) {
        result &= AvalancheTest(hInfo, flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

    if (g_testSeed) {
        result &= SeedTest(hInfo, flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

    //-----------------------------------------------------------------------------
    // RNG

    if (g_testRng) {
        result &= RngTest(flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

    //-----------------------------------------------------------------------------
    // Thread safety

    if (g_testThreads) {
        result &= ThreadingTest(hInfo, flags);
        if (!result && g_exitOnFailure) { goto out; }
    }

  out:
    printf("-------------------------------------------------------------------------------\n");
    printf("Summary for: %s [%s]\n", hInfo->name, hInfo->impl);
    printf("Overall result: %s            ( %d / %d passed)\n", result ? "pass" : "FAIL",
            g_testPass, g_testPass + g_testFail);
    if (!result) {
        const char * prev = "";
        printf("Failures");
        for (auto x: g_testFailures) {
            if (strcmp(prev, x.first) != 0) {
                printf("%c\n    %-20s: [%s", (strlen(prev) == 0) ? ':' : ']', x.first, x.second ? x.second : "");
                prev = x.first;
            } else {
                printf(", %s", x.second ? x.second : "");
            }
        }
        printf("]\n");
    }
    printf("-------------------------------------------------------------------------------\n");
    for (auto x: g_testFailures) {
        free(x.second);
    }

    return result;
}

static bool testHash( const char * name, const flags_t flags ) {
    const HashInfo * hInfo;

    if ((hInfo = findHash(name)) == NULL) {
        printf("Invalid hash '%s' specified\n", name);
        return false;
    }

    return test(hInfo, flags);
}

//-----------------------------------------------------------------------------
// Hashing files

static const size_t readsize = 64 * 1024;

// Hashes everything remaining in f. The default variant streams through a
// Hasher; the others need the whole input at once.
static bool hashStream( FILE * f, const HashInfo * hInfo, uint64_t seed, uint64_t & result ) {
    std::vector<uint8_t> buf( readsize );

    if (hInfo == NULL) {
        RapidHash::Hasher hasher( seed );
        size_t            n;
        while ((n = fread(&buf[0], 1, readsize, f)) > 0) {
            hasher.append(&buf[0], n);
        }
        if (ferror(f)) {
            return false;
        }
        result = hasher.finalize();
        return true;
    }

    std::vector<uint8_t> all;
    size_t n;
    while ((n = fread(&buf[0], 1, readsize, f)) > 0) {
        all.insert(all.end(), buf.begin(), buf.begin() + n);
    }
    if (ferror(f)) {
        return false;
    }

    uint8_t out[8];
    hInfo->hash(all.empty() ? NULL : &all[0], all.size(), seed, out);
    result = isLE() ? GET_U64<false>(out, 0) : GET_U64<true>(out, 0);
    return true;
}

static bool hashFiles( const std::vector<const char *> & files, const HashInfo * hInfo, uint64_t seed ) {
    std::vector<const char *> names( files );
    bool ok = true;

    if (names.empty()) {
        names.push_back("-");
    }

    for (const char * name: names) {
        const bool isstdin = (strcmp(name, "-") == 0);
        FILE *     f       = isstdin ? stdin : fopen(name, "rb");
        uint64_t   h;

        if (f == NULL) {
            fprintf(stderr, "Could not read %s: %s\n", name, strerror(errno));
            ok = false;
            continue;
        }
        errno = 0;
        if (!hashStream(f, hInfo, seed, h)) {
            fprintf(stderr, "Could not read %s: %s\n", isstdin ? "<stdin>" : name, strerror(errno));
            ok = false;
        } else if (names.size() > 1) {
            printf("%" PRIu64 "  %s\n", h, name);
        } else {
            printf("%" PRIu64 "\n", h);
        }
        if (!isstdin) {
            fclose(f);
        }
    }

    return ok;
}

//-----------------------------------------------------------------------------

static void usage( void ) {
    printf("Usage: rapidhash-cli [--seed=<seed>] [--hash=<hashname>] [<file>...]\n"
           "\n"
           "       rapidhash-cli --[no]test=<testname>[,...] [--verbose] [--ncpu=N]\n"
           "                     [--seed=<hash_default_seed>] [--randseed=<RNG_base_seed>]\n"
           "                     [--[no]exit-on-failure] [--[no]exit-code-on-failure]\n"
           "                     [--[no]time-tests]\n"
           "                     [<hashname>]\n"
           "\n"
           "       rapidhash-cli [--list]|[--listnames]|[--tests]|[--version]\n"
           "\n"
           "  A file name of - means standard input, which is also used if no\n"
           "  files are given. Hashnames can be supplied using any case letters.\n");
}

int main( int argc, const char ** argv ) {
    setbuf(stderr, NULL); // Unbuffer stderr always
    std::setlocale(LC_COLLATE, "C");
    std::setlocale(LC_CTYPE, "C");

    if (!isLE() && !isBE()) {
        printf("Runtime endian detection failed! Cannot continue\n");
        exit(1);
    }

    set_default_tests(true);

    const char * hashToUse = NULL;
    bool         seedGiven = false;
    std::vector<const char *> positional;

    flags_t flags = FLAG_REPORT_PROGRESS;
    for (int argnb = 1; argnb < argc; argnb++) {
        const char * const arg = argv[argnb];
        if ((strncmp(arg, "--", 2) == 0) && (arg[2] != '\0')) {
            // This is a command
            if (strcmp(arg, "--help") == 0) {
                usage();
                exit(0);
            }
            if (strcmp(arg, "--list") == 0) {
                listHashes(false);
                exit(0);
            }
            if (strcmp(arg, "--listnames") == 0) {
                listHashes(true);
                exit(0);
            }
            if (strcmp(arg, "--tests") == 0) {
                printf("Valid tests:\n");
                for (size_t i = 0; i < sizeof(g_testopts) / sizeof(TestOpts); i++) {
                    printf("  %s\n", g_testopts[i].name);
                }
                exit(0);
            }
            if (strcmp(arg, "--version") == 0) {
                printf("rapidhash-cli %s\n", VERSION);
                exit(0);
            }
            if (strcmp(arg, "--verbose") == 0) {
                flags |= FLAG_REPORT_VERBOSE;
                continue;
            }
            if (strcmp(arg, "--exit-on-failure") == 0) {
                g_exitOnFailure = true;
                continue;
            }
            if (strcmp(arg, "--noexit-on-failure") == 0) {
                g_exitOnFailure = false;
                continue;
            }
            if (strcmp(arg, "--exit-code-on-failure") == 0) {
                g_exitCodeResult = true;
                continue;
            }
            if (strcmp(arg, "--noexit-code-on-failure") == 0) {
                g_exitCodeResult = false;
                continue;
            }
            if (strcmp(arg, "--time-tests") == 0) {
                g_showTestTimes = true;
                continue;
            }
            if (strcmp(arg, "--notime-tests") == 0) {
                g_showTestTimes = false;
                continue;
            }
            if (strncmp(arg, "--seed=", 7) == 0) {
                uint64_t seed;
                if (!parse_u64(&arg[7], seed)) {
                    printf("Error parsing global seed value \"%s\"\n", &arg[7]);
                    exit(1);
                }
                g_seed    = seed;
                seedGiven = true;
                continue;
            }
            if (strncmp(arg, "--randseed=", 11) == 0) {
                uint64_t seed;
                if (!parse_u64(&arg[11], seed)) {
                    printf("Error parsing RNG seed value \"%s\"\n", &arg[11]);
                    exit(1);
                }
                Rand::GLOBAL_SEED = seed;
                continue;
            }
            if (strncmp(arg, "--hash=", 7) == 0) {
                hashToUse = &arg[7];
                continue;
            }
            if (strncmp(arg, "--ncpu=", 7) == 0) {
#if defined(HAVE_THREADS)
                errno = 0;
                char *   endptr;
                long int Ncpu = strtol(&arg[7], &endptr, 0);
                if ((errno != 0) || (arg[7] == '\0') || (*endptr != '\0') || (Ncpu < 1)) {
                    printf("Error parsing cpu number \"%s\"\n", &arg[7]);
                    exit(1);
                }
                if (Ncpu > 32) {
                    printf("WARNING: limiting to 32 threads\n");
                    Ncpu = 32;
                }
                g_NCPU = Ncpu;
                continue;
#else
                printf("WARNING: compiled without threads; ignoring --ncpu\n");
                continue;
#endif
            }
            if (strncmp(arg, "--test=", 7) == 0) {
                // If a list of tests is given, only test those
                g_testMode = true;
                g_testAll  = false;
                set_default_tests(false);
                parse_tests(&arg[7], true);
                continue;
            }
            if (strncmp(arg, "--notest=", 9) == 0) {
                g_testMode = true;
                parse_tests(&arg[9], false);
                continue;
            }
            // invalid command
            printf("Invalid command \"%s\"\n", arg);
            usage();
            exit(1);
        }
        // Not a command ? => a hash name in test mode, or a file name
        positional.push_back(arg);
    }

    //-----------------------------------------------------------------------------
    // Hashing mode

    if (!g_testMode) {
        const HashInfo * hInfo = NULL;
        if ((hashToUse != NULL) && ((hInfo = findHash(hashToUse)) == NULL)) {
            fprintf(stderr, "Invalid hash '%s' specified\n", hashToUse);
            exit(1);
        }
        // The default variant is streamed instead
        if ((hInfo != NULL) && (hInfo == findHash("rapidhash"))) {
            hInfo = NULL;
        }
        fflush(stdout);
        return hashFiles(positional, hInfo, seedGiven ? g_seed : RapidHash::DEFAULT_SEED) ? 0 : 1;
    }

    //-----------------------------------------------------------------------------
    // Testing mode

    setbuf(stdout, NULL); // Unbuffer stdout when testing

    const char * hashToTest = "rapidhash";
    if (hashToUse != NULL) {
        hashToTest = hashToUse;
    }
    if (positional.size() > 1) {
        printf("Only one hash may be tested at a time\n");
        usage();
        exit(1);
    } else if (positional.size() == 1) {
        hashToTest = positional[0];
    }

    bool   result    = true;
    size_t timeBegin = g_prevtime = monotonic_clock();

    if (g_testVerifyAll) {
        HashSelfTestAll(flags);
    } else {
        result = testHash(hashToTest, flags);
    }

    size_t timeEnd = monotonic_clock();

    fprintf(stderr, "Testing took %f seconds\n\n", (double)(timeEnd - timeBegin) / (double)NSEC_PER_SEC);

    return (!result && g_exitCodeResult) ? 99 : 0;
}
