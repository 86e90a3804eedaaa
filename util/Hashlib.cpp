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
#include "Hashlib.h"

#include <cstdio>
#include <cctype>
#include <string>
#include <unordered_map>
#include <algorithm>
#include <strings.h>

//-----------------------------------------------------------------------------
typedef std::unordered_map<std::string, const HashInfo *>  HashMap;
typedef std::vector<const HashInfo *>                      HashMapOrder;

static HashMap & hashMap() {
    static HashMap * map = new HashMap;

    return *map;
}

//-----------------------------------------------------------------------------
// Add a hash to the hashMap list of all hashes.
unsigned register_hash( const HashInfo * hinfo ) {
    std::string name = hinfo->name;

    // Allow users to lookup hashes by any case
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);

    if (hashMap().find(name) != hashMap().end()) {
        printf("Hash names must be unique.\n");
        printf("\"%s\" (\"%s\") was added multiple times.\n", hinfo->name, name.c_str());
        printf("Note that hash names are using a case-insensitive comparison.\n");
        exit(1);
    }
    if ((hinfo->hashfn == NULL) || (hinfo->bits == 0) || ((hinfo->bits % 8) != 0)) {
        printf("Hash \"%s\" is missing its hash function or has a bad output size.\n", hinfo->name);
        exit(1);
    }

    hashMap()[name] = hinfo;
    return hashMap().size();
}

//-----------------------------------------------------------------------------
// Routines for querying/finding hashes that have been registered.

// The sort_order field is intended to be used for variants which should
// appear inside their family in other-than-alphabetical order.
static HashMapOrder defaultSort( HashMap & map ) {
    HashMapOrder hashes;

    hashes.reserve(map.size());
    for (auto kv: map) {
        hashes.push_back(kv.second);
    }
    std::sort(hashes.begin(), hashes.end(), []( const HashInfo * a, const HashInfo * b ) {
            int r;
            // Sort by family (case-insensitive)
            if ((r = strcasecmp(a->family, b->family)) != 0) {
                return r < 0;
            }
            // Then by hash output size (smaller first)
            if (a->bits != b->bits) {
                return a->bits < b->bits;
            }
            // Then by explicit sort_order
            if (a->sort_order != b->sort_order) {
                return a->sort_order < b->sort_order;
            }
            // And finally by hash name (case-insensitive)
            if ((r = strcasecmp(a->name, b->name)) != 0) {
                return r < 0;
            }
            return false;
        });
    return hashes;
}

std::vector<const HashInfo *> findAllHashes( void ) {
    return defaultSort(hashMap());
}

const HashInfo * findHash( const char * name ) {
    std::string n = name;

    // Search without regards to case
    std::transform(n.begin(), n.end(), n.begin(), ::tolower);
    // Since underscores can't be in names, the user must have meant a dash
    std::replace(n.begin(), n.end(), '_', '-');

    const auto it = hashMap().find(n);
    if (it == hashMap().end()) {
        return NULL;
    }
    return it->second;
}

void listHashes( bool nameonly ) {
    if (!nameonly) {
        printf("Hashnames can be supplied using any case letters.\n\n");
        printf("%-25s %4s  %10s  %-60s\n", "Name", "Bits", "Impl   "   , "Description");
        printf("%-25s %4s  %10s  %-60s\n", "----", "----", "----------", "-----------");
    }
    for (const HashInfo * h: defaultSort(hashMap())) {
        if (!nameonly) {
            printf("%-25s %4d  %10s  %-60s\n", h->name, h->bits, h->impl, h->desc);
        } else {
            printf("%s\n", h->name);
        }
    }
}

//-----------------------------------------------------------------------------
// Hash verification routines

static bool compareVerification( uint32_t expected, uint32_t actual,
        const HashInfo * hinfo, bool verbose, bool prefix ) {
    const char * result_str;
    bool         result = true;

    if (expected == actual) {
        result_str = (actual != 0) ? "PASS\n" : "INSECURE (should not be 0)\n";
    } else if (expected == 0) {
        result_str = "SKIP (unverifiable)\n";
    } else {
        result_str = "FAIL! (Expected 0x%08x)\n";
        result     = false;
    }

    if (verbose) {
        if (prefix) {
            printf("%10s| %25s - ", hinfo->impl, hinfo->name);
        }
        printf("Verification value 0x%08X ...... ", actual);
        printf(result_str, expected);
    }

    return result;
}

bool verifyHash( const HashInfo * hinfo, bool verbose, bool prefix ) {
    const uint32_t actual = hinfo->ComputedVerify();

    return compareVerification(hinfo->verification, actual, hinfo, verbose, prefix);
}

bool verifyAllHashes( bool verbose ) {
    bool result = true;

    for (const HashInfo * h: defaultSort(hashMap())) {
        result &= verifyHash(h, verbose, true);
    }
    if (verbose) {
        printf("\n");
    }
    return result;
}
