/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include "StackStructures.h"

/**
 * @file FunctionLookup.h
 * @brief Address lookup tolerant of the Thumb bit
 *
 * On ARM the least significant bit of a code address selects the Thumb
 * instruction set. Symbol tables, aliases and .stack_sizes records do not
 * agree on whether that bit is set, so every lookup tries both variants.
 */

class FunctionLookup {
public:
    /**
     * @brief Find the defined function at an address, ignoring the low bit
     *
     * Tries the address with its low bit set first, then with it cleared.
     *
     * @param defined Catalog of defined functions
     * @param address Address as recorded by the symbol or section
     * @return Pointer into the catalog, or nullptr if neither variant matches
     */
    static Function* find(FunctionMap& defined, uint64_t address);
};
