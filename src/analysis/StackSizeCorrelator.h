/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <vector>
#include "StackStructures.h"

/**
 * @class StackSizeCorrelator
 * @brief Assigns decoded stack sizes to the functions they describe
 *
 * Records are matched with FunctionLookup, so a Thumb function whose symbol
 * carries the low bit still picks up a record emitted without it (and the
 * other way around). Records for code the linker discarded or merged match
 * nothing and are ignored.
 */
class StackSizeCorrelator {
public:
    /**
     * @param defined Catalog to update in place
     * @param records Records from StackSizeDecoder
     * @return Number of records that matched a function
     */
    static size_t correlate(FunctionMap& defined, const std::vector<StackSizeRecord>& records);
};
