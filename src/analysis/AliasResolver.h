/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include "StackStructures.h"

/**
 * @class AliasResolver
 * @brief Attaches untyped symbols to the function sharing their address
 *
 * Toolchains often emit a plain label next to the typed function symbol (for
 * example a hand-written assembly entry point). Such names are appended to the
 * function's name list in address order. Groups that do not land on a defined
 * function are dropped.
 */
class AliasResolver {
public:
    /**
     * @param defined Catalog to enrich
     * @param candidates Alias candidates produced by SymbolTableParser
     * @return Number of alias groups attached to a function
     */
    static size_t resolve(FunctionMap& defined, const AliasCandidateMap& candidates);
};
